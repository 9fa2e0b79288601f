#pragma once

#include <optional>
#include <string>

namespace pathguard {

// ============================================================================
// Lexical Relative Path
// ============================================================================

// Relative path from `base` to `target`, both expected absolute and clean.
// Returns nullopt when no relative path exists (one absolute, one not).
std::optional<std::string> relative_path(const std::string& base, const std::string& target);

// ============================================================================
// Containment Resolver
// ============================================================================

struct ContainmentResult {
    bool contained = false;
    std::string error;
    std::string resolved;   // absolute, clean candidate (or link target)
};

// Both paths are made absolute and cleaned; the candidate is contained when
// the relative path from base to candidate exists and does not start with "..".
ContainmentResult check_containment(const std::string& candidate, const std::string& base);

// Convenience wrapper over check_containment
bool is_within_base(const std::string& candidate, const std::string& base);

// Follow every symlink in the path (the final one and any intermediate
// directory) and require the result to stay under the equally resolved base.
// Components that do not exist yet are appended lexically.
ContainmentResult check_resolved_containment(const std::string& path, const std::string& base);

// Read the link, resolve a relative target against the link's parent
// directory, clean it and contain-check it against `base`. Any failure to
// read or resolve the link is reported as not contained.
ContainmentResult check_symlink_containment(const std::string& link_path, const std::string& base);

// ============================================================================
// Root-Relative Normalization
// ============================================================================

enum class PathError {
    None,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

const char* path_error_to_string(PathError e);

struct PathResult {
    bool ok;
    std::string path;  // normalized absolute path when ok
    PathError error;
};

// Normalize a path relative to a root without following symlinks (string-based).
// - Rejects NUL bytes
// - Rejects absolute relative_path when allow_absolute is false
// - Collapses "." and ".." segments
// - Fails if resulting path would escape root
PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute = false);

} // namespace pathguard
