#pragma once

#include "pathguard/types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace pathguard {

// ============================================================================
// Lexical Normalization
// ============================================================================

// Lexically clean a path without touching the filesystem:
// - Collapses repeated separators and "." segments
// - Resolves ".." against a preceding named segment
// - Keeps leading ".." of relative paths, drops ".." directly under root
// - Strips a trailing separator
// An empty result becomes ".". clean_path(clean_path(p)) == clean_path(p).
std::string clean_path(const std::string& path);

// True if the path is absolute on the current platform
bool is_absolute_path(const std::string& path);

// ============================================================================
// Path
// ============================================================================

// A caller-supplied path together with its normalized form. Both strings are
// fixed at construction; derived paths are new instances.
class Path {
public:
    explicit Path(std::string raw, PathOptions options = {});

    // Normalized form
    const std::string& string() const { return normalized_; }

    // The string exactly as the caller supplied it
    const std::string& original() const { return original_; }

    const PathOptions& options() const { return options_; }

    bool empty() const { return original_.empty(); }
    bool is_absolute() const;

    // Filesystem state, queried on every call
    bool exists() const;
    bool is_dir() const;
    bool is_file() const;
    bool is_symlink() const;
    std::optional<std::filesystem::perms> mode() const;
    std::optional<std::string> readlink() const;

    // Append an element to both the normalized and original forms
    Path join(const std::string& element) const;

    // Same path with different options
    Path with_options(PathOptions options) const;

    // Check the path against its own options. Returns the first problem:
    // empty path, ".." (unless allow_unsafe), length, base restriction.
    std::optional<ValidationError> validate() const;
    bool is_valid() const { return !validate().has_value(); }

private:
    std::string normalized_;
    std::string original_;
    PathOptions options_;
};

} // namespace pathguard
