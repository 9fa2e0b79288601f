#pragma once

#include "pathguard/path.hpp"

#include <string>

namespace pathguard {

// ============================================================================
// Path Safety Checker
// ============================================================================

// Outcome of a safety check. `reason` names the first violation found.
struct SafetyVerdict {
    bool safe = false;
    std::string reason;
};

// Decides whether a Path can be opened, created or extracted without risking
// traversal, encoding bypasses, platform-specific injection or symlink
// escape from PathOptions::restrict_to_base.
//
// The answer is point-in-time: it is recomputed from the filesystem on every
// call. A symlink swapped in after the check (TOCTOU) is not detected here;
// callers that need a hard guarantee must open with O_NOFOLLOW semantics or
// re-verify after opening.
//
// Never throws. Any filesystem error while inspecting the path yields unsafe.
class PathSafetyChecker {
public:
    PathSafetyChecker() = default;

    SafetyVerdict check(const Path& path) const;

    bool is_safe(const Path& path) const { return check(path).safe; }
    bool is_safe(const std::string& path) const { return is_safe(Path(path)); }

private:
    SafetyVerdict check_strings(const Path& path) const;
    SafetyVerdict check_symlink(const Path& path) const;
    SafetyVerdict check_base(const Path& path) const;
};

// One-off check with a temporary checker
bool is_safe(const Path& path);
bool is_safe(const std::string& path, const PathOptions& options = {});

} // namespace pathguard
