#include "pathguard/safety_checker.hpp"
#include "pathguard/containment.hpp"
#include "pathguard/detectors.hpp"
#include "pathguard/platform.hpp"

#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

SafetyVerdict unsafe(const std::string& reason) {
    return {false, reason};
}

SafetyVerdict safe() {
    return {true, {}};
}

SafetyVerdict scan(const std::string& s, const char* form, std::size_t max_length) {
    if (auto violation = find_violation(s, max_length)) {
        return unsafe(std::string(detector_to_string(*violation)) + " in " + form + " path");
    }
    return safe();
}

// Walk the components below the base one at a time and stop at the first
// symlink. The base itself is the caller's choice. Components past the first
// missing one cannot be links.
SafetyVerdict reject_symlinks_below_base(const std::string& path, const std::string& base) {
    auto abs_path = make_absolute(path);
    auto abs_base = make_absolute(base);
    if (!abs_path || !abs_base) {
        return unsafe("cannot resolve absolute path: " + path);
    }
    auto rel = relative_path(*abs_base, *abs_path);
    if (!rel || *rel == ".." || rel->compare(0, 3, "../") == 0) {
        // Not below the base; the containment check reports it
        return safe();
    }

    std::string current = *abs_base;
    std::istringstream ss(*rel == "." ? std::string() : *rel);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (part.empty()) continue;
        current += (current.back() == '/') ? part : "/" + part;

        EntryInfo info = lstat_entry(current);
        if (!info.ok) {
            return unsafe("cannot inspect path: " + info.error);
        }
        if (!info.exists) {
            break;
        }
        if (info.is_symlink) {
            return unsafe("symlinks are not followed: " + current);
        }
    }
    return safe();
}

} // namespace

// ============================================================================
// PathSafetyChecker
// ============================================================================

SafetyVerdict PathSafetyChecker::check(const Path& path) const {
    // String scans first; the filesystem is touched only for clean strings
    SafetyVerdict verdict = check_strings(path);
    if (verdict.safe) verdict = check_symlink(path);
    if (verdict.safe) verdict = check_base(path);

    if (!verdict.safe) {
        spdlog::debug("unsafe path rejected ({}): {} bytes", verdict.reason,
                      path.original().size());
    }
    return verdict;
}

SafetyVerdict PathSafetyChecker::check_strings(const Path& path) const {
    const std::size_t max_length = path.options().effective_max_length();

    // Cleaning can remove or reshape attack strings, so the raw form is
    // judged on its own.
    if (!path.original().empty()) {
        auto verdict = scan(path.original(), "original", max_length);
        if (!verdict.safe) return verdict;
    }

    return scan(path.string(), "normalized", max_length);
}

SafetyVerdict PathSafetyChecker::check_symlink(const Path& path) const {
    const std::string& base = path.options().restrict_to_base;

    if (!path.options().follow_symlinks && !base.empty()) {
        return reject_symlinks_below_base(path.string(), base);
    }

    EntryInfo info = lstat_entry(path.string());
    if (!info.ok) {
        return unsafe("cannot inspect path: " + info.error);
    }
    if (!info.exists || !info.is_symlink) {
        return safe();
    }

    if (!path.options().follow_symlinks) {
        return unsafe("symlinks are not followed");
    }
    if (!base.empty()) {
        auto containment = check_symlink_containment(path.string(), base);
        if (!containment.contained) {
            return unsafe(containment.error);
        }
    }
    return safe();
}

SafetyVerdict PathSafetyChecker::check_base(const Path& path) const {
    const std::string& base = path.options().restrict_to_base;
    if (base.empty()) {
        return safe();
    }

    auto containment = check_containment(path.string(), base);
    if (!containment.contained) {
        return unsafe(containment.error);
    }

    // A symlinked directory anywhere in the path can still lead outside
    auto resolved = check_resolved_containment(path.string(), base);
    if (!resolved.contained) {
        return unsafe(resolved.error);
    }
    return safe();
}

// ============================================================================
// One-off Checks
// ============================================================================

bool is_safe(const Path& path) {
    return PathSafetyChecker().is_safe(path);
}

bool is_safe(const std::string& path, const PathOptions& options) {
    return PathSafetyChecker().is_safe(Path(path, options));
}

} // namespace pathguard
