#include "pathguard/containment.hpp"
#include "pathguard/path.hpp"
#include "pathguard/platform.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace pathguard {

namespace fs = std::filesystem;

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

std::vector<std::string> components(const std::string& clean) {
    std::vector<std::string> parts;
    if (clean == "." || clean == "/") {
        return parts;
    }
    for (auto& part : split(clean, '/')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

std::string join_components(const std::string& root, const std::vector<std::string>& comps) {
    fs::path p(root);
    for (const auto& c : comps) {
        p /= c;
    }
    // Always use forward slashes for portable paths
    return to_portable_path(p.lexically_normal().string());
}

bool starts_with_dotdot(const std::string& rel) {
    return rel == ".." || rel.compare(0, 3, "../") == 0;
}

} // namespace

// ============================================================================
// Lexical Relative Path
// ============================================================================

std::optional<std::string> relative_path(const std::string& base, const std::string& target) {
    const std::string clean_base = clean_path(base);
    const std::string clean_target = clean_path(target);

    if (is_absolute_path(clean_base) != is_absolute_path(clean_target)) {
        return std::nullopt;
    }

    const auto base_parts = components(clean_base);
    const auto target_parts = components(clean_target);

    size_t common = 0;
    while (common < base_parts.size() && common < target_parts.size() &&
           base_parts[common] == target_parts[common]) {
        ++common;
    }

    // A relative base cannot be climbed out of lexically
    for (size_t i = common; i < base_parts.size(); ++i) {
        if (base_parts[i] == "..") {
            return std::nullopt;
        }
    }

    std::string rel;
    for (size_t i = common; i < base_parts.size(); ++i) {
        if (!rel.empty()) rel += '/';
        rel += "..";
    }
    for (size_t i = common; i < target_parts.size(); ++i) {
        if (!rel.empty()) rel += '/';
        rel += target_parts[i];
    }
    return rel.empty() ? std::string(".") : rel;
}

// ============================================================================
// Containment Resolver
// ============================================================================

ContainmentResult check_containment(const std::string& candidate, const std::string& base) {
    ContainmentResult result;

    if (base.empty()) {
        result.error = "base path is empty";
        return result;
    }

    auto abs_candidate = make_absolute(candidate);
    if (!abs_candidate) {
        result.error = "cannot resolve absolute path: " + candidate;
        return result;
    }
    auto abs_base = make_absolute(base);
    if (!abs_base) {
        result.error = "cannot resolve base path: " + base;
        return result;
    }
    result.resolved = *abs_candidate;

    auto rel = relative_path(*abs_base, *abs_candidate);
    if (!rel) {
        result.error = "cannot relate " + *abs_candidate + " to " + *abs_base;
        return result;
    }
    if (starts_with_dotdot(*rel)) {
        result.error = "path is outside of base path " + base + ": " + *abs_candidate;
        return result;
    }

    result.contained = true;
    return result;
}

bool is_within_base(const std::string& candidate, const std::string& base) {
    return check_containment(candidate, base).contained;
}

ContainmentResult check_resolved_containment(const std::string& path, const std::string& base) {
    ContainmentResult result;
    if (contains_nul(path) || contains_nul(base)) {
        result.error = "path contains NUL byte";
        return result;
    }

    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(path, ec);
    if (ec) {
        result.error = "cannot resolve symlink chain: " + path;
        return result;
    }
    fs::path resolved_base = fs::weakly_canonical(base, ec);
    if (ec) {
        result.error = "cannot resolve base path: " + base;
        return result;
    }

    result = check_containment(to_portable_path(resolved.string()),
                               to_portable_path(resolved_base.string()));
    if (!result.contained && !result.resolved.empty()) {
        result.error = "resolved path escapes base: " + path + " -> " + result.resolved;
    }
    return result;
}

ContainmentResult check_symlink_containment(const std::string& link_path, const std::string& base) {
    ContainmentResult result;

    auto target = read_symlink(link_path);
    if (!target) {
        result.error = "cannot read symlink: " + link_path;
        return result;
    }

    std::string resolved = *target;
    if (!is_absolute_path(resolved)) {
        auto abs_link = make_absolute(link_path);
        if (!abs_link) {
            result.error = "cannot resolve symlink location: " + link_path;
            return result;
        }
        // Relative targets are relative to the directory holding the link
        resolved = clean_path(*abs_link + "/..") + "/" + resolved;
    }
    resolved = clean_path(resolved);

    result = check_containment(resolved, base);
    if (!result.contained) {
        result.error = "symlink target escapes base: " + link_path + " -> " + *target;
        return result;
    }

    auto chain = check_resolved_containment(link_path, base);
    if (!chain.contained) {
        chain.error = "symlink chain escapes base: " + link_path + " -> " + chain.resolved;
        return chain;
    }
    return result;
}

// ============================================================================
// Root-Relative Normalization
// ============================================================================

const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "none";
        case PathError::ContainsNul: return "path contains NUL byte";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::EscapesRoot: return "path escapes root";
        default: return "unknown";
    }
}

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::vector<std::string> parts;

    if (!relative_path.empty() && (relative_path[0] == '/' || relative_path[0] == '\\')) {
        if (!allow_absolute) {
            return {false, {}, PathError::AbsoluteNotAllowed};
        }
        auto trimmed = relative_path;
        while (!trimmed.empty() && (trimmed[0] == '/' || trimmed[0] == '\\')) {
            trimmed.erase(trimmed.begin());
        }
        parts = split(trimmed, '/');
    } else {
        parts = split(relative_path, '/');
    }

    std::vector<std::string> normalized;
    for (const auto& part : parts) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    std::string out = join_components(root, normalized);
    // Ensure containment: lexically compare without touching filesystem.
    auto lex_root = fs::path(root).lexically_normal();
    auto lex_out = fs::path(out).lexically_normal();
    auto root_it = lex_root.begin();
    auto out_it = lex_out.begin();
    for (; root_it != lex_root.end() && out_it != lex_out.end(); ++root_it, ++out_it) {
        // A trailing separator on the root shows up as an empty element
        if (root_it->empty()) break;
        if (*root_it != *out_it) {
            return {false, {}, PathError::EscapesRoot};
        }
    }
    if (root_it != lex_root.end() && !root_it->empty()) {
        return {false, {}, PathError::EscapesRoot};
    }

    return {true, out, PathError::None};
}

} // namespace pathguard
