#include "pathguard/path.hpp"
#include "pathguard/containment.hpp"
#include "pathguard/platform.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

bool has_dotdot_component(const std::string& cleaned) {
    for (const auto& part : split(cleaned, '/')) {
        if (part == "..") return true;
    }
    return false;
}

} // namespace

// ============================================================================
// Lexical Normalization
// ============================================================================

std::string clean_path(const std::string& path) {
    if (path.empty()) {
        return ".";
    }

    const bool rooted = path[0] == '/';
    std::vector<std::string> kept;

    for (const auto& part : split(path, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (!kept.empty() && kept.back() != "..") {
                kept.pop_back();
            } else if (!rooted) {
                kept.push_back(part);
            }
            // ".." directly under root stays at root
            continue;
        }
        kept.push_back(part);
    }

    std::string out = rooted ? "/" : "";
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) out += '/';
        out += kept[i];
    }
    return out.empty() ? "." : out;
}

bool is_absolute_path(const std::string& path) {
    return std::filesystem::path(path).is_absolute();
}

// ============================================================================
// Path
// ============================================================================

Path::Path(std::string raw, PathOptions options)
    : normalized_(clean_path(raw)),
      original_(std::move(raw)),
      options_(std::move(options)) {
    if (has_dotdot_component(normalized_)) {
        spdlog::warn("path contains '..' elements after cleaning: {}", normalized_);
    }
}

bool Path::is_absolute() const {
    return is_absolute_path(normalized_);
}

bool Path::exists() const {
    auto info = stat_entry(normalized_);
    return info.ok && info.exists;
}

bool Path::is_dir() const {
    auto info = stat_entry(normalized_);
    return info.ok && info.is_directory;
}

bool Path::is_file() const {
    auto info = stat_entry(normalized_);
    return info.ok && info.is_regular_file;
}

bool Path::is_symlink() const {
    auto info = lstat_entry(normalized_);
    return info.ok && info.is_symlink;
}

std::optional<std::filesystem::perms> Path::mode() const {
    auto info = stat_entry(normalized_);
    if (!info.ok || !info.exists) {
        return std::nullopt;
    }
    return info.permissions;
}

std::optional<std::string> Path::readlink() const {
    return read_symlink(normalized_);
}

Path Path::join(const std::string& element) const {
    // The original keeps the raw element so attack strings stay visible
    return Path(original_.empty() ? element : original_ + "/" + element, options_);
}

Path Path::with_options(PathOptions options) const {
    Path copy(*this);
    copy.options_ = std::move(options);
    return copy;
}

std::optional<ValidationError> Path::validate() const {
    if (original_.empty()) {
        return ValidationError{original_, "non-empty", "path cannot be empty", CODE_EMPTY_PATH};
    }

    if (!options_.allow_unsafe && normalized_.find("..") != std::string::npos) {
        return ValidationError{normalized_, "safe-path", "path contains unsafe '..' component",
                               CODE_UNSAFE_PATH};
    }

    if (options_.max_length > 0 && normalized_.size() > options_.max_length) {
        return ValidationError{normalized_, "max-length",
                               "path exceeds maximum length of " +
                                   std::to_string(options_.max_length),
                               CODE_PATH_TOO_LONG};
    }

    if (!options_.restrict_to_base.empty()) {
        auto containment = check_containment(normalized_, options_.restrict_to_base);
        if (!containment.contained) {
            return ValidationError{normalized_, "base-path",
                                   "path is outside of base path " + options_.restrict_to_base,
                                   CODE_OUTSIDE_BASE_PATH};
        }
    }

    return std::nullopt;
}

} // namespace pathguard
