#include "pathguard/platform.hpp"
#include "pathguard/path.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace pathguard {

namespace fs = std::filesystem;

namespace {

// The OS APIs stop at the first NUL, so such a name would be queried as a
// different, shorter path.
bool has_embedded_nul(const std::string& path) {
    return path.find('\0') != std::string::npos;
}

EntryInfo unqueryable(const std::string& reason) {
    EntryInfo info;
    info.error = reason;
    return info;
}

bool is_missing(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

EntryInfo entry_info_from(const fs::file_status& status, const std::error_code& ec,
                          bool is_link) {
    EntryInfo info;
    if (ec) {
        if (is_missing(ec)) {
            info.ok = true;
            return info;
        }
        info.error = ec.message();
        return info;
    }

    info.ok = true;
    info.exists = fs::exists(status);
    if (!info.exists) {
        return info;
    }
    info.is_symlink = is_link;
    info.is_directory = fs::is_directory(status);
    info.is_regular_file = fs::is_regular_file(status);
    info.permissions = status.permissions();
    return info;
}

} // namespace

// ============================================================================
// Path Utilities
// ============================================================================

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::optional<std::string> make_absolute(const std::string& path) {
    if (is_absolute_path(path)) {
        return clean_path(path);
    }

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        return std::nullopt;
    }
    return clean_path(to_portable_path(cwd.string()) + "/" + path);
}

// ============================================================================
// Filesystem Queries
// ============================================================================

EntryInfo stat_entry(const std::string& path) {
    if (has_embedded_nul(path)) {
        return unqueryable("path contains null byte");
    }
    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    return entry_info_from(status, ec, false);
}

EntryInfo lstat_entry(const std::string& path) {
    if (has_embedded_nul(path)) {
        return unqueryable("path contains null byte");
    }
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    return entry_info_from(status, ec, !ec && fs::is_symlink(status));
}

std::optional<std::string> read_symlink(const std::string& path) {
    if (has_embedded_nul(path)) {
        return std::nullopt;
    }
    std::error_code ec;
    fs::path target = fs::read_symlink(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return target.string();
}

bool has_access(const std::string& path, Access mode) {
    if (has_embedded_nul(path)) {
        return false;
    }
#ifdef _WIN32
    if (mode == Access::Execute) {
        EntryInfo info = stat_entry(path);
        return info.ok && info.exists &&
               (info.permissions & fs::perms::owner_exec) != fs::perms::none;
    }
    return _access(path.c_str(), mode == Access::Read ? 4 : 2) == 0;
#else
    int flags = R_OK;
    switch (mode) {
        case Access::Read: flags = R_OK; break;
        case Access::Write: flags = W_OK; break;
        case Access::Execute: flags = X_OK; break;
    }
    return ::access(path.c_str(), flags) == 0;
#endif
}

} // namespace pathguard
