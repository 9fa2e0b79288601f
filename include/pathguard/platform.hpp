#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace pathguard {

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Resolve a path against the current working directory and clean it.
// Returns nullopt when the working directory cannot be determined.
std::optional<std::string> make_absolute(const std::string& path);

// ============================================================================
// Filesystem Queries
// ============================================================================

// Snapshot of a directory entry. `ok` is false when the query itself failed
// for a reason other than the entry being absent (permission denied, name
// too long, I/O error); callers treat that as "cannot confirm".
struct EntryInfo {
    bool ok = false;
    std::string error;
    bool exists = false;
    bool is_symlink = false;
    bool is_directory = false;
    bool is_regular_file = false;
    std::filesystem::perms permissions = std::filesystem::perms::unknown;
};

// Query an entry, following symlinks
EntryInfo stat_entry(const std::string& path);

// Query an entry without following a final symlink
EntryInfo lstat_entry(const std::string& path);

// Read symlink target
std::optional<std::string> read_symlink(const std::string& path);

enum class Access {
    Read,
    Write,
    Execute
};

// Check whether the calling process may access an existing entry
bool has_access(const std::string& path, Access mode);

} // namespace pathguard
