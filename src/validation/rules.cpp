#include "pathguard/rules.hpp"
#include "pathguard/detectors.hpp"
#include "pathguard/platform.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <re2/re2.h>

namespace pathguard {

namespace fs = std::filesystem;

namespace {

constexpr const char* kTraversalDetected = "invalid path: path traversal detected";

// Final extension of the last path element, including the dot
std::string extension_of(const std::string& path) {
    for (size_t i = path.size(); i > 0; --i) {
        char c = path[i - 1];
        if (c == '/') break;
        if (c == '.') return path.substr(i - 1);
    }
    return "";
}

std::string join_list(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    out += "]";
    return out;
}

// Run a string rule on both forms; the original goes first because cleaning
// may have hidden what it contains.
RuleOutcome validate_both_forms(const ValidationRule& rule, const Path& path) {
    if (!path.original().empty()) {
        auto outcome = rule.validate(path.original());
        if (!outcome.ok) return outcome;
    }
    return rule.validate(path.string());
}

} // namespace

// ============================================================================
// Path Form Rules
// ============================================================================

RuleOutcome AbsolutePathRule::validate(const std::string& path) const {
    if (!is_absolute_path(path)) {
        return RuleOutcome::fail("path must be absolute");
    }
    return RuleOutcome::pass();
}

RuleOutcome RelativePathRule::validate(const std::string& path) const {
    if (is_absolute_path(path)) {
        return RuleOutcome::fail("path must be relative");
    }
    return RuleOutcome::pass();
}

// ============================================================================
// Filesystem Rules
// ============================================================================

RuleOutcome ExistsRule::validate(const std::string& path) const {
    EntryInfo info = stat_entry(path);
    if (!info.ok) {
        return RuleOutcome::fail("cannot stat path: " + info.error);
    }
    if (!info.exists) {
        return RuleOutcome::fail("path does not exist");
    }
    return RuleOutcome::pass();
}

RuleOutcome ExistsRule::validate_path(const Path& path) const {
    if (!path.exists()) {
        return RuleOutcome::fail("path does not exist");
    }
    return RuleOutcome::pass();
}

// Any entry counts, a dangling symlink included
RuleOutcome NotExistsRule::validate(const std::string& path) const {
    EntryInfo info = lstat_entry(path);
    if (!info.ok) {
        return RuleOutcome::fail("cannot determine whether path exists: " + info.error);
    }
    if (info.exists) {
        return RuleOutcome::fail("path already exists");
    }
    return RuleOutcome::pass();
}

RuleOutcome NotExistsRule::validate_path(const Path& path) const {
    return validate(path.string());
}

RuleOutcome ReadableRule::validate(const std::string& path) const {
    const std::string clean = clean_path(path);
    if (clean.find("..") != std::string::npos) {
        return RuleOutcome::fail(kTraversalDetected);
    }

    EntryInfo info = stat_entry(clean);
    if (!info.ok) {
        return RuleOutcome::fail("path is not readable: " + info.error);
    }
    if (!info.exists) {
        return RuleOutcome::fail("path is not readable: path does not exist");
    }
    if (!has_access(clean, Access::Read)) {
        return RuleOutcome::fail("path is not readable: permission denied");
    }
    return RuleOutcome::pass();
}

RuleOutcome WritableRule::validate(const std::string& path) const {
    const std::string clean = clean_path(path);
    if (clean.find("..") != std::string::npos) {
        return RuleOutcome::fail(kTraversalDetected);
    }

    EntryInfo info = stat_entry(clean);
    if (!info.ok) {
        return RuleOutcome::fail("path is not writable: " + info.error);
    }

    if (!info.exists) {
        const std::string parent = clean_path(clean + "/..");
        EntryInfo parent_info = stat_entry(parent);
        if (!parent_info.ok || !parent_info.exists || !parent_info.is_directory) {
            return RuleOutcome::fail("directory is not writable: " + parent +
                                     " does not exist");
        }
        if (!has_access(parent, Access::Write)) {
            return RuleOutcome::fail("directory is not writable: " + parent);
        }
        return RuleOutcome::pass();
    }

    if (!has_access(clean, Access::Write)) {
        return RuleOutcome::fail(info.is_directory ? "directory is not writable: " + clean
                                                   : "path is not writable: " + clean);
    }
    return RuleOutcome::pass();
}

RuleOutcome ExecutableRule::validate(const std::string& path) const {
    EntryInfo info = stat_entry(path);
    if (!info.ok) {
        return RuleOutcome::fail("cannot stat path: " + info.error);
    }
    if (!info.exists) {
        return RuleOutcome::fail("path does not exist");
    }

    const auto exec_bits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    if ((info.permissions & exec_bits) == fs::perms::none) {
        return RuleOutcome::fail("path is not executable");
    }
    return RuleOutcome::pass();
}

RuleOutcome DirectoryRule::validate(const std::string& path) const {
    EntryInfo info = stat_entry(path);
    if (!info.ok) {
        return RuleOutcome::fail("cannot stat path: " + info.error);
    }
    if (!info.exists) {
        return RuleOutcome::fail("path does not exist");
    }
    if (!info.is_directory) {
        return RuleOutcome::fail("path is not a directory");
    }
    return RuleOutcome::pass();
}

RuleOutcome DirectoryRule::validate_path(const Path& path) const {
    if (!path.is_dir()) {
        return RuleOutcome::fail("path is not a directory");
    }
    return RuleOutcome::pass();
}

RuleOutcome FileRule::validate(const std::string& path) const {
    EntryInfo info = stat_entry(path);
    if (!info.ok) {
        return RuleOutcome::fail("cannot stat path: " + info.error);
    }
    if (!info.exists) {
        return RuleOutcome::fail("path does not exist");
    }
    if (!info.is_regular_file) {
        return RuleOutcome::fail("path is not a file");
    }
    return RuleOutcome::pass();
}

RuleOutcome FileRule::validate_path(const Path& path) const {
    if (!path.is_file()) {
        return RuleOutcome::fail("path is not a file");
    }
    return RuleOutcome::pass();
}

// ============================================================================
// String Rules
// ============================================================================

RuleOutcome ExtensionRule::validate(const std::string& path) const {
    const std::string ext = fold_case_utf8(extension_of(path));

    for (const auto& allowed : extensions_) {
        std::string candidate = allowed;
        if (candidate.empty() || candidate[0] != '.') {
            candidate = "." + candidate;
        }
        if (fold_case_utf8(candidate) == ext) {
            return RuleOutcome::pass();
        }
    }

    return RuleOutcome::fail("path must have one of the required extensions: " +
                             join_list(extensions_));
}

RuleOutcome MaxLengthRule::validate(const std::string& path) const {
    if (path.size() > max_length_) {
        return RuleOutcome::fail("path exceeds maximum length: " + std::to_string(path.size()) +
                                 " exceeds maximum " + std::to_string(max_length_));
    }
    return RuleOutcome::pass();
}

RuleOutcome MaxLengthRule::validate_path(const Path& path) const {
    return validate(path.original());
}

PatternRule::PatternRule(std::string pattern, bool required)
    : pattern_(std::move(pattern)), required_(required) {
    re2::RE2::Options options;
    options.set_log_errors(false);
    auto compiled = std::make_shared<const re2::RE2>(pattern_, options);
    if (compiled->ok()) {
        regex_ = std::move(compiled);
    } else {
        compile_error_ = compiled->error();
    }
}

std::string PatternRule::name() const {
    return required_ ? "require-pattern" : "forbid-pattern";
}

std::string PatternRule::description() const {
    return required_ ? "path must match pattern" : "path must not match pattern";
}

bool PatternRule::is_security_pattern() const {
    static const char* const kSecurityPatterns[] = {
        R"(\.\.)",
        R"(\.\./)",
        R"(/\.\./)",
        "%2e%2e",
        "%252e",
        R"(\x2e\x2e)",
    };
    for (const char* p : kSecurityPatterns) {
        if (pattern_ == p) return true;
    }
    return false;
}

RuleOutcome PatternRule::validate(const std::string& path) const {
    if (!regex_) {
        return RuleOutcome::fail("invalid pattern: " + compile_error_);
    }

    const bool matched = re2::RE2::PartialMatch(path, *regex_);

    if (required_ && !matched) {
        return RuleOutcome::fail("path does not match required pattern: " + pattern_);
    }
    if (!required_ && matched) {
        return RuleOutcome::fail("path matches forbidden pattern: " + pattern_);
    }
    return RuleOutcome::pass();
}

RuleOutcome PatternRule::validate_path(const Path& path) const {
    if (is_security_pattern()) {
        return validate_both_forms(*this, path);
    }
    return validate(path.string());
}

// ============================================================================
// Security Rules
// ============================================================================

RuleOutcome PathTraversalRule::validate(const std::string& path) const {
    if (contains_traversal(path)) {
        return RuleOutcome::fail(kTraversalDetected);
    }
    return RuleOutcome::pass();
}

RuleOutcome PathTraversalRule::validate_path(const Path& path) const {
    return validate_both_forms(*this, path);
}

RuleOutcome NullByteRule::validate(const std::string& path) const {
    if (contains_null_byte(path)) {
        return RuleOutcome::fail("path contains null byte");
    }
    return RuleOutcome::pass();
}

RuleOutcome NullByteRule::validate_path(const Path& path) const {
    return validate_both_forms(*this, path);
}

RuleOutcome ControlCharacterRule::validate(const std::string& path) const {
    if (contains_control_character(path)) {
        return RuleOutcome::fail("path contains control character");
    }
    return RuleOutcome::pass();
}

RuleOutcome ControlCharacterRule::validate_path(const Path& path) const {
    return validate_both_forms(*this, path);
}

RuleOutcome WindowsReservedRule::validate(const std::string& path) const {
    if (is_windows_reserved_name(path)) {
        return RuleOutcome::fail("path uses Windows reserved device name");
    }
    return RuleOutcome::pass();
}

RuleOutcome UncPathRule::validate(const std::string& path) const {
    if (is_unc_path(path)) {
        return RuleOutcome::fail("UNC paths not allowed");
    }
    return RuleOutcome::pass();
}

RuleOutcome DrivePathRule::validate(const std::string& path) const {
    if (is_drive_path(path)) {
        return RuleOutcome::fail("windows drive paths not allowed");
    }
    return RuleOutcome::pass();
}

RuleOutcome ValidUtf8Rule::validate(const std::string& path) const {
    if (contains_overlong_utf8(path)) {
        return RuleOutcome::fail("path contains overlong UTF-8 sequence");
    }
    if (!is_valid_utf8(path)) {
        return RuleOutcome::fail("path contains invalid UTF-8 bytes");
    }
    return RuleOutcome::pass();
}

RuleOutcome ValidUtf8Rule::validate_path(const Path& path) const {
    return validate_both_forms(*this, path);
}

// ============================================================================
// One-off Checks
// ============================================================================

RuleOutcome validate_exists(const std::string& path) {
    return ExistsRule().validate(path);
}

RuleOutcome validate_readable(const std::string& path) {
    return ReadableRule().validate(path);
}

RuleOutcome validate_writable(const std::string& path) {
    return WritableRule().validate(path);
}

RuleOutcome validate_extension(const std::string& path, const std::vector<std::string>& extensions) {
    return ExtensionRule(extensions).validate(path);
}

} // namespace pathguard
