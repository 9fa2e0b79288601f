#pragma once

#include "pathguard/path.hpp"
#include "pathguard/types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace re2 {
class RE2;
} // namespace re2

namespace pathguard {

// ============================================================================
// Validation Rule Interface
// ============================================================================

// A named, stateless check over a path. Implementations must be safe to call
// concurrently from any number of validators.
class ValidationRule {
public:
    virtual ~ValidationRule() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    virtual RuleOutcome validate(const std::string& path) const = 0;

    // Defaults to validating the normalized form
    virtual RuleOutcome validate_path(const Path& path) const {
        return validate(path.string());
    }
};

using RulePtr = std::shared_ptr<const ValidationRule>;

// ============================================================================
// Path Form Rules
// ============================================================================

class AbsolutePathRule : public ValidationRule {
public:
    std::string name() const override { return "absolute-path"; }
    std::string description() const override { return "path must be absolute"; }
    RuleOutcome validate(const std::string& path) const override;
};

class RelativePathRule : public ValidationRule {
public:
    std::string name() const override { return "relative-path"; }
    std::string description() const override { return "path must be relative"; }
    RuleOutcome validate(const std::string& path) const override;
};

// ============================================================================
// Filesystem Rules
// ============================================================================

class ExistsRule : public ValidationRule {
public:
    std::string name() const override { return "exists"; }
    std::string description() const override { return "path must exist"; }
    RuleOutcome validate(const std::string& path) const override;
    RuleOutcome validate_path(const Path& path) const override;
};

class NotExistsRule : public ValidationRule {
public:
    std::string name() const override { return "not-exists"; }
    std::string description() const override { return "path must not exist"; }
    RuleOutcome validate(const std::string& path) const override;
    RuleOutcome validate_path(const Path& path) const override;
};

class ReadableRule : public ValidationRule {
public:
    std::string name() const override { return "readable"; }
    std::string description() const override { return "path must be readable"; }
    RuleOutcome validate(const std::string& path) const override;
};

// An absent entry is writable when its parent directory is
class WritableRule : public ValidationRule {
public:
    std::string name() const override { return "writable"; }
    std::string description() const override { return "path must be writable"; }
    RuleOutcome validate(const std::string& path) const override;
};

class ExecutableRule : public ValidationRule {
public:
    std::string name() const override { return "executable"; }
    std::string description() const override { return "path must be executable"; }
    RuleOutcome validate(const std::string& path) const override;
};

class DirectoryRule : public ValidationRule {
public:
    std::string name() const override { return "directory"; }
    std::string description() const override { return "path must be a directory"; }
    RuleOutcome validate(const std::string& path) const override;
    RuleOutcome validate_path(const Path& path) const override;
};

class FileRule : public ValidationRule {
public:
    std::string name() const override { return "file"; }
    std::string description() const override { return "path must be a file"; }
    RuleOutcome validate(const std::string& path) const override;
    RuleOutcome validate_path(const Path& path) const override;
};

// ============================================================================
// String Rules
// ============================================================================

// Case-insensitive match of the final extension against an allow-list.
// Entries may be given with or without the leading dot.
class ExtensionRule : public ValidationRule {
public:
    explicit ExtensionRule(std::vector<std::string> extensions)
        : extensions_(std::move(extensions)) {}

    std::string name() const override { return "extension"; }
    std::string description() const override { return "path must have allowed extension"; }
    RuleOutcome validate(const std::string& path) const override;

    const std::vector<std::string>& extensions() const { return extensions_; }

private:
    std::vector<std::string> extensions_;
};

// Judged on the original string so that cleaning cannot shorten a path
// below the limit.
class MaxLengthRule : public ValidationRule {
public:
    explicit MaxLengthRule(std::size_t max_length) : max_length_(max_length) {}

    std::string name() const override { return "max-length"; }
    std::string description() const override { return "path must not exceed maximum length"; }
    RuleOutcome validate(const std::string& path) const override;
    RuleOutcome validate_path(const Path& path) const override;

    std::size_t max_length() const { return max_length_; }

private:
    std::size_t max_length_;
};

// RE2 regex searched anywhere in the path (linear time in the input).
// `required` selects between require-pattern and forbid-pattern. An invalid
// expression fails every validation with "invalid pattern".
class PatternRule : public ValidationRule {
public:
    PatternRule(std::string pattern, bool required);

    std::string name() const override;
    std::string description() const override;
    RuleOutcome validate(const std::string& path) const override;
    RuleOutcome validate_path(const Path& path) const override;

    const std::string& pattern() const { return pattern_; }
    bool required() const { return required_; }

    // Well-known traversal patterns are also checked against the original
    bool is_security_pattern() const;

private:
    std::string pattern_;
    bool required_;
    std::shared_ptr<const re2::RE2> regex_;
    std::string compile_error_;
};

// ============================================================================
// Security Rules (wrap the attack-pattern detectors)
// ============================================================================

class PathTraversalRule : public ValidationRule {
public:
    std::string name() const override { return "no-path-traversal"; }
    std::string description() const override {
        return "path must not contain path traversal patterns";
    }
    RuleOutcome validate(const std::string& path) const override;
    RuleOutcome validate_path(const Path& path) const override;
};

class NullByteRule : public ValidationRule {
public:
    std::string name() const override { return "no-null-bytes"; }
    std::string description() const override { return "path must not contain null bytes"; }
    RuleOutcome validate(const std::string& path) const override;
    RuleOutcome validate_path(const Path& path) const override;
};

class ControlCharacterRule : public ValidationRule {
public:
    std::string name() const override { return "no-control-chars"; }
    std::string description() const override {
        return "path must not contain control characters";
    }
    RuleOutcome validate(const std::string& path) const override;
    RuleOutcome validate_path(const Path& path) const override;
};

class WindowsReservedRule : public ValidationRule {
public:
    std::string name() const override { return "no-windows-reserved"; }
    std::string description() const override {
        return "path must not use Windows reserved device names";
    }
    RuleOutcome validate(const std::string& path) const override;
};

class UncPathRule : public ValidationRule {
public:
    std::string name() const override { return "no-unc-paths"; }
    std::string description() const override { return "path must not use UNC paths"; }
    RuleOutcome validate(const std::string& path) const override;
};

class DrivePathRule : public ValidationRule {
public:
    std::string name() const override { return "no-drive-paths"; }
    std::string description() const override { return "path must not use Windows drive paths"; }
    RuleOutcome validate(const std::string& path) const override;
};

class ValidUtf8Rule : public ValidationRule {
public:
    std::string name() const override { return "valid-utf8"; }
    std::string description() const override { return "path must contain valid UTF-8"; }
    RuleOutcome validate(const std::string& path) const override;
    RuleOutcome validate_path(const Path& path) const override;
};

// ============================================================================
// One-off Checks
// ============================================================================

RuleOutcome validate_exists(const std::string& path);
RuleOutcome validate_readable(const std::string& path);
RuleOutcome validate_writable(const std::string& path);
RuleOutcome validate_extension(const std::string& path, const std::vector<std::string>& extensions);

} // namespace pathguard
