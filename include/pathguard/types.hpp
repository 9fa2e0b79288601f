#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace pathguard {

// ============================================================================
// Limits
// ============================================================================

// Length bound applied when PathOptions::max_length is unset
constexpr std::size_t DEFAULT_MAX_PATH_LENGTH = 4096;

// ============================================================================
// Path Options
// ============================================================================

// Options are fixed when a Path is constructed.
struct PathOptions {
    std::size_t max_length = 0;     // 0 = unset (DEFAULT_MAX_PATH_LENGTH applies)
    std::string restrict_to_base;   // empty = unset
    bool follow_symlinks = false;
    bool allow_unsafe = false;

    std::size_t effective_max_length() const {
        return max_length > 0 ? max_length : DEFAULT_MAX_PATH_LENGTH;
    }
};

// ============================================================================
// Validation Error
// ============================================================================

// One failing rule. Returned in lists, never thrown.
struct ValidationError {
    std::string path;
    std::string rule;
    std::string message;
    std::string code;
};

// Error codes carried by ValidationError::code
constexpr const char* CODE_VALIDATION_FAILED = "VALIDATION_FAILED";
constexpr const char* CODE_EMPTY_PATH = "EMPTY_PATH";
constexpr const char* CODE_UNSAFE_PATH = "UNSAFE_PATH";
constexpr const char* CODE_PATH_TOO_LONG = "PATH_TOO_LONG";
constexpr const char* CODE_OUTSIDE_BASE_PATH = "OUTSIDE_BASE_PATH";

// ============================================================================
// Rule Outcome
// ============================================================================

// Result of evaluating a single rule against a path
struct RuleOutcome {
    bool ok = true;
    std::string error;

    static RuleOutcome pass() { return {}; }
    static RuleOutcome fail(std::string message) { return {false, std::move(message)}; }
};

// ============================================================================
// Rule Registration Errors
// ============================================================================

enum class RuleError {
    None,
    RuleCannotBeNil,
    RuleNotFound,
};

inline const char* rule_error_to_string(RuleError e) {
    switch (e) {
        case RuleError::None: return "none";
        case RuleError::RuleCannotBeNil: return "rule cannot be nil";
        case RuleError::RuleNotFound: return "rule not found";
        default: return "unknown";
    }
}

struct RuleResult {
    bool ok = false;
    RuleError error = RuleError::None;
    std::string message;
};

} // namespace pathguard
