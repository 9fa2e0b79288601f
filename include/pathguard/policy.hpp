#pragma once

#include "pathguard/rule_validator.hpp"
#include "pathguard/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pathguard {

// ============================================================================
// Validation Policy (JSON configuration)
// ============================================================================

constexpr const char* POLICY_SCHEMA = "pathguard.policy.v1";

enum class RuleKind {
    Secure,
    Absolute,
    Relative,
    Exists,
    NotExists,
    Readable,
    Writable,
    Executable,
    Directory,
    File,
    Extension,
    MaxLength,
    RequirePattern,
    ForbidPattern,
};

const char* rule_kind_to_string(RuleKind kind);

// Parse a policy rule key (case-insensitive, '-' and '_' interchangeable)
std::optional<RuleKind> parse_rule_kind(const std::string& key);

struct RuleSpec {
    RuleKind kind = RuleKind::Secure;
    std::vector<std::string> extensions;  // Extension
    std::size_t max_length = 0;           // MaxLength
    std::string pattern;                  // RequirePattern / ForbidPattern
};

struct ValidationPolicy {
    std::string schema;
    PathOptions options;
    std::vector<RuleSpec> rules;

    // Source path for trace
    std::string source_path;
};

struct PolicyParseResult {
    bool ok = false;
    std::string error;
    ValidationPolicy policy;
    std::vector<std::string> warnings;
};

// Parse a policy from a JSON string
PolicyParseResult parse_validation_policy(const std::string& json_str,
                                          const std::string& source_path = "");

// Read and parse a policy file
PolicyParseResult load_validation_policy(const std::string& file_path);

// Append the policy's rules to a validator, in file order
void apply_policy(const ValidationPolicy& policy, RuleValidator& validator);

// Fresh validator configured from the policy
std::unique_ptr<RuleValidator> build_validator(const ValidationPolicy& policy);

} // namespace pathguard
