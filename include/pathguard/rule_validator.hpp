#pragma once

#include "pathguard/path.hpp"
#include "pathguard/rules.hpp"
#include "pathguard/types.hpp"

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <vector>

namespace pathguard {

// ============================================================================
// Rule Validator
// ============================================================================

// An ordered collection of rules. Validation runs every rule (no
// short-circuit) and reports failures in registration order.
//
// Validations may run concurrently; add/remove/clear are serialized against
// each other. A validation works on a snapshot of the rule list taken when it
// starts, and runs the rules without holding the lock, so a rule may call
// back into its own validator. A rule that throws fails with the exception's
// message; validate() itself never throws.
class RuleValidator {
public:
    RuleValidator() = default;

    RuleValidator(const RuleValidator&) = delete;
    RuleValidator& operator=(const RuleValidator&) = delete;

    // Fails with RuleCannotBeNil for an empty pointer
    RuleResult add_rule(RulePtr rule);

    // Removes the first rule with this exact name; RuleNotFound otherwise
    RuleResult remove_rule(const std::string& name);

    void clear_rules();

    // Snapshot in registration order
    std::vector<RulePtr> rules() const;
    std::size_t rule_count() const;

    std::vector<ValidationError> validate(const std::string& path) const;
    std::vector<ValidationError> validate_path(const Path& path) const;

    bool is_valid(const std::string& path) const { return validate(path).empty(); }
    bool is_valid_path(const Path& path) const { return validate_path(path).empty(); }

    // ------------------------------------------------------------------------
    // Builders. Each appends one built-in rule and returns *this; chaining is
    // optional.
    // ------------------------------------------------------------------------

    RuleValidator& require_absolute();
    RuleValidator& require_relative();
    RuleValidator& require_exists();
    RuleValidator& require_not_exists();
    RuleValidator& require_readable();
    RuleValidator& require_writable();
    RuleValidator& require_executable();
    RuleValidator& require_directory();
    RuleValidator& require_file();
    RuleValidator& require_extension(std::vector<std::string> extensions);
    RuleValidator& require_max_length(std::size_t max_length);
    RuleValidator& require_pattern(const std::string& pattern);
    RuleValidator& forbid_pattern(const std::string& pattern);

    // Appends, in order: no-path-traversal, no-null-bytes, no-control-chars,
    // no-windows-reserved, no-unc-paths, no-drive-paths, valid-utf8
    RuleValidator& require_secure();

private:
    RuleValidator& add_builtin(RulePtr rule);

    mutable std::shared_mutex mutex_;
    std::vector<RulePtr> rules_;
};

// ============================================================================
// Convenience (explicit validator, no global default)
// ============================================================================

std::vector<ValidationError> validate(const std::string& path, const RuleValidator& validator);
bool is_valid(const std::string& path, const RuleValidator& validator);

} // namespace pathguard
