#include "pathguard/rule_validator.hpp"

#include <memory>
#include <exception>
#include <mutex>
#include <shared_mutex>
#include <utility>

#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

ValidationError make_error(const std::string& path, const ValidationRule& rule,
                           const RuleOutcome& outcome) {
    return ValidationError{path, rule.name(), outcome.error, CODE_VALIDATION_FAILED};
}

// Rules run without the validator's lock held, so a rule may use its own
// validator. An exception from a rule becomes that rule's failure.
template <typename Fn>
RuleOutcome run_rule(const ValidationRule& rule, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        spdlog::warn("rule {} threw: {}", rule.name(), e.what());
        return RuleOutcome::fail(e.what());
    }
}

} // namespace

// ============================================================================
// Rule Management
// ============================================================================

RuleResult RuleValidator::add_rule(RulePtr rule) {
    RuleResult result;
    if (!rule) {
        result.error = RuleError::RuleCannotBeNil;
        result.message = rule_error_to_string(RuleError::RuleCannotBeNil);
        return result;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    rules_.push_back(std::move(rule));
    result.ok = true;
    return result;
}

RuleResult RuleValidator::remove_rule(const std::string& name) {
    RuleResult result;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = rules_.begin(); it != rules_.end(); ++it) {
        if ((*it)->name() == name) {
            rules_.erase(it);
            result.ok = true;
            return result;
        }
    }

    result.error = RuleError::RuleNotFound;
    result.message = std::string(rule_error_to_string(RuleError::RuleNotFound)) + ": \"" +
                     name + "\"";
    return result;
}

void RuleValidator::clear_rules() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rules_.clear();
}

std::vector<RulePtr> RuleValidator::rules() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rules_;
}

std::size_t RuleValidator::rule_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rules_.size();
}

// ============================================================================
// Validation
// ============================================================================

std::vector<ValidationError> RuleValidator::validate(const std::string& path) const {
    std::vector<ValidationError> errors;
    for (const auto& rule : rules()) {
        auto outcome = run_rule(*rule, [&] { return rule->validate(path); });
        if (!outcome.ok) {
            errors.push_back(make_error(path, *rule, outcome));
        }
    }
    return errors;
}

std::vector<ValidationError> RuleValidator::validate_path(const Path& path) const {
    std::vector<ValidationError> errors;
    for (const auto& rule : rules()) {
        auto outcome = run_rule(*rule, [&] { return rule->validate_path(path); });
        if (!outcome.ok) {
            errors.push_back(make_error(path.string(), *rule, outcome));
        }
    }
    return errors;
}

// ============================================================================
// Builders
// ============================================================================

RuleValidator& RuleValidator::add_builtin(RulePtr rule) {
    const std::string name = rule ? rule->name() : "<null>";
    auto result = add_rule(std::move(rule));
    if (!result.ok) {
        spdlog::warn("failed to add {} rule: {}", name, result.message);
    }
    return *this;
}

RuleValidator& RuleValidator::require_absolute() {
    return add_builtin(std::make_shared<AbsolutePathRule>());
}

RuleValidator& RuleValidator::require_relative() {
    return add_builtin(std::make_shared<RelativePathRule>());
}

RuleValidator& RuleValidator::require_exists() {
    return add_builtin(std::make_shared<ExistsRule>());
}

RuleValidator& RuleValidator::require_not_exists() {
    return add_builtin(std::make_shared<NotExistsRule>());
}

RuleValidator& RuleValidator::require_readable() {
    return add_builtin(std::make_shared<ReadableRule>());
}

RuleValidator& RuleValidator::require_writable() {
    return add_builtin(std::make_shared<WritableRule>());
}

RuleValidator& RuleValidator::require_executable() {
    return add_builtin(std::make_shared<ExecutableRule>());
}

RuleValidator& RuleValidator::require_directory() {
    return add_builtin(std::make_shared<DirectoryRule>());
}

RuleValidator& RuleValidator::require_file() {
    return add_builtin(std::make_shared<FileRule>());
}

RuleValidator& RuleValidator::require_extension(std::vector<std::string> extensions) {
    return add_builtin(std::make_shared<ExtensionRule>(std::move(extensions)));
}

RuleValidator& RuleValidator::require_max_length(std::size_t max_length) {
    return add_builtin(std::make_shared<MaxLengthRule>(max_length));
}

RuleValidator& RuleValidator::require_pattern(const std::string& pattern) {
    return add_builtin(std::make_shared<PatternRule>(pattern, true));
}

RuleValidator& RuleValidator::forbid_pattern(const std::string& pattern) {
    return add_builtin(std::make_shared<PatternRule>(pattern, false));
}

RuleValidator& RuleValidator::require_secure() {
    add_builtin(std::make_shared<PathTraversalRule>());
    add_builtin(std::make_shared<NullByteRule>());
    add_builtin(std::make_shared<ControlCharacterRule>());
    add_builtin(std::make_shared<WindowsReservedRule>());
    add_builtin(std::make_shared<UncPathRule>());
    add_builtin(std::make_shared<DrivePathRule>());
    add_builtin(std::make_shared<ValidUtf8Rule>());
    return *this;
}

// ============================================================================
// Convenience
// ============================================================================

std::vector<ValidationError> validate(const std::string& path, const RuleValidator& validator) {
    return validator.validate(path);
}

bool is_valid(const std::string& path, const RuleValidator& validator) {
    return validator.is_valid(path);
}

} // namespace pathguard
