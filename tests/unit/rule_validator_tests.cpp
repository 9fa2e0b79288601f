#include <doctest/doctest.h>
#include <pathguard/rule_validator.hpp>

#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace pathguard;

namespace {

bool has_rule(const std::vector<ValidationError>& errors, const std::string& rule) {
    for (const auto& e : errors) {
        if (e.rule == rule) return true;
    }
    return false;
}

// Registers another rule on its own validator the first time it runs
class SelfExtendingRule : public ValidationRule {
public:
    explicit SelfExtendingRule(RuleValidator* owner) : owner_(owner) {}

    std::string name() const override { return "self-extending"; }
    std::string description() const override { return "adds a rule while validating"; }
    RuleOutcome validate(const std::string& path) const override {
        if (extended_.exchange(true)) {
            return RuleOutcome::pass();
        }
        owner_->require_relative();
        // Nested validation on the same validator
        if (!owner_->is_valid("nested/" + path)) {
            return RuleOutcome::fail("nested validation failed");
        }
        return RuleOutcome::pass();
    }

private:
    RuleValidator* owner_;
    mutable std::atomic<bool> extended_{false};
};

class ThrowingRule : public ValidationRule {
public:
    std::string name() const override { return "throwing"; }
    std::string description() const override { return "always throws"; }
    RuleOutcome validate(const std::string&) const override {
        throw std::runtime_error("EACCES");
    }
};

} // namespace

// ============================================================================
// Rule Management
// ============================================================================

TEST_CASE("add_rule rejects null") {
    RuleValidator validator;
    auto r = validator.add_rule(nullptr);
    CHECK_FALSE(r.ok);
    CHECK(r.error == RuleError::RuleCannotBeNil);
    CHECK(r.message == "rule cannot be nil");
    CHECK(validator.rule_count() == 0);
}

TEST_CASE("remove_rule") {
    RuleValidator validator;
    validator.require_absolute().require_exists();
    REQUIRE(validator.rule_count() == 2);

    SUBCASE("removes by name") {
        auto r = validator.remove_rule("absolute-path");
        CHECK(r.ok);
        CHECK(validator.rule_count() == 1);
        CHECK(validator.rules()[0]->name() == "exists");
    }

    SUBCASE("unknown name") {
        auto r = validator.remove_rule("no-such-rule");
        CHECK_FALSE(r.ok);
        CHECK(r.error == RuleError::RuleNotFound);
        CHECK(r.message == "rule not found: \"no-such-rule\"");
        CHECK(validator.rule_count() == 2);
    }

    SUBCASE("only the first match goes") {
        validator.require_absolute();
        CHECK(validator.remove_rule("absolute-path").ok);
        CHECK(validator.rule_count() == 2);
        CHECK(validator.rules()[1]->name() == "absolute-path");
    }
}

TEST_CASE("clear_rules") {
    RuleValidator validator;
    validator.require_secure();
    CHECK(validator.rule_count() == 7);
    validator.clear_rules();
    CHECK(validator.rule_count() == 0);
    CHECK(validator.is_valid("../anything"));
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("secure rules reject a reserved device name") {
    RuleValidator validator;
    validator.require_secure();

    auto errors = validator.validate("CON.txt");
    REQUIRE_FALSE(errors.empty());
    CHECK(has_rule(errors, "no-windows-reserved"));
    for (const auto& e : errors) {
        CHECK(e.code == CODE_VALIDATION_FAILED);
        CHECK(e.path == "CON.txt");
    }
}

TEST_CASE("relative-only validator accepts a relative path") {
    RuleValidator validator;
    validator.require_relative();
    CHECK(validator.validate("relative/path").empty());
}

TEST_CASE("require_secure registers rules in a fixed order") {
    RuleValidator validator;
    validator.require_secure();
    const char* expected[] = {
        "no-path-traversal", "no-null-bytes", "no-control-chars", "no-windows-reserved",
        "no-unc-paths", "no-drive-paths", "valid-utf8",
    };
    auto rules = validator.rules();
    REQUIRE(rules.size() == 7);
    for (size_t i = 0; i < rules.size(); ++i) {
        CHECK(rules[i]->name() == expected[i]);
    }
}

TEST_CASE("every failing rule is reported in registration order") {
    RuleValidator validator;
    validator.require_absolute().require_extension({".json"}).require_max_length(4);

    auto errors = validator.validate("relative/file.txt");
    REQUIRE(errors.size() == 3);
    CHECK(errors[0].rule == "absolute-path");
    CHECK(errors[1].rule == "extension");
    CHECK(errors[2].rule == "max-length");
}

TEST_CASE("empty validator accepts anything") {
    RuleValidator validator;
    CHECK(validator.is_valid(""));
    CHECK(validator.is_valid("../../etc/passwd"));
}

TEST_CASE("validate_path checks both forms for security rules") {
    RuleValidator validator;
    validator.require_secure();

    Path p("safe/../../etc/passwd");
    auto errors = validator.validate_path(p);
    CHECK(has_rule(errors, "no-path-traversal"));

    // The string overload sees only what it is given
    CHECK(validator.is_valid("etc/passwd"));
}

TEST_CASE("builders work standalone") {
    RuleValidator validator;
    validator.require_file();
    validator.require_readable();
    CHECK(validator.rule_count() == 2);

    TempTestDir temp_dir;
    const std::string file = temp_dir.file("x.txt");
    CHECK(validator.is_valid_path(Path(file)));
    CHECK_FALSE(validator.is_valid_path(Path(temp_dir.path)));
}

TEST_CASE("convenience functions use the given validator") {
    RuleValidator validator;
    validator.forbid_pattern(R"(\.exe$)");
    CHECK(is_valid("setup.msi", validator));
    auto errors = validate("setup.exe", validator);
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].rule == "forbid-pattern");
}

TEST_CASE("a rule may call back into its own validator") {
    RuleValidator validator;
    REQUIRE(validator.add_rule(std::make_shared<SelfExtendingRule>(&validator)).ok);

    auto done = std::async(std::launch::async, [&validator] {
        return validator.validate("some/file");
    });
    REQUIRE(done.wait_for(std::chrono::seconds(5)) == std::future_status::ready);

    // The rule added mid-validation is not part of the running snapshot
    CHECK(done.get().empty());
    CHECK(validator.rule_count() == 2);
    CHECK(validator.rules()[1]->name() == "relative-path");
}

TEST_CASE("a throwing rule fails instead of escaping validate") {
    RuleValidator validator;
    validator.require_absolute();
    validator.add_rule(std::make_shared<ThrowingRule>());
    validator.require_extension({".txt"});

    std::vector<ValidationError> errors;
    CHECK_NOTHROW(errors = validator.validate("x"));
    REQUIRE(errors.size() == 3);
    CHECK(errors[0].rule == "absolute-path");
    CHECK(errors[1].rule == "throwing");
    CHECK(errors[1].message == "EACCES");
    CHECK(errors[1].code == CODE_VALIDATION_FAILED);
    CHECK(errors[2].rule == "extension");

    CHECK_NOTHROW(errors = validator.validate_path(Path("x")));
    CHECK(errors.size() == 3);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("concurrent validation and mutation") {
    RuleValidator validator;
    validator.require_secure();

    std::atomic<bool> failed{false};
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&validator, &failed] {
            for (int i = 0; i < 500; ++i) {
                auto errors = validator.validate("../etc/passwd");
                // no-path-traversal is never removed
                bool found = false;
                for (const auto& e : errors) {
                    if (e.rule == "no-path-traversal") found = true;
                }
                if (!found) failed = true;
            }
        });
    }

    threads.emplace_back([&validator] {
        for (int i = 0; i < 500; ++i) {
            validator.require_max_length(1000);
            validator.remove_rule("max-length");
        }
    });

    for (auto& th : threads) {
        th.join();
    }

    CHECK_FALSE(failed.load());
    CHECK(validator.rule_count() == 7);
}
