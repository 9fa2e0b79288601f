#include <doctest/doctest.h>
#include <pathguard/policy.hpp>

#include "test_helpers.hpp"

#include <string>

using namespace pathguard;

TEST_CASE("parse a complete policy") {
    const std::string json = R"({
        "$schema": "pathguard.policy.v1",
        "options": {
            "max_length": 256,
            "restrict_to_base": "/srv/uploads",
            "follow_symlinks": true,
            "allow_unsafe": false
        },
        "rules": [
            "secure",
            "relative",
            {"extension": [".png", ".jpg"]},
            {"max_length": 128},
            {"forbid_pattern": "\\.php$"}
        ]
    })";

    auto result = parse_validation_policy(json, "uploads.json");
    REQUIRE(result.ok);
    CHECK(result.warnings.empty());

    const auto& policy = result.policy;
    CHECK(policy.schema == POLICY_SCHEMA);
    CHECK(policy.source_path == "uploads.json");
    CHECK(policy.options.max_length == 256);
    CHECK(policy.options.restrict_to_base == "/srv/uploads");
    CHECK(policy.options.follow_symlinks);
    CHECK_FALSE(policy.options.allow_unsafe);

    REQUIRE(policy.rules.size() == 5);
    CHECK(policy.rules[0].kind == RuleKind::Secure);
    CHECK(policy.rules[1].kind == RuleKind::Relative);
    CHECK(policy.rules[2].kind == RuleKind::Extension);
    CHECK(policy.rules[2].extensions == std::vector<std::string>{".png", ".jpg"});
    CHECK(policy.rules[3].kind == RuleKind::MaxLength);
    CHECK(policy.rules[3].max_length == 128);
    CHECK(policy.rules[4].kind == RuleKind::ForbidPattern);
    CHECK(policy.rules[4].pattern == "\\.php$");
}

TEST_CASE("build a validator from a policy") {
    auto result = parse_validation_policy(R"({
        "$schema": "pathguard.policy.v1",
        "rules": ["secure", "relative", {"extension": ".png"}, {"forbid_pattern": "^tmp/"}]
    })");
    REQUIRE(result.ok);

    auto validator = build_validator(result.policy);
    REQUIRE(validator);
    CHECK(validator->rule_count() == 10);
    CHECK(validator->is_valid("images/cat.png"));
    CHECK_FALSE(validator->is_valid("/images/cat.png"));
    CHECK_FALSE(validator->is_valid("images/cat.gif"));
    CHECK_FALSE(validator->is_valid("tmp/cat.png"));
    CHECK_FALSE(validator->is_valid("CON.png"));
}

TEST_CASE("apply_policy appends to an existing validator") {
    RuleValidator validator;
    validator.require_absolute();

    ValidationPolicy policy;
    RuleSpec spec;
    spec.kind = RuleKind::NotExists;
    policy.rules.push_back(spec);

    apply_policy(policy, validator);
    auto rules = validator.rules();
    REQUIRE(rules.size() == 2);
    CHECK(rules[0]->name() == "absolute-path");
    CHECK(rules[1]->name() == "not-exists");
}

TEST_CASE("rule keys accept dashes and any case") {
    CHECK(parse_rule_kind("not-exists") == RuleKind::NotExists);
    CHECK(parse_rule_kind("NOT_EXISTS") == RuleKind::NotExists);
    CHECK(parse_rule_kind(" Require-Pattern ") == RuleKind::RequirePattern);
    CHECK_FALSE(parse_rule_kind("sometimes").has_value());
    CHECK(std::string(rule_kind_to_string(RuleKind::MaxLength)) == "max_length");
}

TEST_CASE("flag rules may be written as objects") {
    auto result = parse_validation_policy(R"({
        "$schema": "pathguard.policy.v1",
        "rules": [{"exists": true}, {"directory": false}]
    })");
    REQUIRE(result.ok);
    REQUIRE(result.policy.rules.size() == 1);
    CHECK(result.policy.rules[0].kind == RuleKind::Exists);
    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0] == "invalid_configuration:invalid_argument:rules[1]");
}

TEST_CASE("bad rule entries are skipped with warnings") {
    auto result = parse_validation_policy(R"({
        "$schema": "pathguard.policy.v1",
        "options": {"max_length": -3},
        "rules": [
            "frobnicate",
            "extension",
            {"max_length": "long"},
            {"a": 1, "b": 2},
            42,
            "file"
        ]
    })");
    REQUIRE(result.ok);
    REQUIRE(result.policy.rules.size() == 1);
    CHECK(result.policy.rules[0].kind == RuleKind::File);
    CHECK(result.policy.options.max_length == 0);

    REQUIRE(result.warnings.size() == 6);
    CHECK(result.warnings[0] == "invalid_configuration:invalid_option:max_length");
    CHECK(result.warnings[1] == "invalid_configuration:unknown_rule:frobnicate");
    CHECK(result.warnings[2] == "invalid_configuration:missing_argument:rules[1]");
    CHECK(result.warnings[3] == "invalid_configuration:invalid_argument:rules[2]");
    CHECK(result.warnings[4] == "invalid_configuration:malformed_rule:rules[3]");
    CHECK(result.warnings[5] == "invalid_configuration:malformed_rule:rules[4]");
}

TEST_CASE("mistyped options are skipped with warnings") {
    auto result = parse_validation_policy(R"({
        "$schema": "pathguard.policy.v1",
        "options": {
            "max_length": 64,
            "restrict_to_base": 7,
            "follow_symlinks": "yes",
            "allow_unsafe": 1
        }
    })");
    REQUIRE(result.ok);
    CHECK(result.policy.options.max_length == 64);
    CHECK(result.policy.options.restrict_to_base.empty());
    CHECK_FALSE(result.policy.options.follow_symlinks);
    CHECK_FALSE(result.policy.options.allow_unsafe);

    REQUIRE(result.warnings.size() == 3);
    CHECK(result.warnings[0] == "invalid_configuration:invalid_option:restrict_to_base");
    CHECK(result.warnings[1] == "invalid_configuration:invalid_option:follow_symlinks");
    CHECK(result.warnings[2] == "invalid_configuration:invalid_option:allow_unsafe");
}

TEST_CASE("hard errors") {
    SUBCASE("malformed JSON") {
        auto result = parse_validation_policy("{ not json");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("JSON parse error") == 0);
    }

    SUBCASE("not an object") {
        auto result = parse_validation_policy("[1, 2, 3]");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "JSON must be an object");
    }

    SUBCASE("missing schema") {
        auto result = parse_validation_policy(R"({"rules": []})");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "$schema missing");
    }

    SUBCASE("wrong schema") {
        auto result = parse_validation_policy(R"({"$schema": "pathguard.policy.v2"})");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("$schema mismatch") == 0);
    }

    SUBCASE("rules not an array") {
        auto result = parse_validation_policy(
            R"({"$schema": "pathguard.policy.v1", "rules": "secure"})");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "rules must be an array");
    }

    SUBCASE("options not an object") {
        auto result = parse_validation_policy(
            R"({"$schema": "pathguard.policy.v1", "options": []})");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "options must be an object");
    }
}

TEST_CASE("load_validation_policy reads a file") {
    TempTestDir temp_dir;
    const std::string file = temp_dir.file(
        "policy.json", R"({"$schema": "pathguard.policy.v1", "rules": ["absolute"]})");

    auto result = load_validation_policy(file);
    REQUIRE(result.ok);
    CHECK(result.policy.source_path == file);
    REQUIRE(result.policy.rules.size() == 1);
    CHECK(result.policy.rules[0].kind == RuleKind::Absolute);

    auto missing = load_validation_policy(temp_dir.path + "/missing.json");
    CHECK_FALSE(missing.ok);
    CHECK(missing.error.find("cannot open policy file") == 0);
}
