#include "pathguard/policy.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

std::string normalize_key(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<bool> get_bool(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

std::optional<std::size_t> get_size(const nlohmann::json& j) {
    if (j.is_number_unsigned()) {
        return j.get<std::size_t>();
    }
    if (j.is_number_integer() && j.get<long long>() >= 0) {
        return static_cast<std::size_t>(j.get<long long>());
    }
    return std::nullopt;
}

void add_warning(PolicyParseResult& result, const std::string& detail) {
    spdlog::warn("policy {}: skipping {}", result.policy.source_path.empty()
                                               ? "<inline>"
                                               : result.policy.source_path,
                 detail);
    result.warnings.push_back("invalid_configuration:" + detail);
}

bool takes_argument(RuleKind kind) {
    return kind == RuleKind::Extension || kind == RuleKind::MaxLength ||
           kind == RuleKind::RequirePattern || kind == RuleKind::ForbidPattern;
}

// Parse the argument of {"<kind>": <value>} entries
std::optional<RuleSpec> parse_rule_argument(RuleKind kind, const nlohmann::json& value) {
    RuleSpec spec;
    spec.kind = kind;

    switch (kind) {
        case RuleKind::Extension:
            if (value.is_string()) {
                spec.extensions.push_back(value.get<std::string>());
                return spec;
            }
            if (value.is_array()) {
                for (const auto& elem : value) {
                    if (!elem.is_string()) return std::nullopt;
                    spec.extensions.push_back(elem.get<std::string>());
                }
                return spec;
            }
            return std::nullopt;

        case RuleKind::MaxLength:
            if (auto n = get_size(value)) {
                spec.max_length = *n;
                return spec;
            }
            return std::nullopt;

        case RuleKind::RequirePattern:
        case RuleKind::ForbidPattern:
            if (value.is_string()) {
                spec.pattern = value.get<std::string>();
                return spec;
            }
            return std::nullopt;

        default:
            // Flag rules accept `true` as a value: {"exists": true}
            if (value.is_boolean() && value.get<bool>()) {
                return spec;
            }
            return std::nullopt;
    }
}

void parse_rules(const nlohmann::json& rules, PolicyParseResult& result) {
    for (size_t i = 0; i < rules.size(); ++i) {
        const auto& entry = rules[i];
        const std::string where = "rules[" + std::to_string(i) + "]";

        if (entry.is_string()) {
            auto kind = parse_rule_kind(entry.get<std::string>());
            if (!kind) {
                add_warning(result, "unknown_rule:" + entry.get<std::string>());
                continue;
            }
            if (takes_argument(*kind)) {
                add_warning(result, "missing_argument:" + where);
                continue;
            }
            RuleSpec spec;
            spec.kind = *kind;
            result.policy.rules.push_back(spec);
            continue;
        }

        if (entry.is_object() && entry.size() == 1) {
            auto it = entry.begin();
            auto kind = parse_rule_kind(it.key());
            if (!kind) {
                add_warning(result, "unknown_rule:" + it.key());
                continue;
            }
            auto spec = parse_rule_argument(*kind, it.value());
            if (!spec) {
                add_warning(result, "invalid_argument:" + where);
                continue;
            }
            result.policy.rules.push_back(*spec);
            continue;
        }

        add_warning(result, "malformed_rule:" + where);
    }
}

} // namespace

// ============================================================================
// Rule Kinds
// ============================================================================

const char* rule_kind_to_string(RuleKind kind) {
    switch (kind) {
        case RuleKind::Secure: return "secure";
        case RuleKind::Absolute: return "absolute";
        case RuleKind::Relative: return "relative";
        case RuleKind::Exists: return "exists";
        case RuleKind::NotExists: return "not_exists";
        case RuleKind::Readable: return "readable";
        case RuleKind::Writable: return "writable";
        case RuleKind::Executable: return "executable";
        case RuleKind::Directory: return "directory";
        case RuleKind::File: return "file";
        case RuleKind::Extension: return "extension";
        case RuleKind::MaxLength: return "max_length";
        case RuleKind::RequirePattern: return "require_pattern";
        case RuleKind::ForbidPattern: return "forbid_pattern";
        default: return "unknown";
    }
}

std::optional<RuleKind> parse_rule_kind(const std::string& key) {
    const std::string k = normalize_key(trim(key));
    if (k == "secure") return RuleKind::Secure;
    if (k == "absolute") return RuleKind::Absolute;
    if (k == "relative") return RuleKind::Relative;
    if (k == "exists") return RuleKind::Exists;
    if (k == "not_exists") return RuleKind::NotExists;
    if (k == "readable") return RuleKind::Readable;
    if (k == "writable") return RuleKind::Writable;
    if (k == "executable") return RuleKind::Executable;
    if (k == "directory") return RuleKind::Directory;
    if (k == "file") return RuleKind::File;
    if (k == "extension") return RuleKind::Extension;
    if (k == "max_length") return RuleKind::MaxLength;
    if (k == "require_pattern") return RuleKind::RequirePattern;
    if (k == "forbid_pattern") return RuleKind::ForbidPattern;
    return std::nullopt;
}

// ============================================================================
// Policy Parsing
// ============================================================================

PolicyParseResult parse_validation_policy(const std::string& json_str,
                                          const std::string& source_path) {
    PolicyParseResult result;
    result.policy.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.policy.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.policy.schema != POLICY_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + POLICY_SCHEMA;
            return result;
        }

        // "options" section
        if (j.contains("options")) {
            const auto& opts = j["options"];
            if (!opts.is_object()) {
                result.error = "options must be an object";
                return result;
            }

            if (opts.contains("max_length")) {
                if (auto n = get_size(opts["max_length"])) {
                    result.policy.options.max_length = *n;
                } else {
                    add_warning(result, "invalid_option:max_length");
                }
            }
            if (opts.contains("restrict_to_base")) {
                if (auto base = get_string(opts, "restrict_to_base")) {
                    result.policy.options.restrict_to_base = *base;
                } else {
                    add_warning(result, "invalid_option:restrict_to_base");
                }
            }
            if (opts.contains("follow_symlinks")) {
                if (auto follow = get_bool(opts, "follow_symlinks")) {
                    result.policy.options.follow_symlinks = *follow;
                } else {
                    add_warning(result, "invalid_option:follow_symlinks");
                }
            }
            if (opts.contains("allow_unsafe")) {
                if (auto unsafe = get_bool(opts, "allow_unsafe")) {
                    result.policy.options.allow_unsafe = *unsafe;
                } else {
                    add_warning(result, "invalid_option:allow_unsafe");
                }
            }
        }

        // "rules" section
        if (j.contains("rules")) {
            if (!j["rules"].is_array()) {
                result.error = "rules must be an array";
                return result;
            }
            parse_rules(j["rules"], result);
        }

        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

PolicyParseResult load_validation_policy(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file) {
        PolicyParseResult result;
        result.policy.source_path = file_path;
        result.error = "cannot open policy file: " + file_path;
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_validation_policy(buffer.str(), file_path);
}

// ============================================================================
// Validator Construction
// ============================================================================

void apply_policy(const ValidationPolicy& policy, RuleValidator& validator) {
    for (const auto& spec : policy.rules) {
        switch (spec.kind) {
            case RuleKind::Secure: validator.require_secure(); break;
            case RuleKind::Absolute: validator.require_absolute(); break;
            case RuleKind::Relative: validator.require_relative(); break;
            case RuleKind::Exists: validator.require_exists(); break;
            case RuleKind::NotExists: validator.require_not_exists(); break;
            case RuleKind::Readable: validator.require_readable(); break;
            case RuleKind::Writable: validator.require_writable(); break;
            case RuleKind::Executable: validator.require_executable(); break;
            case RuleKind::Directory: validator.require_directory(); break;
            case RuleKind::File: validator.require_file(); break;
            case RuleKind::Extension: validator.require_extension(spec.extensions); break;
            case RuleKind::MaxLength: validator.require_max_length(spec.max_length); break;
            case RuleKind::RequirePattern: validator.require_pattern(spec.pattern); break;
            case RuleKind::ForbidPattern: validator.forbid_pattern(spec.pattern); break;
        }
    }
}

std::unique_ptr<RuleValidator> build_validator(const ValidationPolicy& policy) {
    auto validator = std::make_unique<RuleValidator>();
    apply_policy(policy, *validator);
    return validator;
}

} // namespace pathguard
