#include "polcanon/filter.hpp"

#include <algorithm>
#include <regex>
#include <utility>

#include <spdlog/spdlog.h>

namespace polcanon {

namespace {

std::string shape_error(const FilterRule& rule, const std::string& expected, const Value& found) {
    return rule.path + ": expected " + expected + ", found " + kind_name(found);
}

ApplyResult fail(std::string error) {
    ApplyResult result;
    result.ok = false;
    result.error = std::move(error);
    return result;
}

ApplyResult clean_map(Value& map, const std::vector<FilterRule>& rules) {
    Document doc(std::move(map));
    ApplyResult result = apply_rules(doc, rules);
    map = std::move(doc.root());
    return result;
}

ApplyResult apply_elements(Value& list, const FilterRule& rule) {
    if (!list.is_array()) {
        return fail(shape_error(rule, "list", list));
    }

    Value cleaned = Value::array();
    for (size_t i = 0; i < list.size(); ++i) {
        if (!list[i].is_object()) {
            return fail(rule.path + ": expected map in list element " + std::to_string(i) +
                        ", found " + kind_name(list[i]));
        }
        Value element = list[i];
        auto result = clean_map(element, rule.nested);
        if (!result.ok) {
            return result;
        }
        cleaned.push_back(std::move(element));
    }
    list = std::move(cleaned);
    return {};
}

ApplyResult apply_members(Value& map, const FilterRule& rule) {
    if (map.is_null()) {
        return {};
    }
    if (!map.is_object()) {
        return fail(shape_error(rule, "map", map));
    }

    for (auto it = map.begin(); it != map.end(); ++it) {
        Value& member = it.value();
        if (member.is_null()) {
            continue;
        }
        if (!member.is_object()) {
            return fail(rule.path + "." + it.key() + ": expected map, found " + kind_name(member));
        }
        auto result = clean_map(member, rule.nested);
        if (!result.ok) {
            return result;
        }
    }
    return {};
}

ApplyResult apply_rename_keys(Value& map, const FilterRule& rule) {
    if (!map.is_object()) {
        return fail(shape_error(rule, "map", map));
    }
    if (!rule.regex) {
        return fail(rule.path + ": invalid key pattern '" + rule.pattern + "'");
    }

    std::vector<std::string> keys;
    for (auto it = map.begin(); it != map.end(); ++it) {
        keys.push_back(it.key());
    }
    std::sort(keys.begin(), keys.end(), natural_less);

    std::vector<std::pair<std::string, Value>> renamed;
    for (const auto& key : keys) {
        if (key.size() > MAX_RENAMED_KEY_LENGTH) {
            spdlog::warn("{}: key of {} characters not matched against '{}'", rule.path, key.size(),
                         rule.pattern);
            continue;
        }
        if (!std::regex_search(key, *rule.regex)) {
            continue;
        }
        std::string new_key = std::regex_replace(key, *rule.regex, rule.replacement);
        renamed.emplace_back(new_key, std::move(map[key]));
        map.erase(key);
    }

    for (auto& [key, value] : renamed) {
        if (map.find(key) != map.end()) {
            spdlog::warn("{}: several keys renamed to '{}', keeping the first", rule.path, key);
            continue;
        }
        map[key] = std::move(value);
    }
    return {};
}

ApplyResult apply_replace_values(Value& value, const FilterRule& rule) {
    if (value.is_array()) {
        for (size_t i = 0; i < value.size(); ++i) {
            if (!is_scalar(value[i])) {
                return fail(rule.path + ": expected scalar in list element " + std::to_string(i) +
                            ", found " + kind_name(value[i]));
            }
            value[i] = rule.replacement;
        }
        return {};
    }
    if (value.is_object()) {
        return fail(shape_error(rule, "scalar or list", value));
    }
    value = rule.replacement;
    return {};
}

ApplyResult apply_rule(Document& doc, const FilterRule& rule) {
    PathError error = PathError::None;
    std::string message;
    Value* value = doc.find(rule.path, error, message);

    if (error == PathError::NotFound) {
        return {};
    }
    if (error != PathError::None) {
        return fail(message);
    }

    switch (rule.kind) {
        case RuleKind::Elements:
            return apply_elements(*value, rule);
        case RuleKind::Members:
            return apply_members(*value, rule);
        case RuleKind::RenameKeys:
            return apply_rename_keys(*value, rule);
        case RuleKind::ReplaceValues:
            return apply_replace_values(*value, rule);
        case RuleKind::Delete:
        default: {
            if (rule.only_if_empty && !is_empty_value(*value, rule.ignore_values)) {
                return {};
            }
            auto removed = doc.remove(rule.path);
            if (!removed.ok) {
                return fail(removed.message);
            }
            return {};
        }
    }
}

} // namespace

std::optional<RuleKind> parse_rule_kind(const std::string& s) {
    if (s == "delete") return RuleKind::Delete;
    if (s == "elements") return RuleKind::Elements;
    if (s == "members") return RuleKind::Members;
    if (s == "rename_keys") return RuleKind::RenameKeys;
    if (s == "replace_values") return RuleKind::ReplaceValues;
    return std::nullopt;
}

FilterRule delete_rule(const std::string& path) {
    FilterRule rule;
    rule.kind = RuleKind::Delete;
    rule.path = path;
    return rule;
}

FilterRule delete_if_empty_rule(const std::string& path, std::vector<Value> ignore_values) {
    FilterRule rule = delete_rule(path);
    rule.only_if_empty = true;
    rule.ignore_values = std::move(ignore_values);
    return rule;
}

FilterRule elements_rule(const std::string& path, std::vector<FilterRule> nested) {
    FilterRule rule;
    rule.kind = RuleKind::Elements;
    rule.path = path;
    rule.nested = std::move(nested);
    return rule;
}

FilterRule members_rule(const std::string& path, std::vector<FilterRule> nested) {
    FilterRule rule;
    rule.kind = RuleKind::Members;
    rule.path = path;
    rule.nested = std::move(nested);
    return rule;
}

FilterRule rename_keys_rule(const std::string& path, const std::string& pattern,
                            const std::string& replacement) {
    FilterRule rule;
    rule.kind = RuleKind::RenameKeys;
    rule.path = path;
    rule.pattern = pattern;
    rule.replacement = replacement;
    try {
        rule.regex = std::make_shared<const std::regex>(pattern);
    } catch (const std::regex_error& e) {
        spdlog::error("{}: invalid key pattern '{}': {}", path, pattern, e.what());
    }
    return rule;
}

FilterRule replace_values_rule(const std::string& path, const std::string& replacement) {
    FilterRule rule;
    rule.kind = RuleKind::ReplaceValues;
    rule.path = path;
    rule.replacement = replacement;
    return rule;
}

ApplyResult apply_rules(Document& doc, const std::vector<FilterRule>& rules) {
    for (const auto& rule : rules) {
        auto result = apply_rule(doc, rule);
        if (!result.ok) {
            return result;
        }
    }
    return {};
}

bool is_empty_value(const Value& v, const std::vector<Value>& ignore_values) {
    if (v.is_null()) {
        return true;
    }
    if (v.is_object()) {
        return v.empty();
    }
    if (v.is_array()) {
        return std::all_of(v.begin(), v.end(), [&](const Value& element) {
            return std::find(ignore_values.begin(), ignore_values.end(), element) != ignore_values.end();
        });
    }
    return false;
}

const std::vector<FilterRule>& policy_rule_table() {
    static const std::vector<FilterRule> rules = {
        // IDs are not relevant.
        delete_rule("id"),
        elements_rule("inputs", {
            delete_rule("id"),
            delete_rule("package_policy_id"),
            elements_rule("streams", {
                delete_rule("id"),
            }),
        }),
        elements_rule("secret_references", {
            delete_rule("id"),
        }),

        // Avoid regenerating fixtures every time the package version changes.
        elements_rule("inputs", {
            delete_rule("meta.package.version"),
        }),

        delete_rule("revision"),
        elements_rule("inputs", {
            delete_rule("revision"),
        }),

        // Depend on the deployment.
        delete_rule("agent"),
        delete_rule("fleet"),
        delete_rule("outputs"),

        // Signatures change from installation to installation.
        delete_rule("agent.protection.uninstall_token_hash"),
        delete_rule("agent.protection.signing_key"),
        delete_rule("signed"),

        // Permissions for related indices are stored under a random UUID.
        rename_keys_rule("output_permissions.default",
                         "^[a-z0-9]{4,}(-[a-z0-9]{4,})+$",
                         PERMISSIONS_KEY_PLACEHOLDER),

        // Older stacks do not send namespaces.
        delete_if_empty_rule("namespaces", {Value("default")}),

        // Set by Fleet in input packages starting on 9.1.0.
        elements_rule("inputs", {
            elements_rule("streams", {
                delete_rule("data_stream.type"),
                delete_rule("data_stream.elasticsearch.dynamic_dataset"),
                delete_rule("data_stream.elasticsearch.dynamic_namespace"),
                delete_if_empty_rule("data_stream.elasticsearch"),
            }),
        }),

        // Exporter endpoints point to the deployment under test.
        members_rule("exporters", {
            replace_values_rule("endpoints", ENDPOINT_PLACEHOLDER),
        }),
    };
    return rules;
}

Value rules_to_json(const std::vector<FilterRule>& rules) {
    Value out = Value::array();
    for (const auto& rule : rules) {
        Value j;
        j["kind"] = rule_kind_to_string(rule.kind);
        j["path"] = rule.path;
        switch (rule.kind) {
            case RuleKind::Elements:
            case RuleKind::Members:
                j["rules"] = rules_to_json(rule.nested);
                break;
            case RuleKind::RenameKeys:
                j["pattern"] = rule.pattern;
                j["replacement"] = rule.replacement;
                break;
            case RuleKind::ReplaceValues:
                j["replacement"] = rule.replacement;
                break;
            case RuleKind::Delete:
            default:
                if (rule.only_if_empty) {
                    j["only_if_empty"] = true;
                    j["ignore_values"] = rule.ignore_values;
                }
                break;
        }
        out.push_back(std::move(j));
    }
    return out;
}

} // namespace polcanon
