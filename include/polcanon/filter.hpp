#pragma once

#include "polcanon/document.hpp"
#include "polcanon/types.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace polcanon {

// ============================================================================
// Filter Rules
// ============================================================================

enum class RuleKind {
    Delete,         // remove the field (optionally only when empty)
    Elements,       // apply nested rules to every map in the list at path
    Members,        // apply nested rules to every map value of the map at path
    RenameKeys,     // rename map keys matching a pattern
    ReplaceValues,  // replace a scalar, or each scalar of a list, with a constant
};

inline const char* rule_kind_to_string(RuleKind k) {
    switch (k) {
        case RuleKind::Delete: return "delete";
        case RuleKind::Elements: return "elements";
        case RuleKind::Members: return "members";
        case RuleKind::RenameKeys: return "rename_keys";
        case RuleKind::ReplaceValues: return "replace_values";
        default: return "unknown";
    }
}

std::optional<RuleKind> parse_rule_kind(const std::string& s);

struct FilterRule {
    RuleKind kind = RuleKind::Delete;
    std::string path;

    // Elements / Members
    std::vector<FilterRule> nested;

    // RenameKeys: ECMAScript pattern and $n format string. ReplaceValues: replacement.
    std::string pattern;
    std::string replacement;
    std::shared_ptr<const std::regex> regex;  // null when pattern is invalid

    // Delete: keep the field unless it is empty once these values are ignored.
    bool only_if_empty = false;
    std::vector<Value> ignore_values;
};

// Rule builders
FilterRule delete_rule(const std::string& path);
FilterRule delete_if_empty_rule(const std::string& path, std::vector<Value> ignore_values = {});
FilterRule elements_rule(const std::string& path, std::vector<FilterRule> nested);
FilterRule members_rule(const std::string& path, std::vector<FilterRule> nested);
FilterRule rename_keys_rule(const std::string& path, const std::string& pattern,
                            const std::string& replacement);
FilterRule replace_values_rule(const std::string& path, const std::string& replacement);

// ============================================================================
// Rule Application
// ============================================================================

struct ApplyResult {
    bool ok = true;
    std::string error;
};

// Apply rules in order. Missing paths are skipped; a value of the wrong kind
// at a rule's path is an error and leaves the document partially filtered.
ApplyResult apply_rules(Document& doc, const std::vector<FilterRule>& rules);

// Empty means null, an empty map, an empty list, or a list holding only
// ignorable values.
bool is_empty_value(const Value& v, const std::vector<Value>& ignore_values);

// ============================================================================
// Policy Rule Table
// ============================================================================

// Longer keys are left as they are by RenameKeys rules.
constexpr size_t MAX_RENAMED_KEY_LENGTH = 1024;

// Placeholder for permission keys stored under a random identifier.
constexpr const char* PERMISSIONS_KEY_PLACEHOLDER = "uuid-for-permissions-on-related-indices";

// Placeholder for exporter endpoints, which depend on the deployment.
constexpr const char* ENDPOINT_PLACEHOLDER = "https://elasticsearch:9200";

// Fields of a downloaded agent policy that are generated by the stack and are
// not relevant when comparing against a fixture.
const std::vector<FilterRule>& policy_rule_table();

// Machine readable dump of a rule list.
Value rules_to_json(const std::vector<FilterRule>& rules);

} // namespace polcanon
