#include "polcanon/canonical.hpp"
#include "polcanon/document.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace polcanon {

CanonicalResult canonicalize(const std::string& policy) {
    return canonicalize(policy, policy_rule_table());
}

CanonicalResult canonicalize(const std::string& policy, const std::vector<FilterRule>& rules) {
    CanonicalResult result;

    try {
        // Bring the text into the serializer's block layout first, so that
        // flow-style sections are seen by the identifier pass the same way
        // on every run.
        auto source = parse_document(policy);
        if (!source.ok) {
            result.error = "failed to decode policy: " + source.error;
            return result;
        }

        auto ids = canonicalize_component_ids(serialize_document(source.value));
        result.identities = std::move(ids.identities);

        auto parsed = parse_document(ids.text);
        if (!parsed.ok) {
            result.error = "failed to decode policy: " + parsed.error;
            return result;
        }

        auto applied = apply_rules(parsed.value, rules);
        if (!applied.ok) {
            result.error = applied.error;
            return result;
        }

        result.value = serialize_document(parsed.value);
        result.ok = true;
    } catch (const std::exception& e) {
        result.error = e.what();
    }

    if (!result.ok) {
        spdlog::debug("canonicalization failed: {}", result.error);
    }
    return result;
}

} // namespace polcanon
