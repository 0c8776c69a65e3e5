#pragma once

#include "polcanon/component_ids.hpp"
#include "polcanon/filter.hpp"

#include <string>
#include <vector>

namespace polcanon {

// ============================================================================
// Canonical Form
// ============================================================================

struct CanonicalResult {
    bool ok = false;
    std::string error;
    std::string value;       // canonical YAML, ends in a single newline
    IdentityMap identities;  // component identifiers rewritten on the way
};

// Reduce a policy to the form used for fixture comparison:
//   1. the text is parsed and written back in block layout
//   2. component identifiers are renamed to positional placeholders, and
//      the text is parsed again into a tree
//   3. the policy rule table drops and normalizes stack generated fields
//   4. the tree is serialized with sorted keys
//
// Two policies that differ only in the fields covered by the rule table, in
// component instance suffixes, or in map key order produce identical bytes.
// The result is itself a fixed point: canonicalize(canonicalize(x)) == canonicalize(x).
CanonicalResult canonicalize(const std::string& policy);

// Same pipeline with a caller supplied rule list.
CanonicalResult canonicalize(const std::string& policy, const std::vector<FilterRule>& rules);

} // namespace polcanon
