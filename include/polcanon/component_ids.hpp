#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace polcanon {

// ============================================================================
// Component Identifier Canonicalization
// ============================================================================

// Top-level sections whose map keys are component identifiers of the form
// <type>/<instance-suffix>.
const std::vector<std::string>& component_sections();

// Prefix of every rewritten instance suffix.
constexpr const char* COMPONENT_ID_PREFIX = "componentid-";

// Original identifier -> canonical identifier, scoped to one document.
using IdentityMap = std::unordered_map<std::string, std::string>;

struct ComponentIdResult {
    std::string text;
    IdentityMap identities;
    size_t headers_rewritten = 0;
};

// Rewrite component headers in block-style policy text and every reference
// to them. Headers are the direct children of a component section, plus the
// direct children of service.pipelines; deeper keys keep their names.
//
// Within each section, components are numbered 0..N-1 in order of their type
// (natural order), keeping declaration order among components of the same
// type; the counter restarts in every section. References are replaced as
// whole tokens only, in a single pass, so one identifier never rewrites part
// of a longer one and replacements never chain.
ComponentIdResult canonicalize_component_ids(const std::string& text);

} // namespace polcanon
