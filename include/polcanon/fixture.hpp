#pragma once

#include <string>

namespace polcanon {

// ============================================================================
// Fixture Paths
// ============================================================================

// Extension of golden policy fixtures.
constexpr const char* EXPECTED_EXTENSION = ".expected";

// Extension of the last path element including the dot, or "" when the
// element has none ("dir/test-default.yml" -> ".yml").
std::string path_extension(const std::string& path);

// Fixture stored next to a test definition:
// "dir/test-default.yml" -> "dir/test-default.expected".
std::string expected_path_for(const std::string& test_path);

// Last path element without its extension: "dir/test-default.yml" -> "test-default".
std::string test_name_from_path(const std::string& test_path);

} // namespace polcanon
