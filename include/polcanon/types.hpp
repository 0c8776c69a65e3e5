#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace polcanon {

// Parsed policy values are plain JSON trees: objects are maps, arrays are
// lists, everything else is a scalar.
using Value = nlohmann::json;

// ============================================================================
// Results
// ============================================================================

template<typename T>
struct ParseResult {
    bool ok = false;
    std::string error;
    T value;
    std::vector<std::string> warnings;
};

// ============================================================================
// Path Errors
// ============================================================================

enum class PathError {
    None,
    NotFound,
    NotAMap,
};

inline const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "none";
        case PathError::NotFound: return "not_found";
        case PathError::NotAMap: return "not_a_map";
        default: return "unknown";
    }
}

// Kind name used in schema-shape error messages.
inline const char* kind_name(const Value& v) {
    switch (v.type()) {
        case Value::value_t::object: return "map";
        case Value::value_t::array: return "list";
        case Value::value_t::string: return "string";
        case Value::value_t::boolean: return "bool";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned: return "integer";
        case Value::value_t::number_float: return "float";
        case Value::value_t::null: return "null";
        default: return "unknown";
    }
}

inline bool is_scalar(const Value& v) {
    return !v.is_object() && !v.is_array();
}

} // namespace polcanon
