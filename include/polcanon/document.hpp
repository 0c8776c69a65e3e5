#pragma once

#include "polcanon/types.hpp"

#include <cstddef>
#include <string>

namespace polcanon {

// ============================================================================
// Policy Document
// ============================================================================

// Maximum nesting accepted while expanding a parsed YAML tree.
constexpr size_t MAX_DOCUMENT_DEPTH = 256;

// Alias expansion budget: a document may expand to at most
// MIN_EXPANDED_NODES + EXPANDED_NODES_PER_BYTE * <input size> nodes.
constexpr size_t MIN_EXPANDED_NODES = 100000;
constexpr size_t EXPANDED_NODES_PER_BYTE = 16;

size_t expansion_limit(size_t text_size);

struct PathLookup {
    PathError error = PathError::NotFound;
    const Value* value = nullptr;  // valid only when found()
    std::string message;           // set for PathError::NotAMap

    bool found() const { return error == PathError::None; }
};

struct PathUpdate {
    bool ok = true;
    PathError error = PathError::None;
    std::string message;
};

// A policy as a tree of maps, lists and scalars.
//
// Paths are dotted ("agent.protection.signing_key"). At every level the
// whole remaining path is tried as a literal key first, so keys that contain
// dots ("ssl.ca_trusted_fingerprint") stay addressable.
class Document {
public:
    Document() : root_(Value::object()) {}
    explicit Document(Value root);

    const Value& root() const { return root_; }
    Value& root() { return root_; }

    // Missing paths report PathError::NotFound, which is not a failure.
    PathLookup get(const std::string& path) const;

    // Mutable access to an existing value, nullptr when absent.
    // `error` receives NotAMap when an intermediate segment is not a map.
    Value* find(const std::string& path, PathError& error, std::string& message);

    // Creates intermediate maps as needed.
    PathUpdate put(const std::string& path, Value value);

    // Removing an absent path is a successful no-op.
    PathUpdate remove(const std::string& path);

private:
    Value root_;
};

// ============================================================================
// YAML Conversion
// ============================================================================

// Parse YAML text. Anchors and aliases are expanded into independent copies;
// a document expanding past expansion_limit() is rejected. The root must be a
// map; an empty or null document is the empty map.
ParseResult<Document> parse_document(const std::string& text);

// Serialize in block style with 2-space indentation and sorted keys (natural
// order) so equal trees always produce identical bytes. Strings that would read back as another type are quoted.
std::string serialize_document(const Document& doc);

// Natural ordering: digit runs compare by numeric value ("a2" < "a10").
bool natural_less(const std::string& a, const std::string& b);

// Resolve a plain (unquoted) YAML scalar using the YAML 1.2 core schema.
Value resolve_plain_scalar(const std::string& text);

// True when a string must be quoted to survive a serialize/parse round trip.
bool needs_quoting(const std::string& s);

} // namespace polcanon
