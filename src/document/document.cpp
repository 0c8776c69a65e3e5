#include "polcanon/document.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace polcanon {

namespace {

const char* const TAG_PLAIN = "?";
const char* const TAG_NON_PLAIN = "!";
const char* const TAG_STR = "tag:yaml.org,2002:str";
const char* const MERGE_KEY = "<<";

// Parent map and final key of an existing path.
template<typename V>
struct Located {
    V* parent = nullptr;
    std::string key;
};

template<typename V>
Located<V> locate(V& root, const std::string& path, PathError& error, std::string& message) {
    Located<V> loc;
    if (!root.is_object()) {
        error = PathError::NotAMap;
        message = std::string("expected map at document root, found ") + kind_name(root);
        return loc;
    }

    V* data = &root;
    std::string key = path;
    std::string walked;

    for (;;) {
        // Fast path: the remaining path is present as a literal key.
        if (data->find(key) != data->end()) {
            error = PathError::None;
            loc.parent = data;
            loc.key = key;
            return loc;
        }

        size_t dot = key.find('.');
        if (dot == std::string::npos) {
            error = PathError::NotFound;
            return loc;
        }

        std::string head = key.substr(0, dot);
        auto it = data->find(head);
        if (it == data->end()) {
            error = PathError::NotFound;
            return loc;
        }

        walked += walked.empty() ? head : "." + head;
        if (!it->is_object()) {
            error = PathError::NotAMap;
            message = walked + ": expected map, found " + kind_name(*it);
            return loc;
        }

        data = &*it;
        key = key.substr(dot + 1);
    }
}

bool is_yaml11_bool_word(const std::string& s) {
    static const char* const words[] = {
        "y", "Y", "yes", "Yes", "YES", "n", "N", "no", "No", "NO",
        "on", "On", "ON", "off", "Off", "OFF",
    };
    for (const char* w : words) {
        if (s == w) return true;
    }
    return false;
}

size_t count_digits(const std::string& s, size_t from, int base) {
    size_t n = from;
    while (n < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[n]);
        bool ok = base == 16 ? std::isxdigit(c) != 0
                : base == 8 ? (c >= '0' && c <= '7')
                : std::isdigit(c) != 0;
        if (!ok) break;
        ++n;
    }
    return n - from;
}

size_t skip_sign(const std::string& s) {
    return !s.empty() && (s[0] == '-' || s[0] == '+') ? 1 : 0;
}

// [-+]?[0-9]+
bool is_decimal_int(const std::string& s) {
    size_t start = skip_sign(s);
    size_t digits = count_digits(s, start, 10);
    return digits > 0 && start + digits == s.size();
}

// 0x[0-9a-fA-F]+ or 0o[0-7]+
bool is_prefixed_int(const std::string& s, const char* prefix, int base) {
    if (s.size() < 3 || s.compare(0, 2, prefix) != 0) return false;
    return count_digits(s, 2, base) == s.size() - 2;
}

// [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
bool is_decimal_float(const std::string& s) {
    size_t i = skip_sign(s);
    size_t whole = count_digits(s, i, 10);
    i += whole;
    if (whole == 0) {
        if (i >= s.size() || s[i] != '.') return false;
        size_t fraction = count_digits(s, i + 1, 10);
        if (fraction == 0) return false;
        i += 1 + fraction;
    } else if (i < s.size() && s[i] == '.') {
        i += 1 + count_digits(s, i + 1, 10);
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
        size_t exponent = count_digits(s, i, 10);
        if (exponent == 0) return false;
        i += exponent;
    }
    return i == s.size();
}

// [-+]?\.(inf|Inf|INF)
bool is_infinity(const std::string& s) {
    std::string rest = s.substr(skip_sign(s));
    return rest == ".inf" || rest == ".Inf" || rest == ".INF";
}

bool is_not_a_number(const std::string& s) {
    return s == ".nan" || s == ".NaN" || s == ".NAN";
}

Value parse_integer(const std::string& digits, int base, bool negative) {
    errno = 0;
    char* end = nullptr;
    unsigned long long magnitude = std::strtoull(digits.c_str(), &end, base);
    if (errno == ERANGE || end == digits.c_str() || *end != '\0') {
        return Value();
    }

    if (negative) {
        constexpr unsigned long long limit =
            static_cast<unsigned long long>(std::numeric_limits<long long>::max()) + 1ULL;
        if (magnitude > limit) return Value();
        if (magnitude == limit) return Value(std::numeric_limits<long long>::min());
        return Value(-static_cast<long long>(magnitude));
    }
    if (magnitude <= static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        return Value(static_cast<long long>(magnitude));
    }
    return Value(magnitude);
}

std::string format_float(double d) {
    if (std::isnan(d)) return ".nan";
    if (std::isinf(d)) return d > 0 ? ".inf" : "-.inf";
    // nlohmann prints the shortest representation that reads back exactly,
    // always with a fraction or exponent ("1.0", "1e+21").
    return Value(d).dump();
}

Value scalar_value(const YAML::Node& node) {
    const std::string& tag = node.Tag();
    const std::string& text = node.Scalar();

    if (tag == TAG_NON_PLAIN || tag == TAG_STR) {
        return Value(text);
    }
    if (tag.empty() || tag == TAG_PLAIN || tag.rfind("tag:yaml.org,2002:", 0) == 0) {
        return resolve_plain_scalar(text);
    }
    // Application specific tags carry their scalar text unchanged.
    return Value(text);
}

// Aliases are expanded into copies, so a small document can describe a huge
// tree. Every converted node is charged against this budget.
struct Expansion {
    size_t remaining = 0;
    size_t limit = 0;
};

bool to_value(const YAML::Node& node, size_t depth, Expansion& budget, Value& out, std::string& error);

bool merge_into(Value& target, const YAML::Node& source, size_t depth, Expansion& budget,
                std::string& error) {
    std::vector<YAML::Node> sources;
    if (source.IsMap()) {
        sources.push_back(source);
    } else if (source.IsSequence()) {
        for (const auto& item : source) {
            if (!item.IsMap()) {
                error = "merge key expects a map or a list of maps";
                return false;
            }
            sources.push_back(item);
        }
    } else {
        error = "merge key expects a map or a list of maps";
        return false;
    }

    // Explicit keys win over merged ones, earlier merge sources over later.
    for (const auto& src : sources) {
        Value merged;
        if (!to_value(src, depth + 1, budget, merged, error)) return false;
        for (auto& [key, val] : merged.items()) {
            if (target.find(key) == target.end()) {
                target[key] = val;
            }
        }
    }
    return true;
}

bool to_value(const YAML::Node& node, size_t depth, Expansion& budget, Value& out, std::string& error) {
    if (depth > MAX_DOCUMENT_DEPTH) {
        error = "document nesting exceeds " + std::to_string(MAX_DOCUMENT_DEPTH) + " levels";
        return false;
    }
    if (budget.remaining == 0) {
        error = "document expands to more than " + std::to_string(budget.limit) +
                " nodes (excessive aliasing)";
        return false;
    }
    --budget.remaining;

    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            out = nullptr;
            return true;

        case YAML::NodeType::Scalar:
            out = scalar_value(node);
            return true;

        case YAML::NodeType::Sequence:
            out = Value::array();
            for (const auto& item : node) {
                Value element;
                if (!to_value(item, depth + 1, budget, element, error)) return false;
                out.push_back(std::move(element));
            }
            return true;

        case YAML::NodeType::Map: {
            out = Value::object();
            std::vector<YAML::Node> merges;
            for (const auto& entry : node) {
                const YAML::Node& key = entry.first;
                if (!key.IsScalar()) {
                    error = "unsupported non-scalar map key";
                    return false;
                }
                if (key.Scalar() == MERGE_KEY && key.Tag() == TAG_PLAIN) {
                    merges.push_back(entry.second);
                    continue;
                }
                Value member;
                if (!to_value(entry.second, depth + 1, budget, member, error)) return false;
                out[key.Scalar()] = std::move(member);
            }
            for (const auto& m : merges) {
                if (!merge_into(out, m, depth, budget, error)) return false;
            }
            return true;
        }
    }

    error = "unknown YAML node type";
    return false;
}

void emit_string(YAML::Emitter& out, const std::string& s) {
    if (needs_quoting(s)) {
        out << YAML::DoubleQuoted;
    }
    out << s;
}

void emit_value(YAML::Emitter& out, const Value& v) {
    switch (v.type()) {
        case Value::value_t::object: {
            if (v.empty()) {
                out << YAML::Flow << YAML::BeginMap << YAML::EndMap;
                return;
            }
            std::vector<std::string> keys;
            keys.reserve(v.size());
            for (auto it = v.begin(); it != v.end(); ++it) {
                keys.push_back(it.key());
            }
            std::sort(keys.begin(), keys.end(), natural_less);

            out << YAML::BeginMap;
            for (const auto& key : keys) {
                out << YAML::Key;
                emit_string(out, key);
                out << YAML::Value;
                emit_value(out, v.at(key));
            }
            out << YAML::EndMap;
            return;
        }
        case Value::value_t::array:
            if (v.empty()) {
                out << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;
                return;
            }
            out << YAML::BeginSeq;
            for (const auto& item : v) {
                emit_value(out, item);
            }
            out << YAML::EndSeq;
            return;
        case Value::value_t::string:
            emit_string(out, v.get<std::string>());
            return;
        case Value::value_t::boolean:
            out << v.get<bool>();
            return;
        case Value::value_t::number_integer:
            out << v.get<long long>();
            return;
        case Value::value_t::number_unsigned:
            out << v.get<unsigned long long>();
            return;
        case Value::value_t::number_float:
            out << format_float(v.get<double>());
            return;
        case Value::value_t::null:
        default:
            out << YAML::Null;
            return;
    }
}

} // namespace

// ============================================================================
// Document
// ============================================================================

Document::Document(Value root) : root_(std::move(root)) {
    if (root_.is_null()) {
        root_ = Value::object();
    }
}

PathLookup Document::get(const std::string& path) const {
    PathLookup result;
    auto loc = locate(root_, path, result.error, result.message);
    if (result.error == PathError::None) {
        result.value = &loc.parent->at(loc.key);
    }
    return result;
}

Value* Document::find(const std::string& path, PathError& error, std::string& message) {
    auto loc = locate(root_, path, error, message);
    if (error != PathError::None) {
        return nullptr;
    }
    return &loc.parent->at(loc.key);
}

PathUpdate Document::put(const std::string& path, Value value) {
    PathUpdate result;
    if (!root_.is_object()) {
        result.ok = false;
        result.error = PathError::NotAMap;
        result.message = std::string("expected map at document root, found ") + kind_name(root_);
        return result;
    }

    Value* data = &root_;
    std::string key = path;
    std::string walked;

    for (;;) {
        if (data->find(key) != data->end()) {
            (*data)[key] = std::move(value);
            return result;
        }

        size_t dot = key.find('.');
        if (dot == std::string::npos) {
            (*data)[key] = std::move(value);
            return result;
        }

        std::string head = key.substr(0, dot);
        if (data->find(head) == data->end()) {
            (*data)[head] = Value::object();
        }

        Value& next = (*data)[head];
        walked += walked.empty() ? head : "." + head;
        if (!next.is_object()) {
            result.ok = false;
            result.error = PathError::NotAMap;
            result.message = walked + ": expected map, found " + kind_name(next);
            return result;
        }

        data = &next;
        key = key.substr(dot + 1);
    }
}

PathUpdate Document::remove(const std::string& path) {
    PathUpdate result;
    auto loc = locate(root_, path, result.error, result.message);
    if (result.error == PathError::NotFound) {
        result.error = PathError::None;
        return result;
    }
    if (result.error != PathError::None) {
        result.ok = false;
        return result;
    }
    loc.parent->erase(loc.key);
    return result;
}

// ============================================================================
// YAML Conversion
// ============================================================================

size_t expansion_limit(size_t text_size) {
    return MIN_EXPANDED_NODES + EXPANDED_NODES_PER_BYTE * text_size;
}

ParseResult<Document> parse_document(const std::string& text) {
    ParseResult<Document> result;

    try {
        YAML::Node node = YAML::Load(text);

        Expansion budget;
        budget.limit = expansion_limit(text.size());
        budget.remaining = budget.limit;

        Value tree;
        std::string error;
        if (!to_value(node, 0, budget, tree, error)) {
            result.error = error;
            return result;
        }

        if (tree.is_null()) {
            tree = Value::object();
        }
        if (!tree.is_object()) {
            result.error = std::string("document root must be a map, found ") + kind_name(tree);
            return result;
        }

        result.value = Document(std::move(tree));
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = e.what();
    }

    return result;
}

std::string serialize_document(const Document& doc) {
    YAML::Emitter out;
    out.SetIndent(2);
    out.SetMapFormat(YAML::Block);
    out.SetSeqFormat(YAML::Block);
    out.SetBoolFormat(YAML::TrueFalseBool);
    out.SetBoolFormat(YAML::LowerCase);

    emit_value(out, doc.root());

    if (!out.good()) {
        throw std::runtime_error("failed to encode policy: " + out.GetLastError());
    }

    std::string text = out.c_str();
    text += "\n";
    return text;
}

bool natural_less(const std::string& a, const std::string& b) {
    size_t i = 0;
    size_t j = 0;

    while (i < a.size() && j < b.size()) {
        unsigned char ca = static_cast<unsigned char>(a[i]);
        unsigned char cb = static_cast<unsigned char>(b[j]);

        if (std::isdigit(ca) && std::isdigit(cb)) {
            size_t ei = i;
            while (ei < a.size() && std::isdigit(static_cast<unsigned char>(a[ei]))) ++ei;
            size_t ej = j;
            while (ej < b.size() && std::isdigit(static_cast<unsigned char>(b[ej]))) ++ej;

            size_t si = i;
            while (si + 1 < ei && a[si] == '0') ++si;
            size_t sj = j;
            while (sj + 1 < ej && b[sj] == '0') ++sj;

            size_t len_a = ei - si;
            size_t len_b = ej - sj;
            if (len_a != len_b) return len_a < len_b;

            int cmp = a.compare(si, len_a, b, sj, len_b);
            if (cmp != 0) return cmp < 0;

            // Same number, fewer leading zeros first.
            if (ei - i != ej - j) return (ei - i) < (ej - j);

            i = ei;
            j = ej;
            continue;
        }

        if (ca != cb) return ca < cb;
        ++i;
        ++j;
    }

    return i == a.size() && j < b.size();
}

Value resolve_plain_scalar(const std::string& text) {
    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return Value();
    }
    if (text == "true" || text == "True" || text == "TRUE") {
        return Value(true);
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return Value(false);
    }

    if (is_decimal_int(text)) {
        size_t sign = skip_sign(text);
        Value v = parse_integer(text.substr(sign), 10, sign == 1 && text[0] == '-');
        if (!v.is_null()) return v;
    } else if (is_prefixed_int(text, "0x", 16)) {
        Value v = parse_integer(text.substr(2), 16, false);
        if (!v.is_null()) return v;
    } else if (is_prefixed_int(text, "0o", 8)) {
        Value v = parse_integer(text.substr(2), 8, false);
        if (!v.is_null()) return v;
    }

    if (is_decimal_float(text)) {
        return Value(std::strtod(text.c_str(), nullptr));
    }
    if (is_infinity(text)) {
        double inf = std::numeric_limits<double>::infinity();
        return Value(text[0] == '-' ? -inf : inf);
    }
    if (is_not_a_number(text)) {
        return Value(std::numeric_limits<double>::quiet_NaN());
    }

    return Value(text);
}

bool needs_quoting(const std::string& s) {
    if (s.empty() || s == MERGE_KEY || is_yaml11_bool_word(s)) {
        return true;
    }
    if (std::isspace(static_cast<unsigned char>(s.front())) ||
        std::isspace(static_cast<unsigned char>(s.back()))) {
        return true;
    }
    return !resolve_plain_scalar(s).is_string();
}

} // namespace polcanon
