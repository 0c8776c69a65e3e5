#include "polcanon/component_ids.hpp"
#include "polcanon/document.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace polcanon {

namespace {

struct ComponentHeader {
    size_t line = 0;
    std::string indent;
    std::string type;
    std::string suffix;
    std::string tail;
};

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    for (;;) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            return lines;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string text;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) text += '\n';
        text += lines[i];
    }
    return text;
}

bool is_blank(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool all_blank(const std::string& s, size_t from) {
    for (size_t i = from; i < s.size(); ++i) {
        if (!is_blank(s[i])) return false;
    }
    return true;
}

size_t indent_of(const std::string& line) {
    size_t n = 0;
    while (n < line.size() && is_blank(line[n])) ++n;
    return n;
}

// <section>:  or  <section>: {}  at column 0. `empty` is set for the latter.
bool match_section_opener(const std::string& line, std::string& section, bool& empty) {
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    std::string name = line.substr(0, colon);
    const auto& sections = component_sections();
    if (std::find(sections.begin(), sections.end(), name) == sections.end()) {
        return false;
    }

    size_t rest = colon + 1;
    empty = rest + 2 < line.size() && is_blank(line[rest]) &&
            line.compare(rest + 1, 2, "{}") == 0;
    if (empty) {
        rest += 3;
    }
    if (!all_blank(line, rest)) {
        return false;
    }
    section = std::move(name);
    return true;
}

// <indent><type>/<suffix>: followed by nothing, {} or ~ (a serialized null).
// Lines are scanned by hand: they may carry arbitrarily long scalars.
bool match_component_header(const std::string& line, ComponentHeader& h) {
    size_t indent = indent_of(line);
    if (indent < 2 || indent == line.size()) {
        return false;
    }

    size_t colon = line.find(':', indent);
    if (colon == std::string::npos) {
        return false;
    }
    size_t slash = line.find('/', indent);
    if (slash == std::string::npos || slash == indent || slash + 1 >= colon) {
        return false;
    }
    for (size_t i = indent; i < colon; ++i) {
        if (is_blank(line[i])) return false;
    }

    std::string tail = line.substr(colon + 1);
    bool valid_tail = all_blank(tail, 0) ||
                      (tail.size() == 3 && is_blank(tail[0]) && tail.compare(1, 2, "{}") == 0) ||
                      (tail.size() == 2 && is_blank(tail[0]) && tail[1] == '~');
    if (!valid_tail) {
        return false;
    }

    h.indent = line.substr(0, indent);
    h.type = line.substr(indent, slash - indent);
    h.suffix = line.substr(slash + 1, colon - slash - 1);
    h.tail = std::move(tail);
    return true;
}

// A section's block runs until the next line with content at column 0.
bool continues_block(const std::string& line) {
    if (line.empty()) return true;
    return is_blank(line[0]);
}

bool is_token_delimiter(char c) {
    switch (c) {
        case ':': case ',': case '[': case ']': case '{': case '}':
        case '"': case '\'': case '(': case ')':
            return true;
        default:
            return std::isspace(static_cast<unsigned char>(c)) != 0;
    }
}

std::string replace_tokens(const std::string& line, const IdentityMap& identities) {
    std::string out;
    out.reserve(line.size());

    size_t i = 0;
    while (i < line.size()) {
        if (is_token_delimiter(line[i])) {
            out += line[i];
            ++i;
            continue;
        }
        size_t end = i;
        while (end < line.size() && !is_token_delimiter(line[end])) ++end;

        std::string token = line.substr(i, end - i);
        auto it = identities.find(token);
        out += it != identities.end() ? it->second : token;
        i = end;
    }
    return out;
}

} // namespace

const std::vector<std::string>& component_sections() {
    static const std::vector<std::string> sections = {
        "extensions", "receivers", "processors", "connectors", "exporters", "service",
    };
    return sections;
}

ComponentIdResult canonicalize_component_ids(const std::string& text) {
    ComponentIdResult result;

    std::vector<std::string> lines = split_lines(text);
    std::vector<bool> is_header(lines.size(), false);

    size_t i = 0;
    while (i < lines.size()) {
        std::string section;
        bool empty = false;
        if (!match_section_opener(lines[i], section, empty)) {
            ++i;
            continue;
        }
        ++i;
        if (empty) {
            continue;
        }

        // Components are the direct children of the section. Pipelines are
        // the direct children of service.pipelines. Deeper keys that look
        // like identifiers are settings and keep their names.
        const bool is_service = section == "service";
        size_t child_indent = 0;
        bool in_pipelines = false;
        size_t pipeline_indent = 0;

        std::vector<ComponentHeader> headers;
        while (i < lines.size() && continues_block(lines[i])) {
            const std::string& line = lines[i];
            size_t indent = indent_of(line);
            if (indent == line.size()) {
                ++i;
                continue;
            }
            if (child_indent == 0) {
                child_indent = indent;
            }

            bool candidate = false;
            if (indent <= child_indent) {
                in_pipelines = is_service && line.compare(indent, 10, "pipelines:") == 0 &&
                               all_blank(line, indent + 10);
                pipeline_indent = 0;
                candidate = indent == child_indent;
            } else if (in_pipelines) {
                if (pipeline_indent == 0) {
                    pipeline_indent = indent;
                }
                candidate = indent == pipeline_indent;
            }

            ComponentHeader h;
            if (candidate && match_component_header(line, h)) {
                h.line = i;
                headers.push_back(std::move(h));
            }
            ++i;
        }

        std::stable_sort(headers.begin(), headers.end(),
                         [](const ComponentHeader& a, const ComponentHeader& b) {
                             return natural_less(a.type + "/", b.type + "/");
                         });

        for (size_t n = 0; n < headers.size(); ++n) {
            const auto& h = headers[n];
            std::string original = h.type + "/" + h.suffix;
            std::string canonical = h.type + "/" + COMPONENT_ID_PREFIX + std::to_string(n);

            auto [it, inserted] = result.identities.emplace(original, canonical);
            if (!inserted && it->second != canonical) {
                spdlog::warn("component {} declared more than once (section {}), references resolve to {}",
                             original, section, it->second);
            }

            lines[h.line] = h.indent + canonical + ":" + h.tail;
            is_header[h.line] = true;
            ++result.headers_rewritten;
        }
    }

    if (!result.identities.empty()) {
        for (size_t l = 0; l < lines.size(); ++l) {
            if (!is_header[l]) {
                lines[l] = replace_tokens(lines[l], result.identities);
            }
        }
    }

    spdlog::debug("rewrote {} component headers ({} identifiers)",
                  result.headers_rewritten, result.identities.size());

    result.text = join_lines(lines);
    return result;
}

} // namespace polcanon
