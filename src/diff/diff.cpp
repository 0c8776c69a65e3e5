#include "polcanon/diff.hpp"
#include "polcanon/canonical.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace polcanon {

namespace {

enum class OpTag {
    Equal,
    Replace,
    Delete,
    Insert,
};

struct Opcode {
    OpTag tag;
    size_t i1, i2;
    size_t j1, j2;
};

using Lines = std::vector<std::string>;

// Lines keep their terminator, so a missing final newline is a difference.
Lines split_lines(const std::string& text) {
    Lines lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl + 1 - start));
        start = nl + 1;
    }
    return lines;
}

void write_line(std::string& out, char prefix, const std::string& line) {
    out += prefix;
    out += line;
    if (line.empty() || line.back() != '\n') {
        out += "\n\\ No newline at end of file\n";
    }
}

// Pairs (i, j) of equal lines forming a longest common subsequence, in order.
std::vector<std::pair<size_t, size_t>> common_lines(const Lines& a, const Lines& b) {
    std::vector<std::pair<size_t, size_t>> pairs;

    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
        pairs.emplace_back(prefix, prefix);
        ++prefix;
    }

    size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }

    const size_t n = a.size() - prefix - suffix;
    const size_t m = b.size() - prefix - suffix;

    // lcs[i][j]: length of the LCS of a[prefix+i..] and b[prefix+j..] in the middle section.
    std::vector<unsigned> lcs((n + 1) * (m + 1), 0);
    auto at = [m](size_t i, size_t j) { return i * (m + 1) + j; };
    for (size_t i = n; i-- > 0;) {
        for (size_t j = m; j-- > 0;) {
            if (a[prefix + i] == b[prefix + j]) {
                lcs[at(i, j)] = lcs[at(i + 1, j + 1)] + 1;
            } else {
                lcs[at(i, j)] = std::max(lcs[at(i + 1, j)], lcs[at(i, j + 1)]);
            }
        }
    }

    size_t i = 0;
    size_t j = 0;
    while (i < n && j < m) {
        if (a[prefix + i] == b[prefix + j]) {
            pairs.emplace_back(prefix + i, prefix + j);
            ++i;
            ++j;
        } else if (lcs[at(i + 1, j)] >= lcs[at(i, j + 1)]) {
            ++i;
        } else {
            ++j;
        }
    }

    for (size_t k = suffix; k > 0; --k) {
        pairs.emplace_back(a.size() - k, b.size() - k);
    }
    return pairs;
}

std::vector<Opcode> opcodes(const Lines& a, const Lines& b) {
    std::vector<Opcode> codes;
    size_t i = 0;
    size_t j = 0;

    auto emit_gap = [&](size_t ai, size_t bj) {
        if (i < ai && j < bj) {
            codes.push_back({OpTag::Replace, i, ai, j, bj});
        } else if (i < ai) {
            codes.push_back({OpTag::Delete, i, ai, j, bj});
        } else if (j < bj) {
            codes.push_back({OpTag::Insert, i, ai, j, bj});
        }
    };

    for (const auto& [ai, bj] : common_lines(a, b)) {
        emit_gap(ai, bj);
        if (!codes.empty() && codes.back().tag == OpTag::Equal &&
            codes.back().i2 == ai && codes.back().j2 == bj) {
            ++codes.back().i2;
            ++codes.back().j2;
        } else {
            codes.push_back({OpTag::Equal, ai, ai + 1, bj, bj + 1});
        }
        i = ai + 1;
        j = bj + 1;
    }
    emit_gap(a.size(), b.size());
    return codes;
}

// Split opcodes into hunks separated by runs of more than 2*n equal lines,
// trimming equal runs down to n lines of context.
std::vector<std::vector<Opcode>> grouped_opcodes(std::vector<Opcode> codes, size_t n) {
    std::vector<std::vector<Opcode>> groups;
    if (codes.empty()) {
        codes.push_back({OpTag::Equal, 0, 1, 0, 1});
    }

    Opcode& first = codes.front();
    if (first.tag == OpTag::Equal) {
        first.i1 = std::max(first.i1, first.i2 > n ? first.i2 - n : 0);
        first.j1 = std::max(first.j1, first.j2 > n ? first.j2 - n : 0);
    }
    Opcode& last = codes.back();
    if (last.tag == OpTag::Equal) {
        last.i2 = std::min(last.i2, last.i1 + n);
        last.j2 = std::min(last.j2, last.j1 + n);
    }

    std::vector<Opcode> group;
    for (Opcode code : codes) {
        if (code.tag == OpTag::Equal && code.i2 - code.i1 > 2 * n) {
            group.push_back({OpTag::Equal, code.i1, std::min(code.i2, code.i1 + n),
                             code.j1, std::min(code.j2, code.j1 + n)});
            groups.push_back(std::move(group));
            group.clear();
            code.i1 = std::max(code.i1, code.i2 - n);
            code.j1 = std::max(code.j1, code.j2 - n);
        }
        group.push_back(code);
    }
    if (!group.empty() && !(group.size() == 1 && group.front().tag == OpTag::Equal)) {
        groups.push_back(std::move(group));
    }
    return groups;
}

// "start,length" with 1-based start; a single line is just "start" and an
// empty range points at the line before it.
std::string format_range(size_t start, size_t stop) {
    size_t beginning = start + 1;
    size_t length = stop - start;
    if (length == 1) {
        return std::to_string(beginning);
    }
    if (length == 0) {
        --beginning;
    }
    return std::to_string(beginning) + "," + std::to_string(length);
}

} // namespace

std::string unified_diff(const std::string& a, const std::string& b,
                         const std::string& from_label, const std::string& to_label,
                         size_t context) {
    if (a == b) {
        return "";
    }

    Lines left = split_lines(a);
    Lines right = split_lines(b);

    std::string out;
    bool started = false;
    for (const auto& group : grouped_opcodes(opcodes(left, right), context)) {
        if (!started) {
            out += "--- " + from_label + "\n";
            out += "+++ " + to_label + "\n";
            started = true;
        }

        const Opcode& first = group.front();
        const Opcode& last = group.back();
        out += "@@ -" + format_range(first.i1, last.i2) + " +" +
               format_range(first.j1, last.j2) + " @@\n";

        for (const auto& code : group) {
            if (code.tag == OpTag::Equal) {
                for (size_t i = code.i1; i < code.i2; ++i) write_line(out, ' ', left[i]);
                continue;
            }
            if (code.tag == OpTag::Replace || code.tag == OpTag::Delete) {
                for (size_t i = code.i1; i < code.i2; ++i) write_line(out, '-', left[i]);
            }
            if (code.tag == OpTag::Replace || code.tag == OpTag::Insert) {
                for (size_t j = code.j1; j < code.j2; ++j) write_line(out, '+', right[j]);
            }
        }
    }
    return out;
}

CompareResult compare(const std::string& expected, const std::string& found,
                      const CompareOptions& options) {
    CompareResult result;

    auto want = canonicalize(expected);
    if (!want.ok) {
        result.error = "failed to prepare expected policy: " + want.error;
        return result;
    }

    auto got = canonicalize(found);
    if (!got.ok) {
        result.error = "failed to prepare found policy: " + got.error;
        return result;
    }

    spdlog::trace("expected policy after cleanup:\n{}", want.value);
    spdlog::trace("found policy after cleanup:\n{}", got.value);

    result.diff = unified_diff(want.value, got.value, options.from_label, options.to_label,
                               options.context_lines);
    result.ok = true;
    return result;
}

} // namespace polcanon
