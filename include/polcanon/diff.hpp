#pragma once

#include <cstddef>
#include <string>

namespace polcanon {

// ============================================================================
// Policy Comparison
// ============================================================================

struct CompareOptions {
    size_t context_lines = 1;
    std::string from_label = "want";
    std::string to_label = "got";
};

struct CompareResult {
    bool ok = false;
    std::string error;
    std::string diff;  // empty when the canonical forms are identical

    bool matches() const { return ok && diff.empty(); }
};

// Canonicalize both policies and diff the results line by line.
// A mismatch is reported through `diff`, never through `error`.
CompareResult compare(const std::string& expected, const std::string& found,
                      const CompareOptions& options = {});

// Unified diff of two texts with `context` lines around every change.
// Returns an empty string when the texts are equal. A last line without a
// newline is followed by "\ No newline at end of file".
std::string unified_diff(const std::string& a, const std::string& b,
                         const std::string& from_label, const std::string& to_label,
                         size_t context);

} // namespace polcanon
