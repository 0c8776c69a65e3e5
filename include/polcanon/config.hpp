#pragma once

#include "polcanon/diff.hpp"
#include "polcanon/types.hpp"

#include <optional>
#include <string>

#include <spdlog/common.h>

namespace polcanon {

// ============================================================================
// Engine Configuration
// ============================================================================

struct EngineConfig {
    size_t context_lines = 1;
    std::string from_label = "want";
    std::string to_label = "got";
    spdlog::level::level_enum log_level = spdlog::level::warn;
    std::string source_path;
};

// Parse a JSON configuration:
//
//   {
//     "diff": { "context_lines": 1, "from_label": "want", "to_label": "got" },
//     "log_level": "warn"
//   }
//
// Every field is optional. Invalid values keep their default and add an
// "invalid_configuration:<field>" warning; only malformed JSON or a
// non-object document fail.
ParseResult<EngineConfig> parse_engine_config(const std::string& json_str,
                                              const std::string& source_path = "");

// "trace", "debug", "info", "warn", "error", "off" (case-insensitive).
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

CompareOptions compare_options(const EngineConfig& config);

} // namespace polcanon
