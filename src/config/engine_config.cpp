#include "polcanon/config.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

namespace polcanon {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Reads an optional non-empty string field, warning when it has another shape.
void read_label(const nlohmann::json& j, const std::string& key, std::string& out,
                std::vector<std::string>& warnings) {
    if (!j.contains(key)) {
        return;
    }
    const auto& v = j[key];
    if (v.is_string() && !v.get<std::string>().empty()) {
        out = v.get<std::string>();
    } else {
        warnings.push_back("invalid_configuration:diff." + key);
    }
}

} // namespace

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    std::string level = to_lower(s);
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

ParseResult<EngineConfig> parse_engine_config(const std::string& json_str,
                                              const std::string& source_path) {
    ParseResult<EngineConfig> result;
    result.value.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // "diff" section
        if (j.contains("diff")) {
            const auto& diff = j["diff"];
            if (!diff.is_object()) {
                result.warnings.push_back("invalid_configuration:diff");
            } else {
                if (diff.contains("context_lines")) {
                    const auto& n = diff["context_lines"];
                    if (n.is_number_unsigned()) {
                        result.value.context_lines = n.get<size_t>();
                    } else {
                        result.warnings.push_back("invalid_configuration:diff.context_lines");
                    }
                }
                read_label(diff, "from_label", result.value.from_label, result.warnings);
                read_label(diff, "to_label", result.value.to_label, result.warnings);
            }
        }

        // log_level
        if (j.contains("log_level")) {
            const auto& v = j["log_level"];
            std::optional<spdlog::level::level_enum> level;
            if (v.is_string()) {
                level = parse_log_level(v.get<std::string>());
            }
            if (level) {
                result.value.log_level = *level;
            } else {
                result.warnings.push_back("invalid_configuration:log_level");
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

CompareOptions compare_options(const EngineConfig& config) {
    CompareOptions options;
    options.context_lines = config.context_lines;
    options.from_label = config.from_label;
    options.to_label = config.to_label;
    return options;
}

} // namespace polcanon
