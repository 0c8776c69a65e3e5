/**
 * polcanon CLI - Common utilities and types
 */

#pragma once

#include <polcanon/config.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifndef POLCANON_VERSION
#define POLCANON_VERSION "0.1.0"
#endif

namespace polcanon::cli {

// Portable getenv that avoids MSVC warnings
inline std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool trace = false;            // --trace
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Exit codes shared by the comparing commands.
 */
constexpr int EXIT_MATCH = 0;
constexpr int EXIT_MISMATCH = 1;
constexpr int EXIT_ERROR = 2;

/**
 * File helpers.
 */
inline std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

inline bool write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out << content;
    out.flush();
    return out.good();
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Logging goes to stderr so that canonical output and diffs on stdout stay
 * clean.
 * Priority: --trace > --verbose > --quiet > config log_level > POLCANON_LOG_LEVEL > warn
 */
inline void configure_logging(const GlobalOptions& opts, const std::optional<EngineConfig>& config) {
    static bool sink_installed = false;
    if (!sink_installed) {
        spdlog::set_default_logger(spdlog::stderr_color_mt("polcanon"));
        spdlog::set_pattern("[%l] %v");
        sink_installed = true;
    }

    auto level = spdlog::level::warn;
    if (auto env = parse_log_level(safe_getenv("POLCANON_LOG_LEVEL"))) {
        level = *env;
    }
    if (config) {
        level = config->log_level;
    }
    if (opts.quiet) level = spdlog::level::err;
    if (opts.verbose) level = spdlog::level::debug;
    if (opts.trace) level = spdlog::level::trace;

    spdlog::set_level(level);
}

/**
 * Prepare a command: reset warnings, load --config and set the log level.
 * Returns nullopt (after printing the error) when the config cannot be used.
 */
inline std::optional<EngineConfig> init_command(const GlobalOptions& opts) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = opts.json;
    collector.quiet = opts.quiet;

    if (opts.config.empty()) {
        configure_logging(opts, std::nullopt);
        return EngineConfig{};
    }

    auto content = read_file(opts.config);
    if (!content) {
        configure_logging(opts, std::nullopt);
        print_error("failed to read config: " + opts.config, opts.json);
        return std::nullopt;
    }

    auto parsed = parse_engine_config(*content, opts.config);
    if (!parsed.ok) {
        configure_logging(opts, std::nullopt);
        print_error("invalid config " + opts.config + ": " + parsed.error, opts.json);
        return std::nullopt;
    }

    configure_logging(opts, parsed.value);
    for (const auto& w : parsed.warnings) {
        print_warning(w);
    }
    return parsed.value;
}

} // namespace polcanon::cli
