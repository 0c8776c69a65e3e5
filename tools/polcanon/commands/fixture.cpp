/**
 * polcanon CLI - generate and assert commands
 *
 * Maintain the expected policy stored next to a test definition
 * ("test-default.yml" -> "test-default.expected").
 */

#include "../common.hpp"
#include <polcanon/canonical.hpp>
#include <polcanon/diff.hpp>
#include <polcanon/fixture.hpp>
#include <CLI/CLI.hpp>

namespace polcanon::cli::commands {

namespace {

struct FixtureOptions {
    std::string test_path;
    std::string found;
};

int cmd_generate(const GlobalOptions& opts, const FixtureOptions& cmd_opts) {
    if (!init_command(opts)) {
        return EXIT_ERROR;
    }

    auto found = read_file(cmd_opts.found);
    if (!found) {
        print_error("failed to read policy: " + cmd_opts.found, opts.json);
        return EXIT_ERROR;
    }

    auto result = canonicalize(*found);
    if (!result.ok) {
        print_error("failed to prepare policy to store: " + result.error, opts.json);
        return EXIT_ERROR;
    }

    std::string expected_path = expected_path_for(cmd_opts.test_path);
    if (!write_file(expected_path, result.value)) {
        print_error("failed to write policy: " + expected_path, opts.json);
        return EXIT_ERROR;
    }
    spdlog::debug("stored expected policy for {}", test_name_from_path(cmd_opts.test_path));

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["test"] = test_name_from_path(cmd_opts.test_path);
        j["path"] = expected_path;
        output_json(j);
    } else if (!opts.quiet) {
        print_success("Wrote " + expected_path, opts.json);
    }
    return EXIT_MATCH;
}

int cmd_assert(const GlobalOptions& opts, const FixtureOptions& cmd_opts) {
    auto config = init_command(opts);
    if (!config) {
        return EXIT_ERROR;
    }

    auto found = read_file(cmd_opts.found);
    if (!found) {
        print_error("failed to read policy: " + cmd_opts.found, opts.json);
        return EXIT_ERROR;
    }

    std::string expected_path = expected_path_for(cmd_opts.test_path);
    auto expected = read_file(expected_path);
    if (!expected) {
        print_error("failed to read expected policy: " + expected_path, opts.json);
        return EXIT_ERROR;
    }

    auto result = compare(*expected, *found, compare_options(*config));
    if (!result.ok) {
        print_error("failed to compare policies: " + result.error, opts.json);
        return EXIT_ERROR;
    }
    if (!result.diff.empty()) {
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = false;
            j["test"] = test_name_from_path(cmd_opts.test_path);
            j["path"] = expected_path;
            j["error"] = "unexpected content in policy";
            j["diff"] = result.diff;
            output_json(j);
        } else {
            std::cerr << "Error: unexpected content in policy: " << result.diff;
        }
        return EXIT_MISMATCH;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["test"] = test_name_from_path(cmd_opts.test_path);
        j["path"] = expected_path;
        output_json(j);
    } else if (!opts.quiet) {
        print_success("Policy matches " + expected_path, opts.json);
    }
    return EXIT_MATCH;
}

} // anonymous namespace

void setup_generate(CLI::App* app, GlobalOptions& opts) {
    static FixtureOptions cmd_opts;

    app->add_option("test", cmd_opts.test_path, "Test definition the fixture belongs to")->required();
    app->add_option("policy", cmd_opts.found, "Policy to store")->required();

    app->callback([&opts]() {
        std::exit(cmd_generate(opts, cmd_opts));
    });
}

void setup_assert(CLI::App* app, GlobalOptions& opts) {
    static FixtureOptions cmd_opts;

    app->add_option("test", cmd_opts.test_path, "Test definition the fixture belongs to")->required();
    app->add_option("policy", cmd_opts.found, "Policy to check")->required();

    app->callback([&opts]() {
        std::exit(cmd_assert(opts, cmd_opts));
    });
}

} // namespace polcanon::cli::commands
