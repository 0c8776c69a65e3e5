/**
 * polcanon CLI - compare command
 *
 * Diff two policy files after canonicalization.
 */

#include "../common.hpp"
#include <polcanon/diff.hpp>
#include <CLI/CLI.hpp>

namespace polcanon::cli::commands {

namespace {

struct CompareCommandOptions {
    std::string expected;
    std::string found;
};

int cmd_compare(const GlobalOptions& opts, const CompareCommandOptions& cmd_opts) {
    auto config = init_command(opts);
    if (!config) {
        return EXIT_ERROR;
    }

    auto expected = read_file(cmd_opts.expected);
    if (!expected) {
        print_error("failed to read expected policy: " + cmd_opts.expected, opts.json);
        return EXIT_ERROR;
    }
    auto found = read_file(cmd_opts.found);
    if (!found) {
        print_error("failed to read found policy: " + cmd_opts.found, opts.json);
        return EXIT_ERROR;
    }

    auto result = compare(*expected, *found, compare_options(*config));
    if (!result.ok) {
        print_error(result.error, opts.json);
        return EXIT_ERROR;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["match"] = result.diff.empty();
        if (!result.diff.empty()) {
            j["diff"] = result.diff;
        }
        output_json(j);
    } else if (!result.diff.empty()) {
        std::cout << result.diff;
    } else if (!opts.quiet) {
        print_success("policies match", opts.json);
    }

    return result.diff.empty() ? EXIT_MATCH : EXIT_MISMATCH;
}

} // anonymous namespace

void setup_compare(CLI::App* app, GlobalOptions& opts) {
    static CompareCommandOptions cmd_opts;

    app->add_option("expected", cmd_opts.expected, "Expected policy (fixture)")->required();
    app->add_option("found", cmd_opts.found, "Found policy")->required();

    app->callback([&opts]() {
        std::exit(cmd_compare(opts, cmd_opts));
    });
}

} // namespace polcanon::cli::commands
