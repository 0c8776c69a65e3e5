/**
 * polcanon CLI - Entry Point
 *
 * Canonicalize and compare Fleet agent policies against golden fixtures.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace polcanon::cli::commands {
    void setup_canonicalize(CLI::App* app, GlobalOptions& opts);
    void setup_compare(CLI::App* app, GlobalOptions& opts);
    void setup_generate(CLI::App* app, GlobalOptions& opts);
    void setup_assert(CLI::App* app, GlobalOptions& opts);
    void setup_rules(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace polcanon::cli;

    CLI::App app{"polcanon - agent policy canonicalization and diff"};
    app.set_version_flag("-V,--version", POLCANON_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Engine configuration (JSON)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("--trace", opts.trace, "Log canonical forms while comparing");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* canonicalize_cmd = app.add_subcommand("canonicalize", "Print the canonical form of a policy");
    commands::setup_canonicalize(canonicalize_cmd, opts);

    auto* compare_cmd = app.add_subcommand("compare", "Diff two policies after canonicalization");
    commands::setup_compare(compare_cmd, opts);

    auto* generate_cmd = app.add_subcommand("generate", "Write the expected fixture for a test");
    commands::setup_generate(generate_cmd, opts);

    auto* assert_cmd = app.add_subcommand("assert", "Check a policy against a test's expected fixture");
    commands::setup_assert(assert_cmd, opts);

    auto* rules_cmd = app.add_subcommand("rules", "Show the policy filter rules");
    commands::setup_rules(rules_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
