/**
 * polcanon CLI - canonicalize command
 *
 * Print the canonical form of a policy file.
 */

#include "../common.hpp"
#include <polcanon/canonical.hpp>
#include <CLI/CLI.hpp>

namespace polcanon::cli::commands {

namespace {

struct CanonicalizeOptions {
    std::string policy;
    bool show_ids = false;
};

int cmd_canonicalize(const GlobalOptions& opts, const CanonicalizeOptions& cmd_opts) {
    if (!init_command(opts)) {
        return EXIT_ERROR;
    }

    auto content = read_file(cmd_opts.policy);
    if (!content) {
        print_error("failed to read policy: " + cmd_opts.policy, opts.json);
        return EXIT_ERROR;
    }

    auto result = canonicalize(*content);
    if (!result.ok) {
        print_error(result.error, opts.json);
        return EXIT_ERROR;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["path"] = cmd_opts.policy;
        j["canonical"] = result.value;
        if (cmd_opts.show_ids) {
            j["identities"] = nlohmann::json::object();
            for (const auto& [original, canonical] : result.identities) {
                j["identities"][original] = canonical;
            }
        }
        output_json(j);
        return EXIT_MATCH;
    }

    std::cout << result.value;
    if (cmd_opts.show_ids) {
        for (const auto& [original, canonical] : result.identities) {
            std::cerr << original << " -> " << canonical << std::endl;
        }
    }
    return EXIT_MATCH;
}

} // anonymous namespace

void setup_canonicalize(CLI::App* app, GlobalOptions& opts) {
    static CanonicalizeOptions cmd_opts;

    app->add_option("policy", cmd_opts.policy, "Policy file (YAML)")->required();
    app->add_flag("--ids", cmd_opts.show_ids, "Also list rewritten component identifiers");

    app->callback([&opts]() {
        std::exit(cmd_canonicalize(opts, cmd_opts));
    });
}

} // namespace polcanon::cli::commands
