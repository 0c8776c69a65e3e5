/**
 * polcanon CLI - rules command
 *
 * Show the filter rules applied to every policy.
 */

#include "../common.hpp"
#include <polcanon/filter.hpp>
#include <CLI/CLI.hpp>

namespace polcanon::cli::commands {

namespace {

void print_rules(const std::vector<FilterRule>& rules, const std::string& indent) {
    for (const auto& rule : rules) {
        std::cout << indent << rule_kind_to_string(rule.kind) << " " << rule.path;
        switch (rule.kind) {
            case RuleKind::RenameKeys:
                std::cout << " /" << rule.pattern << "/ -> " << rule.replacement;
                break;
            case RuleKind::ReplaceValues:
                std::cout << " -> " << rule.replacement;
                break;
            case RuleKind::Delete:
                if (rule.only_if_empty) {
                    std::cout << " (if empty";
                    if (!rule.ignore_values.empty()) {
                        std::cout << ", ignoring " << Value(rule.ignore_values).dump();
                    }
                    std::cout << ")";
                }
                break;
            default:
                break;
        }
        std::cout << std::endl;
        if (!rule.nested.empty()) {
            print_rules(rule.nested, indent + "  ");
        }
    }
}

int cmd_rules(const GlobalOptions& opts) {
    if (!init_command(opts)) {
        return EXIT_ERROR;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["rules"] = rules_to_json(policy_rule_table());
        output_json(j);
        return EXIT_MATCH;
    }

    print_rules(policy_rule_table(), "");
    return EXIT_MATCH;
}

} // anonymous namespace

void setup_rules(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_rules(opts));
    });
}

} // namespace polcanon::cli::commands
