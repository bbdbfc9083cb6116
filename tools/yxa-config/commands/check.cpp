/**
 * yxa-config - check command
 *
 * Evaluate a condition. Exit status 0 when true, 1 when false.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <yxa/condition.hpp>
#include <yxa/resolver.hpp>

namespace yxa::cli::commands {

namespace {

struct CheckOptions {
    std::string condition;
    std::vector<std::string> command;
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    auto config = load_config(opts);
    if (!config) {
        return 2;
    }

    std::string condition = check_opts.condition;
    if (!check_opts.command.empty()) {
        const Command* cmd = find_command(*config, check_opts.command);
        if (!cmd) {
            print_error("command not found: " + join(check_opts.command, " "), opts.json);
            return 2;
        }
        condition = cmd->condition;
    }

    ResolutionContext ctx = make_resolution_context(*config);
    std::string resolved = resolve_variables(ctx, condition);
    bool value = evaluate_condition(ctx, condition);

    if (opts.json) {
        nlohmann::json j;
        j["condition"] = condition;
        j["resolved"] = resolved;
        j["match"] = condition_match_to_json(match_condition(resolved));
        j["value"] = value;
        output_json(j);
    } else {
        std::cout << (value ? "true" : "false") << std::endl;
    }

    return value ? 0 : 1;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    auto* cond = app->add_option("condition", check_opts.condition, "Condition to evaluate");
    auto* from = app->add_option("--command", check_opts.command,
                                 "Evaluate the condition of this command instead");
    cond->excludes(from);

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace yxa::cli::commands
