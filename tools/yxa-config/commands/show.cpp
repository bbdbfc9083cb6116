/**
 * yxa-config - show command
 *
 * Print one command as loaded, with its hooks and tasks resolved and its
 * condition evaluated against the current environment.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <yxa/condition.hpp>
#include <yxa/resolver.hpp>

namespace yxa::cli::commands {

namespace {

struct ShowOptions {
    std::vector<std::string> path;
    bool defaults = false;
};

int cmd_show(const GlobalOptions& opts, const ShowOptions& show_opts) {
    auto config = load_config(opts);
    if (!config) {
        return 1;
    }

    const Command* cmd = find_command(*config, show_opts.path);
    if (!cmd) {
        print_error("command not found: " + join(show_opts.path, " "), opts.json);
        return 1;
    }

    VariableMap params;
    if (show_opts.defaults) {
        params = parameter_defaults(*cmd);
    }
    ResolutionContext ctx = make_resolution_context(*config, show_opts.defaults ? &params : nullptr);
    ResolvedCommandLines lines = resolve_command_lines(ctx, *cmd);
    bool enabled = evaluate_condition(ctx, cmd->condition);

    if (opts.json) {
        nlohmann::json j = command_to_json(*cmd);
        j["name"] = join(show_opts.path, " ");
        j["resolved"] = {{"run", lines.run}, {"pre", lines.pre},
                         {"post", lines.post}, {"tasks", lines.tasks}};
        j["enabled"] = enabled;
        output_json(j);
        return 0;
    }

    std::cout << "Command: " << join(show_opts.path, " ") << std::endl;
    if (!cmd->description.empty()) {
        std::cout << "Description: " << cmd->description << std::endl;
    }
    if (!lines.pre.empty()) std::cout << "Pre: " << lines.pre << std::endl;
    if (!lines.run.empty()) std::cout << "Run: " << lines.run << std::endl;
    if (!lines.post.empty()) std::cout << "Post: " << lines.post << std::endl;
    if (!lines.tasks.empty()) {
        std::cout << "Tasks" << (cmd->parallel ? " (parallel):" : ":") << std::endl;
        for (const auto& task : lines.tasks) {
            std::cout << "  " << task << std::endl;
        }
    }
    if (!cmd->depends.empty()) {
        std::cout << "Depends: " << join(cmd->depends, ", ") << std::endl;
    }
    if (!cmd->timeout.empty()) {
        std::cout << "Timeout: " << cmd->timeout << std::endl;
    }
    if (!cmd->condition.empty()) {
        std::cout << "Condition: " << cmd->condition
                  << (enabled ? " (true)" : " (false)") << std::endl;
    }
    if (!cmd->commands.empty()) {
        std::cout << "Sub-commands:" << std::endl;
        for (const auto& entry : cmd->commands) {
            std::cout << "  " << entry.first << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

void setup_show(CLI::App* app, GlobalOptions& opts) {
    static ShowOptions show_opts;

    app->add_option("command", show_opts.path, "Command name, then sub-command names")->required();
    app->add_flag("--defaults", show_opts.defaults, "Resolve with parameter defaults");

    app->callback([&opts]() {
        std::exit(cmd_show(opts, show_opts));
    });
}

} // namespace yxa::cli::commands
