/**
 * yxa-config - list command
 *
 * Print every command and sub-command with its description.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <algorithm>

namespace yxa::cli::commands {

namespace {

void collect(const std::string& prefix,
             const std::map<std::string, Command>& commands,
             std::vector<std::pair<std::string, const Command*>>& out) {
    for (const auto& [name, cmd] : commands) {
        std::string full = prefix.empty() ? name : prefix + " " + name;
        out.emplace_back(full, &cmd);
        collect(full, cmd.commands, out);
    }
}

int cmd_list(const GlobalOptions& opts) {
    auto config = load_config(opts);
    if (!config) {
        return 1;
    }

    std::vector<std::pair<std::string, const Command*>> entries;
    collect("", config->commands, entries);

    if (opts.json) {
        nlohmann::json j;
        j["name"] = config->name;
        j["commands"] = nlohmann::json::array();
        for (const auto& [name, cmd] : entries) {
            j["commands"].push_back({{"name", name}, {"description", cmd->description}});
        }
        output_json(j);
        return 0;
    }

    if (!config->name.empty()) {
        std::cout << config->name << std::endl;
    }
    size_t width = 0;
    for (const auto& entry : entries) {
        width = std::max(width, entry.first.size());
    }
    for (const auto& [name, cmd] : entries) {
        std::cout << "  " << name << std::string(width - name.size() + 2, ' ')
                  << cmd->description << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_list(opts));
    });
}

} // namespace yxa::cli::commands
