/**
 * yxa-config - Common utilities and types
 */

#pragma once

#include <yxa/config_json.hpp>
#include <yxa/project_config.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace yxa::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool no_global = false;        // --no-global
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

inline void init_logging(const GlobalOptions& opts) {
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

/**
 * Locate and load the configuration named by the global options.
 * Prints the error and returns nullopt on failure.
 */
inline std::optional<ProjectConfig> load_config(const GlobalOptions& opts) {
    init_logging(opts);

    auto path = resolve_config_path(opts.config);
    if (!path.ok) {
        print_error(path.error, opts.json);
        return std::nullopt;
    }

    LoadOptions load_opts;
    load_opts.merge_global = !opts.no_global;

    auto result = load_project_config_from(path.path, load_opts);
    if (!result.ok) {
        print_error(result.error, opts.json);
        return std::nullopt;
    }
    return std::move(result.config);
}

/**
 * Find a command by path ("build" or "parent", "child", ...).
 */
inline const Command* find_command(const ProjectConfig& config,
                                   const std::vector<std::string>& path) {
    const std::map<std::string, Command>* level = &config.commands;
    const Command* found = nullptr;

    for (const auto& name : path) {
        auto it = level->find(name);
        if (it == level->end()) {
            return nullptr;
        }
        found = &it->second;
        level = &found->commands;
    }
    return found;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace yxa::cli
