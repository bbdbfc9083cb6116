#pragma once

#include "yxa/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace yxa {

// ============================================================================
// Command Parameters
// ============================================================================

struct Param {
    std::string name;         // "name" or "name|n" (long name with shorthand)
    std::string type;         // string | int | float | bool, empty means string
    std::string default_value;
    std::string description;
    bool required = false;
    bool flag = false;
    int position = -1;        // -1 when not positional
};

// Split "name|n" into {"name", "n"}; shorthand is empty when absent
struct ParamName {
    std::string name;
    std::string shorthand;
};

ParamName split_param_name(const std::string& definition);

// ============================================================================
// Command Record
// ============================================================================

struct Command {
    std::string run;                        // primary command line
    std::vector<std::string> tasks;         // multiple command lines
    std::map<std::string, Command> commands;  // nested sub-commands
    std::vector<std::string> depends;       // not validated here
    std::string description;
    std::string condition;                  // empty means always runs
    std::string pre;
    std::string post;
    std::string timeout;                    // e.g. "30s", "5m"
    bool parallel = false;
    std::vector<Param> params;
    std::string workingdir;
};

// ============================================================================
// Configuration Record
// ============================================================================

struct ProjectConfig {
    std::string name;
    VariableMap variables;                  // declared in the document
    std::map<std::string, Command> commands;
    std::string workingdir;

    // Populated from the environment file at load time; never serialized
    VariableMap env_file_vars;

    // File the record was loaded from (empty when parsed from a string)
    std::string source_path;
};

// ============================================================================
// Parsing and Loading
// ============================================================================

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    ProjectConfig config;
};

// Parse a project document from YAML text. Performs no variable substitution.
ConfigParseResult parse_project_config(const std::string& yaml_str,
                                       const std::string& source_path = "");

struct LoadOptions {
    // Environment file; empty means ".env" beside the config file
    std::string env_file;
    // Merge $XDG_CONFIG_HOME/yxa/config.yml or ~/.yxa.yml underneath the project
    bool merge_global = true;
};

struct ConfigLoadResult {
    bool ok = false;
    LoadError error_kind = LoadError::config_not_found;
    std::string error;
    ProjectConfig config;
    std::vector<std::string> warnings;
};

// Load ./yxa.yml
ConfigLoadResult load_project_config();

// Load an explicit file: parse, read the environment file, resolve every
// command's run line once, then merge the global config if present.
ConfigLoadResult load_project_config_from(const std::string& config_path,
                                          const LoadOptions& options = {});

// Project values override global values key by key
ProjectConfig merge_configs(const ProjectConfig& global, const ProjectConfig& project);

// Global config candidates in order, skipping `current_path`; nullopt if none exists
std::optional<std::string> find_global_config(const std::string& current_path);

struct ConfigPathResult {
    bool ok = false;
    std::string path;
    std::string error;
};

// Priority: explicit path > YXA_CONFIG > ./yxa.yml > XDG config > ~/.yxa.yml
ConfigPathResult resolve_config_path(const std::string& flag_path = "");

// Declared defaults of every parameter that has one, keyed by long name
VariableMap parameter_defaults(const Command& command);

} // namespace yxa
