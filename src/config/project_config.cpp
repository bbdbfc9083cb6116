#include "yxa/project_config.hpp"
#include "yxa/env_file.hpp"
#include "yxa/resolver.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace yxa {

namespace {

namespace stdfs = std::filesystem;

// Shape errors inside the document; caught at the parse boundary
class DocumentError : public std::runtime_error {
public:
    DocumentError(const std::string& path, const std::string& message)
        : std::runtime_error(path + ": " + message) {}
};

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string env_or_empty(const char* name) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : std::string();
}

bool is_identifier(const std::string& name) {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

// Scalar as string; null and missing read as empty
std::string scalar_string(const YAML::Node& node, const std::string& path) {
    if (!node || node.IsNull()) {
        return "";
    }
    if (!node.IsScalar()) {
        throw DocumentError(path, "expected a string");
    }
    return node.as<std::string>();
}

std::string get_string(const YAML::Node& map, const std::string& key, const std::string& path) {
    return scalar_string(map[key], path.empty() ? key : path + "." + key);
}

bool get_bool(const YAML::Node& map, const std::string& key, const std::string& path) {
    const YAML::Node node = map[key];
    if (!node || node.IsNull()) {
        return false;
    }
    bool value = false;
    if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
        throw DocumentError(path + "." + key, "expected a boolean");
    }
    return value;
}

std::vector<std::string> get_string_list(const YAML::Node& map, const std::string& key,
                                         const std::string& path) {
    std::vector<std::string> result;
    const YAML::Node node = map[key];
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsSequence()) {
        throw DocumentError(path + "." + key, "expected a list of strings");
    }
    for (size_t i = 0; i < node.size(); ++i) {
        result.push_back(scalar_string(node[i], path + "." + key + "[" + std::to_string(i) + "]"));
    }
    return result;
}

Param parse_param(const YAML::Node& node, const std::string& path) {
    if (!node.IsMap()) {
        throw DocumentError(path, "expected a parameter mapping");
    }
    Param param;
    param.name = get_string(node, "name", path);
    param.type = get_string(node, "type", path);
    param.default_value = get_string(node, "default", path);
    param.description = get_string(node, "description", path);
    param.required = get_bool(node, "required", path);
    param.flag = get_bool(node, "flag", path);

    const YAML::Node position = node["position"];
    if (position && !position.IsNull()) {
        int value = -1;
        if (!position.IsScalar() || !YAML::convert<int>::decode(position, value)) {
            throw DocumentError(path + ".position", "expected an integer");
        }
        param.position = value;
    }
    return param;
}

std::map<std::string, Command> parse_commands(const YAML::Node& node, const std::string& path);

Command parse_command(const YAML::Node& node, const std::string& path) {
    Command cmd;
    if (!node || node.IsNull()) {
        return cmd;
    }
    if (!node.IsMap()) {
        throw DocumentError(path, "expected a command mapping");
    }

    cmd.run = get_string(node, "run", path);
    cmd.tasks = get_string_list(node, "tasks", path);
    cmd.depends = get_string_list(node, "depends", path);
    if (cmd.depends.empty()) {
        cmd.depends = get_string_list(node, "dependencies", path);
    }
    cmd.description = get_string(node, "description", path);
    cmd.condition = get_string(node, "condition", path);
    cmd.pre = get_string(node, "pre", path);
    cmd.post = get_string(node, "post", path);
    cmd.timeout = get_string(node, "timeout", path);
    cmd.parallel = get_bool(node, "parallel", path);
    cmd.workingdir = get_string(node, "workingdir", path);

    const YAML::Node params = node["params"];
    if (params && !params.IsNull()) {
        if (!params.IsSequence()) {
            throw DocumentError(path + ".params", "expected a list of parameters");
        }
        for (size_t i = 0; i < params.size(); ++i) {
            cmd.params.push_back(parse_param(params[i], path + ".params[" + std::to_string(i) + "]"));
        }
    }

    cmd.commands = parse_commands(node["commands"], path + ".commands");
    return cmd;
}

std::map<std::string, Command> parse_commands(const YAML::Node& node, const std::string& path) {
    std::map<std::string, Command> result;
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsMap()) {
        throw DocumentError(path, "expected a mapping of command names");
    }
    for (const auto& entry : node) {
        std::string name = entry.first.as<std::string>();
        result[name] = parse_command(entry.second, path + "." + name);
    }
    return result;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return stdfs::exists(path, ec) && !ec;
}

bool same_file(const std::string& a, const std::string& b) {
    if (a == b) return true;
    std::error_code ec_a;
    std::error_code ec_b;
    auto ca = stdfs::weakly_canonical(a, ec_a);
    auto cb = stdfs::weakly_canonical(b, ec_b);
    return !ec_a && !ec_b && ca == cb;
}

void collect_command_warnings(const std::string& prefix,
                              const std::map<std::string, Command>& commands,
                              std::vector<std::string>& warnings) {
    for (const auto& [name, cmd] : commands) {
        std::string full = prefix.empty() ? name : prefix + " " + name;
        if (cmd.run.empty() && cmd.tasks.empty() && cmd.commands.empty() && cmd.depends.empty()) {
            warnings.push_back("command '" + full + "' has nothing to run");
        }
        collect_command_warnings(full, cmd.commands, warnings);
    }
}

} // namespace

std::optional<ParamType> parse_param_type(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower.empty() || lower == "string") return ParamType::String;
    if (lower == "int") return ParamType::Int;
    if (lower == "float") return ParamType::Float;
    if (lower == "bool") return ParamType::Bool;
    return std::nullopt;
}

ParamName split_param_name(const std::string& definition) {
    ParamName result;
    size_t bar = definition.find('|');
    if (bar == std::string::npos) {
        result.name = definition;
    } else {
        result.name = definition.substr(0, bar);
        result.shorthand = definition.substr(bar + 1);
    }
    return result;
}

ConfigParseResult parse_project_config(const std::string& yaml_str,
                                       const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    try {
        YAML::Node root = YAML::Load(yaml_str);

        if (!root || root.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            result.error = "document must be a mapping";
            return result;
        }

        result.config.name = get_string(root, "name", "");
        result.config.workingdir = get_string(root, "workingdir", "");

        const YAML::Node vars = root["variables"];
        if (vars && !vars.IsNull()) {
            if (!vars.IsMap()) {
                throw DocumentError("variables", "expected a mapping");
            }
            for (const auto& entry : vars) {
                std::string key = entry.first.as<std::string>();
                result.config.variables[key] = scalar_string(entry.second, "variables." + key);
            }
        }

        result.config.commands = parse_commands(root["commands"], "commands");

        result.ok = true;
        return result;

    } catch (const DocumentError& e) {
        result.error = e.what();
        return result;
    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML error: ") + e.what();
        return result;
    }
}

ConfigLoadResult load_project_config() {
    return load_project_config_from((stdfs::path(".") / "yxa.yml").string());
}

ConfigLoadResult load_project_config_from(const std::string& config_path,
                                          const LoadOptions& options) {
    ConfigLoadResult result;

    if (!file_exists(config_path)) {
        result.error_kind = LoadError::config_not_found;
        result.error = "config file not found: " + config_path;
        return result;
    }

    auto content = read_file(config_path);
    if (!content) {
        result.error_kind = LoadError::config_read_failed;
        result.error = "failed to read config file: " + config_path;
        return result;
    }

    auto parsed = parse_project_config(*content, config_path);
    if (!parsed.ok) {
        result.error_kind = LoadError::config_parse_failed;
        result.error = "failed to parse config file " + config_path + ": " + parsed.error;
        return result;
    }
    result.config = std::move(parsed.config);
    spdlog::debug("loaded config {} ({} commands)", config_path, result.config.commands.size());

    std::string env_path = options.env_file;
    if (env_path.empty()) {
        env_path = (stdfs::path(config_path).parent_path() / ".env").string();
    }
    if (file_exists(env_path)) {
        auto env = read_env_file(env_path);
        if (!env.ok) {
            result.error_kind = LoadError::env_file_parse_failed;
            result.error = "failed to read .env file: " + env.error;
            return result;
        }
        result.config.env_file_vars = std::move(env.values);
        spdlog::debug("read {} variables from {}", result.config.env_file_vars.size(), env_path);
    }

    resolve_run_lines(result.config);

    for (const auto& [name, value] : result.config.variables) {
        if (!is_identifier(name)) {
            result.warnings.push_back("variable '" + name + "' can never be referenced");
        }
    }
    collect_command_warnings("", result.config.commands, result.warnings);

    if (options.merge_global) {
        if (auto global_path = find_global_config(config_path)) {
            LoadOptions global_options;
            global_options.env_file = env_path;
            global_options.merge_global = false;

            auto global = load_project_config_from(*global_path, global_options);
            if (!global.ok) {
                result.error_kind = LoadError::global_config_failed;
                result.error = "failed to load global config: " + global.error;
                return result;
            }
            spdlog::debug("merging global config {}", *global_path);
            result.config = merge_configs(global.config, result.config);
            result.warnings.insert(result.warnings.end(),
                                   global.warnings.begin(), global.warnings.end());
        }
    }

    for (const auto& w : result.warnings) {
        spdlog::warn("{}", w);
    }

    result.ok = true;
    return result;
}

ProjectConfig merge_configs(const ProjectConfig& global, const ProjectConfig& project) {
    ProjectConfig merged = global;

    if (!project.name.empty()) {
        merged.name = project.name;
    }
    if (!project.workingdir.empty()) {
        merged.workingdir = project.workingdir;
    }
    for (const auto& [key, value] : project.variables) {
        merged.variables[key] = value;
    }
    for (const auto& [key, value] : project.env_file_vars) {
        merged.env_file_vars[key] = value;
    }
    for (const auto& [key, cmd] : project.commands) {
        merged.commands[key] = cmd;
    }
    merged.source_path = project.source_path;
    return merged;
}

std::optional<std::string> find_global_config(const std::string& current_path) {
    std::vector<std::string> candidates;

    std::string xdg = env_or_empty("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        candidates.push_back((stdfs::path(xdg) / "yxa" / "config.yml").string());
    }
    std::string home = env_or_empty("HOME");
    if (!home.empty()) {
        candidates.push_back((stdfs::path(home) / ".yxa.yml").string());
    }

    for (const auto& candidate : candidates) {
        if (same_file(candidate, current_path)) {
            continue;
        }
        if (file_exists(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

ConfigPathResult resolve_config_path(const std::string& flag_path) {
    ConfigPathResult result;

    if (!flag_path.empty()) {
        spdlog::debug("using config path from flag: {}", flag_path);
        result.ok = true;
        result.path = flag_path;
        return result;
    }

    std::string env_path = env_or_empty("YXA_CONFIG");
    if (!env_path.empty()) {
        spdlog::debug("using config path from YXA_CONFIG: {}", env_path);
        result.ok = true;
        result.path = env_path;
        return result;
    }

    std::vector<std::string> candidates;
    candidates.push_back((stdfs::path(".") / "yxa.yml").string());
    std::string xdg = env_or_empty("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        candidates.push_back((stdfs::path(xdg) / "yxa" / "config.yml").string());
    }
    std::string home = env_or_empty("HOME");
    if (!home.empty()) {
        candidates.push_back((stdfs::path(home) / ".yxa.yml").string());
    }

    for (const auto& candidate : candidates) {
        if (file_exists(candidate)) {
            spdlog::debug("found config file at {}", candidate);
            result.ok = true;
            result.path = candidate;
            return result;
        }
        spdlog::debug("no config file at {}", candidate);
    }

    result.error = "no yxa config file found";
    return result;
}

VariableMap parameter_defaults(const Command& command) {
    VariableMap defaults;
    for (const auto& param : command.params) {
        if (!param.default_value.empty()) {
            defaults[split_param_name(param.name).name] = param.default_value;
        }
    }
    return defaults;
}

} // namespace yxa
