#include "yxa/config_json.hpp"

namespace yxa {

namespace {

void put_if_set(nlohmann::json& j, const char* key, const std::string& value) {
    if (!value.empty()) {
        j[key] = value;
    }
}

nlohmann::json param_to_json(const Param& param) {
    nlohmann::json j;
    j["name"] = param.name;
    j["type"] = param.type.empty() ? std::string("string") : param.type;
    put_if_set(j, "default", param.default_value);
    put_if_set(j, "description", param.description);
    if (param.required) j["required"] = true;
    if (param.flag) j["flag"] = true;
    if (param.position >= 0) j["position"] = param.position;
    return j;
}

} // namespace

nlohmann::json command_to_json(const Command& command) {
    nlohmann::json j = nlohmann::json::object();
    put_if_set(j, "run", command.run);
    if (!command.tasks.empty()) j["tasks"] = command.tasks;
    if (!command.depends.empty()) j["depends"] = command.depends;
    put_if_set(j, "description", command.description);
    put_if_set(j, "condition", command.condition);
    put_if_set(j, "pre", command.pre);
    put_if_set(j, "post", command.post);
    put_if_set(j, "timeout", command.timeout);
    if (command.parallel) j["parallel"] = true;
    put_if_set(j, "workingdir", command.workingdir);

    if (!command.params.empty()) {
        nlohmann::json params = nlohmann::json::array();
        for (const auto& p : command.params) {
            params.push_back(param_to_json(p));
        }
        j["params"] = params;
    }

    if (!command.commands.empty()) {
        nlohmann::json subs = nlohmann::json::object();
        for (const auto& [name, sub] : command.commands) {
            subs[name] = command_to_json(sub);
        }
        j["commands"] = subs;
    }
    return j;
}

nlohmann::json project_config_to_json(const ProjectConfig& config) {
    nlohmann::json j;
    j["name"] = config.name;
    put_if_set(j, "workingdir", config.workingdir);

    nlohmann::json vars = nlohmann::json::object();
    for (const auto& [key, value] : config.variables) {
        vars[key] = value;
    }
    j["variables"] = vars;

    nlohmann::json commands = nlohmann::json::object();
    for (const auto& [name, cmd] : config.commands) {
        commands[name] = command_to_json(cmd);
    }
    j["commands"] = commands;
    return j;
}

nlohmann::json condition_match_to_json(const ConditionMatch& match) {
    nlohmann::json j;
    j["kind"] = condition_kind_to_string(match.kind);
    if (match.kind == ConditionKind::exists) {
        j["path"] = match.left;
    } else if (match.kind != ConditionKind::none) {
        j["left"] = match.left;
        j["right"] = match.right;
    }
    return j;
}

nlohmann::json config_issues_to_json(const std::vector<ConfigIssue>& issues) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& issue : issues) {
        arr.push_back({{"section", issue.section},
                       {"name", issue.name},
                       {"message", issue.message}});
    }
    return arr;
}

nlohmann::json warnings_to_json(const std::vector<WarningObject>& warnings) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : warnings) {
        nlohmann::json entry;
        entry["key"] = w.key;
        entry["action"] = w.action;
        entry["fields"] = w.fields;
        arr.push_back(entry);
    }
    return arr;
}

} // namespace yxa
