#include "yxa/validation.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <map>
#include <set>

namespace yxa {

namespace {

bool valid_default(ParamType type, const std::string& value) {
    if (value.empty()) return true;

    switch (type) {
        case ParamType::String:
            return true;
        case ParamType::Int: {
            char* end = nullptr;
            std::strtoll(value.c_str(), &end, 10);
            return end != value.c_str() && *end == '\0';
        }
        case ParamType::Float: {
            char* end = nullptr;
            std::strtod(value.c_str(), &end);
            return end != value.c_str() && *end == '\0';
        }
        case ParamType::Bool: {
            static const std::set<std::string> accepted = {
                "1", "t", "T", "TRUE", "true", "True",
                "0", "f", "F", "FALSE", "false", "False",
            };
            return accepted.count(value) > 0;
        }
    }
    return false;
}

void validate_params(const std::string& cmd_name, const Command& cmd,
                     std::vector<ConfigIssue>& issues) {
    std::string section = "command '" + cmd_name + "' parameter";
    std::set<std::string> seen;
    std::map<int, std::string> positions;

    for (const auto& param : cmd.params) {
        std::string name = split_param_name(param.name).name;

        if (name.empty()) {
            issues.push_back({section, param.name, "parameter name is empty"});
            continue;
        }
        if (!seen.insert(name).second) {
            issues.push_back({section, name, "duplicate parameter name"});
        }

        auto type = parse_param_type(param.type);
        if (!type) {
            issues.push_back({section, name, "unsupported parameter type '" + param.type + "'"});
        } else if (!valid_default(*type, param.default_value)) {
            issues.push_back({section, name,
                              "invalid default '" + param.default_value + "' for type " +
                              param_type_to_string(*type)});
        }

        if (!param.flag && param.position >= 0) {
            auto [it, inserted] = positions.emplace(param.position, name);
            if (!inserted) {
                issues.push_back({"command '" + cmd_name + "' parameter position",
                                  it->second + ", " + name,
                                  "conflicting position " + std::to_string(param.position)});
            }
        }
    }

    // Positions must run 0..n-1 without gaps
    int expected = 0;
    for (const auto& [pos, name] : positions) {
        if (pos != expected) {
            issues.push_back({"command '" + cmd_name + "' parameter position", name,
                              "gap in positional parameters at position " + std::to_string(expected)});
            break;
        }
        ++expected;
    }
}

void validate_commands(const std::string& prefix,
                       const std::map<std::string, Command>& commands,
                       std::vector<ConfigIssue>& issues) {
    for (const auto& [name, cmd] : commands) {
        std::string full = prefix.empty() ? name : prefix + " " + name;

        if (!cmd.timeout.empty() && !parse_duration(cmd.timeout)) {
            issues.push_back({"command timeout", full, "invalid timeout '" + cmd.timeout + "'"});
        }
        if (cmd.parallel && cmd.tasks.empty()) {
            issues.push_back({"command parallel", full, "parallel is set but no tasks are defined"});
        }
        validate_params(full, cmd, issues);
        validate_commands(full, cmd.commands, issues);
    }
}

} // namespace

std::string ConfigIssue::to_string() const {
    return "config error in " + section + " '" + name + "': " + message;
}

std::vector<ConfigIssue> validate_project_config(const ProjectConfig& config) {
    std::vector<ConfigIssue> issues;
    validate_commands("", config.commands, issues);
    return issues;
}

void report_config_issues(const std::vector<ConfigIssue>& issues, WarningCollector& warnings) {
    for (const auto& issue : issues) {
        warnings.emit(Warning::invalid_configuration,
                      yxa::warnings::invalid_configuration(issue.to_string(), issue.section));
    }
}

std::optional<std::chrono::nanoseconds> parse_duration(const std::string& text) {
    if (text.empty()) return std::nullopt;
    if (text == "0") return std::chrono::nanoseconds(0);

    static const std::map<std::string, double> units = {
        {"ns", 1.0},
        {"us", 1e3},
        {"ms", 1e6},
        {"s", 1e9},
        {"m", 60e9},
        {"h", 3600e9},
    };

    double total = 0.0;
    size_t i = 0;
    while (i < text.size()) {
        // Number: digits with an optional fraction
        size_t start = i;
        while (i < text.size() && (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == '.')) {
            ++i;
        }
        std::string number = text.substr(start, i - start);
        if (number.empty() || number == "." || std::count(number.begin(), number.end(), '.') > 1) {
            return std::nullopt;
        }

        size_t unit_start = i;
        while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        auto unit = units.find(text.substr(unit_start, i - unit_start));
        if (unit == units.end()) {
            return std::nullopt;
        }
        total += std::strtod(number.c_str(), nullptr) * unit->second;
    }

    using rep = std::chrono::nanoseconds::rep;
    if (total >= static_cast<double>(std::numeric_limits<rep>::max())) {
        return std::nullopt;
    }
    return std::chrono::nanoseconds(static_cast<rep>(total));
}

} // namespace yxa
