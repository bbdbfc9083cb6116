#include "yxa/resolver.hpp"
#include "yxa/project_config.hpp"

#include <cstdlib>
#include <functional>

namespace yxa {

namespace {

bool is_name_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '_';
}

std::optional<std::string> find_in(const VariableMap* map, const std::string& name) {
    if (map) {
        auto it = map->find(name);
        if (it != map->end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

// Scan `input` once, calling on_missing(name) for every placeholder that
// resolves nowhere. Shared by all resolve_variables overloads.
std::string substitute(const ResolutionContext& ctx,
                       const std::string& input,
                       const std::function<void(const std::string&)>& on_missing) {
    std::string output;
    output.reserve(input.size());

    auto substitute_var = [&](const std::string& name, size_t begin, size_t end) {
        if (auto value = lookup_variable(ctx, name)) {
            output += *value;
        } else {
            if (on_missing) on_missing(name);
            output.append(input, begin, end - begin);  // keep the placeholder text
        }
    };

    size_t i = 0;
    while (i < input.size()) {
        if (input[i] != '$' || i + 1 >= input.size()) {
            output += input[i];
            ++i;
            continue;
        }

        if (is_name_char(input[i + 1])) {
            // $NAME - read the longest identifier
            size_t end = i + 1;
            while (end < input.size() && is_name_char(input[end])) {
                ++end;
            }
            substitute_var(input.substr(i + 1, end - i - 1), i, end);
            i = end;
        } else if (input[i + 1] == '{') {
            // ${NAME} - identifier characters only, then the closing brace
            size_t end = i + 2;
            while (end < input.size() && is_name_char(input[end])) {
                ++end;
            }
            if (end > i + 2 && end < input.size() && input[end] == '}') {
                substitute_var(input.substr(i + 2, end - i - 2), i, end + 1);
                i = end + 1;
            } else {
                // Not a placeholder, copy the '$' literally
                output += input[i];
                ++i;
            }
        } else {
            // Lone $ or $ followed by non-identifier
            output += input[i];
            ++i;
        }
    }

    return output;
}

void resolve_run_recursive(const ResolutionContext& ctx, std::map<std::string, Command>& commands) {
    for (auto& [name, command] : commands) {
        command.run = resolve_variables(ctx, command.run);
        resolve_run_recursive(ctx, command.commands);
    }
}

} // namespace

ResolutionContext make_resolution_context(const ProjectConfig& config,
                                          const VariableMap* parameters) {
    ResolutionContext ctx;
    ctx.parameters = parameters;
    ctx.declared = &config.variables;
    ctx.overlay = &config.env_file_vars;
    return ctx;
}

std::optional<std::string> lookup_variable(const ResolutionContext& ctx,
                                           const std::string& name) {
    if (auto v = find_in(ctx.parameters, name)) return v;
    if (auto v = find_in(ctx.declared, name)) return v;
    if (auto v = find_in(ctx.overlay, name)) return v;

    if (ctx.use_process_environment) {
        const char* val = std::getenv(name.c_str());
        if (val) {
            return std::string(val);
        }
    }
    return std::nullopt;
}

std::string resolve_variables(const ResolutionContext& ctx, const std::string& input) {
    if (input.empty()) {
        return input;
    }
    return substitute(ctx, input, nullptr);
}

std::string resolve_variables(const ResolutionContext& ctx,
                              const std::string& input,
                              std::vector<std::string>& missing) {
    return substitute(ctx, input, [&missing](const std::string& name) {
        missing.push_back(name);
    });
}

std::string resolve_variables_strict(const ResolutionContext& ctx,
                                     const std::string& input,
                                     const std::string& source_path,
                                     WarningCollector& warnings) {
    return substitute(ctx, input, [&](const std::string& name) {
        warnings.emit(Warning::missing_variable, yxa::warnings::missing_variable(name, source_path));
    });
}

std::vector<std::string> resolve_all(const ResolutionContext& ctx,
                                     const std::vector<std::string>& inputs) {
    std::vector<std::string> result;
    result.reserve(inputs.size());
    for (const auto& s : inputs) {
        result.push_back(resolve_variables(ctx, s));
    }
    return result;
}

ResolvedCommandLines resolve_command_lines(const ResolutionContext& ctx, const Command& command) {
    ResolvedCommandLines lines;
    lines.run = resolve_variables(ctx, command.run);
    lines.pre = resolve_variables(ctx, command.pre);
    lines.post = resolve_variables(ctx, command.post);
    lines.tasks = resolve_all(ctx, command.tasks);
    return lines;
}

void resolve_run_lines(ProjectConfig& config) {
    ResolutionContext ctx = make_resolution_context(config);
    resolve_run_recursive(ctx, config.commands);
}

} // namespace yxa
