/**
 * yxa-config - resolve command
 *
 * Substitute $NAME and ${NAME} in a string using the project variables,
 * the environment file and the process environment.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <yxa/resolver.hpp>
#include <yxa/warnings.hpp>

namespace yxa::cli::commands {

namespace {

struct ResolveOptions {
    std::string text;
    bool strict = false;
};

int cmd_resolve(const GlobalOptions& opts, const ResolveOptions& resolve_opts) {
    auto config = load_config(opts);
    if (!config) {
        return 1;
    }

    ResolutionContext ctx = make_resolution_context(*config);
    WarningCollector warnings;
    if (resolve_opts.strict) {
        warnings.apply_override(warning_to_string(Warning::missing_variable), WarningAction::Error);
    }
    std::string resolved = resolve_variables_strict(ctx, resolve_opts.text, "argument", warnings);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = !warnings.has_errors();
        j["input"] = resolve_opts.text;
        j["resolved"] = resolved;
        j["warnings"] = warnings_to_json(warnings.get_warnings());
        output_json(j);
    } else {
        std::cout << resolved << std::endl;
        for (const auto& w : warnings.get_warnings()) {
            spdlog::warn("unresolved variable {}", w.fields.at("missing"));
        }
    }

    return warnings.has_errors() ? 1 : 0;
}

} // anonymous namespace

void setup_resolve(CLI::App* app, GlobalOptions& opts) {
    static ResolveOptions resolve_opts;

    app->add_option("text", resolve_opts.text, "Text to resolve")->required();
    app->add_flag("--strict", resolve_opts.strict, "Fail if any placeholder stays unresolved");

    app->callback([&opts]() {
        std::exit(cmd_resolve(opts, resolve_opts));
    });
}

} // namespace yxa::cli::commands
