/**
 * yxa-config - Entry Point
 *
 * Inspect how a yxa project file resolves.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace yxa::cli::commands {
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_show(CLI::App* app, GlobalOptions& opts);
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_validate(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace yxa::cli;

    CLI::App app{"yxa-config - inspect yxa project configuration"};
    app.set_version_flag("-V,--version", YXA_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("-c,--config", opts.config, "Path to the project file");
    app.add_flag("--no-global", opts.no_global, "Do not merge the global config");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    auto* list_cmd = app.add_subcommand("list", "List commands");
    commands::setup_list(list_cmd, opts);

    auto* show_cmd = app.add_subcommand("show", "Show a resolved command");
    commands::setup_show(show_cmd, opts);

    auto* resolve_cmd = app.add_subcommand("resolve", "Substitute variables in text");
    commands::setup_resolve(resolve_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Evaluate a condition");
    commands::setup_check(check_cmd, opts);

    auto* validate_cmd = app.add_subcommand("validate", "Check parameters and timeouts");
    commands::setup_validate(validate_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
