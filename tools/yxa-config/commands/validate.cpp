/**
 * yxa-config - validate command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <yxa/validation.hpp>

namespace yxa::cli::commands {

namespace {

int cmd_validate(const GlobalOptions& opts) {
    auto config = load_config(opts);
    if (!config) {
        return 1;
    }

    auto issues = validate_project_config(*config);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = issues.empty();
        j["issues"] = config_issues_to_json(issues);
        output_json(j);
    } else if (issues.empty()) {
        if (!opts.quiet) {
            std::cout << "OK" << std::endl;
        }
    } else {
        for (const auto& issue : issues) {
            std::cerr << issue.to_string() << std::endl;
        }
    }

    return issues.empty() ? 0 : 1;
}

} // anonymous namespace

void setup_validate(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_validate(opts));
    });
}

} // namespace yxa::cli::commands
