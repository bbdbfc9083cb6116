#pragma once

#include "yxa/project_config.hpp"
#include "yxa/warnings.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace yxa {

// ============================================================================
// Configuration Validation
// ============================================================================
//
// Optional pass over a loaded configuration. Loading never runs it, and it
// does not inspect dependency names or graph shape.

struct ConfigIssue {
    std::string section;  // e.g. "command timeout", "command 'build' parameter"
    std::string name;
    std::string message;

    // "config error in <section> '<name>': <message>"
    std::string to_string() const;
};

std::vector<ConfigIssue> validate_project_config(const ProjectConfig& config);

// Emit one invalid_configuration warning per issue
void report_config_issues(const std::vector<ConfigIssue>& issues, WarningCollector& warnings);

// Parse a duration such as "300ms", "30s", "5m", "1h30m" or "1.5h".
// Units: ns, us, ms, s, m, h. A bare "0" is allowed.
std::optional<std::chrono::nanoseconds> parse_duration(const std::string& text);

} // namespace yxa
