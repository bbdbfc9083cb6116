#pragma once

#include "yxa/condition.hpp"
#include "yxa/project_config.hpp"
#include "yxa/validation.hpp"

#include <nlohmann/json.hpp>

namespace yxa {

// ============================================================================
// JSON Rendering
// ============================================================================
//
// Mirrors the document shape. The environment overlay is never included.
// Empty optional fields are omitted.

nlohmann::json command_to_json(const Command& command);

nlohmann::json project_config_to_json(const ProjectConfig& config);

nlohmann::json condition_match_to_json(const ConditionMatch& match);

nlohmann::json config_issues_to_json(const std::vector<ConfigIssue>& issues);

nlohmann::json warnings_to_json(const std::vector<WarningObject>& warnings);

} // namespace yxa
