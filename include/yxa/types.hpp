#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace yxa {

// Variable name -> value
using VariableMap = std::unordered_map<std::string, std::string>;

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    missing_variable,
    invalid_configuration,
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::missing_variable: return "missing_variable";
        case Warning::invalid_configuration: return "invalid_configuration";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

// ============================================================================
// Warning Action
// ============================================================================

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

// ============================================================================
// Load Errors
// ============================================================================

enum class LoadError {
    config_not_found,
    config_read_failed,
    config_parse_failed,
    env_file_parse_failed,
    global_config_failed,
};

inline const char* load_error_to_string(LoadError e) {
    switch (e) {
        case LoadError::config_not_found: return "config_not_found";
        case LoadError::config_read_failed: return "config_read_failed";
        case LoadError::config_parse_failed: return "config_parse_failed";
        case LoadError::env_file_parse_failed: return "env_file_parse_failed";
        case LoadError::global_config_failed: return "global_config_failed";
        default: return "unknown";
    }
}

// ============================================================================
// Parameter Types
// ============================================================================

enum class ParamType {
    String,
    Int,
    Float,
    Bool
};

inline const char* param_type_to_string(ParamType t) {
    switch (t) {
        case ParamType::String: return "string";
        case ParamType::Int: return "int";
        case ParamType::Float: return "float";
        case ParamType::Bool: return "bool";
        default: return "string";
    }
}

// Empty string parses as String (the default type)
std::optional<ParamType> parse_param_type(const std::string& s);

} // namespace yxa
