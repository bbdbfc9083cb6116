#pragma once

#include "yxa/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace yxa {

// ============================================================================
// Warning Collector
// ============================================================================

class WarningCollector {
public:
    WarningCollector() = default;

    // Constructor with policy map (warning key -> action)
    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy)
        : policy_(policy) {}

    // Emit a warning with fields
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    // Emit a warning with no fields
    void emit(Warning warning);

    // Emit a warning by key string (for dynamic warning keys)
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Override the policy for one key; takes precedence over the policy map
    void apply_override(const std::string& warning_key, WarningAction action);

    // Get all emitted warnings after policy application
    // Warnings with action "ignore" are excluded
    std::vector<WarningObject> get_warnings() const;

    // Check if any warning was upgraded to error
    bool has_errors() const;

    // Check if any effective warnings remain (excluding ignored)
    bool has_effective_warnings() const;

    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;
    std::unordered_map<std::string, WarningAction> overrides_;

    WarningAction get_effective_action(const std::string& key) const;
};

// ============================================================================
// Field helpers for specific warnings
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> missing_variable(
    const std::string& var_name,
    const std::string& source_path) {
    return {{"missing", var_name}, {"source_path", source_path}};
}

inline std::unordered_map<std::string, std::string> invalid_configuration(
    const std::string& reason,
    const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

} // namespace warnings

} // namespace yxa
