#include "yxa/warnings.hpp"

#include <algorithm>
#include <cctype>

namespace yxa {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Warning> parse_warning_key(const std::string& key) {
    static const Warning all[] = {
        Warning::missing_variable,
        Warning::invalid_configuration,
    };
    std::string lower = to_lower(key);
    for (Warning w : all) {
        if (lower == warning_to_string(w)) {
            return w;
        }
    }
    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

// ============================================================================
// WarningCollector Implementation
// ============================================================================

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(Warning warning) {
    emit(warning_to_string(warning), {});
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    WarningAction action = get_effective_action(warning_key);

    // Ignored warnings are still collected but filtered on read
    warnings_.push_back({to_lower(warning_key), std::move(fields), action});
}

void WarningCollector::apply_override(const std::string& warning_key, WarningAction action) {
    overrides_[to_lower(warning_key)] = action;
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

bool WarningCollector::has_errors() const {
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action == WarningAction::Error;
    });
}

bool WarningCollector::has_effective_warnings() const {
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action != WarningAction::Ignore;
    });
}

void WarningCollector::clear() {
    warnings_.clear();
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    std::string lower_key = to_lower(key);

    auto override_it = overrides_.find(lower_key);
    if (override_it != overrides_.end()) {
        return override_it->second;
    }

    auto policy_it = policy_.find(lower_key);
    if (policy_it != policy_.end()) {
        return policy_it->second;
    }

    // Default: warn
    return WarningAction::Warn;
}

} // namespace yxa
