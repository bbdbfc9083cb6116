#pragma once

#include "yxa/resolver.hpp"

#include <string>

namespace yxa {

// ============================================================================
// Guard Conditions
// ============================================================================
//
// Forms, tried in this order (operands are trimmed):
//   <left> == <right>
//   <left> != <right>
//   <left> contains <right>
//   exists <path>
// Anything else evaluates to false. Operator texts must stay mutually
// exclusive: no operator may be a substring of another.

enum class ConditionKind {
    equals,
    not_equals,
    contains,
    exists,
    none
};

inline const char* condition_kind_to_string(ConditionKind k) {
    switch (k) {
        case ConditionKind::equals: return "equals";
        case ConditionKind::not_equals: return "not_equals";
        case ConditionKind::contains: return "contains";
        case ConditionKind::exists: return "exists";
        case ConditionKind::none: return "none";
        default: return "none";
    }
}

struct ConditionMatch {
    ConditionKind kind = ConditionKind::none;
    std::string left;   // the path for `exists`
    std::string right;  // empty for `exists`
};

// Classify an already-resolved condition; no filesystem access
ConditionMatch match_condition(const std::string& resolved);

// Evaluate an already-resolved condition
bool evaluate_resolved_condition(const std::string& resolved);

// Empty or whitespace-only is true; otherwise resolve placeholders, then match
bool evaluate_condition(const ResolutionContext& ctx, const std::string& condition);

} // namespace yxa
