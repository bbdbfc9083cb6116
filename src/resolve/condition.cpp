#include "yxa/condition.hpp"

#include <cctype>
#include <filesystem>
#include <system_error>

namespace yxa {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// <left> OP <right>: first OP with at least one character on each side
bool match_binary(const std::string& s, const std::string& op, ConditionMatch& out) {
    size_t pos = s.find(op, 1);
    if (pos == std::string::npos || pos + op.size() >= s.size()) {
        return false;
    }
    out.left = trim(s.substr(0, pos));
    out.right = trim(s.substr(pos + op.size()));
    return true;
}

bool match_equals(const std::string& s, ConditionMatch& out) {
    return match_binary(s, "==", out);
}

bool match_not_equals(const std::string& s, ConditionMatch& out) {
    return match_binary(s, "!=", out);
}

// <left> contains <right>: the keyword needs whitespace on both sides, a
// character before that whitespace and a character after it
bool match_contains(const std::string& s, ConditionMatch& out) {
    static const std::string keyword = "contains";
    size_t pos = s.find(keyword, 2);
    while (pos != std::string::npos) {
        size_t after = pos + keyword.size();
        if (is_space(s[pos - 1]) && after + 1 < s.size() && is_space(s[after])) {
            out.left = trim(s.substr(0, pos));
            out.right = trim(s.substr(after));
            return true;
        }
        pos = s.find(keyword, pos + 1);
    }
    return false;
}

// exists <path>: leading keyword, whitespace, then at least one character
bool match_exists(const std::string& s, ConditionMatch& out) {
    static const std::string keyword = "exists";
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    size_t after = start + keyword.size();
    if (s.compare(start, keyword.size(), keyword) != 0 ||
        after + 1 >= s.size() || !is_space(s[after])) {
        return false;
    }
    out.left = trim(s.substr(after));
    return true;
}

struct ConditionRule {
    ConditionKind kind;
    bool (*match)(const std::string&, ConditionMatch&);
};

// Order is the matching order
const ConditionRule condition_rules[] = {
    {ConditionKind::equals, match_equals},
    {ConditionKind::not_equals, match_not_equals},
    {ConditionKind::contains, match_contains},
    {ConditionKind::exists, match_exists},
};

bool path_exists(const std::string& path) {
    std::error_code ec;
    bool found = std::filesystem::exists(std::filesystem::path(path), ec);
    return !ec && found;
}

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

ConditionMatch match_condition(const std::string& resolved) {
    for (const auto& rule : condition_rules) {
        ConditionMatch match;
        if (rule.match(resolved, match)) {
            match.kind = rule.kind;
            return match;
        }
    }
    return ConditionMatch{};
}

bool evaluate_resolved_condition(const std::string& resolved) {
    ConditionMatch match = match_condition(resolved);

    switch (match.kind) {
        case ConditionKind::equals:
            return match.left == match.right;
        case ConditionKind::not_equals:
            return match.left != match.right;
        case ConditionKind::contains:
            return match.left.find(match.right) != std::string::npos;
        case ConditionKind::exists:
            return path_exists(match.left);
        case ConditionKind::none:
            return false;
    }

    return false;
}

bool evaluate_condition(const ResolutionContext& ctx, const std::string& condition) {
    if (is_blank(condition)) {
        return true;
    }
    return evaluate_resolved_condition(resolve_variables(ctx, condition));
}

} // namespace yxa
