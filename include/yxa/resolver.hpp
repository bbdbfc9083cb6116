#pragma once

#include "yxa/types.hpp"
#include "yxa/warnings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace yxa {

struct ProjectConfig;
struct Command;

// ============================================================================
// Resolution Context
// ============================================================================
//
// A read-only view over the variable sources, highest precedence first:
//   1. parameters        (optional, supplied by the execution layer)
//   2. declared          (document `variables`)
//   3. overlay           (environment file)
//   4. process environment, read at lookup time
// The maps are borrowed and must outlive the context. Sources are never merged.

struct ResolutionContext {
    const VariableMap* parameters = nullptr;
    const VariableMap* declared = nullptr;
    const VariableMap* overlay = nullptr;
    bool use_process_environment = true;
};

// Context over a loaded configuration's declared variables and overlay
ResolutionContext make_resolution_context(const ProjectConfig& config,
                                          const VariableMap* parameters = nullptr);

// Ordered lookup of one name; nullopt when absent from every source.
// A process variable that is set but empty counts as present.
std::optional<std::string> lookup_variable(const ResolutionContext& ctx,
                                           const std::string& name);

// ============================================================================
// Placeholder Substitution
// ============================================================================
//
// Placeholders are $NAME or ${NAME} where NAME is [A-Za-z0-9_]+ (bare names
// match greedily). Substitution is single-pass: inserted values are never
// rescanned. Unresolved placeholders are emitted verbatim.

std::string resolve_variables(const ResolutionContext& ctx, const std::string& input);

// Same, also appending every unresolved name to `missing` in order of appearance
std::string resolve_variables(const ResolutionContext& ctx,
                              const std::string& input,
                              std::vector<std::string>& missing);

// Same, emitting a missing_variable warning per unresolved placeholder
std::string resolve_variables_strict(const ResolutionContext& ctx,
                                     const std::string& input,
                                     const std::string& source_path,
                                     WarningCollector& warnings);

std::vector<std::string> resolve_all(const ResolutionContext& ctx,
                                     const std::vector<std::string>& inputs);

// ============================================================================
// Command Lines
// ============================================================================

// Lines of one command resolved on demand for execution
struct ResolvedCommandLines {
    std::string run;
    std::string pre;
    std::string post;
    std::vector<std::string> tasks;
};

ResolvedCommandLines resolve_command_lines(const ResolutionContext& ctx, const Command& command);

// Load-time pass: overwrite `run` of every command and nested sub-command
void resolve_run_lines(ProjectConfig& config);

} // namespace yxa
