#pragma once

#include "yxa/types.hpp"

#include <string>
#include <vector>

namespace yxa {

// ============================================================================
// Environment File (.env)
// ============================================================================
//
// Supported lines:
//   KEY=VALUE
//   export KEY=VALUE
//   KEY="VALUE"   (double-quoted, \n \t \" \\ escapes)
//   KEY='VALUE'   (single-quoted, literal)
//   # comment     (full line, or after an unquoted value preceded by space)
// Blank lines are skipped. A later declaration of a key replaces an earlier one.

struct EnvFileParseResult {
    bool ok = false;
    std::string error;
    VariableMap values;
};

EnvFileParseResult parse_env_file(const std::string& content,
                                  const std::string& source_path = "");

// Read and parse; a missing file is an error here, callers check existence first
EnvFileParseResult read_env_file(const std::string& path);

} // namespace yxa
