#pragma once

#include "confine/validator.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace confine {

// ============================================================================
// Guard Configuration
// ============================================================================
//
// {
//   "$schema": "confine.guard.v1",
//   "base": "/srv/data",
//   "encoding": "utf8",
//   "symlinks": "resolve",
//   "seal_ambient": true,
//   "log_level": "info"
// }

struct GuardConfig {
    std::string schema;  // MUST be "confine.guard.v1"
    std::string base;
    ValidatorOptions options;
    bool seal_ambient = true;
    std::string log_level = "info";

    // Source path for diagnostics
    std::string source_path;
};

struct GuardConfigParseResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> warnings;  // "<kind>:<detail>"
    GuardConfig config;
};

// Invalid optional values produce a warning and keep the default. A missing
// or mismatched $schema, a missing base, or malformed JSON is an error.
GuardConfigParseResult parse_guard_config(const std::string& json_str,
                                          const std::string& source_path = "");

GuardConfigParseResult load_guard_config(const std::string& path);

// CONFINE_BASE replaces base, CONFINE_LOG_LEVEL replaces log_level.
// Returns warnings for values that were ignored.
std::vector<std::string> apply_env_overrides(
    GuardConfig& config,
    const std::unordered_map<std::string, std::string>& env);

} // namespace confine
