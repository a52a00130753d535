#pragma once

#include <string>

namespace confine {

// Known levels: debug, info, warn, error, off.
bool is_log_level(const std::string& level);

// Apply a level to the default spdlog logger. Unknown names fall back to
// info and return false.
bool set_log_level(const std::string& level);

// Replace the default logger with one writing to stderr, keeping stdout for
// command output.
void log_to_stderr();

} // namespace confine
