#include "confine/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace confine {

bool is_log_level(const std::string& level) {
    return level == "debug" || level == "info" || level == "warn" ||
           level == "error" || level == "off";
}

bool set_log_level(const std::string& level) {
    if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::set_level(spdlog::level::info);
        return level == "info";
    }
    return true;
}

void log_to_stderr() {
    auto logger = spdlog::get("confine");
    if (!logger) {
        logger = spdlog::stderr_color_mt("confine");
    }
    spdlog::set_default_logger(logger);
}

} // namespace confine
