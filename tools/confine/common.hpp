/**
 * confine CLI - Common utilities and types
 */

#pragma once

#include <confine/confine.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace confine::cli {

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_REJECTED = 1;
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_CAPTURE_FAILED = 3;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet

    // Filled in by bootstrap_guard before any command runs
    GuardConfig guard;
    std::vector<std::string> warnings;
};

// Portable getenv that avoids MSVC warnings
inline std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

inline std::unordered_map<std::string, std::string> read_confine_env() {
    std::unordered_map<std::string, std::string> env;
    for (const char* name : {"CONFINE_BASE", "CONFINE_LOG_LEVEL"}) {
        std::string value = safe_getenv(name);
        if (!value.empty()) {
            env[name] = value;
        }
    }
    return env;
}

/**
 * Load the guard configuration (file, then environment) and seal the codec
 * table unless the configuration turns sealing off.
 */
struct BootstrapResult {
    bool ok = false;
    std::string error;
    GuardConfig config;
    std::vector<std::string> warnings;
};

inline BootstrapResult bootstrap_guard(const std::string& config_path,
                                       const std::unordered_map<std::string, std::string>& env,
                                       CodecTable& table) {
    BootstrapResult result;

    if (!config_path.empty()) {
        auto loaded = load_guard_config(config_path);
        if (!loaded.ok) {
            result.error = "Invalid config " + config_path + ": " + loaded.error;
            return result;
        }
        result.config = loaded.config;
        result.warnings = loaded.warnings;
    }

    auto env_warnings = apply_env_overrides(result.config, env);
    result.warnings.insert(result.warnings.end(), env_warnings.begin(), env_warnings.end());

    if (result.config.seal_ambient) {
        table.seal();
    }

    result.ok = true;
    return result;
}

/**
 * Parse a hex command-line argument into bytes.
 * Rejects odd length and any non-hex digit instead of truncating.
 */
inline std::optional<Bytes> parse_hex_arg(const std::string& arg) {
    if (arg.size() % 2 != 0) {
        return std::nullopt;
    }
    auto digit = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    Bytes out;
    out.reserve(arg.size() / 2);
    for (size_t i = 0; i < arg.size(); i += 2) {
        int hi = digit(arg[i]);
        int lo = digit(arg[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warnings(const std::vector<std::string>& warnings, bool quiet) {
    if (quiet) return;
    for (const auto& w : warnings) {
        std::cerr << "Warning: " << w << std::endl;
    }
}

} // namespace confine::cli
