#include "confine/guard_config.hpp"
#include "confine/logging.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

namespace confine {

namespace {

const char* GUARD_SCHEMA = "confine.guard.v1";

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<SymlinkPolicy> parse_symlink_policy(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v == "resolve") return SymlinkPolicy::Resolve;
    if (v == "lexical") return SymlinkPolicy::Lexical;
    return std::nullopt;
}

bool is_known_key(const std::string& key) {
    return key == "$schema" || key == "base" || key == "encoding" || key == "symlinks" ||
           key == "seal_ambient" || key == "log_level";
}

} // namespace

GuardConfigParseResult parse_guard_config(const std::string& json_str,
                                          const std::string& source_path) {
    GuardConfigParseResult result;
    result.config.source_path = source_path;

    nlohmann::json j = nlohmann::json::parse(json_str, nullptr, false);
    if (j.is_discarded()) {
        result.error = "invalid JSON";
        return result;
    }
    if (!j.is_object()) {
        result.error = "JSON must be an object";
        return result;
    }

    // $schema (REQUIRED)
    if (auto schema = get_string(j, "$schema")) {
        result.config.schema = trim(*schema);
    } else {
        result.error = "$schema missing";
        return result;
    }
    if (result.config.schema != GUARD_SCHEMA) {
        result.error = std::string("$schema mismatch: expected ") + GUARD_SCHEMA;
        return result;
    }

    // base (REQUIRED)
    if (auto base = get_string(j, "base")) {
        result.config.base = *base;
    }
    if (result.config.base.empty()) {
        result.error = "base missing";
        return result;
    }

    if (j.contains("encoding")) {
        auto name = get_string(j, "encoding");
        auto encoding = name ? parse_encoding(trim(*name)) : std::nullopt;
        if (encoding) {
            result.config.options.encoding = *encoding;
        } else {
            result.warnings.push_back("invalid_configuration:invalid_encoding");
        }
    }

    if (j.contains("symlinks")) {
        auto name = get_string(j, "symlinks");
        auto policy = name ? parse_symlink_policy(*name) : std::nullopt;
        if (policy) {
            result.config.options.symlinks = *policy;
        } else {
            result.warnings.push_back("invalid_configuration:invalid_symlinks");
        }
    }

    if (j.contains("seal_ambient")) {
        if (j["seal_ambient"].is_boolean()) {
            result.config.seal_ambient = j["seal_ambient"].get<bool>();
        } else {
            result.warnings.push_back("invalid_configuration:invalid_seal_ambient");
        }
    }

    if (j.contains("log_level")) {
        auto level = get_string(j, "log_level");
        if (level && is_log_level(to_lower(trim(*level)))) {
            result.config.log_level = to_lower(trim(*level));
        } else {
            result.warnings.push_back("invalid_configuration:invalid_log_level");
        }
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!is_known_key(it.key())) {
            result.warnings.push_back("unknown_key:" + it.key());
        }
    }

    result.ok = true;
    return result;
}

GuardConfigParseResult load_guard_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        GuardConfigParseResult result;
        result.config.source_path = path;
        result.error = "cannot open " + path;
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse_guard_config(ss.str(), path);
}

std::vector<std::string> apply_env_overrides(
    GuardConfig& config,
    const std::unordered_map<std::string, std::string>& env) {
    std::vector<std::string> warnings;

    auto base = env.find("CONFINE_BASE");
    if (base != env.end() && !base->second.empty()) {
        config.base = base->second;
    }

    auto level = env.find("CONFINE_LOG_LEVEL");
    if (level != env.end() && !level->second.empty()) {
        std::string v = to_lower(trim(level->second));
        if (is_log_level(v)) {
            config.log_level = v;
        } else {
            warnings.push_back("invalid_configuration:CONFINE_LOG_LEVEL");
        }
    }

    return warnings;
}

} // namespace confine
