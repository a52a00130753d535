/**
 * confine CLI - check command
 *
 * Validate paths against a base directory.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace confine::cli::commands {

namespace {

struct CheckOptions {
    std::string base;
    std::string encoding;
    bool bytes = false;
    bool lexical = false;
    std::vector<std::string> paths;
};

void apply_log_level(const GlobalOptions& opts, const GuardConfig& config) {
    if (opts.verbose) {
        set_log_level("debug");
    } else if (opts.quiet) {
        set_log_level("error");
    } else {
        set_log_level(config.log_level);
    }
}

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    GuardConfig config = opts.guard;
    const std::vector<std::string>& warnings = opts.warnings;

    // Command line wins over config and environment
    if (!check_opts.base.empty()) {
        config.base = check_opts.base;
    }
    if (!check_opts.encoding.empty()) {
        auto encoding = parse_encoding(check_opts.encoding);
        if (!encoding) {
            print_error("Unknown encoding: " + check_opts.encoding, opts.json);
            return EXIT_CONFIG_ERROR;
        }
        config.options.encoding = *encoding;
    }
    if (check_opts.lexical) {
        config.options.symlinks = SymlinkPolicy::Lexical;
    }

    apply_log_level(opts, config);
    print_warnings(warnings, opts.quiet);

    if (config.base.empty()) {
        print_error("No base directory (use --base, --config or CONFINE_BASE)", opts.json);
        return EXIT_CONFIG_ERROR;
    }

    const PrimitiveSnapshot* snapshot = trusted_primitives();
    if (!snapshot) {
        print_error("Trusted primitives unavailable", opts.json);
        return EXIT_CAPTURE_FAILED;
    }

    auto created = PathValidator::create(config.base, config.options, *snapshot);
    if (!created.ok) {
        print_error(std::string(to_string(created.error)) + ": " + created.message, opts.json);
        return EXIT_CONFIG_ERROR;
    }
    const PathValidator& validator = *created.validator;

    bool all_ok = true;
    nlohmann::json results = nlohmann::json::array();

    for (const auto& arg : check_opts.paths) {
        ValidationResult result;
        if (check_opts.bytes) {
            auto bytes = parse_hex_arg(arg);
            if (bytes) {
                result = validator.validate(*bytes);
            } else {
                result.error = ValidationError::InvalidInputType;
                result.message = "argument is not an even-length hex string";
            }
        } else {
            result = validator.validate(arg);
        }
        all_ok = all_ok && result.ok;

        if (opts.json) {
            nlohmann::json j;
            j["input"] = arg;
            j["ok"] = result.ok;
            if (result.ok) {
                j["path"] = result.path;
            } else {
                j["error"] = to_string(result.error);
                j["message"] = result.message;
            }
            results.push_back(j);
        } else if (result.ok) {
            std::cout << result.path << std::endl;
        } else {
            std::cerr << arg << ": " << to_string(result.error) << std::endl;
        }
    }

    if (opts.json) {
        nlohmann::json out;
        out["base"] = validator.base_directory();
        out["results"] = results;
        if (!warnings.empty()) {
            out["warnings"] = warnings;
        }
        std::cout << out.dump(2) << std::endl;
    }

    return all_ok ? EXIT_OK : EXIT_REJECTED;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("--base", check_opts.base, "Base directory paths must stay inside");
    app->add_option("--encoding", check_opts.encoding, "Encoding of byte paths (utf8, latin1, ascii, hex)");
    app->add_flag("--bytes", check_opts.bytes, "Treat each path as hex-encoded raw bytes");
    app->add_flag("--lexical", check_opts.lexical, "Do not resolve symlinks");
    app->add_option("paths", check_opts.paths, "Paths to validate")->required();

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace confine::cli::commands
