/**
 * confine CLI - Entry Point
 *
 * Validate that paths stay inside a base directory.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace confine::cli::commands {
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_primitives(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace confine::cli;

    confine::log_to_stderr();

    // The library captured during static initialization; nothing may run
    // before this check if that failed.
    if (!confine::trusted_primitives()) {
        print_error("Trusted primitive capture failed", false);
        return EXIT_CAPTURE_FAILED;
    }

    CLI::App app{"confine - tamper-resistant path confinement"};
    app.set_version_flag("-V,--version", CONFINE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Guard configuration file (JSON)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed logging");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* check_cmd = app.add_subcommand("check", "Validate paths against a base directory");
    commands::setup_check(check_cmd, opts);

    auto* primitives_cmd = app.add_subcommand("primitives", "Show captured primitive state");
    commands::setup_primitives(primitives_cmd, opts);

    // Runs once parsing is complete and before any command callback: load
    // the guard configuration and seal the codec table.
    app.parse_complete_callback([&opts]() {
        auto boot = bootstrap_guard(opts.config, read_confine_env(), confine::ambient_codecs());
        if (!boot.ok) {
            print_error(boot.error, opts.json);
            std::exit(EXIT_CONFIG_ERROR);
        }
        opts.guard = boot.config;
        opts.warnings = boot.warnings;
    });

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
