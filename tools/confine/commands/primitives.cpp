/**
 * confine CLI - primitives command
 *
 * Report the state of the captured codec primitives.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace confine::cli::commands {

namespace {

int cmd_primitives(const GlobalOptions& opts) {
    const PrimitiveSnapshot* snapshot = trusted_primitives();
    PrimitiveBindings ambient = ambient_codecs().bindings();
    PrimitiveBindings builtin = builtin_bindings();

    bool captured = snapshot != nullptr;
    bool snapshot_builtin = false;
    bool ambient_matches = false;
    if (captured) {
        PrimitiveBindings b = snapshot->bindings();
        snapshot_builtin = b.decode == builtin.decode && b.encode == builtin.encode &&
                           b.construct == builtin.construct;
        ambient_matches = b.decode == ambient.decode && b.encode == ambient.encode &&
                          b.construct == ambient.construct;
    }

    if (opts.json) {
        nlohmann::json j;
        j["captured"] = captured;
        j["sealed"] = ambient_codecs().sealed();
        j["snapshot_is_builtin"] = snapshot_builtin;
        j["ambient_matches_snapshot"] = ambient_matches;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cout << "Captured: " << (captured ? "yes" : "no") << std::endl;
        std::cout << "Ambient table sealed: " << (ambient_codecs().sealed() ? "yes" : "no") << std::endl;
        std::cout << "Snapshot uses built-in codec: " << (snapshot_builtin ? "yes" : "no") << std::endl;
        std::cout << "Ambient table matches snapshot: " << (ambient_matches ? "yes" : "no") << std::endl;
    }

    return captured ? EXIT_OK : EXIT_CAPTURE_FAILED;
}

} // anonymous namespace

void setup_primitives(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_primitives(opts));
    });
}

} // namespace confine::cli::commands
