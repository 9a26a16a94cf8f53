/**
 * securepath CLI - Entry Point
 *
 * Resolve untrusted paths inside a container root filesystem.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

namespace securepath::cli::commands {
    void setup_join(CLI::App* app, GlobalOptions& opts);
    void setup_batch(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace securepath::cli;

    CLI::App app{"securepath - resolve untrusted paths under a root filesystem"};
    app.set_version_flag("-V,--version", SECUREPATH_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    app.add_option("--root", opts.root, "Root filesystem directory");
    app.add_option("--config", opts.config, "JSON configuration file");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Log each resolution step");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    auto* join_cmd = app.add_subcommand("join", "Resolve paths given as arguments");
    commands::setup_join(join_cmd, opts);

    auto* batch_cmd = app.add_subcommand("batch", "Resolve paths read one per line");
    commands::setup_batch(batch_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
