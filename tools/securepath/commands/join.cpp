/**
 * securepath CLI - join command
 *
 * Resolve untrusted paths given on the command line under the root.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace securepath::cli::commands {

namespace {

struct JoinOptions {
    std::vector<std::string> paths;
    JoinSwitches switches;
};

int cmd_join(const GlobalOptions& opts, const JoinOptions& join_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto resolved = resolve_settings(opts, join_opts.switches);
    setup_logging(opts, resolved.settings.log_level);
    for (const auto& w : resolved.warnings) {
        print_warning(w);
    }
    if (!resolved.ok) {
        print_error(resolved.error, opts.json);
        return 1;
    }

    return run_joins(opts, resolved.settings, join_opts.paths);
}

} // anonymous namespace

void setup_join(CLI::App* app, GlobalOptions& opts) {
    static JoinOptions join_opts;

    app->add_option("paths", join_opts.paths, "Untrusted paths to resolve")->required();
    app->add_flag("--strict", join_opts.switches.strict, "Reject NUL bytes and invalid UTF-8");
    app->add_flag("--trace", join_opts.switches.trace, "Show each resolution decision");

    app->callback([&opts]() {
        std::exit(cmd_join(opts, join_opts));
    });
}

} // namespace securepath::cli::commands
