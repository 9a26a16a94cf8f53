/**
 * securepath CLI - batch command
 *
 * Resolve untrusted paths read one per line from a file or stdin.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <spdlog/spdlog.h>

#include <fstream>

namespace securepath::cli::commands {

namespace {

struct BatchOptions {
    std::string input = "-";
    JoinSwitches switches;
};

std::vector<std::string> read_lines(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // Blank lines separate groups in hand-written lists
        if (line.empty()) {
            continue;
        }
        lines.push_back(line);
    }
    return lines;
}

int cmd_batch(const GlobalOptions& opts, const BatchOptions& batch_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto resolved = resolve_settings(opts, batch_opts.switches);
    setup_logging(opts, resolved.settings.log_level);
    for (const auto& w : resolved.warnings) {
        print_warning(w);
    }
    if (!resolved.ok) {
        print_error(resolved.error, opts.json);
        return 1;
    }

    std::vector<std::string> inputs;
    if (batch_opts.input == "-") {
        inputs = read_lines(std::cin);
    } else {
        std::ifstream file(batch_opts.input);
        if (!file) {
            print_error("Failed to open input: " + batch_opts.input, opts.json);
            return 1;
        }
        inputs = read_lines(file);
    }

    spdlog::debug("batch: {} paths from {}", inputs.size(), batch_opts.input);
    return run_joins(opts, resolved.settings, inputs);
}

} // anonymous namespace

void setup_batch(CLI::App* app, GlobalOptions& opts) {
    static BatchOptions batch_opts;

    app->add_option("input", batch_opts.input, "File with one path per line ('-' for stdin)");
    app->add_flag("--strict", batch_opts.switches.strict, "Reject NUL bytes and invalid UTF-8");
    app->add_flag("--trace", batch_opts.switches.trace, "Show each resolution decision");

    app->callback([&opts]() {
        std::exit(cmd_batch(opts, batch_opts));
    });
}

} // namespace securepath::cli::commands
