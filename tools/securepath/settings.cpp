/**
 * securepath CLI - Settings resolution
 */

#include "settings.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>

namespace securepath::cli {

std::string safe_getenv(const char* name) {
    const char* val = std::getenv(name);
    return val ? val : "";
}

SettingsResult resolve_settings(const GlobalOptions& opts, const JoinSwitches& switches) {
    SettingsResult result;

    JoinConfig config;
    if (!opts.config.empty()) {
        auto loaded = load_join_config(opts.config);
        if (!loaded.ok) {
            result.error = opts.config + ": " + loaded.error;
            return result;
        }
        config = loaded.config;
        result.warnings = loaded.warnings;
        result.settings.log_level = config.log_level;
    }

    if (opts.root) {
        result.settings.root = *opts.root;
    } else if (config.root) {
        result.settings.root = *config.root;
    } else {
        std::string env_root = safe_getenv("SECUREPATH_ROOT");
        if (env_root.empty()) {
            result.error = "No root directory given (use --root, config \"root\" or SECUREPATH_ROOT)";
            return result;
        }
        result.settings.root = env_root;
    }

    result.settings.strict = switches.strict || config.strict;
    result.settings.trace = switches.trace || config.trace;
    spdlog::debug("root: {} (strict={}, trace={})", result.settings.root,
                  result.settings.strict, result.settings.trace);
    result.ok = true;
    return result;
}

void setup_logging(const GlobalOptions& opts, const std::optional<LogLevel>& configured) {
    auto logger = spdlog::get("securepath");
    if (!logger) {
        logger = spdlog::stderr_color_mt("securepath");
    }
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (configured) {
        switch (*configured) {
            case LogLevel::Trace: spdlog::set_level(spdlog::level::trace); break;
            case LogLevel::Debug: spdlog::set_level(spdlog::level::debug); break;
            case LogLevel::Info: spdlog::set_level(spdlog::level::info); break;
            case LogLevel::Warn: spdlog::set_level(spdlog::level::warn); break;
            case LogLevel::Error: spdlog::set_level(spdlog::level::err); break;
            case LogLevel::Off: spdlog::set_level(spdlog::level::off); break;
        }
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

} // namespace securepath::cli
