/**
 * securepath CLI - Settings resolution
 *
 * Merges command-line flags, the JSON config file and the environment.
 */

#pragma once

#include <securepath/join_config.hpp>

#include <optional>
#include <string>
#include <vector>

namespace securepath::cli {

std::string safe_getenv(const char* name);

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::optional<std::string> root;   // --root (an explicit "" is kept)
    std::string config;                // --config
    bool json = false;                 // --json
    bool verbose = false;              // -v, --verbose
    bool quiet = false;                // -q, --quiet
};

/**
 * Per-command join switches. Config file values are OR-ed in.
 */
struct JoinSwitches {
    bool strict = false;           // --strict
    bool trace = false;            // --trace
};

/**
 * Settings after merging flags, config file and environment.
 */
struct Settings {
    std::string root;
    bool strict = false;
    bool trace = false;
    std::optional<LogLevel> log_level;  // from the config file
};

struct SettingsResult {
    bool ok = false;
    std::string error;
    Settings settings;
    std::vector<std::string> warnings;
};

/**
 * Resolve effective settings.
 * Root priority: --root flag > config "root" > SECUREPATH_ROOT env.
 * An unset or empty SECUREPATH_ROOT counts as not given.
 */
SettingsResult resolve_settings(const GlobalOptions& opts, const JoinSwitches& switches);

/**
 * Route spdlog to stderr so stdout carries only results.
 * Priority: -v / -q flags > config log_level > warn.
 */
void setup_logging(const GlobalOptions& opts, const std::optional<LogLevel>& configured);

} // namespace securepath::cli
