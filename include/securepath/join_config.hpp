#pragma once

#include "securepath/export.hpp"

#include <optional>
#include <string>
#include <vector>

namespace securepath {

// ============================================================================
// Join Configuration
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

SECUREPATH_API std::optional<LogLevel> parse_log_level(const std::string& s);
SECUREPATH_API const char* log_level_to_string(LogLevel level);

struct JoinConfig {
    std::optional<std::string> root;
    bool strict = false;
    bool trace = false;
    std::optional<LogLevel> log_level;

    // Source path for diagnostics
    std::string source_path;
};

struct JoinConfigParseResult {
    bool ok = false;
    std::string error;
    JoinConfig config;
    std::vector<std::string> warnings;
};

SECUREPATH_API JoinConfigParseResult parse_join_config(const std::string& json_str,
                                                       const std::string& source_path = "");

// Read and parse a configuration file.
SECUREPATH_API JoinConfigParseResult load_join_config(const std::string& path);

} // namespace securepath
