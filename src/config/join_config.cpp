#include "securepath/join_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace securepath {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

const char* kKnownKeys[] = {"root", "strict", "trace", "log_level"};

bool is_known_key(const std::string& key) {
    for (const char* k : kKnownKeys) {
        if (key == k) return true;
    }
    return false;
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string& s) {
    auto lower = to_lower(s);
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

JoinConfigParseResult parse_join_config(const std::string& json_str,
                                        const std::string& source_path) {
    JoinConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        if (j.contains("root")) {
            if (!j["root"].is_string()) {
                result.error = "root must be a string";
                return result;
            }
            result.config.root = j["root"].get<std::string>();
        }

        if (j.contains("strict")) {
            if (!j["strict"].is_boolean()) {
                result.error = "strict must be a boolean";
                return result;
            }
            result.config.strict = j["strict"].get<bool>();
        }

        if (j.contains("trace")) {
            if (!j["trace"].is_boolean()) {
                result.error = "trace must be a boolean";
                return result;
            }
            result.config.trace = j["trace"].get<bool>();
        }

        if (j.contains("log_level")) {
            if (!j["log_level"].is_string()) {
                result.error = "log_level must be a string";
                return result;
            }
            auto level = parse_log_level(j["log_level"].get<std::string>());
            if (!level) {
                result.error = "unknown log_level: " + j["log_level"].get<std::string>();
                return result;
            }
            result.config.log_level = *level;
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!is_known_key(it.key())) {
                result.warnings.push_back("invalid_configuration:unknown_key:" + it.key());
            }
        }

        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

JoinConfigParseResult load_join_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        JoinConfigParseResult result;
        result.config.source_path = path;
        result.error = "failed to read config: " + path;
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse_join_config(ss.str(), path);
}

} // namespace securepath
