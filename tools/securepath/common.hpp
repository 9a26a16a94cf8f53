/**
 * securepath CLI - Common utilities and types
 */

#pragma once

#include "settings.hpp"

#include <securepath/secure_join.hpp>
#include <securepath/trace.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace securepath::cli {

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline nlohmann::json trace_to_json(const JoinTrace& trace) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : trace.entries()) {
        arr.push_back({
            {"event", join_event_to_string(e.event)},
            {"component", e.component},
            {"path", e.path},
        });
    }
    return arr;
}

/**
 * Resolve every input under the configured root and print the results.
 * Returns the process exit code.
 */
inline int run_joins(const GlobalOptions& opts, const Settings& settings,
                     const std::vector<std::string>& inputs) {
    bool all_ok = true;
    nlohmann::json results = nlohmann::json::array();

    for (const auto& input : inputs) {
        JoinTrace trace;
        JoinTrace* trace_ptr = settings.trace ? &trace : nullptr;

        JoinResult joined;
        if (settings.strict) {
            joined = secure_join_checked(settings.root, input, trace_ptr);
        } else {
            joined = {true, secure_join(settings.root, input, trace_ptr), JoinError::None};
        }

        if (!joined.ok) {
            all_ok = false;
            if (opts.json) {
                results.push_back({
                    {"input", input},
                    {"ok", false},
                    {"error", join_error_to_string(joined.error)},
                });
            } else {
                std::cerr << "Error: cannot resolve '" << input << "': "
                          << join_error_to_string(joined.error) << std::endl;
            }
            continue;
        }

        if (opts.json) {
            nlohmann::json entry;
            entry["input"] = input;
            entry["ok"] = true;
            entry["path"] = joined.path;
            if (settings.trace) {
                entry["escapes"] = trace.escape_count();
                entry["trace"] = trace_to_json(trace);
            }
            results.push_back(entry);
        } else {
            std::cout << joined.path << std::endl;
            if (settings.trace) {
                for (const auto& e : trace.entries()) {
                    std::cout << "  " << join_event_to_string(e.event) << " " << e.component
                              << " -> " << e.path << std::endl;
                }
            }
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = all_ok;
        j["root"] = settings.root;
        j["results"] = results;
        output_json(j);
    }

    return all_ok ? 0 : 1;
}

} // namespace securepath::cli
