#pragma once

#include "securepath/export.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace securepath {

// ============================================================================
// Join Events
// ============================================================================

enum class JoinEvent {
    root_marker_skipped,
    dotdot_dropped,
    absolute_link_reclamped,
    relative_link_followed,
    link_canonicalized,
    escape_clamped,
    link_query_failed,
    canonicalize_failed,
};

// Canonical lowercase snake_case name of an event
inline const char* join_event_to_string(JoinEvent e) {
    switch (e) {
        case JoinEvent::root_marker_skipped: return "root_marker_skipped";
        case JoinEvent::dotdot_dropped: return "dotdot_dropped";
        case JoinEvent::absolute_link_reclamped: return "absolute_link_reclamped";
        case JoinEvent::relative_link_followed: return "relative_link_followed";
        case JoinEvent::link_canonicalized: return "link_canonicalized";
        case JoinEvent::escape_clamped: return "escape_clamped";
        case JoinEvent::link_query_failed: return "link_query_failed";
        case JoinEvent::canonicalize_failed: return "canonicalize_failed";
    }
    return "unknown";
}

struct TraceEntry {
    JoinEvent event;
    std::string component;  // untrusted or link-target component being processed
    std::string path;       // working path after the decision
};

// ============================================================================
// Join Trace
// ============================================================================

// Records the decisions taken while resolving one untrusted path.
// Attach one to secure_join() to audit escapes that were silently clamped.
class SECUREPATH_API JoinTrace {
public:
    void emit(JoinEvent event, const std::string& component, const std::string& path);

    const std::vector<TraceEntry>& entries() const { return entries_; }

    std::size_t count(JoinEvent event) const;
    std::size_t escape_count() const { return count(JoinEvent::escape_clamped); }
    bool has_escapes() const { return escape_count() > 0; }

    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

private:
    std::vector<TraceEntry> entries_;
};

} // namespace securepath
