#include "securepath/trace.hpp"

#include <algorithm>

namespace securepath {

void JoinTrace::emit(JoinEvent event, const std::string& component, const std::string& path) {
    entries_.push_back(TraceEntry{event, component, path});
}

std::size_t JoinTrace::count(JoinEvent event) const {
    return static_cast<std::size_t>(std::count_if(
        entries_.begin(), entries_.end(),
        [event](const TraceEntry& e) { return e.event == event; }));
}

} // namespace securepath
