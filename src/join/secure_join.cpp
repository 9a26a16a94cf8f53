#include "securepath/secure_join.hpp"
#include "securepath/fs_query.hpp"
#include "securepath/path_utils.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace securepath {

namespace {

void record(JoinTrace* trace, JoinEvent event, const std::string& component,
            const std::string& path) {
    if (trace) {
        trace->emit(event, component, path);
    }
}

bool is_absolute_target(const std::string& target) {
    return !target.empty() && target[0] == '/';
}

// Walk a relative link target starting from the directory holding the link.
// Every existing step is canonicalized; a step that lands outside rootfs
// resets the working path to rootfs.
void follow_relative_link(const std::string& rootfs, const std::string& target,
                          std::string& path, JoinTrace* trace) {
    for (const auto& part : split_components(target)) {
        push_component(path, part);
        if (!path_exists(path)) {
            continue;
        }

        auto canonical = canonical_path(path);
        if (!canonical) {
            spdlog::debug("secure_join: cannot canonicalize {}", path);
            record(trace, JoinEvent::canonicalize_failed, part, path);
            continue;
        }
        path = *canonical;
        record(trace, JoinEvent::link_canonicalized, part, path);

        if (!has_path_prefix(path, rootfs)) {
            spdlog::warn("secure_join: {} escapes root {}, resetting to root", path, rootfs);
            path = rootfs;
            record(trace, JoinEvent::escape_clamped, part, path);
        }
    }
}

} // namespace

std::string secure_join(const std::string& rootfs, const std::string& unsafe_path) {
    return secure_join(rootfs, unsafe_path, nullptr);
}

std::string secure_join(const std::string& rootfs, const std::string& unsafe_path,
                        JoinTrace* trace) {
    std::string path = rootfs + "/";

    for (const auto& component : split_components(unsafe_path)) {
        // A leading "/" must not replace what has been accumulated
        if (is_root_marker(component)) {
            record(trace, JoinEvent::root_marker_skipped, component, path);
            continue;
        }

        push_component(path, component);

        auto link = query_link(path);
        if (link.is_symlink()) {
            if (is_absolute_target(link.target)) {
                path = rootfs + link.target;
                spdlog::debug("secure_join: absolute link {} -> {}", component, path);
                record(trace, JoinEvent::absolute_link_reclamped, component, path);
            } else {
                pop_component(path);
                spdlog::debug("secure_join: relative link {} -> {}", component, link.target);
                record(trace, JoinEvent::relative_link_followed, component, path);
                follow_relative_link(rootfs, link.target, path, trace);
            }
        } else if (link.status == LinkStatus::IoError) {
            spdlog::debug("secure_join: cannot inspect {}: {}", path, link.error.message());
            record(trace, JoinEvent::link_query_failed, component, path);
        }

        // Skip any ".."
        if (last_component(path) == "..") {
            pop_component(path);
            record(trace, JoinEvent::dotdot_dropped, component, path);
        }
    }

    return path;
}

JoinResult secure_join_checked(const std::string& rootfs, const std::string& unsafe_path,
                               JoinTrace* trace) {
    if (contains_nul(rootfs) || contains_nul(unsafe_path)) {
        return {false, {}, JoinError::ContainsNul};
    }
    if (!is_valid_utf8(rootfs) || !is_valid_utf8(unsafe_path)) {
        return {false, {}, JoinError::InvalidEncoding};
    }
    return {true, secure_join(rootfs, unsafe_path, trace), JoinError::None};
}

} // namespace securepath
