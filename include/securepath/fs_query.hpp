#pragma once

#include "securepath/export.hpp"

#include <optional>
#include <string>
#include <system_error>

namespace securepath {

// ============================================================================
// Symlink Query
// ============================================================================

enum class LinkStatus {
    Symlink,
    NotFound,
    NotSymlink,
    IoError,
};

inline const char* link_status_to_string(LinkStatus s) {
    switch (s) {
        case LinkStatus::Symlink: return "symlink";
        case LinkStatus::NotFound: return "not_found";
        case LinkStatus::NotSymlink: return "not_symlink";
        case LinkStatus::IoError: return "io_error";
    }
    return "unknown";
}

struct LinkQuery {
    LinkStatus status = LinkStatus::NotFound;
    std::string target;     // link text when status == Symlink
    std::error_code error;  // set when status == IoError

    bool is_symlink() const { return status == LinkStatus::Symlink; }
};

// Inspect the entry at path without following it.
SECUREPATH_API LinkQuery query_link(const std::string& path);

// ============================================================================
// Existence and Canonicalization
// ============================================================================

// True if path exists, following symlinks. Any error means false.
SECUREPATH_API bool path_exists(const std::string& path);

// Fully resolved absolute form of an existing path.
SECUREPATH_API std::optional<std::string> canonical_path(const std::string& path);

} // namespace securepath
