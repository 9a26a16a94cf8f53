#pragma once

#include "securepath/export.hpp"
#include "securepath/trace.hpp"

#include <string>

namespace securepath {

// Resolve unsafe_path under rootfs, following symlinks, such that the result
// stays below rootfs.
//
// - rootfs is the root of a container filesystem. It need not exist; when it
//   does not, resolution is purely lexical.
// - unsafe_path is a path inside the container and may try to escape with
//   ".." segments or with symlinks pointing outside rootfs.
//
// Absolute symlink targets are re-rooted by prefixing rootfs and are not
// checked further. Relative targets are canonicalized one component at a time
// and any step that leaves rootfs resets the result to rootfs.
//
// Never fails: filesystem errors are treated as "not a symlink".
SECUREPATH_API std::string secure_join(const std::string& rootfs,
                                       const std::string& unsafe_path);

// Same as above, recording each decision into trace when it is non-null.
SECUREPATH_API std::string secure_join(const std::string& rootfs,
                                       const std::string& unsafe_path,
                                       JoinTrace* trace);

// ============================================================================
// Checked Join
// ============================================================================

enum class JoinError {
    None,
    ContainsNul,
    InvalidEncoding,
};

inline const char* join_error_to_string(JoinError e) {
    switch (e) {
        case JoinError::None: return "none";
        case JoinError::ContainsNul: return "contains_nul";
        case JoinError::InvalidEncoding: return "invalid_encoding";
    }
    return "unknown";
}

struct JoinResult {
    bool ok = false;
    std::string path;  // resolved path when ok
    JoinError error = JoinError::None;
};

// Rejects inputs that cannot be represented as path text (NUL bytes, invalid
// UTF-8) before resolving.
SECUREPATH_API JoinResult secure_join_checked(const std::string& rootfs,
                                              const std::string& unsafe_path,
                                              JoinTrace* trace = nullptr);

} // namespace securepath
