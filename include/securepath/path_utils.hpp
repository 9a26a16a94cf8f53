#pragma once

#include "securepath/export.hpp"

#include <string>
#include <vector>

namespace securepath {

// ============================================================================
// Component Iteration
// ============================================================================

// Marker component yielded for a leading separator.
constexpr const char* kRootMarker = "/";

// Component yielded for a leading "." segment.
constexpr const char* kCurrentDir = ".";

// Split a path into its components.
// - A leading separator yields a single kRootMarker component
// - A leading "." segment is kept as kCurrentDir
// - Repeated and trailing separators are collapsed
// - Other "." segments are dropped, ".." segments are kept verbatim
SECUREPATH_API std::vector<std::string> split_components(const std::string& path);

inline bool is_root_marker(const std::string& component) {
    return component == kRootMarker;
}

// ============================================================================
// Path Buffer Operations
// ============================================================================

// Append a component as a new segment. No separator is inserted when the
// buffer is empty or already ends with one.
SECUREPATH_API void push_component(std::string& buf, const std::string& component);

// Truncate the buffer to its parent ("/a" -> "/", "a" -> "").
// No-op when the buffer is empty or just "/".
SECUREPATH_API void pop_component(std::string& buf);

// Last component, ignoring trailing separators and non-leading "." segments.
// Empty when the path has none.
SECUREPATH_API std::string last_component(const std::string& path);

// Component-wise prefix test: "/tmp/abc" does not start with "/tmp/ab".
// An empty prefix matches every path.
SECUREPATH_API bool has_path_prefix(const std::string& path, const std::string& prefix);

// ============================================================================
// Text Validation
// ============================================================================

SECUREPATH_API bool contains_nul(const std::string& s);

// Strict UTF-8 check: rejects overlong forms, surrogates and code points
// above U+10FFFF.
SECUREPATH_API bool is_valid_utf8(const std::string& s);

} // namespace securepath
