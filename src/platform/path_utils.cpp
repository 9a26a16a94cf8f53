#include "securepath/path_utils.hpp"

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace securepath {

namespace {

// End of the path once trailing separators and "." segments are stripped.
// A leading "." is a component of its own and is kept.
std::size_t trimmed_end(const std::string& path) {
    std::size_t end = path.size();
    while (end > 0) {
        if (path[end - 1] == '/') {
            --end;
        } else if (path[end - 1] == '.' && end > 1 && path[end - 2] == '/') {
            --end;
        } else {
            break;
        }
    }
    return end;
}

} // namespace

std::vector<std::string> split_components(const std::string& path) {
    std::vector<std::string> parts;
    if (!path.empty() && path[0] == '/') {
        parts.push_back(kRootMarker);
    } else if (path == "." || path.compare(0, 2, "./") == 0) {
        parts.push_back(kCurrentDir);
    }

    std::string current;
    std::istringstream ss(path);
    while (std::getline(ss, current, '/')) {
        if (current.empty() || current == ".") {
            continue;
        }
        parts.push_back(current);
    }
    return parts;
}

void push_component(std::string& buf, const std::string& component) {
    if (buf.empty() || buf.back() == '/') {
        buf += component;
    } else {
        buf += '/';
        buf += component;
    }
}

void pop_component(std::string& buf) {
    std::size_t end = trimmed_end(buf);
    if (end == 0) {
        return;
    }

    auto slash = buf.rfind('/', end - 1);
    if (slash == std::string::npos) {
        buf.clear();
        return;
    }

    std::string parent = buf.substr(0, slash);
    std::size_t parent_end = trimmed_end(parent);
    if (parent_end == 0) {
        buf = (buf[0] == '/') ? "/" : "";
    } else {
        buf.resize(parent_end);
    }
}

std::string last_component(const std::string& path) {
    std::size_t end = trimmed_end(path);
    if (end == 0) {
        return {};
    }
    auto slash = path.rfind('/', end - 1);
    if (slash == std::string::npos) {
        return path.substr(0, end);
    }
    return path.substr(slash + 1, end - slash - 1);
}

bool has_path_prefix(const std::string& path, const std::string& prefix) {
    auto path_parts = split_components(path);
    auto prefix_parts = split_components(prefix);
    if (prefix_parts.size() > path_parts.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix_parts.size(); ++i) {
        if (path_parts[i] != prefix_parts[i]) {
            return false;
        }
    }
    return true;
}

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool is_valid_utf8(const std::string& s) {
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        unsigned int cp = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > n) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong encodings
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace securepath
