#include "securepath/fs_query.hpp"

#include <filesystem>

namespace securepath {

namespace stdfs = std::filesystem;

LinkQuery query_link(const std::string& path) {
    LinkQuery result;
    std::error_code ec;

    auto st = stdfs::symlink_status(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
            result.status = LinkStatus::NotFound;
        } else {
            result.status = LinkStatus::IoError;
            result.error = ec;
        }
        return result;
    }

    if (st.type() == stdfs::file_type::not_found) {
        result.status = LinkStatus::NotFound;
        return result;
    }
    if (st.type() != stdfs::file_type::symlink) {
        result.status = LinkStatus::NotSymlink;
        return result;
    }

    auto target = stdfs::read_symlink(path, ec);
    if (ec) {
        // Entry was replaced between the two calls
        result.status = LinkStatus::IoError;
        result.error = ec;
        return result;
    }

    result.status = LinkStatus::Symlink;
    result.target = target.string();
    return result;
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return stdfs::exists(path, ec) && !ec;
}

std::optional<std::string> canonical_path(const std::string& path) {
    std::error_code ec;
    auto result = stdfs::canonical(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return result.string();
}

} // namespace securepath
