#include "./op.hpp"

#include <drydock/error/on_error.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

using namespace drydock;

bool drydock::file_exists(path_ref filepath) {
    std::error_code ec;
    auto            r = std::filesystem::exists(filepath, ec);
    if (ec) {
        BOOST_LEAF_THROW_EXCEPTION(
            std::system_error{ec,
                              neo::ufmt("Error checking for the existence of a file [{}]",
                                        filepath.string())},
            filepath,
            ec);
    }
    return r;
}

std::optional<std::filesystem::file_time_type> drydock::file_mtime(path_ref filepath) {
    std::error_code ec;
    auto            time = std::filesystem::last_write_time(filepath, ec);
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return std::nullopt;
    }
    if (ec) {
        BOOST_LEAF_THROW_EXCEPTION(
            std::system_error{ec,
                              neo::ufmt("Failed to obtain the modification time of [{}]",
                                        filepath.string())},
            filepath,
            ec);
    }
    return time;
}

bool drydock::remove_all_if_exists(path_ref filepath) {
    std::error_code ec;
    auto            n = std::filesystem::remove_all(filepath, ec);
    if (ec) {
        BOOST_LEAF_THROW_EXCEPTION(std::system_error{ec,
                                                     neo::ufmt("Failed to remove [{}]",
                                                               filepath.string())},
                                   filepath,
                                   ec);
    }
    return n != 0;
}

void drydock::ensure_parent_dirs(path_ref filepath) {
    auto            parent = filepath.parent_path();
    std::error_code ec;
    if (parent.empty()) {
        return;
    }
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        BOOST_LEAF_THROW_EXCEPTION(std::system_error{ec,
                                                     neo::ufmt("Failed to create directory [{}]",
                                                               parent.string())},
                                   filepath,
                                   ec);
    }
}
