#include "./io.hpp"

#include <drydock/error/on_error.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

using namespace drydock;

namespace {

[[noreturn]] void throw_io_error(int e, std::string_view what, const std::filesystem::path& p) {
    auto ec = std::error_code{e ? e : EIO, std::system_category()};
    BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec, neo::ufmt("{} [{}]", what, p.string())),
                               boost::leaf::e_errno{ec.value()});
}

}  // namespace

void drydock::write_file(const std::filesystem::path& dest, std::string_view content) {
    DRYDOCK_E_SCOPE(e_file_io{dest, "writing"});
    errno = 0;
    std::ofstream out{dest, std::ios::binary | std::ios::trunc};
    if (!out) {
        throw_io_error(errno, "Failed to open file for writing", dest);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        throw_io_error(errno, "Failed to write to file", dest);
    }
}

std::string drydock::read_file(const std::filesystem::path& path) {
    DRYDOCK_E_SCOPE(e_file_io{path, "reading"});
    errno = 0;
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        throw_io_error(errno, "Failed to open file for reading", path);
    }
    std::ostringstream out;
    out << in.rdbuf();
    return std::move(out).str();
}
