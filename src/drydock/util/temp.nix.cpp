#ifndef _WIN32
#include "./temp.hpp"

#include <cerrno>
#include <cstdlib>
#include <system_error>

using namespace drydock;

temporary_dir temporary_dir::create_in(const std::filesystem::path& base) {
    std::filesystem::create_directories(base);
    auto file = (base / "drydock-tmp-XXXXXX").string();

    const char* tempdir_path = ::mkdtemp(file.data());
    if (tempdir_path == nullptr) {
        throw std::system_error(std::error_code(errno, std::system_category()),
                                "Failed to create a temporary directory");
    }
    return temporary_dir(std::make_shared<impl>(std::filesystem::path(tempdir_path)));
}
#endif
