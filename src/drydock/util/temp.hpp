#pragma once

#include <filesystem>
#include <memory>

namespace drydock {

/**
 * @brief A directory that is removed (recursively) when the last copy of this handle goes away.
 */
class temporary_dir {
    struct impl {
        std::filesystem::path path;
        explicit impl(const std::filesystem::path& p)
            : path(p) {}

        impl(const impl&) = delete;

        ~impl() {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    };

    std::shared_ptr<impl> _ptr;

    temporary_dir(std::shared_ptr<impl> p)
        : _ptr(p) {}

public:
    static temporary_dir create_in(const std::filesystem::path& parent);
    static temporary_dir create() { return create_in(std::filesystem::temp_directory_path()); }

    const std::filesystem::path& path() const noexcept { return _ptr->path; }
};

}  // namespace drydock
