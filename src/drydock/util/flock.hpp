#pragma once

#include <filesystem>

namespace drydock {

/**
 * @brief An advisory lock on a file. The file is created if it does not exist. The lock is
 * released when the object is destroyed.
 *
 * The lock belongs to this object's open file description, not to the process, so two
 * file_lock objects for the same path exclude each other even within one process.
 */
class file_lock {
    std::filesystem::path _path;
    int                   _fd     = -1;
    bool                  _locked = false;

public:
    explicit file_lock(const std::filesystem::path& p);

    file_lock(const file_lock&) = delete;
    file_lock& operator=(const file_lock&) = delete;

    ~file_lock();

    const std::filesystem::path& path() const noexcept { return _path; }

    /// Attempt to take an exclusive lock without blocking
    [[nodiscard]] bool try_lock();
    void               unlock();

    bool owns_lock() const noexcept { return _locked; }
};

}  // namespace drydock
