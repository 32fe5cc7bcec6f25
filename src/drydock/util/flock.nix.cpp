#ifndef _WIN32

#include "./flock.hpp"

#include <neo/ufmt.hpp>

#include <cerrno>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

using namespace drydock;

namespace {

bool set_lock(int fd, int fcntl_kind, short lock_kind, const std::filesystem::path& p) {
    struct ::flock lk = {};
    lk.l_type         = lock_kind;
    lk.l_len          = 0;
    lk.l_whence       = SEEK_SET;
    lk.l_start        = 0;
    lk.l_pid          = 0;
    auto rc           = ::fcntl(fd, fcntl_kind, &lk);
    if (rc == -1) {
        if (errno == EAGAIN || errno == EACCES) {
            return false;
        }
        throw std::system_error(std::error_code(errno, std::system_category()),
                                neo::ufmt("Failed to modify file lock [{}]", p.string()));
    }
    return true;
}

}  // namespace

file_lock::file_lock(const std::filesystem::path& filepath)
    : _path{filepath} {
    _fd = ::open(_path.string().c_str(), O_CREAT | O_CLOEXEC | O_RDWR, 0b110'100'100);
    if (_fd < 0) {
        throw std::system_error(std::error_code(errno, std::system_category()),
                                neo::ufmt("Failed to open file for locking [{}]", _path.string()));
    }
}

file_lock::~file_lock() {
    // Closing the last descriptor of the open file description drops its lock
    ::close(_fd);
}

bool file_lock::try_lock() {
    _locked = set_lock(_fd, F_OFD_SETLK, F_WRLCK, _path);
    return _locked;
}

void file_lock::unlock() {
    if (_locked) {
        set_lock(_fd, F_OFD_SETLK, F_UNLCK, _path);
        _locked = false;
    }
}

#endif
