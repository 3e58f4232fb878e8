#include "lpkgm/prefix_lock.hpp"
#include "lpkgm/platform.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace lpkgm {

PrefixLock::PrefixLock(const std::string& lock_path) : path_(lock_path) {
    auto parent = get_parent_directory(lock_path);
    if (!parent.empty() && !create_directories(parent)) {
        error_ = "cannot create directory for lock file: " + parent;
        return;
    }

    int fd = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        error_ = "cannot open lock file " + lock_path + ": " + strerror(errno);
        return;
    }

    struct flock fl {};
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;

    if (fcntl(fd, F_SETLK, &fl) != 0) {
        int err = errno;
        if (err == EACCES || err == EAGAIN) {
            error_ = "another transaction holds " + lock_path;
        } else {
            error_ = "cannot lock " + lock_path + ": " + strerror(err);
        }
        close(fd);
        return;
    }

    fd_ = fd;
    spdlog::debug("Acquired prefix lock {}", lock_path);
}

PrefixLock::~PrefixLock() {
    if (fd_ < 0) return;

    struct flock fl {};
    fl.l_type = F_UNLCK;
    fl.l_whence = SEEK_SET;
    fcntl(fd_, F_SETLK, &fl);
    close(fd_);
    spdlog::debug("Released prefix lock {}", path_);
}

std::string default_lock_path(const std::string& prefix) {
    std::string name = get_filename(prefix);
    return join_path(get_parent_directory(prefix), "." + name + ".lpkgm.lock");
}

} // namespace lpkgm
