#pragma once

#include <string>

namespace lpkgm {

// ============================================================================
// Per-prefix Advisory Lock
// ============================================================================

// Exclusive fcntl() record lock on a lock file. Held for the lifetime of the
// object; released on destruction. Non-blocking: when another process holds
// the lock, locked() is false and error() says why.
class PrefixLock {
public:
    explicit PrefixLock(const std::string& lock_path);
    ~PrefixLock();

    PrefixLock(const PrefixLock&) = delete;
    PrefixLock& operator=(const PrefixLock&) = delete;

    bool locked() const { return fd_ >= 0; }
    const std::string& error() const { return error_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::string error_;
    int fd_ = -1;
};

// Lock file guarding a prefix: "<parent>/.<name>.lpkgm.lock", kept outside
// the prefix itself.
std::string default_lock_path(const std::string& prefix);

} // namespace lpkgm
