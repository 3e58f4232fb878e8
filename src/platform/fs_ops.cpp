#include "lpkgm/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <fnmatch.h>
#include <unistd.h>
#include <sys/stat.h>

extern "C" char** environ;

namespace lpkgm {

namespace fs = std::filesystem;

namespace {

// Owns a file descriptor; closed on destruction
class Descriptor {
public:
    explicit Descriptor(int fd) : fd_(fd) {}
    ~Descriptor() {
        if (fd_ >= 0) close(fd_);
    }

    Descriptor(const Descriptor&) = delete;
    Descriptor& operator=(const Descriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    bool write_all(const std::string& data) const {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            ssize_t n = ::write(fd_, p, left);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

    bool sync() const { return fsync(fd_) == 0; }

private:
    int fd_;
};

std::string errno_text() {
    return std::strerror(errno);
}

// Sibling of path, unique per process and attempt
std::string staging_name(const std::string& path) {
    static unsigned counter = 0;
    return path + ".lpkgm-tmp." + std::to_string(getpid()) + "." + std::to_string(++counter);
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;
    const std::string staged = staging_name(path);

    {
        Descriptor fd(open(staged.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
        if (!fd.valid()) {
            result.error = "cannot create " + staged + ": " + errno_text();
            return result;
        }
        if (!fd.write_all(content) || !fd.sync()) {
            result.error = "cannot write " + staged + ": " + errno_text();
            unlink(staged.c_str());
            return result;
        }
    }

    if (rename(staged.c_str(), path.c_str()) != 0) {
        result.error = "cannot move " + staged + " to " + path + ": " + errno_text();
        unlink(staged.c_str());
        return result;
    }

    // Persist the rename itself
    auto dir = get_parent_directory(path);
    Descriptor dir_fd(open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (dir_fd.valid() && !dir_fd.sync()) {
        spdlog::debug("fsync of {} failed: {}", dir, errno_text());
    }

    result.ok = true;
    return result;
}

AtomicWriteResult append_lines(const std::string& path, const std::vector<std::string>& lines) {
    AtomicWriteResult result;

    Descriptor fd(open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        result.error = "cannot open " + path + ": " + errno_text();
        return result;
    }

    std::string buffer;
    for (const auto& line : lines) {
        buffer += line;
        buffer += '\n';
    }

    if (!fd.write_all(buffer)) {
        result.error = "cannot append to " + path + ": " + errno_text();
        return result;
    }
    if (!fd.sync()) {
        result.error = "cannot sync " + path + ": " + errno_text();
        return result;
    }

    result.ok = true;
    return result;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool resolves_to_regular_file(const std::string& path) {
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (ec) return false;
    return fs::is_regular_file(st);
}

bool is_symlink(const std::string& path) {
    std::error_code ec;
    return fs::is_symlink(path, ec);
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;
    std::error_code ec;

    if (!fs::is_directory(path, ec)) return entries;

    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().filename().string());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::optional<std::uintmax_t> file_size(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_directory(const std::string& path, std::string* error) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        if (error) *error = ec.message();
        return false;
    }
    return true;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec) && !ec;
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

std::unordered_map<std::string, std::string> get_all_env() {
    std::unordered_map<std::string, std::string> env;

    for (char** ep = environ; *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        if (eq != std::string::npos) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }

    return env;
}

std::string current_directory() {
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) return ".";
    return to_portable_path(cwd.string());
}

std::string temp_directory() {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) return "/tmp";
    return to_portable_path(tmp.string());
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::string fnv1a_hex(const std::string& data) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

bool wildcard_match(const std::string& pattern, const std::string& text) {
    return fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

} // namespace lpkgm
