#include "platform.hpp"
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <atomic>
#include <unistd.h>
#include <fcntl.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path expand_user(const fs::path& p) {
    std::string s = p.string();
    if (s == "~") return home_dir();
    if (s.rfind("~/", 0) == 0) return home_dir() / s.substr(2);
    return p;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

bool fsync_path(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;
    int rc = ::fsync(fd);
    int saved = errno;
    ::close(fd);
    errno = saved;
    return rc == 0;
}

bool fsync_dir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) return false;
    int rc = ::fsync(fd);
    int saved = errno;
    ::close(fd);
    errno = saved;
    return rc == 0;
}

bool write_file_atomic(const fs::path& path, const std::string& content, std::string* error) {
    static std::atomic<unsigned> counter{0};
    fs::path tmp = path;
    tmp += ".tmp." + std::to_string(getpid()) + "." + std::to_string(counter++);

    auto fail = [&](const std::string& what) {
        if (error) *error = what + " " + tmp.string() + ": " + std::strerror(errno);
        ::unlink(tmp.c_str());
        return false;
    };

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return fail("open");

    size_t written = 0;
    while (written < content.size()) {
        ssize_t w = ::write(fd, content.data() + written, content.size() - written);
        if (w < 0) {
            if (errno == EINTR) continue;
            ::close(fd);
            return fail("write");
        }
        written += static_cast<size_t>(w);
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return fail("fsync");
    }
    ::close(fd);

    if (::rename(tmp.c_str(), path.c_str()) != 0) return fail("rename");
    if (!fsync_dir(path.parent_path().empty() ? fs::path(".") : path.parent_path())) {
        if (error) *error = "fsync dir " + path.parent_path().string() + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

} // namespace platform
