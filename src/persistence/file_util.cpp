#include "persistence/file_util.hpp"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

namespace tierkv::persistence {

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

std::error_code write_all(int fd, const uint8_t* data, std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code read_file(const std::filesystem::path& path, std::vector<uint8_t>& out) {
    out.clear();

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return make_errno_error();
    }

    uint8_t buf[65536];
    while (true) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            auto ec = make_errno_error();
            ::close(fd);
            return ec;
        }
        if (n == 0) break;
        out.insert(out.end(), buf, buf + n);
    }

    ::close(fd);
    return {};
}

std::error_code fsync_dir(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return make_errno_error();
    }
    std::error_code ec;
    if (::fsync(fd) < 0) {
        ec = make_errno_error();
    }
    ::close(fd);
    return ec;
}

} // namespace tierkv::persistence
