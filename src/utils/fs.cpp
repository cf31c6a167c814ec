#include "utils/fs.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace safexec::utils {

std::optional<std::string> ReadRegularFile(const std::filesystem::path& path,
                                           std::size_t offset,
                                           std::size_t max_bytes) {
    // O_NONBLOCK keeps a planted FIFO from stalling the open
    const int fd = ::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC);
    if (fd == -1) {
        return std::nullopt;
    }
    struct stat st {};
    if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        ::close(fd);
        return std::nullopt;
    }
    std::string data;
    char buffer[8192];
    auto position = static_cast<off_t>(offset);
    while (data.size() < max_bytes) {
        const auto want = std::min(sizeof(buffer), max_bytes - data.size());
        const auto count = ::pread(fd, buffer, want, position);
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::close(fd);
            return std::nullopt;
        }
        if (count == 0) {
            break;
        }
        data.append(buffer, static_cast<std::size_t>(count));
        position += count;
    }
    ::close(fd);
    return data;
}

bool WriteNewFile(const std::filesystem::path& path, const std::string& content) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd == -1) {
        return false;
    }
    std::size_t written = 0;
    while (written < content.size()) {
        const auto count = ::write(fd, content.data() + written, content.size() - written);
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::close(fd);
            return false;
        }
        written += static_cast<std::size_t>(count);
    }
    return ::close(fd) == 0;
}

bool ReplaceFile(const std::filesystem::path& path, const std::string& content) {
    auto temp_path = path;
    temp_path += ".tmp";
    std::error_code ec;
    // removes a stale entry itself, never what it points at
    std::filesystem::remove(temp_path, ec);
    if (!WriteNewFile(temp_path, content)) {
        return false;
    }
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return false;
    }
    return true;
}

}  // namespace safexec::utils
