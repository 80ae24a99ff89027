#include "file_utils.h"
#include "logger.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace tvlink {

bool write_file_atomically(const std::string& path, const std::string& contents, mode_t mode) {
    const std::string tmp = path + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
    if (fd < 0) {
        LOG_WARN("[Store] Cannot write " + tmp + ": " + std::strerror(errno));
        return false;
    }
    size_t offset = 0;
    while (offset < contents.size()) {
        ssize_t n = ::write(fd, contents.data() + offset, contents.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_WARN("[Store] Write failed for " + tmp + ": " + std::strerror(errno));
            ::close(fd);
            ::unlink(tmp.c_str());
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    ::fsync(fd);
    ::close(fd);
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        LOG_WARN("[Store] Rename failed for " + path + ": " + std::strerror(errno));
        ::unlink(tmp.c_str());
        return false;
    }
    return true;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace tvlink
