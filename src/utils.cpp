#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <zlib.h>

#include <cerrno>

bool file_crc32(const std::string& path, uint32_t* out) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;

    uLong crc = crc32(0L, Z_NULL, 0);
    unsigned char buf[64 * 1024];
    while (true) {
        ssize_t r = ::read(fd, buf, sizeof(buf));
        if (r == 0) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            ::close(fd);
            return false;
        }
        crc = crc32(crc, buf, static_cast<uInt>(r));
    }
    ::close(fd);
    *out = static_cast<uint32_t>(crc);
    return true;
}

bool fsync_dir(const std::string& dir) {
    int dfd = ::open(dir.c_str(), O_DIRECTORY | O_RDONLY);
    if (dfd < 0) return false;
    bool ok = (::fsync(dfd) == 0);
    ::close(dfd);
    return ok;
}
