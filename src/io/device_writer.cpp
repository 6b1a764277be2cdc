// device_writer.cpp - Writer implementation for a block device path.

#include "io/device_writer.hpp"

#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace cloner {

Result DeviceWriter::Open(std::string path, DeviceWriter& out) {
    out.path_ = std::move(path);

    int flags = O_WRONLY | O_CLOEXEC;
    if (!IsDevPath(out.path_)) {
        flags |= O_CREAT | O_TRUNC;
    }
    int fd = ::open(out.path_.c_str(), flags, 0644);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::WriteError,
                            e,
                            "Failed to open device: " + out.path_ + " (" + std::strerror(e) + ")");
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result DeviceWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = (n == 0) ? ENOSPC : errno;
        return Result::Fail(ErrorKind::WriteError,
                            e,
                            "Write to " + path_ + " failed (" + std::string(std::strerror(e)) + ")");
    }

    return Result::Ok();
}

Result DeviceWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int e = errno;
        return Result::Fail(ErrorKind::WriteError,
                            e,
                            "fsync of " + path_ + " failed (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

} // namespace cloner
