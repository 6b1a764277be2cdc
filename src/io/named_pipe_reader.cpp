#include "io/named_pipe_reader.hpp"

#include "system/signals.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace cloner {

Result NamedPipeReader::Open(std::string path, NamedPipeReader& out) {
    out.path_ = std::move(path);

    while (true) {
        const int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd >= 0) {
            out.fd_.Reset(fd);
            return Result::Ok();
        }
        const int e = errno;
        if (e != EINTR) {
            return Result::Fail(ErrorKind::ChannelOpenError,
                                e,
                                "Failed to open channel: " + out.path_ + " (" + std::strerror(e) + ")");
        }
        if (g_cancel.load(std::memory_order_relaxed)) {
            return Result::Fail(ErrorKind::Cancelled, ECANCELED, "Canceled while opening channel: " + out.path_);
        }
    }
}

ssize_t NamedPipeReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        if (g_cancel.load(std::memory_order_relaxed)) {
            errno = ECANCELED;
            return -1;
        }
        const ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno != EINTR) {
            return -1;
        }
    }
}

void NamedPipeReader::Close() { (void)fd_.Close(); }

} // namespace cloner
