#include "io/fd.hpp"

#include <unistd.h>

namespace cloner {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() { (void)Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

int Fd::Close() {
    if (fd_ < 0) return 0;
    // close(2) must not be retried on EINTR on Linux; the descriptor is gone either way.
    const int rc = ::close(fd_);
    fd_ = -1;
    return rc;
}

} // namespace cloner
