#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace relay {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() { (void)Close(); }

Result Fd::Open(const std::string& path, int flags, int mode, Fd& out) {
    int fd = -1;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        const int e = errno;
        return Result::FromErrno(e, "open " + path + " (" + std::strerror(e) + ")");
    }
    out.Reset(fd);
    return Result::Ok();
}

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

// close(2) may report a deferred write error (NFS, quota); callers that wrote
// through this descriptor check it.
Result Fd::Close() {
    if (fd_ < 0) return Result::Ok();
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0 && errno != EINTR) {
        const int e = errno;
        return Result::FromErrno(e, std::string("close failed (") + std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace relay
