// file_writer.cpp - Writer for files inside the staging area.

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace relay {

Result FileWriter::Open(std::string path, Mode mode, FileWriter& out) {
    out.path_ = std::move(path);
    out.written_ = 0;

    int flags = O_WRONLY | O_CREAT;
    flags |= (mode == Mode::CreateExclusive) ? O_EXCL : O_TRUNC;

    auto res = Fd::Open(out.path_, flags, 0644, out.fd_);
    if (!res.is_ok()) return res.Wrap("Failed to open output");
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            written_ += static_cast<std::uint64_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = errno;
        return Result::FromErrno(e, "Write " + path_ + " failed (" + std::strerror(e) + ")");
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int e = errno;
        return Result::FromErrno(e, "fsync " + path_ + " failed (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

Result FileWriter::Finish() {
    if (!fd_.Valid()) return Result::Ok();
    auto sr = FsyncNow();
    if (!sr.is_ok()) return sr;
    return fd_.Close().Wrap(path_);
}

} // namespace relay
