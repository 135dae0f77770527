#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace relay {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    auto res = Fd::Open(out.path_, O_RDONLY, 0, out.fd_);
    if (!res.is_ok()) return res.Wrap("Failed to open input");

    struct stat st{};
    if (::fstat(out.fd_.Get(), &st) != 0) {
        const int e = errno;
        return Result::FromErrno(e, "fstat " + out.path_ + " (" + std::strerror(e) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(ErrorKind::Io, "Not a regular file: " + out.path_);
    }
    out.size_ = static_cast<std::uint64_t>(st.st_size);
    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result FileReader::SeekTo(std::uint64_t offset) {
    if (::lseek(fd_.Get(), static_cast<off_t>(offset), SEEK_SET) == static_cast<off_t>(-1)) {
        const int e = errno;
        return Result::FromErrno(e, "lseek " + path_ + " (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace relay
