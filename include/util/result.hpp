#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace relay {

enum class ErrorKind : int {
    None = 0,
    LinkInvalid,
    UnsupportedSource,
    DownloadFailure,
    ArchiveCorrupt,
    ArchiveCollision,
    UploadFailure,
    DiskFull,
    Timeout,
    Cancelled,
    Io,
    Config,
};

std::string_view ToString(ErrorKind kind);

// Io unless errno says the disk (or quota) is exhausted.
ErrorKind KindFromErrno(int e, ErrorKind fallback = ErrorKind::Io);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m, int e = 0) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }
    static Result FromErrno(int e, std::string m, ErrorKind fallback = ErrorKind::Io) {
        return Fail(KindFromErrno(e, fallback), std::move(m), e);
    }

    // Same kind and errno, message prefixed with context.
    Result Wrap(std::string_view context) const {
        if (ok) return *this;
        return Fail(kind, std::string(context) + ": " + msg, err);
    }
};

} // namespace relay
