#pragma once

#include "util/result.hpp"

#include <string>

namespace relay {

// Owning POSIX file descriptor.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // open(2) with O_CLOEXEC added; errno is mapped through KindFromErrno.
    static Result Open(const std::string& path, int flags, int mode, Fd& out);

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    int Release();
    Result Close();

  private:
    int fd_{-1};
};

} // namespace relay
