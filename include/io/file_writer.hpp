#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace relay {

// Regular-file writer for staged artifacts (fetched objects, members, chunks).
class FileWriter final : public IWriter {
  public:
    enum class Mode {
        CreateExclusive, // fail if the file already exists
        Truncate,
    };

    static Result Open(std::string path, Mode mode, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    // Flush to disk and close; reports deferred write errors.
    Result Finish();

    const std::string& Path() const { return path_; }
    std::uint64_t BytesWritten() const { return written_; }

  private:
    std::string path_;
    Fd fd_;
    std::uint64_t written_ = 0;
};

} // namespace relay
