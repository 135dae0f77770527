#pragma once

#include "io/file_reader.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace relay {

inline constexpr std::uint64_t kDefaultChunkSizeLimit = 2ULL * 1024 * 1024 * 1024;

struct ChunkDescriptor {
    std::uint64_t index = 0;   // 0-based
    std::uint64_t offset = 0;  // byte offset in the source file
    std::uint64_t length = 0;
    std::uint64_t ordinal = 0; // 1-based
    std::uint64_t total = 0;   // number of parts
    std::string source_name;
    std::string path;          // "<source path>.part<index>"

    // "Part 2/3 of movie.mkv"
    std::string Caption() const;
};

// Views a file as ceil(size / limit) contiguous parts. Parts are materialized
// one at a time, on demand and in any order, by streaming their byte range
// into "<file>.part<index>"; memory use is one copy buffer regardless of the
// part size.
class ChunkSplitter {
  public:
    static Result Open(const std::string& path, std::uint64_t chunk_size_limit, ChunkSplitter& out);

    std::uint64_t Count() const { return count_; }
    std::uint64_t FileSize() const { return size_; }
    std::uint64_t Limit() const { return limit_; }

    // index must be < Count().
    ChunkDescriptor Describe(std::uint64_t index) const;

    // Writes the part file for `chunk` and verifies its length.
    Result Materialize(const ChunkDescriptor& chunk);

    static std::uint64_t ChunkCount(std::uint64_t file_size, std::uint64_t limit);

  private:
    std::string path_;
    std::string name_;
    FileReader reader_;
    std::uint64_t size_ = 0;
    std::uint64_t limit_ = kDefaultChunkSizeLimit;
    std::uint64_t count_ = 0;
};

} // namespace relay
