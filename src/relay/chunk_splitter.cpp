#include "relay/chunk_splitter.hpp"

#include "io/file_writer.hpp"
#include "system/signals.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

namespace relay {

namespace {
constexpr size_t kCopyBufferBytes = 1024 * 1024;
} // namespace

std::string ChunkDescriptor::Caption() const {
    return "Part " + std::to_string(ordinal) + "/" + std::to_string(total) + " of " + source_name;
}

std::uint64_t ChunkSplitter::ChunkCount(std::uint64_t file_size, std::uint64_t limit) {
    if (limit == 0) return 0;
    return file_size / limit + (file_size % limit != 0 ? 1 : 0);
}

Result ChunkSplitter::Open(const std::string& path, std::uint64_t chunk_size_limit, ChunkSplitter& out) {
    if (chunk_size_limit == 0) {
        return Result::Fail(ErrorKind::Config, "chunk size limit must be greater than zero");
    }

    out.path_ = path;
    out.name_ = std::string(LastSegment(path));
    out.limit_ = chunk_size_limit;

    auto open_result = FileReader::Open(path, out.reader_);
    if (!open_result.is_ok()) return open_result;

    out.size_ = out.reader_.TotalSize().value_or(0);
    out.count_ = ChunkCount(out.size_, out.limit_);
    return Result::Ok();
}

ChunkDescriptor ChunkSplitter::Describe(std::uint64_t index) const {
    ChunkDescriptor d;
    d.index = index;
    d.offset = index * limit_;
    d.length = d.offset < size_ ? std::min(limit_, size_ - d.offset) : 0;
    d.ordinal = index + 1;
    d.total = count_;
    d.source_name = name_;
    d.path = path_ + ".part" + std::to_string(index);
    return d;
}

Result ChunkSplitter::Materialize(const ChunkDescriptor& chunk) {
    if (chunk.index >= count_) {
        return Result::Fail(ErrorKind::Io,
                            "chunk index " + std::to_string(chunk.index) + " out of range for " + path_);
    }

    auto seek_result = reader_.SeekTo(chunk.offset);
    if (!seek_result.is_ok()) return seek_result;

    FileWriter writer;
    auto open_result = FileWriter::Open(chunk.path, FileWriter::Mode::Truncate, writer);
    if (!open_result.is_ok()) return open_result;

    std::vector<std::uint8_t> buf(static_cast<size_t>(std::min<std::uint64_t>(kCopyBufferBytes, chunk.length)));
    std::uint64_t remaining = chunk.length;
    Result res = Result::Ok();
    while (remaining > 0) {
        if (CancelRequested()) {
            res = Result::Fail(ErrorKind::Cancelled, "split cancelled");
            break;
        }
        const size_t want = static_cast<size_t>(std::min<std::uint64_t>(remaining, buf.size()));
        const ssize_t n = reader_.Read(std::span<std::uint8_t>(buf.data(), want));
        if (n < 0) {
            res = Result::Fail(ErrorKind::Io, "read failed while splitting " + path_);
            break;
        }
        if (n == 0) {
            res = Result::Fail(ErrorKind::Io, path_ + " shrank while splitting");
            break;
        }
        res = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!res.is_ok()) break;
        remaining -= static_cast<std::uint64_t>(n);
    }
    if (res.is_ok()) res = writer.Finish();

    if (!res.is_ok()) {
        std::error_code ec;
        std::filesystem::remove(chunk.path, ec);
        return res.Wrap("part " + std::to_string(chunk.ordinal) + "/" + std::to_string(chunk.total));
    }
    return Result::Ok();
}

} // namespace relay
