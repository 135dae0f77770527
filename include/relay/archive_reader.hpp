#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct archive;
struct archive_entry;

namespace relay {

struct ArchiveEntryInfo {
    std::string name;
    std::uint64_t size = 0;
};

// Sequential reader over the regular-file entries of a ZIP container.
// Failures carry ErrorKind::ArchiveCorrupt.
class ZipArchiveReader {
public:
    ZipArchiveReader() = default;
    ~ZipArchiveReader();

    ZipArchiveReader(const ZipArchiveReader&) = delete;
    ZipArchiveReader& operator=(const ZipArchiveReader&) = delete;

    Result Open(const std::string& path);

    // Move to next regular file entry.
    // Returns Ok + eof=true when end-of-archive.
    Result Next(ArchiveEntryInfo& out, bool& eof);

    // Streams the current entry with archive_read_data(); libarchive is
    // sequential, so read to EOF (or SkipCurrent) before calling Next().
    Result OpenCurrentEntryReader(std::unique_ptr<IReader>& out_reader);

    Result SkipCurrent();

private:
    Result Fail(const std::string& what) const;

    struct archive* ar_ = nullptr;
    struct archive_entry* cur_entry_ = nullptr;
    bool in_entry_ = false;
    std::string path_;

    class EntryReader final : public IReader {
    public:
        explicit EntryReader(ZipArchiveReader* parent) : parent_(parent) {}
        ssize_t Read(std::span<std::uint8_t> out) override;
        std::optional<std::uint64_t> TotalSize() const override;

    private:
        ZipArchiveReader* parent_ = nullptr;
    };
};

} // namespace relay
