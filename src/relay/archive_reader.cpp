#include "relay/archive_reader.hpp"

#include <archive.h>
#include <archive_entry.h>

namespace relay {

ZipArchiveReader::~ZipArchiveReader() {
    if (ar_) {
        archive_read_free(ar_);
        ar_ = nullptr;
    }
}

Result ZipArchiveReader::Fail(const std::string& what) const {
    const char* em = ar_ ? archive_error_string(ar_) : nullptr;
    return Result::Fail(ErrorKind::ArchiveCorrupt,
                        what + ": " + (em ? em : "unknown") + " (" + path_ + ")");
}

Result ZipArchiveReader::Open(const std::string& path) {
    if (ar_) return Result::Fail(ErrorKind::ArchiveCorrupt, "Archive already opened");
    path_ = path;

    ar_ = archive_read_new();
    if (!ar_) return Result::Fail(ErrorKind::ArchiveCorrupt, "archive_read_new failed");

    archive_read_support_format_zip(ar_);

    if (archive_read_open_filename(ar_, path.c_str(), 64 * 1024) != ARCHIVE_OK) {
        auto res = Fail("archive_read_open_filename");
        archive_read_free(ar_);
        ar_ = nullptr;
        return res;
    }
    return Result::Ok();
}

Result ZipArchiveReader::Next(ArchiveEntryInfo& out, bool& eof) {
    eof = false;
    if (!ar_) return Result::Fail(ErrorKind::ArchiveCorrupt, "Archive not opened");

    if (in_entry_) {
        auto skip_result = SkipCurrent();
        if (!skip_result.is_ok()) return skip_result;
    }

    while (true) {
        const int r = archive_read_next_header(ar_, &cur_entry_);
        if (r == ARCHIVE_EOF) {
            eof = true;
            return Result::Ok();
        }
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Fail("archive_read_next_header");
        }

        // Only regular files
        if (archive_entry_filetype(cur_entry_) != AE_IFREG) {
            if (archive_read_data_skip(ar_) != ARCHIVE_OK) return Fail("archive_read_data_skip");
            continue;
        }

        const char* name = archive_entry_pathname(cur_entry_);
        out.name = name ? std::string(name) : std::string();
        const la_int64_t sz = archive_entry_size_is_set(cur_entry_) ? archive_entry_size(cur_entry_) : 0;
        out.size = sz > 0 ? static_cast<std::uint64_t>(sz) : 0;

        in_entry_ = true;
        return Result::Ok();
    }
}

Result ZipArchiveReader::SkipCurrent() {
    if (!in_entry_) return Result::Ok();
    in_entry_ = false;
    if (archive_read_data_skip(ar_) != ARCHIVE_OK) {
        return Fail("archive_read_data_skip");
    }
    return Result::Ok();
}

Result ZipArchiveReader::OpenCurrentEntryReader(std::unique_ptr<IReader>& out_reader) {
    if (!in_entry_) return Result::Fail(ErrorKind::ArchiveCorrupt, "No current entry");
    out_reader = std::make_unique<EntryReader>(this);
    return Result::Ok();
}

ssize_t ZipArchiveReader::EntryReader::Read(std::span<std::uint8_t> out) {
    if (!parent_ || !parent_->in_entry_) return 0;
    const la_ssize_t n = archive_read_data(parent_->ar_, out.data(), out.size());
    if (n < 0) return -1;
    if (n == 0) {
        // entry finished
        parent_->in_entry_ = false;
        return 0;
    }
    return static_cast<ssize_t>(n);
}

std::optional<std::uint64_t> ZipArchiveReader::EntryReader::TotalSize() const {
    if (!parent_ || !parent_->cur_entry_) return std::nullopt;
    if (!archive_entry_size_is_set(parent_->cur_entry_)) return std::nullopt;
    const la_int64_t sz = archive_entry_size(parent_->cur_entry_);
    if (sz < 0) return std::nullopt;
    return static_cast<std::uint64_t>(sz);
}

} // namespace relay
