#include "relay/content_classifier.hpp"

#include "io/file_reader.hpp"

#include <array>
#include <cstring>

namespace relay {

namespace {
// local file header, and end-of-central-directory for an empty archive
constexpr std::array<std::uint8_t, 4> kZipLocalHeader{'P', 'K', 0x03, 0x04};
constexpr std::array<std::uint8_t, 4> kZipEmptyArchive{'P', 'K', 0x05, 0x06};
} // namespace

std::string_view ToString(ContentKind kind) {
    return kind == ContentKind::Archive ? "Archive" : "PlainFile";
}

ContentKind ContentClassifier::ClassifyHeader(std::span<const std::uint8_t> head) {
    if (head.size() < kZipLocalHeader.size()) return ContentKind::PlainFile;
    if (std::memcmp(head.data(), kZipLocalHeader.data(), kZipLocalHeader.size()) == 0 ||
        std::memcmp(head.data(), kZipEmptyArchive.data(), kZipEmptyArchive.size()) == 0) {
        return ContentKind::Archive;
    }
    return ContentKind::PlainFile;
}

Result ContentClassifier::Classify(const std::string& path, ContentKind& out) {
    FileReader reader;
    auto open_result = FileReader::Open(path, reader);
    if (!open_result.is_ok()) return open_result;

    std::array<std::uint8_t, 4> head{};
    size_t got = 0;
    while (got < head.size()) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(head.data() + got, head.size() - got));
        if (n < 0) return Result::Fail(ErrorKind::Io, "read failed while classifying " + path);
        if (n == 0) break;
        got += static_cast<size_t>(n);
    }

    out = ClassifyHeader(std::span<const std::uint8_t>(head.data(), got));
    return Result::Ok();
}

} // namespace relay
