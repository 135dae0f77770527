#include "relay/directory_relay.hpp"

#include "io/counting_reader.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "system/signals.hpp"
#include "util/path_utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace relay {

namespace {

std::string OneLine(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        if (c == '\t' || c == '\n' || c == '\r') c = ' ';
    }
    return out;
}

Result AppendCaption(const std::string& index_path, const std::string& line) {
    Fd fd;
    auto open_result = Fd::Open(index_path, O_WRONLY | O_CREAT | O_APPEND, 0644, fd);
    if (!open_result.is_ok()) return open_result;

    size_t off = 0;
    while (off < line.size()) {
        const ssize_t n = ::write(fd.Get(), line.data() + off, line.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::FromErrno(errno, "append to " + index_path + " failed");
        }
        off += static_cast<size_t>(n);
    }
    return fd.Close();
}

// A full disk stays DiskFull; any other write failure at the destination
// is the upload failing.
Result AsUploadError(const Result& r) {
    if (r.kind == ErrorKind::DiskFull) return r;
    return Result::Fail(ErrorKind::UploadFailure, r.msg, r.err);
}

} // namespace

DirectoryRelay::DirectoryRelay(std::string outbox_dir) : outbox_(std::move(outbox_dir)) {}

Result DirectoryRelay::Send(const std::string& path,
                            const std::string& caption,
                            std::atomic<std::uint64_t>* bytes_sent) {
    std::error_code ec;
    fs::create_directories(outbox_, ec);
    if (ec) return Result::FromErrno(ec.value(), "cannot create outbox " + outbox_ + ": " + ec.message());

    FileReader reader;
    auto open_result = FileReader::Open(path, reader);
    if (!open_result.is_ok()) return open_result.Wrap("upload source");

    const std::string name(LastSegment(path));
    const std::string target = (fs::path(outbox_) / name).string();

    FileWriter writer;
    auto wo = FileWriter::Open(target, FileWriter::Mode::Truncate, writer);
    if (!wo.is_ok()) return AsUploadError(wo);

    if (bytes_sent) bytes_sent->store(0);
    CountingReader counted(reader, bytes_sent);
    std::vector<std::uint8_t> buf(256 * 1024);
    while (true) {
        if (CancelRequested()) {
            std::error_code rm;
            fs::remove(target, rm);
            return Result::Fail(ErrorKind::Cancelled, "upload cancelled");
        }
        const ssize_t n = counted.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n < 0) return Result::Fail(ErrorKind::Io, "read failed while delivering " + path);
        if (n == 0) break;
        auto wr = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.is_ok()) return AsUploadError(wr);
    }
    auto fin = writer.Finish();
    if (!fin.is_ok()) return AsUploadError(fin);

    auto idx = AppendCaption((fs::path(outbox_) / kCaptionsFile).string(), name + "\t" + OneLine(caption) + "\n");
    if (!idx.is_ok()) return AsUploadError(idx);
    return Result::Ok();
}

} // namespace relay
