#include "relay/fetcher.hpp"

#include "io/file_writer.hpp"
#include "relay/progress_monitor.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace relay {

namespace {

// Provider failures become DownloadFailure; kinds with their own meaning
// (disk, deadline, cancel, link shape) pass through.
Result AsFetchError(const Result& r) {
    switch (r.kind) {
    case ErrorKind::LinkInvalid:
    case ErrorKind::UnsupportedSource:
    case ErrorKind::DownloadFailure:
    case ErrorKind::DiskFull:
    case ErrorKind::Timeout:
    case ErrorKind::Cancelled:
    case ErrorKind::Io:
        return r;
    default:
        return Result::Fail(ErrorKind::DownloadFailure, r.msg, r.err);
    }
}

} // namespace

Fetcher::Fetcher(IStorageClient& client, IProgress* sink, Options opt)
    : client_(client), sink_(sink), opt_(opt) {}

Result Fetcher::Fetch(std::string_view uri, const std::string& dest_dir, FetchedObject& out) {
    SourceLink link;
    auto parse_result = ParseSourceLink(uri, link);
    if (!parse_result.is_ok()) return parse_result;
    return Fetch(link, dest_dir, out);
}

Result Fetcher::Fetch(const SourceLink& link, const std::string& dest_dir, FetchedObject& out) {
    out = FetchedObject{};
    if (link.kind == SourceKind::Folder) {
        return Result::Fail(ErrorKind::UnsupportedSource, "folder links are not supported");
    }
    if (CancelRequested()) return Result::Fail(ErrorKind::Cancelled, "fetch cancelled");

    const auto started = std::chrono::steady_clock::now();

    RemoteObject object;
    auto resolve_result = client_.Resolve(link, object);
    if (!resolve_result.is_ok()) return AsFetchError(resolve_result);

    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        return Result::FromErrno(ec.value(), "cannot create " + dest_dir + ": " + ec.message());
    }

    const std::string path = (fs::path(dest_dir) / object.name).string();
    FileWriter writer;
    auto open_result = FileWriter::Open(path, FileWriter::Mode::CreateExclusive, writer);
    if (!open_result.is_ok()) return open_result;

    LogInfo("Downloading %s (%llu bytes) to %s",
            object.name.c_str(),
            (unsigned long long)object.size,
            path.c_str());

    Result result = Result::Ok();
    {
        ProgressMonitor monitor(sink_, {.interval = opt_.poll_interval, .label = "Download"});
        monitor.Start(ProgressMonitor::FileSizeProbe(path), object.size);
        result = client_.Download(object, writer, net::DeadlineAfter(opt_.timeout));
        if (result.is_ok()) result = writer.Finish();
        monitor.Stop();
    }

    if (!result.is_ok()) {
        fs::remove(path, ec);
        return AsFetchError(result);
    }

    out.path = path;
    out.name = object.name;
    out.size = writer.BytesWritten();
    out.elapsed = std::chrono::steady_clock::now() - started;
    LogInfo("Download completed in %.2f seconds", out.elapsed.count());
    return Result::Ok();
}

} // namespace relay
