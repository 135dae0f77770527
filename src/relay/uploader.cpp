#include "relay/uploader.hpp"

#include "relay/progress_monitor.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <atomic>
#include <filesystem>

namespace fs = std::filesystem;

namespace relay {

Uploader::Uploader(IRelay& relay, IProgress* sink, Options opt)
    : relay_(relay), sink_(sink), opt_(opt) {}

Result Uploader::Upload(const std::string& path, const std::string& caption) {
    if (CancelRequested()) return Result::Fail(ErrorKind::Cancelled, "upload cancelled");

    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) return Result::FromErrno(ec.value(), "cannot stat " + path + ": " + ec.message());

    const std::string name(LastSegment(path));
    LogInfo("Uploading %s (%llu bytes)", name.c_str(), (unsigned long long)size);

    std::atomic<std::uint64_t> sent{0};
    Result result = Result::Ok();
    {
        ProgressMonitor monitor(sink_, {.interval = opt_.poll_interval, .label = "Upload"});
        monitor.Start(ProgressMonitor::CounterProbe(sent), size);
        result = relay_.Send(path, caption, &sent);
        monitor.Stop();
    }

    if (!result.is_ok()) {
        switch (result.kind) {
        case ErrorKind::UploadFailure:
        case ErrorKind::DiskFull:
        case ErrorKind::Timeout:
        case ErrorKind::Cancelled:
        case ErrorKind::Config:
        case ErrorKind::Io:
            return result;
        default:
            return Result::Fail(ErrorKind::UploadFailure, result.msg, result.err);
        }
    }

    fs::remove(path, ec);
    if (ec) return Result::FromErrno(ec.value(), "cannot remove uploaded " + path + ": " + ec.message());

    ++items_;
    bytes_ += size;
    LogInfo("Uploaded %s", name.c_str());
    return Result::Ok();
}

} // namespace relay
