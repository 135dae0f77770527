#include "relay/progress_sinks.hpp"

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>

namespace relay {

namespace {
std::atomic<bool> g_progress_line_active{false};
} // namespace

double ComputePercent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 0.0;
    if (done >= total) return 100.0;
    return static_cast<double>(done) * 100.0 / static_cast<double>(total);
}

std::string FormatProgressLine(const ProgressEvent& e) {
    char buf[160];
    const unsigned long long done_mb = e.done / (1024ULL * 1024ULL);
    const unsigned long long total_mb = e.total / (1024ULL * 1024ULL);
    const double mbps = e.bytes_per_second / (1024.0 * 1024.0);
    std::snprintf(buf,
                  sizeof(buf),
                  "%.*s Progress: %.2f%% (%lluMB/%lluMB, %.1f MB/s)",
                  (int)e.label.size(),
                  e.label.data(),
                  e.percent,
                  done_mb,
                  total_mb,
                  mbps);
    return buf;
}

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

Result FileProgressSink::OnProgress(const ProgressEvent& e) {
    nlohmann::json j = {
        {"label", std::string(e.label)},
        {"percent", e.percent},
        {"done", e.done},
        {"total", e.total},
        {"bytes_per_second", e.bytes_per_second},
    };

    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good())
        return Result::Fail(ErrorKind::Io, "cannot open progress file: " + tmp_path);

    os << j.dump();
    os.close();
    if (!os.good())
        return Result::Fail(ErrorKind::Io, "cannot write progress file: " + tmp_path);

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        const int e2 = errno;
        return Result::FromErrno(e2, "rename " + tmp_path + " (" + std::strerror(e2) + ")");
    }
    return Result::Ok();
}

Result ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    const std::string line = FormatProgressLine(e);
    if (std::fprintf(stderr, "\r%s", line.c_str()) < 0) {
        return Result::Fail(ErrorKind::Io, "stderr write failed");
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.total > 0 && e.done >= e.total) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
    return Result::Ok();
}

Result LogProgressSink::OnProgress(const ProgressEvent& e) {
    LogInfo("%s", FormatProgressLine(e).c_str());
    return Result::Ok();
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace relay
