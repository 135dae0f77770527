#include "relay/progress_monitor.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <system_error>

namespace relay {

ProgressMonitor::ProgressMonitor(IProgress* sink, Options opt)
    : sink_(sink), opt_(std::move(opt)) {
    if (opt_.interval.count() <= 0) opt_.interval = std::chrono::milliseconds(1000);
}

ProgressMonitor::~ProgressMonitor() { Stop(); }

void ProgressMonitor::Start(SizeProbe probe, std::uint64_t expected_total) {
    Stop();
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_requested_ = false;
    }
    last_observed_ = 0;
    running_ = true;
    worker_ = std::thread(&ProgressMonitor::Loop, this, std::move(probe), expected_total);
}

void ProgressMonitor::Stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    running_ = false;
}

void ProgressMonitor::Loop(SizeProbe probe, std::uint64_t expected_total) {
    const auto started = std::chrono::steady_clock::now();
    std::uint64_t max_seen = 0;
    bool emitted_any = false;

    while (true) {
        const auto cur = probe();
        if (!cur) {
            LogDebug("%s: monitored target is gone", opt_.label.c_str());
            break;
        }

        // Sizes only move forward; a probe that reads backwards (e.g. a
        // truncate-then-rewrite) must not make the percentage regress.
        if (!emitted_any || *cur > max_seen) {
            max_seen = std::max(max_seen, *cur);
            Emit(max_seen, expected_total, started);
            emitted_any = true;
        }
        if (expected_total > 0 && max_seen >= expected_total) break;

        std::unique_lock<std::mutex> lk(mu_);
        if (cv_.wait_for(lk, opt_.interval, [this] { return stop_requested_; })) {
            lk.unlock();
            const auto last = probe();
            if (last && *last > max_seen) {
                max_seen = *last;
                Emit(max_seen, expected_total, started);
            }
            break;
        }
    }
    running_ = false;
}

void ProgressMonitor::Emit(std::uint64_t observed,
                           std::uint64_t expected_total,
                           std::chrono::steady_clock::time_point started) {
    last_observed_ = observed;
    if (!sink_) return;

    const double secs =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    ProgressEvent e{};
    e.label = opt_.label;
    e.done = observed;
    e.total = expected_total;
    e.percent = ComputePercent(observed, expected_total);
    e.bytes_per_second = secs > 0.0 ? static_cast<double>(observed) / secs : 0.0;

    try {
        auto res = sink_->OnProgress(e);
        if (!res.is_ok()) {
            LogWarn("Failed to update progress (%s): %s",
                    opt_.label.c_str(),
                    res.msg.c_str());
        }
    } catch (const std::exception& ex) {
        LogWarn("Failed to update progress (%s): %s", opt_.label.c_str(), ex.what());
    }
}

ProgressMonitor::SizeProbe ProgressMonitor::FileSizeProbe(std::string path) {
    return [path = std::move(path)]() -> std::optional<std::uint64_t> {
        std::error_code ec;
        const auto sz = std::filesystem::file_size(path, ec);
        if (ec) return std::nullopt;
        return static_cast<std::uint64_t>(sz);
    };
}

ProgressMonitor::SizeProbe ProgressMonitor::CounterProbe(const std::atomic<std::uint64_t>& counter) {
    return [&counter]() -> std::optional<std::uint64_t> {
        return counter.load(std::memory_order_relaxed);
    };
}

} // namespace relay
