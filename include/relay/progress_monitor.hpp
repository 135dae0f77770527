#pragma once

#include "relay/progress.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace relay {

// Polls the size of an in-flight transfer on its own thread and reports it
// to a sink. The transfer itself is never touched: the only shared state is
// what the probe reads (a file size or an atomic byte counter).
class ProgressMonitor {
  public:
    // Current size, or nullopt once the target has disappeared.
    using SizeProbe = std::function<std::optional<std::uint64_t>()>;

    struct Options {
        std::chrono::milliseconds interval{1000};
        std::string label = "Transfer";
    };

    ProgressMonitor(IProgress* sink, Options opt);
    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;
    ~ProgressMonitor();

    // Starts polling; a running monitor is stopped first.
    void Start(SizeProbe probe, std::uint64_t expected_total);

    // Cancels the poll loop and joins. Emits one last update if the size
    // moved since the previous poll. Safe to call repeatedly.
    void Stop();

    bool Running() const { return running_.load(); }
    std::uint64_t LastObserved() const { return last_observed_.load(); }

    static SizeProbe FileSizeProbe(std::string path);
    static SizeProbe CounterProbe(const std::atomic<std::uint64_t>& counter);

  private:
    void Loop(SizeProbe probe, std::uint64_t expected_total);
    void Emit(std::uint64_t observed,
              std::uint64_t expected_total,
              std::chrono::steady_clock::time_point started);

    IProgress* sink_ = nullptr;
    Options opt_;

    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_requested_ = false;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> last_observed_{0};
};

} // namespace relay
