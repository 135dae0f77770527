#pragma once
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace relay {

struct ProgressEvent {
    std::string_view label;
    std::uint64_t done = 0;
    std::uint64_t total = 0; // 0 => unknown
    double percent = 0.0;
    double bytes_per_second = 0.0;
};

// A failed update is reported back to the caller; the monitor logs it and
// keeps going.
class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual Result OnProgress(const ProgressEvent& e) = 0;
};

// done / total * 100, clamped to [0, 100]; 0 when total is unknown.
double ComputePercent(std::uint64_t done, std::uint64_t total);

// "Download Progress: 42.00% (100MB/238MB, 12.5 MB/s)"
std::string FormatProgressLine(const ProgressEvent& e);

} // namespace relay
