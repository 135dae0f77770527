#pragma once

#include "relay/progress.hpp"
#include "relay/relay.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace relay {

// Sends single files through a relay with a monitored byte counter and
// removes each local copy once the destination has acknowledged it.
class Uploader {
  public:
    struct Options {
        std::chrono::milliseconds poll_interval{1000};
    };

    Uploader(IRelay& relay, IProgress* sink, Options opt);

    // On success the file at `path` no longer exists.
    Result Upload(const std::string& path, const std::string& caption);

    std::uint64_t ItemsDelivered() const { return items_; }
    std::uint64_t BytesDelivered() const { return bytes_; }

  private:
    IRelay& relay_;
    IProgress* sink_ = nullptr;
    Options opt_;
    std::uint64_t items_ = 0;
    std::uint64_t bytes_ = 0;
};

} // namespace relay
