#pragma once

#include "util/result.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace relay {

// Destination that accepts one file with a caption per call.
class IRelay {
  public:
    virtual ~IRelay() = default;

    // `bytes_sent`, when given, is advanced as the file goes out so a
    // monitor on another thread can observe it.
    virtual Result Send(const std::string& path,
                        const std::string& caption,
                        std::atomic<std::uint64_t>* bytes_sent) = 0;
};

} // namespace relay
