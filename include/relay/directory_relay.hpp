#pragma once

#include "relay/relay.hpp"

#include <string>

namespace relay {

// Delivers into a local outbox: the file is copied there and a
// "<file>\t<caption>" line is appended to captions.tsv.
class DirectoryRelay final : public IRelay {
  public:
    explicit DirectoryRelay(std::string outbox_dir);

    Result Send(const std::string& path,
                const std::string& caption,
                std::atomic<std::uint64_t>* bytes_sent) override;

    const std::string& Outbox() const { return outbox_; }

    static constexpr const char* kCaptionsFile = "captions.tsv";

  private:
    std::string outbox_;
};

} // namespace relay
