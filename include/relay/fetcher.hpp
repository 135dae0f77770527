#pragma once

#include "relay/progress.hpp"
#include "relay/source_link.hpp"
#include "relay/storage_client.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace relay {

struct FetchedObject {
    std::string path; // <dest_dir>/<name>
    std::string name;
    std::uint64_t size = 0;
    std::chrono::duration<double> elapsed{0};
};

// Retrieves one remote object into a directory (created if missing) while a
// progress monitor watches the destination file grow. No retries.
class Fetcher {
  public:
    struct Options {
        std::chrono::milliseconds poll_interval{1000};
        std::chrono::seconds timeout{0}; // 0 = no deadline
    };

    Fetcher(IStorageClient& client, IProgress* sink, Options opt);

    // Parses `uri` first; a malformed link fails before any I/O.
    Result Fetch(std::string_view uri, const std::string& dest_dir, FetchedObject& out);
    Result Fetch(const SourceLink& link, const std::string& dest_dir, FetchedObject& out);

  private:
    IStorageClient& client_;
    IProgress* sink_ = nullptr;
    Options opt_;
};

} // namespace relay
