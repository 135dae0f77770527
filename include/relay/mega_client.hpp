#pragma once

#include "net/http_client.hpp"
#include "relay/storage_client.hpp"

#include <atomic>
#include <chrono>
#include <string>

namespace relay {

// Public file links on mega.nz / mega.co.nz. Resolves the node through the
// "g" API command, decrypts its attributes for the file name and streams the
// AES-CTR encrypted body through decryption into the writer.
class MegaClient final : public IStorageClient {
  public:
    struct Options {
        std::string api_host = "g.api.mega.co.nz";
        std::chrono::seconds timeout{0}; // for the API call; 0 = none
    };

    MegaClient();
    explicit MegaClient(Options opt);

    Result Resolve(const SourceLink& link, RemoteObject& out) override;
    Result Download(const RemoteObject& object, IWriter& out, net::Deadline deadline) override;

    static bool IsMegaHost(std::string_view host);

    // Keeps one path segment: separators and control characters become '_'.
    static std::string SanitizeFileName(std::string_view name);

  private:
    Options opt_;
    net::HttpClient http_;
    std::atomic<std::uint64_t> seq_{0};
};

} // namespace relay
