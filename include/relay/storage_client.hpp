#pragma once

#include "io/io.hpp"
#include "net/http_client.hpp"
#include "relay/source_link.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace relay {

// What Resolve learned about a remote object before any byte is fetched.
struct RemoteObject {
    std::string name;         // file name, safe to use as a single path segment
    std::uint64_t size = 0;
    std::string download_url; // provider-specific; may be short-lived
    std::string key;          // opaque key material from the link
};

// Session with a remote object store. Injected into the pipeline; the
// implementation owns whatever authentication state it needs.
class IStorageClient {
  public:
    virtual ~IStorageClient() = default;

    // UnsupportedSource for hosts or link kinds the client cannot serve,
    // LinkInvalid for links missing required parts, DownloadFailure for
    // provider errors.
    virtual Result Resolve(const SourceLink& link, RemoteObject& out) = 0;

    // Streams the object body into `out`, in order. `out` is not finished.
    virtual Result Download(const RemoteObject& object, IWriter& out, net::Deadline deadline) = 0;
};

} // namespace relay
