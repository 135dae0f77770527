#pragma once

#include "net/url.hpp"
#include "util/result.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace relay::net {

using Deadline = std::optional<std::chrono::steady_clock::time_point>;

// nullopt when `timeout` is zero.
Deadline DeadlineAfter(std::chrono::seconds timeout);

struct HttpResponse {
    unsigned status = 0;
    std::string body;
};

struct FormField {
    std::string name;
    std::string value;
};

struct FormFile {
    std::string field;     // form field name, e.g. "document"
    std::string path;      // local file streamed as the part body
    std::string filename;  // name announced to the server
};

// Blocking HTTP/1.1 client (Boost.Beast, OpenSSL for https). One connection
// per request. Every network wait is bounded by the request deadline, and the
// process cancel flag is checked between body pieces.
//
// Transport and HTTP-status failures carry `failure_kind`; an expired deadline
// is Timeout, a raised cancel flag is Cancelled.
class HttpClient {
  public:
    struct Options {
        ErrorKind failure_kind = ErrorKind::DownloadFailure;
        bool verify_peer = true;
        std::string user_agent = "megarelay/1.0";
    };

    // Receives each decoded body piece; may modify it in place.
    using BodySink = std::function<Result(std::span<std::uint8_t>)>;

    HttpClient();
    explicit HttpClient(Options opt);

    Result PostJson(const Url& url, const std::string& json, Deadline deadline, HttpResponse& out) const;

    // GET with the body streamed to `sink`. Non-2xx is a failure.
    Result Download(const Url& url,
                    Deadline deadline,
                    const BodySink& sink,
                    std::uint64_t& out_bytes) const;

    // multipart/form-data POST; the file part is streamed from disk and
    // `bytes_sent` (if given) tracks how much of it has gone out.
    Result PostMultipart(const Url& url,
                         const std::vector<FormField>& fields,
                         const FormFile& file,
                         Deadline deadline,
                         std::atomic<std::uint64_t>* bytes_sent,
                         HttpResponse& out) const;

  private:
    Options opt_;
};

} // namespace relay::net
