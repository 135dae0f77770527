#include "net/http_client.hpp"

#include "io/counting_reader.hpp"
#include "io/file_reader.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <limits>
#include <memory>

namespace relay::net {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

constexpr size_t kBodyPieceBytes = 256 * 1024;

// One HTTP connection driven by a private io_context. Each network step is
// started asynchronously and the context is run until it completes, so the
// tcp_stream expiry can enforce the request deadline.
class Connection {
  public:
    Connection(const Url& url, Deadline deadline, const HttpClient::Options& opt)
        : url_(url), deadline_(deadline), opt_(opt), ssl_ctx_(ssl::context::tls_client), resolver_(ioc_) {}

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Result Open() {
        if (CancelRequested()) return Result::Fail(ErrorKind::Cancelled, "request cancelled");

        tcp::resolver::results_type endpoints;
        boost::system::error_code ec = asio::error::would_block;
        resolver_.async_resolve(url_.host,
                                url_.port,
                                [&](boost::system::error_code e, tcp::resolver::results_type r) {
                                    ec = e;
                                    endpoints = std::move(r);
                                });
        ioc_.restart();
        if (deadline_) {
            ioc_.run_until(*deadline_);
        } else {
            ioc_.run();
        }
        if (ec == asio::error::would_block) {
            resolver_.cancel();
            ioc_.restart();
            ioc_.run();
            return Result::Fail(ErrorKind::Timeout, "resolve " + url_.host + ": timed out");
        }
        if (ec) return Fail(ec, "resolve " + url_.host);

        if (url_.Secure()) {
            ssl_ctx_.set_default_verify_paths();
            ssl_ctx_.set_verify_mode(opt_.verify_peer ? ssl::verify_peer : ssl::verify_none);
            tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc_, ssl_ctx_);
            if (!SSL_set_tlsext_host_name(tls_->native_handle(), url_.host.c_str())) {
                return Result::Fail(opt_.failure_kind, "cannot set TLS server name for " + url_.host);
            }
            if (opt_.verify_peer) tls_->set_verify_callback(ssl::host_name_verification(url_.host));

            ec = Run([&](auto handler) {
                beast::get_lowest_layer(*tls_).async_connect(endpoints, std::move(handler));
            });
            if (ec) return Fail(ec, "connect " + url_.HostHeader());

            ec = Run([&](auto handler) { tls_->async_handshake(ssl::stream_base::client, std::move(handler)); });
            if (ec) return Fail(ec, "TLS handshake with " + url_.host);
        } else {
            plain_ = std::make_unique<beast::tcp_stream>(ioc_);
            ec = Run([&](auto handler) { plain_->async_connect(endpoints, std::move(handler)); });
            if (ec) return Fail(ec, "connect " + url_.HostHeader());
        }
        return Result::Ok();
    }

    template <class F>
    void WithStream(F&& f) {
        if (tls_) {
            f(*tls_);
        } else {
            f(*plain_);
        }
    }

    template <class Initiate>
    boost::system::error_code Run(Initiate&& initiate) {
        Arm();
        boost::system::error_code result = asio::error::would_block;
        initiate([&result](boost::system::error_code ec, auto&&...) { result = ec; });
        ioc_.restart();
        ioc_.run();
        return result;
    }

    Result Fail(boost::system::error_code ec, const std::string& what) const {
        if (ec == beast::error::timeout || ec == asio::error::timed_out) {
            return Result::Fail(ErrorKind::Timeout, what + ": timed out");
        }
        if (CancelRequested()) {
            return Result::Fail(ErrorKind::Cancelled, what + ": cancelled");
        }
        return Result::Fail(opt_.failure_kind, what + ": " + ec.message(), ec.value());
    }

    template <class Request>
    void SetCommonHeaders(Request& req) const {
        req.set(http::field::host, url_.HostHeader());
        req.set(http::field::user_agent, opt_.user_agent);
    }

  private:
    void Arm() {
        beast::tcp_stream& lowest = tls_ ? beast::get_lowest_layer(*tls_) : *plain_;
        if (deadline_) {
            lowest.expires_at(*deadline_);
        } else {
            lowest.expires_never();
        }
    }

    const Url& url_;
    Deadline deadline_;
    const HttpClient::Options& opt_;

    asio::io_context ioc_;
    ssl::context ssl_ctx_;
    tcp::resolver resolver_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;
    std::unique_ptr<beast::tcp_stream> plain_;
};

Result ReadResponse(Connection& conn, HttpResponse& out) {
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    auto ec = conn.Run([&](auto handler) {
        conn.WithStream([&](auto& s) { http::async_read(s, buffer, res, std::move(handler)); });
    });
    if (ec) return conn.Fail(ec, "read response");

    out.status = res.result_int();
    out.body = std::move(res.body());
    return Result::Ok();
}

std::string RandomBoundary() {
    std::array<unsigned char, 16> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        return "megarelay-" + std::to_string(now);
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out = "megarelay-";
    for (unsigned char c : raw) {
        out.push_back(kHex[c >> 4]);
        out.push_back(kHex[c & 0xF]);
    }
    return out;
}

std::string QuoteFormValue(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back((c == '"' || c == '\r' || c == '\n') ? '_' : c);
    }
    return out;
}

} // namespace

Deadline DeadlineAfter(std::chrono::seconds timeout) {
    if (timeout.count() <= 0) return std::nullopt;
    return std::chrono::steady_clock::now() + timeout;
}

HttpClient::HttpClient() = default;

HttpClient::HttpClient(Options opt) : opt_(std::move(opt)) {}

Result HttpClient::PostJson(const Url& url, const std::string& json, Deadline deadline, HttpResponse& out) const {
    Connection conn(url, deadline, opt_);
    auto open_result = conn.Open();
    if (!open_result.is_ok()) return open_result;

    http::request<http::string_body> req{http::verb::post, url.target, 11};
    conn.SetCommonHeaders(req);
    req.set(http::field::content_type, "application/json");
    req.body() = json;
    req.prepare_payload();

    auto ec = conn.Run([&](auto handler) {
        conn.WithStream([&](auto& s) { http::async_write(s, req, std::move(handler)); });
    });
    if (ec) return conn.Fail(ec, "POST " + url.host + url.target);

    return ReadResponse(conn, out);
}

Result HttpClient::Download(const Url& url,
                            Deadline deadline,
                            const BodySink& sink,
                            std::uint64_t& out_bytes) const {
    out_bytes = 0;

    Connection conn(url, deadline, opt_);
    auto open_result = conn.Open();
    if (!open_result.is_ok()) return open_result;

    http::request<http::empty_body> req{http::verb::get, url.target, 11};
    conn.SetCommonHeaders(req);

    auto ec = conn.Run([&](auto handler) {
        conn.WithStream([&](auto& s) { http::async_write(s, req, std::move(handler)); });
    });
    if (ec) return conn.Fail(ec, "GET " + url.host);

    beast::flat_buffer buffer;
    http::response_parser<http::buffer_body> parser;
    parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

    ec = conn.Run([&](auto handler) {
        conn.WithStream([&](auto& s) { http::async_read_header(s, buffer, parser, std::move(handler)); });
    });
    if (ec) return conn.Fail(ec, "read response header from " + url.host);

    const unsigned status = parser.get().result_int();
    if (status / 100 != 2) {
        return Result::Fail(opt_.failure_kind, "GET " + url.host + " returned HTTP " + std::to_string(status));
    }
    const auto expected = parser.content_length();

    std::vector<std::uint8_t> piece(kBodyPieceBytes);
    while (!parser.is_done()) {
        if (CancelRequested()) return Result::Fail(ErrorKind::Cancelled, "download cancelled");

        parser.get().body().data = piece.data();
        parser.get().body().size = piece.size();
        ec = conn.Run([&](auto handler) {
            conn.WithStream([&](auto& s) { http::async_read(s, buffer, parser, std::move(handler)); });
        });
        if (ec == http::error::need_buffer) ec = {};
        if (ec) return conn.Fail(ec, "read body from " + url.host);

        const size_t n = piece.size() - parser.get().body().size;
        if (n == 0) continue;
        auto sink_result = sink(std::span<std::uint8_t>(piece.data(), n));
        if (!sink_result.is_ok()) return sink_result;
        out_bytes += n;
    }

    if (expected && *expected != out_bytes) {
        return Result::Fail(opt_.failure_kind,
                            "short body from " + url.host + ": " + std::to_string(out_bytes) + " of " +
                                std::to_string(*expected) + " bytes");
    }
    return Result::Ok();
}

Result HttpClient::PostMultipart(const Url& url,
                                 const std::vector<FormField>& fields,
                                 const FormFile& file,
                                 Deadline deadline,
                                 std::atomic<std::uint64_t>* bytes_sent,
                                 HttpResponse& out) const {
    FileReader reader;
    auto file_result = FileReader::Open(file.path, reader);
    if (!file_result.is_ok()) return file_result;
    const std::uint64_t file_size = reader.TotalSize().value_or(0);
    CountingReader counted(reader, bytes_sent);
    if (bytes_sent) bytes_sent->store(0);

    const std::string boundary = RandomBoundary();
    std::string head;
    for (const auto& f : fields) {
        head += "--" + boundary + "\r\n";
        head += "Content-Disposition: form-data; name=\"" + QuoteFormValue(f.name) + "\"\r\n\r\n";
        head += f.value + "\r\n";
    }
    head += "--" + boundary + "\r\n";
    head += "Content-Disposition: form-data; name=\"" + QuoteFormValue(file.field) + "\"; filename=\"" +
            QuoteFormValue(file.filename) + "\"\r\n";
    head += "Content-Type: application/octet-stream\r\n\r\n";
    const std::string tail = "\r\n--" + boundary + "--\r\n";

    Connection conn(url, deadline, opt_);
    auto open_result = conn.Open();
    if (!open_result.is_ok()) return open_result;

    http::request<http::buffer_body> req{http::verb::post, url.target, 11};
    conn.SetCommonHeaders(req);
    req.set(http::field::content_type, "multipart/form-data; boundary=" + boundary);
    req.content_length(head.size() + file_size + tail.size());
    req.body().data = nullptr;
    req.body().more = true;

    http::request_serializer<http::buffer_body> sr{req};
    auto ec = conn.Run([&](auto handler) {
        conn.WithStream([&](auto& s) { http::async_write_header(s, sr, std::move(handler)); });
    });
    if (ec) return conn.Fail(ec, "POST " + url.host);

    auto send = [&](const void* data, size_t size, bool more) -> Result {
        req.body().data = const_cast<void*>(data);
        req.body().size = size;
        req.body().more = more;
        auto wec = conn.Run([&](auto handler) {
            conn.WithStream([&](auto& s) { http::async_write(s, sr, std::move(handler)); });
        });
        if (wec == http::error::need_buffer) wec = {};
        if (wec) return conn.Fail(wec, "send body to " + url.host);
        return Result::Ok();
    };

    auto r = send(head.data(), head.size(), true);
    if (!r.is_ok()) return r;

    std::vector<std::uint8_t> piece(kBodyPieceBytes);
    std::uint64_t remaining = file_size;
    while (remaining > 0) {
        if (CancelRequested()) return Result::Fail(ErrorKind::Cancelled, "upload cancelled");
        const ssize_t n = counted.Read(std::span<std::uint8_t>(piece.data(), piece.size()));
        if (n < 0) return Result::Fail(ErrorKind::Io, "read failed while uploading " + file.path);
        if (n == 0) return Result::Fail(ErrorKind::Io, file.path + " shrank during upload");
        const size_t sz = static_cast<size_t>(std::min<std::uint64_t>(static_cast<std::uint64_t>(n), remaining));
        r = send(piece.data(), sz, true);
        if (!r.is_ok()) return r;
        remaining -= sz;
    }

    r = send(tail.data(), tail.size(), false);
    if (!r.is_ok()) return r;

    LogDebug("POST %s: %llu body bytes sent",
             url.host.c_str(),
             (unsigned long long)(head.size() + file_size + tail.size()));
    return ReadResponse(conn, out);
}

} // namespace relay::net
