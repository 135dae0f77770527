#include "relay/mega_client.hpp"

#include "crypto/mega_crypto.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <random>

namespace relay {

namespace {

using nlohmann::json;

// API error codes seen for public links.
std::string DescribeApiError(long long code) {
    switch (code) {
    case -2: return "bad arguments";
    case -3: return "temporary congestion, try again later";
    case -4: return "rate limited";
    case -9: return "object not found";
    case -11: return "access denied";
    case -16: return "object blocked";
    case -17: return "over quota";
    case -18: return "resource temporarily unavailable";
    default: return "provider error";
    }
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

} // namespace

MegaClient::MegaClient() : MegaClient(Options{}) {}

MegaClient::MegaClient(Options opt)
    : opt_(std::move(opt)),
      http_(net::HttpClient::Options{.failure_kind = ErrorKind::DownloadFailure}) {
    std::random_device rd;
    seq_.store(rd());
}

bool MegaClient::IsMegaHost(std::string_view host) {
    const std::string h = ToLower(host);
    for (const char* base : {"mega.nz", "mega.co.nz"}) {
        const std::string_view b(base);
        if (h == b) return true;
        if (h.size() > b.size() && h.ends_with(b) && h[h.size() - b.size() - 1] == '.') return true;
    }
    return false;
}

std::string MegaClient::SanitizeFileName(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        out.push_back((c < 0x20 || c == '/' || c == '\\' || c == 0x7F) ? '_' : static_cast<char>(c));
    }
    if (out == "." || out == "..") out.clear();
    return out;
}

Result MegaClient::Resolve(const SourceLink& link, RemoteObject& out) {
    out = RemoteObject{};

    if (!IsMegaHost(link.host)) {
        return Result::Fail(ErrorKind::UnsupportedSource, "not a MEGA link host: " + link.host);
    }
    if (link.kind != SourceKind::File) {
        return Result::Fail(ErrorKind::UnsupportedSource, "folder links are not supported");
    }
    if (link.key.empty()) {
        return Result::Fail(ErrorKind::LinkInvalid, "link has no decryption key");
    }

    MegaFileKey key;
    auto key_result = DeriveFileKey(link.key, key);
    if (!key_result.is_ok()) return key_result.Wrap("bad link key");

    net::Url api;
    const std::string api_url = "https://" + opt_.api_host + "/cs?id=" + std::to_string(seq_.fetch_add(1));
    auto url_result = net::Url::Parse(api_url, api);
    if (!url_result.is_ok()) return Result::Fail(ErrorKind::Config, "bad MEGA API host: " + opt_.api_host);

    const json request = json::array({{{"a", "g"}, {"g", 1}, {"ssl", 1}, {"p", link.id}}});

    net::HttpResponse resp;
    auto post_result = http_.PostJson(api, request.dump(), net::DeadlineAfter(opt_.timeout), resp);
    if (!post_result.is_ok()) return post_result.Wrap("MEGA API");
    if (resp.status != 200) {
        return Result::Fail(ErrorKind::DownloadFailure, "MEGA API returned HTTP " + std::to_string(resp.status));
    }

    try {
        json reply = json::parse(resp.body);
        // A bare number is a request-level error; otherwise one reply per command.
        if (reply.is_number_integer()) {
            const auto code = reply.get<long long>();
            return Result::Fail(ErrorKind::DownloadFailure,
                                "MEGA API error " + std::to_string(code) + " (" + DescribeApiError(code) + ")");
        }
        if (!reply.is_array() || reply.empty()) {
            return Result::Fail(ErrorKind::DownloadFailure, "unexpected MEGA API reply");
        }
        const json& node = reply.at(0);
        if (node.is_number_integer()) {
            const auto code = node.get<long long>();
            return Result::Fail(ErrorKind::DownloadFailure,
                                "MEGA API error " + std::to_string(code) + " (" + DescribeApiError(code) + ")");
        }
        if (!node.is_object() || !node.contains("g") || !node.contains("s")) {
            return Result::Fail(ErrorKind::DownloadFailure, "MEGA API reply lacks download data");
        }

        out.size = node.at("s").get<std::uint64_t>();
        const json& g = node.at("g");
        out.download_url = g.is_array() ? g.at(0).get<std::string>() : g.get<std::string>();
        out.key = link.key;

        if (node.contains("at") && node.at("at").is_string()) {
            std::string attrs;
            auto attrs_result = DecryptAttributes(node.at("at").get<std::string>(), key, attrs);
            if (attrs_result.is_ok()) {
                const json a = json::parse(attrs, nullptr, false);
                if (a.is_object() && a.contains("n") && a.at("n").is_string()) {
                    out.name = SanitizeFileName(a.at("n").get<std::string>());
                }
            } else {
                LogWarn("cannot decrypt attributes of %s: %s", link.id.c_str(), attrs_result.msg.c_str());
            }
        }
    } catch (const json::exception& e) {
        return Result::Fail(ErrorKind::DownloadFailure, std::string("malformed MEGA API reply: ") + e.what());
    }

    if (out.name.empty()) out.name = link.id;
    LogInfo("Resolved %s: %s (%llu bytes)", link.id.c_str(), out.name.c_str(), (unsigned long long)out.size);
    return Result::Ok();
}

Result MegaClient::Download(const RemoteObject& object, IWriter& out, net::Deadline deadline) {
    MegaFileKey key;
    auto key_result = DeriveFileKey(object.key, key);
    if (!key_result.is_ok()) return key_result.Wrap("bad link key");

    net::Url url;
    auto url_result = net::Url::Parse(object.download_url, url);
    if (!url_result.is_ok()) {
        return Result::Fail(ErrorKind::DownloadFailure, "bad download URL: " + url_result.message());
    }

    AesCtrStream ctr;
    auto init_result = ctr.Init(key.aes_key, key.ctr_iv);
    if (!init_result.is_ok()) return init_result;

    std::uint64_t received = 0;
    auto result = http_.Download(
        url,
        deadline,
        [&](std::span<std::uint8_t> piece) -> Result {
            auto r = ctr.Apply(piece);
            if (!r.is_ok()) return r;
            return out.WriteAll(piece);
        },
        received);
    if (!result.is_ok()) return result;

    if (received != object.size) {
        return Result::Fail(ErrorKind::DownloadFailure,
                            "size mismatch: got " + std::to_string(received) + " of " +
                                std::to_string(object.size) + " bytes");
    }
    return Result::Ok();
}

} // namespace relay
