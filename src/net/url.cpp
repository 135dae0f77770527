#include "net/url.hpp"

#include <cctype>

namespace relay::net {

std::string Url::HostHeader() const {
    const bool default_port = (Secure() && port == "443") || (!Secure() && port == "80");
    return default_port ? host : host + ":" + port;
}

Result Url::Parse(std::string_view text, Url& out) {
    out = Url{};

    const auto sep = text.find("://");
    if (sep == std::string_view::npos) return Result::Fail(ErrorKind::LinkInvalid, "URL without scheme: " + std::string(text));
    out.scheme = std::string(text.substr(0, sep));
    for (char& c : out.scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (out.scheme != "http" && out.scheme != "https") {
        return Result::Fail(ErrorKind::LinkInvalid, "unsupported URL scheme: " + out.scheme);
    }

    std::string_view rest = text.substr(sep + 3);
    const auto path_pos = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, path_pos);
    std::string_view target = path_pos == std::string_view::npos ? std::string_view("/") : rest.substr(path_pos);
    if (const auto frag = target.find('#'); frag != std::string_view::npos) target = target.substr(0, frag);

    if (const auto at = authority.rfind('@'); at != std::string_view::npos) authority.remove_prefix(at + 1);
    if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        out.port = std::string(authority.substr(colon + 1));
        authority = authority.substr(0, colon);
        if (out.port.empty()) return Result::Fail(ErrorKind::LinkInvalid, "empty port in URL: " + std::string(text));
        for (char c : out.port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return Result::Fail(ErrorKind::LinkInvalid, "bad port in URL: " + std::string(text));
            }
        }
    } else {
        out.port = out.Secure() ? "443" : "80";
    }
    if (authority.empty()) return Result::Fail(ErrorKind::LinkInvalid, "URL without host: " + std::string(text));

    out.host = std::string(authority);
    out.target = target.empty() || target.front() != '/' ? "/" + std::string(target) : std::string(target);
    return Result::Ok();
}

std::string UrlEncode(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0xF]);
        }
    }
    return out;
}

} // namespace relay::net
