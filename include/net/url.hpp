#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace relay::net {

struct Url {
    std::string scheme; // "http" or "https"
    std::string host;
    std::string port;   // defaulted from the scheme when absent
    std::string target; // path + query, at least "/"

    bool Secure() const { return scheme == "https"; }
    std::string HostHeader() const;

    static Result Parse(std::string_view text, Url& out);
};

// Percent-encodes everything outside RFC 3986 unreserved characters.
std::string UrlEncode(std::string_view s);

} // namespace relay::net
