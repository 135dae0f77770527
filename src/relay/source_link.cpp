#include "relay/source_link.hpp"

#include <cctype>

namespace relay {

namespace {

bool IsIdChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool IsIdToken(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!IsIdChar(c)) return false;
    }
    return true;
}

bool IsHostToken(std::string_view s) {
    if (s.empty() || s.front() == '.' || s.back() == '.') return false;
    for (char c : s) {
        const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-';
        if (!ok) return false;
    }
    return true;
}

Result Invalid(std::string_view text, const char* why) {
    return Result::Fail(ErrorKind::LinkInvalid,
                        "not a valid source link (" + std::string(why) + "): " + std::string(text));
}

} // namespace

std::string SourceLink::ToString() const {
    std::string out = scheme + "://" + host + (kind == SourceKind::File ? "/file/" : "/folder/") + id;
    if (!key.empty()) out += "#" + key;
    return out;
}

Result ParseSourceLink(std::string_view text, SourceLink& out) {
    out = SourceLink{};

    const auto sep = text.find("://");
    if (sep == std::string_view::npos) return Invalid(text, "missing scheme");
    const std::string_view scheme = text.substr(0, sep);
    if (scheme != "https" && scheme != "http") return Invalid(text, "scheme must be http or https");

    std::string_view rest = text.substr(sep + 3);
    const auto host_end = rest.find('/');
    if (host_end == std::string_view::npos) return Invalid(text, "missing path");
    const std::string_view host = rest.substr(0, host_end);
    if (!IsHostToken(host)) return Invalid(text, "bad host");
    rest.remove_prefix(host_end + 1);

    const auto kind_end = rest.find('/');
    if (kind_end == std::string_view::npos) return Invalid(text, "missing id");
    const std::string_view kind = rest.substr(0, kind_end);
    if (kind == "file") {
        out.kind = SourceKind::File;
    } else if (kind == "folder") {
        out.kind = SourceKind::Folder;
    } else {
        return Invalid(text, "expected /file/ or /folder/");
    }
    rest.remove_prefix(kind_end + 1);

    std::string_view id = rest;
    std::string_view key;
    if (const auto hash = rest.find('#'); hash != std::string_view::npos) {
        id = rest.substr(0, hash);
        key = rest.substr(hash + 1);
        if (!IsIdToken(key)) return Invalid(text, "bad key");
    }
    if (!IsIdToken(id)) return Invalid(text, "bad id");

    out.scheme = std::string(scheme);
    out.host = std::string(host);
    out.id = std::string(id);
    out.key = std::string(key);
    return Result::Ok();
}

std::optional<SourceLink> FindSourceLink(std::string_view message) {
    size_t pos = 0;
    while (pos < message.size()) {
        while (pos < message.size() && std::isspace(static_cast<unsigned char>(message[pos]))) ++pos;
        size_t end = pos;
        while (end < message.size() && !std::isspace(static_cast<unsigned char>(message[end]))) ++end;
        if (end > pos) {
            SourceLink link;
            if (ParseSourceLink(message.substr(pos, end - pos), link).is_ok()) return link;
        }
        pos = end;
    }
    return std::nullopt;
}

} // namespace relay
