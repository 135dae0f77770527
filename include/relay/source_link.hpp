#pragma once

#include "util/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace relay {

enum class SourceKind {
    File,
    Folder,
};

// scheme://host/{file|folder}/<id>[#<key>]
struct SourceLink {
    std::string scheme;
    std::string host;
    SourceKind kind = SourceKind::File;
    std::string id;
    std::string key; // empty when the link carries no fragment

    std::string ToString() const;
};

// Whole-string parse. Fails with LinkInvalid.
Result ParseSourceLink(std::string_view text, SourceLink& out);

// First whitespace-separated token of a message that parses as a link.
std::optional<SourceLink> FindSourceLink(std::string_view message);

} // namespace relay
