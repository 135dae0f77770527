#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace relay {

enum class ContentKind {
    PlainFile,
    Archive,
};

std::string_view ToString(ContentKind kind);

// Decides by the leading signature bytes only; the file name is never
// consulted. Only ZIP containers count as archives.
class ContentClassifier {
  public:
    static Result Classify(const std::string& path, ContentKind& out);
    static ContentKind ClassifyHeader(std::span<const std::uint8_t> head);
};

} // namespace relay
