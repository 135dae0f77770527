#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace relay {

std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(std::string_view text);

} // namespace relay
