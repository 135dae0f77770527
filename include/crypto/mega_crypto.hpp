#pragma once

#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace relay {

// base64url without padding, as used in MEGA links and API payloads.
Result Base64UrlDecode(std::string_view in, std::vector<std::uint8_t>& out);
std::string Base64UrlEncode(std::span<const std::uint8_t> in);

// Key material carried in the "#<key>" fragment of a public file link.
// The 256-bit node key is folded into an AES-128 key; the upper half also
// holds the CTR nonce and the meta-MAC.
struct MegaFileKey {
    std::array<std::uint8_t, 16> aes_key{};
    std::array<std::uint8_t, 16> ctr_iv{};
    std::array<std::uint8_t, 8> meta_mac{};
};

Result DeriveFileKey(std::string_view key_fragment, MegaFileKey& out);

// AES-128-CBC, zero IV, no padding; input must be a multiple of 16 bytes.
Result AesCbcZeroIv(std::span<const std::uint8_t> in,
                    const std::array<std::uint8_t, 16>& key,
                    bool encrypt,
                    std::vector<std::uint8_t>& out);

// Decrypts an "at" blob; `json_out` receives the JSON object that follows "MEGA".
Result DecryptAttributes(std::string_view at_b64, const MegaFileKey& key, std::string& json_out);

// Streaming AES-128-CTR. Encryption and decryption are the same operation.
class AesCtrStream {
public:
    AesCtrStream();
    AesCtrStream(const AesCtrStream&) = delete;
    AesCtrStream& operator=(const AesCtrStream&) = delete;
    AesCtrStream(AesCtrStream&&) noexcept;
    AesCtrStream& operator=(AesCtrStream&&) noexcept;
    ~AesCtrStream();

    Result Init(const std::array<std::uint8_t, 16>& key, const std::array<std::uint8_t, 16>& iv);

    // In-place transform of `data`.
    Result Apply(std::span<std::uint8_t> data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace relay
