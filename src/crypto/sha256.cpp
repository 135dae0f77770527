#include "crypto/sha256.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>

namespace relay {

namespace {

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

class EvpMdCtx final {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    ~EvpMdCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

} // namespace

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    EvpMdCtx ctx;
    if (!ctx.ok() || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return {};
    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) return {};

    std::array<std::uint8_t, 32> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1 || len != digest.size()) return {};
    return HexEncode(digest);
}

std::string Sha256Hex(std::string_view text) {
    return Sha256Hex(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

} // namespace relay
