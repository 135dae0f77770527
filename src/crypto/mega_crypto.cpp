#include "crypto/mega_crypto.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <climits>

namespace relay {

namespace {

class EvpCipherCtx final {
public:
    EvpCipherCtx() : ctx_(EVP_CIPHER_CTX_new()) {}
    EvpCipherCtx(const EvpCipherCtx&) = delete;
    EvpCipherCtx& operator=(const EvpCipherCtx&) = delete;
    ~EvpCipherCtx() {
        if (ctx_) EVP_CIPHER_CTX_free(ctx_);
    }

    EVP_CIPHER_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_CIPHER_CTX* ctx_ = nullptr;
};

} // namespace

Result Base64UrlDecode(std::string_view in, std::vector<std::uint8_t>& out) {
    out.clear();
    std::string std_b64(in);
    for (char& c : std_b64) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (c == '+' || c == '/' || c == '=') {
            return Result::Fail(ErrorKind::LinkInvalid, "not base64url: " + std::string(in));
        }
    }
    if (std_b64.size() % 4 == 1) {
        return Result::Fail(ErrorKind::LinkInvalid, "invalid base64url length: " + std::to_string(in.size()));
    }
    size_t pad = 0;
    while (std_b64.size() % 4 != 0) {
        std_b64.push_back('=');
        ++pad;
    }
    if (std_b64.empty()) return Result::Ok();
    if (std_b64.size() > static_cast<size_t>(INT_MAX)) {
        return Result::Fail(ErrorKind::LinkInvalid, "base64url input too large");
    }

    std::vector<std::uint8_t> decoded(std_b64.size() / 4 * 3);
    const int n = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char*>(std_b64.data()),
                                  static_cast<int>(std_b64.size()));
    if (n < 0) return Result::Fail(ErrorKind::LinkInvalid, "invalid base64url: " + std::string(in));
    decoded.resize(static_cast<size_t>(n) - pad);
    out = std::move(decoded);
    return Result::Ok();
}

std::string Base64UrlEncode(std::span<const std::uint8_t> in) {
    if (in.empty()) return {};
    std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  in.data(),
                                  static_cast<int>(in.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    while (!out.empty() && out.back() == '=') out.pop_back();
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

Result DeriveFileKey(std::string_view key_fragment, MegaFileKey& out) {
    out = MegaFileKey{};
    std::vector<std::uint8_t> k;
    auto decode_result = Base64UrlDecode(key_fragment, k);
    if (!decode_result.is_ok()) return decode_result;
    if (k.size() != 32) {
        return Result::Fail(ErrorKind::LinkInvalid, "file key must be 32 bytes, got " + std::to_string(k.size()));
    }

    for (size_t i = 0; i < 16; ++i) {
        out.aes_key[i] = static_cast<std::uint8_t>(k[i] ^ k[i + 16]);
    }
    for (size_t i = 0; i < 8; ++i) {
        out.ctr_iv[i] = k[16 + i];
        out.meta_mac[i] = k[24 + i];
    }
    return Result::Ok();
}

Result AesCbcZeroIv(std::span<const std::uint8_t> in,
                    const std::array<std::uint8_t, 16>& key,
                    bool encrypt,
                    std::vector<std::uint8_t>& out) {
    if (in.size() % 16 != 0) {
        return Result::Fail(ErrorKind::DownloadFailure,
                            "AES-CBC input is not block aligned (" + std::to_string(in.size()) + " bytes)");
    }

    EvpCipherCtx ctx;
    const std::array<std::uint8_t, 16> iv{};
    if (!ctx.ok() ||
        EVP_CipherInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key.data(), iv.data(), encrypt ? 1 : 0) != 1) {
        return Result::Fail(ErrorKind::DownloadFailure, "AES-CBC init failed");
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    out.assign(in.size() + 16, 0);
    int len = 0;
    int fin = 0;
    if (EVP_CipherUpdate(ctx.get(), out.data(), &len, in.data(), static_cast<int>(in.size())) != 1 ||
        EVP_CipherFinal_ex(ctx.get(), out.data() + len, &fin) != 1) {
        return Result::Fail(ErrorKind::DownloadFailure, "AES-CBC transform failed");
    }
    out.resize(static_cast<size_t>(len + fin));
    return Result::Ok();
}

Result DecryptAttributes(std::string_view at_b64, const MegaFileKey& key, std::string& json_out) {
    json_out.clear();
    std::vector<std::uint8_t> blob;
    auto decode_result = Base64UrlDecode(at_b64, blob);
    if (!decode_result.is_ok()) return decode_result;

    std::vector<std::uint8_t> plain;
    auto res = AesCbcZeroIv(blob, key.aes_key, false, plain);
    if (!res.is_ok()) return Result::Fail(ErrorKind::LinkInvalid, res.msg);

    std::string text(plain.begin(), plain.end());
    while (!text.empty() && text.back() == '\0') text.pop_back();
    if (text.rfind("MEGA", 0) != 0) {
        return Result::Fail(ErrorKind::LinkInvalid, "attributes do not decrypt with this key");
    }
    json_out = text.substr(4);
    return Result::Ok();
}

struct AesCtrStream::Impl {
    EvpCipherCtx ctx;
    bool initialized = false;
};

AesCtrStream::AesCtrStream() : impl_(std::make_unique<Impl>()) {}
AesCtrStream::AesCtrStream(AesCtrStream&&) noexcept = default;
AesCtrStream& AesCtrStream::operator=(AesCtrStream&&) noexcept = default;
AesCtrStream::~AesCtrStream() = default;

Result AesCtrStream::Init(const std::array<std::uint8_t, 16>& key,
                          const std::array<std::uint8_t, 16>& iv) {
    if (!impl_ || !impl_->ctx.ok()) return Result::Fail(ErrorKind::DownloadFailure, "EVP_CIPHER_CTX_new failed");
    if (EVP_EncryptInit_ex(impl_->ctx.get(), EVP_aes_128_ctr(), nullptr, key.data(), iv.data()) != 1) {
        return Result::Fail(ErrorKind::DownloadFailure, "AES-CTR init failed");
    }
    impl_->initialized = true;
    return Result::Ok();
}

Result AesCtrStream::Apply(std::span<std::uint8_t> data) {
    if (!impl_ || !impl_->initialized) return Result::Fail(ErrorKind::DownloadFailure, "AES-CTR not initialized");

    size_t off = 0;
    while (off < data.size()) {
        const size_t piece = std::min<size_t>(data.size() - off, INT_MAX / 2);
        int len = 0;
        if (EVP_EncryptUpdate(impl_->ctx.get(),
                              data.data() + off,
                              &len,
                              data.data() + off,
                              static_cast<int>(piece)) != 1) {
            return Result::Fail(ErrorKind::DownloadFailure, "AES-CTR transform failed");
        }
        off += static_cast<size_t>(len);
    }
    return Result::Ok();
}

} // namespace relay
