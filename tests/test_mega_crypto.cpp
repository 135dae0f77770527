#include <gtest/gtest.h>

#include "crypto/mega_crypto.hpp"

#include <string>
#include <vector>

namespace relay {

namespace {

std::vector<std::uint8_t> FromHex(std::string_view hex) {
    std::vector<std::uint8_t> out;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<std::uint8_t>(std::stoi(std::string(hex.substr(i, 2)), nullptr, 16)));
    }
    return out;
}

std::vector<std::uint8_t> Counting(size_t n) {
    std::vector<std::uint8_t> out(n);
    for (size_t i = 0; i < n; ++i) out[i] = static_cast<std::uint8_t>(i);
    return out;
}

} // namespace

TEST(MegaCryptoTest, Base64UrlUsesUrlAlphabetWithoutPadding) {
    const std::vector<std::uint8_t> raw = {0xfb, 0xff, 0xfe};
    EXPECT_EQ(Base64UrlEncode(raw), "-__-");

    std::vector<std::uint8_t> back;
    auto res = Base64UrlDecode("-__-", back);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(back, raw);

    std::vector<std::uint8_t> unpadded;
    ASSERT_TRUE(Base64UrlDecode("YWI", unpadded).is_ok());
    EXPECT_EQ(std::string(unpadded.begin(), unpadded.end()), "ab");
}

TEST(MegaCryptoTest, Base64UrlRejectsStandardAlphabet) {
    std::vector<std::uint8_t> out;
    for (const char* bad : {"ab+/", "YWI=", "Y"}) {
        auto res = Base64UrlDecode(bad, out);
        EXPECT_FALSE(res.is_ok()) << bad;
        EXPECT_EQ(res.kind, ErrorKind::LinkInvalid) << bad;
    }
}

TEST(MegaCryptoTest, DeriveFileKeyFoldsHalvesAndSplitsNonce) {
    const auto raw = Counting(32);
    MegaFileKey key;
    auto res = DeriveFileKey(Base64UrlEncode(raw), key);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    for (size_t i = 0; i < 16; ++i) {
        EXPECT_EQ(key.aes_key[i], static_cast<std::uint8_t>(i ^ (i + 16))) << i;
    }
    for (size_t i = 0; i < 8; ++i) {
        EXPECT_EQ(key.ctr_iv[i], static_cast<std::uint8_t>(16 + i));
        EXPECT_EQ(key.ctr_iv[8 + i], 0);
        EXPECT_EQ(key.meta_mac[i], static_cast<std::uint8_t>(24 + i));
    }
}

TEST(MegaCryptoTest, DeriveFileKeyRequires32Bytes) {
    MegaFileKey key;
    auto res = DeriveFileKey(Base64UrlEncode(Counting(16)), key);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::LinkInvalid);
    EXPECT_NE(res.msg.find("32 bytes"), std::string::npos);
}

TEST(MegaCryptoTest, AesCtrMatchesNistVector) {
    // SP 800-38A F.5.1, first block.
    const auto k = FromHex("2b7e151628aed2a6abf7158809cf4f3c");
    const auto iv = FromHex("f0f1f2f3f4f5f6f7f8f9fafbfcfdfeff");
    std::array<std::uint8_t, 16> key{};
    std::array<std::uint8_t, 16> nonce{};
    std::copy(k.begin(), k.end(), key.begin());
    std::copy(iv.begin(), iv.end(), nonce.begin());

    auto data = FromHex("6bc1bee22e409f96e93d7e117393172a");
    AesCtrStream ctr;
    ASSERT_TRUE(ctr.Init(key, nonce).is_ok());
    ASSERT_TRUE(ctr.Apply(data).is_ok());
    EXPECT_EQ(data, FromHex("874d6191b620e3261bef6864990db6ce"));
}

TEST(MegaCryptoTest, AesCtrIsIndependentOfPieceBoundaries) {
    std::array<std::uint8_t, 16> key{};
    std::array<std::uint8_t, 16> iv{};
    key.fill(0x42);
    iv[0] = 7;

    const auto plain = Counting(1000);
    auto whole = plain;
    AesCtrStream a;
    ASSERT_TRUE(a.Init(key, iv).is_ok());
    ASSERT_TRUE(a.Apply(whole).is_ok());

    auto pieces = plain;
    AesCtrStream b;
    ASSERT_TRUE(b.Init(key, iv).is_ok());
    for (size_t off = 0; off < pieces.size(); off += 37) {
        const size_t n = std::min<size_t>(37, pieces.size() - off);
        ASSERT_TRUE(b.Apply(std::span<std::uint8_t>(pieces.data() + off, n)).is_ok());
    }
    EXPECT_EQ(whole, pieces);
    EXPECT_NE(whole, plain);
}

TEST(MegaCryptoTest, DecryptAttributesReturnsJsonAfterMagic) {
    MegaFileKey key;
    ASSERT_TRUE(DeriveFileKey(Base64UrlEncode(Counting(32)), key).is_ok());

    std::string text = "MEGA{\"n\":\"holiday.zip\"}";
    text.resize((text.size() + 15) / 16 * 16, '\0');
    std::vector<std::uint8_t> cipher;
    ASSERT_TRUE(AesCbcZeroIv(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                                           text.size()),
                             key.aes_key,
                             true,
                             cipher)
                    .is_ok());

    std::string attrs;
    auto res = DecryptAttributes(Base64UrlEncode(cipher), key, attrs);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(attrs, "{\"n\":\"holiday.zip\"}");
}

TEST(MegaCryptoTest, DecryptAttributesWithWrongKeyFails) {
    MegaFileKey key;
    ASSERT_TRUE(DeriveFileKey(Base64UrlEncode(Counting(32)), key).is_ok());
    std::vector<std::uint8_t> junk(32, 0x5a);
    std::string attrs;
    auto res = DecryptAttributes(Base64UrlEncode(junk), key, attrs);
    EXPECT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::LinkInvalid);
    EXPECT_TRUE(attrs.empty());
}

TEST(MegaCryptoTest, AesCbcRejectsUnalignedInput) {
    std::array<std::uint8_t, 16> key{};
    std::vector<std::uint8_t> out;
    std::vector<std::uint8_t> in(15);
    EXPECT_FALSE(AesCbcZeroIv(in, key, false, out).is_ok());
}

} // namespace relay
