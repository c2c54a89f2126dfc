// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file test_codec.cc
 * @brief Hex, Base64, Base58 and Bech32 encoding tests
 */

#include <gtest/gtest.h>
#include "../src/utils/Base58.h"
#include "../src/utils/Bech32.h"
#include "../src/utils/Codec.h"
#include <numeric>

using namespace CertenVault;

namespace {

std::vector<uint8_t> bytes_of(std::string_view text) {
    auto span = Codec::as_bytes(text);
    return {span.begin(), span.end()};
}

}  // namespace

// ============================================================================
// Hex
// ============================================================================

TEST(CodecHexTest, EncodesLowercaseWithoutPrefix) {
    const std::vector<uint8_t> data = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(Codec::to_hex(data), "000fabff");
    EXPECT_EQ(Codec::to_hex(std::vector<uint8_t>{}), "");
}

TEST(CodecHexTest, DecodesWithOrWithoutPrefix) {
    auto plain = Codec::from_hex("deadBEEF");
    auto prefixed = Codec::from_hex("0xdeadbeef");
    auto upper_prefix = Codec::from_hex("0XDEADBEEF");

    ASSERT_TRUE(plain.has_value());
    ASSERT_TRUE(prefixed.has_value());
    ASSERT_TRUE(upper_prefix.has_value());

    const std::vector<uint8_t> expected = {0xde, 0xad, 0xbe, 0xef};
    EXPECT_EQ(*plain, expected);
    EXPECT_EQ(*prefixed, expected);
    EXPECT_EQ(*upper_prefix, expected);
}

TEST(CodecHexTest, EmptyInputDecodesToEmpty) {
    auto empty = Codec::from_hex("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());

    auto prefix_only = Codec::from_hex("0x");
    ASSERT_TRUE(prefix_only.has_value());
    EXPECT_TRUE(prefix_only->empty());
}

TEST(CodecHexTest, RejectsOddLength) {
    auto result = Codec::from_hex("abc");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::InvalidHex);
}

TEST(CodecHexTest, RejectsNonHexCharacters) {
    auto result = Codec::from_hex("zz");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::InvalidHex);

    EXPECT_FALSE(Codec::from_hex("0x12g4").has_value());
}

TEST(CodecHexTest, IsHexRequiresNonEmptyEvenLength) {
    EXPECT_TRUE(Codec::is_hex("0x00ff"));
    EXPECT_TRUE(Codec::is_hex("ABCDEF"));
    EXPECT_FALSE(Codec::is_hex(""));
    EXPECT_FALSE(Codec::is_hex("0x"));
    EXPECT_FALSE(Codec::is_hex("fff"));
    EXPECT_FALSE(Codec::is_hex("xyz0"));
}

TEST(CodecHexTest, StripPrefixLeavesOtherInputAlone) {
    EXPECT_EQ(Codec::strip_hex_prefix("0xabc"), "abc");
    EXPECT_EQ(Codec::strip_hex_prefix("abc"), "abc");
    EXPECT_EQ(Codec::strip_hex_prefix("0"), "0");
}

// ============================================================================
// Base64
// ============================================================================

TEST(CodecBase64Test, Rfc4648Vectors) {
    EXPECT_EQ(Codec::to_base64(bytes_of("")), "");
    EXPECT_EQ(Codec::to_base64(bytes_of("f")), "Zg==");
    EXPECT_EQ(Codec::to_base64(bytes_of("fo")), "Zm8=");
    EXPECT_EQ(Codec::to_base64(bytes_of("foo")), "Zm9v");
    EXPECT_EQ(Codec::to_base64(bytes_of("foobar")), "Zm9vYmFy");
}

TEST(CodecBase64Test, DecodeStripsPadding) {
    auto one = Codec::from_base64("Zg==");
    auto two = Codec::from_base64("Zm8=");
    auto six = Codec::from_base64("Zm9vYmFy");

    ASSERT_TRUE(one.has_value());
    ASSERT_TRUE(two.has_value());
    ASSERT_TRUE(six.has_value());
    EXPECT_EQ(*one, bytes_of("f"));
    EXPECT_EQ(*two, bytes_of("fo"));
    EXPECT_EQ(*six, bytes_of("foobar"));
}

TEST(CodecBase64Test, DecodeRejectsMalformedInput) {
    auto wrong_length = Codec::from_base64("Zm9");
    ASSERT_FALSE(wrong_length.has_value());
    EXPECT_EQ(wrong_length.error(), VaultError::InvalidData);

    EXPECT_FALSE(Codec::from_base64("Zm9*").has_value());
}

TEST(CodecBase64Test, BinaryDataSurvives) {
    std::vector<uint8_t> data(256);
    std::iota(data.begin(), data.end(), 0);

    auto decoded = Codec::from_base64(Codec::to_base64(data));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
}

// ============================================================================
// ASCII helpers
// ============================================================================

TEST(CodecAsciiTest, CaseInsensitiveComparison) {
    EXPECT_TRUE(Codec::iequals_ascii("0xAbCdEf", "0xabcdef"));
    EXPECT_FALSE(Codec::iequals_ascii("0xabc", "0xabcd"));
    EXPECT_EQ(Codec::to_lower_ascii("ACC://Alice.ACME/Book"), "acc://alice.acme/book");
}

// ============================================================================
// Base58
// ============================================================================

TEST(Base58Test, EncodesKnownVectors) {
    EXPECT_EQ(Base58::encode(bytes_of("hello world")), "StV1DL6CwTryKyV");
    EXPECT_EQ(Base58::encode(std::vector<uint8_t>{0x00, 0x00, 0x01}), "112");
    EXPECT_EQ(Base58::encode(std::vector<uint8_t>{}), "");
}

TEST(Base58Test, DecodeRestoresLeadingZeros) {
    auto decoded = Base58::decode("112");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, (std::vector<uint8_t>{0x00, 0x00, 0x01}));

    auto text = Base58::decode("StV1DL6CwTryKyV");
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, bytes_of("hello world"));
}

TEST(Base58Test, DecodeRejectsCharactersOutsideAlphabet) {
    for (std::string_view bad : {"0abc", "Oabc", "Iabc", "labc"}) {
        auto decoded = Base58::decode(bad);
        ASSERT_FALSE(decoded.has_value()) << bad;
        EXPECT_EQ(decoded.error(), VaultError::InvalidAddress);
    }
}

TEST(Base58Test, CheckEncodingOfZeroPayload) {
    const std::vector<uint8_t> payload(21, 0x00);
    EXPECT_EQ(Base58::encode_check(payload), "1111111111111111111114oLvT2");

    auto decoded = Base58::decode_check("1111111111111111111114oLvT2");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, payload);
}

TEST(Base58Test, CheckDecodingRejectsBadChecksum) {
    auto decoded = Base58::decode_check("1111111111111111111114oLvT3");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), VaultError::InvalidAddress);
}

// ============================================================================
// Bech32
// ============================================================================

class Bech32Test : public ::testing::Test {
protected:
    void SetUp() override {
        payload.resize(20);
        std::iota(payload.begin(), payload.end(), 0);
    }

    std::vector<uint8_t> payload;
};

TEST_F(Bech32Test, EncodesCosmosStyleAddresses) {
    EXPECT_EQ(Bech32::encode("cosmos", payload), "cosmos1qqqsyqcyq5rqwzqfpg9scrgwpugpzysnrk363e");
    EXPECT_EQ(Bech32::encode("osmo", payload), "osmo1qqqsyqcyq5rqwzqfpg9scrgwpugpzysntdz28t");
}

TEST_F(Bech32Test, DecodeReturnsPrefixAndPayload) {
    auto decoded = Bech32::decode("cosmos1qqqsyqcyq5rqwzqfpg9scrgwpugpzysnrk363e");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->hrp, "cosmos");
    EXPECT_EQ(decoded->data, payload);
}

TEST_F(Bech32Test, DecodeAcceptsUppercase) {
    auto decoded = Bech32::decode("A12UEL5L");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->hrp, "a");
    EXPECT_TRUE(decoded->data.empty());
}

TEST_F(Bech32Test, DecodeRejectsMixedCase) {
    auto decoded = Bech32::decode("Cosmos1qqqsyqcyq5rqwzqfpg9scrgwpugpzysnrk363e");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), VaultError::InvalidAddress);
}

TEST_F(Bech32Test, DecodeRejectsBadChecksum) {
    auto decoded = Bech32::decode("cosmos1qqqsyqcyq5rqwzqfpg9scrgwpugpzysnrk363f");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), VaultError::InvalidAddress);
}

TEST_F(Bech32Test, DecodeRejectsMissingSeparator) {
    EXPECT_FALSE(Bech32::decode("qqqsyqcyq5rqwzqfpg9scrgwpugpzysnrk363e").has_value());
}
