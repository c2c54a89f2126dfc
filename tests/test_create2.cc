// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file test_create2.cc
 * @brief CREATE2 address prediction tests
 */

#include <gtest/gtest.h>
#include "../src/core/addresses/Create2.h"
#include "../src/core/addresses/ContractRegistry.h"
#include "../src/utils/Codec.h"

using namespace CertenVault;

namespace {

constexpr std::string_view ZERO_WORD =
    "0x0000000000000000000000000000000000000000000000000000000000000000";

// keccak256(0x00)
constexpr std::string_view SINGLE_ZERO_BYTE_HASH =
    "0xbc36789e7a1e281436464229828f817d6612f7b477d66591ff96a9e064bcc98a";

std::vector<uint8_t> owner_key() {
    return *Codec::from_hex("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
}

}  // namespace

// ============================================================================
// compute_address (EIP-1014 examples)
// ============================================================================

TEST(Create2Test, ZeroFactoryZeroSalt) {
    auto address = Create2::compute_address(
        "0x0000000000000000000000000000000000000000", ZERO_WORD, SINGLE_ZERO_BYTE_HASH);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "0x4D1A2e2bB4F88F0250f26Ffff098B0b30B26BF38");
}

TEST(Create2Test, DeadbeefFactory) {
    auto address = Create2::compute_address(
        "0xdeadbeef00000000000000000000000000000000", ZERO_WORD, SINGLE_ZERO_BYTE_HASH);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "0xB928f69Bb1D91Cd65274e3c79d8986362984fDA3");
}

TEST(Create2Test, NonTrivialSaltAndCode) {
    auto init_hash = Create2::hash_init_code("0xdeadbeef");
    ASSERT_TRUE(init_hash.has_value());

    auto address = Create2::compute_address(
        "0x00000000000000000000000000000000deadbeef",
        "0x00000000000000000000000000000000000000000000000000000000cafebabe",
        Codec::to_hex(*init_hash));
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "0x60f3f640a8508fC6a86d45DF051962668E1e8AC7");
}

TEST(Create2Test, RejectsBadFactory) {
    auto address = Create2::compute_address("0x1234", ZERO_WORD, SINGLE_ZERO_BYTE_HASH);
    ASSERT_FALSE(address.has_value());
    EXPECT_EQ(address.error(), VaultError::InvalidAddress);
}

TEST(Create2Test, RejectsShortSalt) {
    auto address = Create2::compute_address(
        "0x0000000000000000000000000000000000000000", "0x00", SINGLE_ZERO_BYTE_HASH);
    ASSERT_FALSE(address.has_value());
    EXPECT_EQ(address.error(), VaultError::InvalidKeyLength);
}

TEST(Create2Test, RejectsUndecodableHash) {
    auto address = Create2::compute_address(
        "0x0000000000000000000000000000000000000000", ZERO_WORD, "0xzz");
    ASSERT_FALSE(address.has_value());
    EXPECT_EQ(address.error(), VaultError::InvalidHex);
}

// ============================================================================
// Smart account prediction
// ============================================================================

TEST(Create2AccountTest, SaltMatchesKnownValue) {
    auto salt = Create2::account_salt("acc://alice.acme", owner_key(), 11155111);
    ASSERT_TRUE(salt.has_value());
    EXPECT_EQ(Codec::to_hex(*salt), "42733702768b08ccec0028d0ebc53c3db420464ef6a60d7e83bce447ffcb9a40");
}

TEST(Create2AccountTest, SaltNormalizesUrl) {
    auto canonical = Create2::account_salt("acc://alice.acme", owner_key(), 11155111);
    auto variant = Create2::account_salt("ACC://Alice.ACME/", owner_key(), 11155111);
    ASSERT_TRUE(canonical.has_value());
    ASSERT_TRUE(variant.has_value());
    EXPECT_EQ(*canonical, *variant);
}

TEST(Create2AccountTest, SaltDependsOnChain) {
    auto sepolia = Create2::account_salt("acc://alice.acme", owner_key(), 11155111);
    auto mainnet = Create2::account_salt("acc://alice.acme", owner_key(), 1);
    ASSERT_TRUE(sepolia.has_value());
    ASSERT_TRUE(mainnet.has_value());
    EXPECT_NE(*sepolia, *mainnet);
}

TEST(Create2AccountTest, SaltRequiresOwnerKey) {
    auto salt = Create2::account_salt("acc://alice.acme", std::vector<uint8_t>{}, 1);
    ASSERT_FALSE(salt.has_value());
    EXPECT_EQ(salt.error(), VaultError::EmptyInput);
}

TEST(Create2AccountTest, MinimalProxyInitCodeHash) {
    auto hash = Create2::minimal_proxy_init_code_hash("0x1111111111111111111111111111111111111111");
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(Codec::to_hex(*hash), "a2d88143eeea48efcc9f4a249ebe53d688d02897963ffc34032b89239ec11b5e");

    EXPECT_FALSE(Create2::minimal_proxy_init_code_hash("0x11").has_value());
}

TEST(Create2AccountTest, PredictAccountOnSepolia) {
    auto factory = ContractRegistry::account_factory(11155111);
    ASSERT_TRUE(factory.has_value());

    auto address = Create2::predict_account_address(
        *factory, "0x1111111111111111111111111111111111111111",
        "acc://alice.acme", owner_key(), 11155111);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "0x14e47a6327f2A196CfCC4C0D692aC53659b90e1c");
}
