// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file test_addresses.cc
 * @brief Chain address derivation, validation and contract registry tests
 */

#include <gtest/gtest.h>
#include "../src/core/addresses/Addresses.h"
#include "../src/core/addresses/ContractRegistry.h"
#include "../src/core/curves/Secp256k1.h"
#include "../src/utils/Codec.h"
#include <algorithm>

using namespace CertenVault;

class AddressesTest : public ::testing::Test {
protected:
    void SetUp() override {
        // RFC 8032 test 1 public key
        ed_key = *Codec::from_hex("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");

        std::vector<uint8_t> one(32, 0x00);
        one.back() = 0x01;
        auto pair = Secp256k1::from_private_key(one);
        ASSERT_TRUE(pair.has_value());
        secp_uncompressed = pair->public_key;

        auto compressed = Secp256k1::compress_public_key(secp_uncompressed);
        ASSERT_TRUE(compressed.has_value());
        secp_compressed = *compressed;
    }

    std::vector<uint8_t> ed_key;
    std::vector<uint8_t> secp_uncompressed;
    std::vector<uint8_t> secp_compressed;
};

// ============================================================================
// EVM
// ============================================================================

TEST_F(AddressesTest, EthereumAddressIsChecksummed) {
    auto address = Addresses::ethereum_address(secp_uncompressed);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");

    auto from_compressed = Addresses::ethereum_address(secp_compressed);
    ASSERT_TRUE(from_compressed.has_value());
    EXPECT_EQ(*from_compressed, *address);
}

TEST_F(AddressesTest, ChecksumMatchesEip55Examples) {
    auto a = Addresses::to_checksum_address("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
    auto b = Addresses::to_checksum_address("0XFB6916095CA1DF60BB79CE92CE3EA74C37C5D359");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
    EXPECT_EQ(*b, "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359");
}

TEST_F(AddressesTest, ChecksumRejectsMalformedAddress) {
    auto result = Addresses::to_checksum_address("0x1234");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::InvalidAddress);
}

TEST_F(AddressesTest, EvmAddressValidation) {
    EXPECT_TRUE(Addresses::is_valid_evm_address("0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf"));
    EXPECT_TRUE(Addresses::is_valid_evm_address("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf"));
    EXPECT_FALSE(Addresses::is_valid_evm_address("7e5f4552091a69125d5dfcb7b8c2659029395bdf"));
    EXPECT_FALSE(Addresses::is_valid_evm_address("0x7e5f4552091a69125d5dfcb7b8c2659029395bd"));
    EXPECT_FALSE(Addresses::is_valid_evm_address("0x7e5f4552091a69125d5dfcb7b8c2659029395bdg"));
}

TEST_F(AddressesTest, EthereumAddressRejectsWrongKeySize) {
    auto result = Addresses::ethereum_address(ed_key);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::InvalidKeyLength);
}

// ============================================================================
// Ed25519 chains
// ============================================================================

TEST_F(AddressesTest, Ed25519ChainAddresses) {
    EXPECT_EQ(*Addresses::solana_address(ed_key), "FVen3X669xLzsi6N2V91DoiyzHzg1uAgqiT8jZ9nS96Z");
    EXPECT_EQ(*Addresses::aptos_address(ed_key),
              "0x63c5215e87770d17b9f4cd47c777e322f4eb152cfd2054c1080fd9d57c48913b");
    EXPECT_EQ(*Addresses::sui_address(ed_key),
              "0x304af458e90e97c841685b8cbbc59b909f3e2cf150df590ada4c81452c29737d");
    EXPECT_EQ(*Addresses::ton_address(ed_key),
              "0:21fe31dfa154a261626bf854046fd2271b7bed4b6abe45aa58877ef47f9721b9");
    EXPECT_EQ(*Addresses::near_address(ed_key),
              "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
}

TEST_F(AddressesTest, Ed25519AddressMapCoversEveryChain) {
    auto addresses = Addresses::ed25519_chain_addresses(ed_key);
    ASSERT_TRUE(addresses.has_value());
    EXPECT_EQ(addresses->size(), 5u);
    for (const char* chain : {"solana", "aptos", "sui", "ton", "near"}) {
        EXPECT_TRUE(addresses->contains(chain)) << chain;
    }
    EXPECT_EQ(addresses->at("solana"), *Addresses::solana_address(ed_key));
}

TEST_F(AddressesTest, Ed25519ChainsRejectSecpKeys) {
    auto result = Addresses::ed25519_chain_addresses(secp_compressed);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::InvalidKeyLength);
    EXPECT_FALSE(Addresses::solana_address(secp_compressed).has_value());
}

// ============================================================================
// secp256k1 chains
// ============================================================================

TEST_F(AddressesTest, CosmosAddressFromEitherEncoding) {
    auto a = Addresses::cosmos_address(secp_compressed, "cosmos");
    auto b = Addresses::cosmos_address(secp_uncompressed, "cosmos");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, "cosmos1w508d6qejxtdg4y5r3zarvary0c5xw7k6ah60c");
    EXPECT_EQ(*a, *b);
}

TEST_F(AddressesTest, CosmosAddressRejectsEmptyPrefix) {
    auto result = Addresses::cosmos_address(secp_compressed, "");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), VaultError::InvalidAddress);
}

TEST_F(AddressesTest, CosmosAddressesShareAccountHash) {
    auto addresses = Addresses::cosmos_addresses(secp_compressed);
    ASSERT_TRUE(addresses.has_value());
    EXPECT_EQ(addresses->size(), Addresses::COSMOS_CHAIN_PREFIXES.size());
    EXPECT_EQ(addresses->at("osmosis"), "osmo1w508d6qejxtdg4y5r3zarvary0c5xw7kjxy2e2");
    EXPECT_EQ(addresses->at("injective"), "inj1w508d6qejxtdg4y5r3zarvary0c5xw7ks5q7aq");
}

TEST_F(AddressesTest, TronAddress) {
    auto address = Addresses::tron_address(secp_uncompressed);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, "TMVQGm1qAQYVdetCeGRRkTWYYrLXuHK2HC");
    EXPECT_TRUE(Addresses::is_valid_tron_address(*address));
}

TEST_F(AddressesTest, Secp256k1AddressMapIncludesTron) {
    auto addresses = Addresses::secp256k1_chain_addresses(secp_compressed);
    ASSERT_TRUE(addresses.has_value());
    EXPECT_EQ(addresses->size(), Addresses::COSMOS_CHAIN_PREFIXES.size() + 1);
    EXPECT_EQ(addresses->at("tron"), "TMVQGm1qAQYVdetCeGRRkTWYYrLXuHK2HC");
}

TEST_F(AddressesTest, CosmosPrefixLookup) {
    EXPECT_EQ(Addresses::cosmos_prefix_for_chain("osmosis"), "osmo");
    EXPECT_EQ(Addresses::cosmos_prefix_for_chain("stargaze"), "stars");
    EXPECT_FALSE(Addresses::cosmos_prefix_for_chain("bitcoin").has_value());
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(AddressesTest, CosmosValidationChecksPrefix) {
    const std::string address = "cosmos1w508d6qejxtdg4y5r3zarvary0c5xw7k6ah60c";
    EXPECT_TRUE(Addresses::is_valid_cosmos_address(address));
    EXPECT_TRUE(Addresses::is_valid_cosmos_address(address, "cosmos"));
    EXPECT_FALSE(Addresses::is_valid_cosmos_address(address, "osmo"));
    EXPECT_FALSE(Addresses::is_valid_cosmos_address("cosmos1w508d6qejxtdg4y5r3zarvary0c5xw7k6ah60d"));

    EXPECT_EQ(Addresses::cosmos_address_prefix(address), "cosmos");
    EXPECT_FALSE(Addresses::cosmos_address_prefix("garbage").has_value());
}

TEST_F(AddressesTest, SolanaValidation) {
    EXPECT_TRUE(Addresses::is_valid_solana_address("FVen3X669xLzsi6N2V91DoiyzHzg1uAgqiT8jZ9nS96Z"));
    EXPECT_FALSE(Addresses::is_valid_solana_address("StV1DL6CwTryKyV"));
    EXPECT_FALSE(Addresses::is_valid_solana_address("0OIl"));
}

TEST_F(AddressesTest, TronValidationRejectsOtherPayloads) {
    EXPECT_FALSE(Addresses::is_valid_tron_address("1111111111111111111114oLvT2"));
    EXPECT_FALSE(Addresses::is_valid_tron_address("TMVQGm1qAQYVdetCeGRRkTWYYrLXuHK2HD"));
}

// ============================================================================
// Contract registry
// ============================================================================

TEST(ContractRegistryTest, SepoliaHasDeployedContracts) {
    const auto* sepolia = ContractRegistry::find(11155111);
    ASSERT_NE(sepolia, nullptr);
    EXPECT_TRUE(sepolia->is_testnet);
    EXPECT_EQ(ContractRegistry::account_factory(11155111), "0xbd9D33310358C8A10254175dD297e2CA8cd623c3");
    EXPECT_TRUE(ContractRegistry::is_fully_deployed(11155111));
    EXPECT_EQ(ContractRegistry::factory_explorer_url(11155111),
              "https://sepolia.etherscan.io/address/0xbd9D33310358C8A10254175dD297e2CA8cd623c3");
}

TEST(ContractRegistryTest, KnownChainWithoutDeployment) {
    ASSERT_NE(ContractRegistry::find(1), nullptr);
    EXPECT_FALSE(ContractRegistry::account_factory(1).has_value());
    EXPECT_FALSE(ContractRegistry::is_fully_deployed(1));
    EXPECT_FALSE(ContractRegistry::factory_explorer_url(1).has_value());
}

TEST(ContractRegistryTest, UnknownChain) {
    EXPECT_EQ(ContractRegistry::find(999999), nullptr);
    EXPECT_FALSE(ContractRegistry::account_factory(999999).has_value());
}

TEST(ContractRegistryTest, SupportedIdsAreUnique) {
    auto ids = ContractRegistry::supported_chain_ids();
    EXPECT_EQ(ids.size(), ContractRegistry::all_chains().size());
    std::ranges::sort(ids);
    EXPECT_EQ(std::ranges::adjacent_find(ids), ids.end());
}

TEST(ContractRegistryTest, EntryPointIsValidAddress) {
    EXPECT_TRUE(Addresses::is_valid_evm_address(ContractRegistry::ERC4337_ENTRYPOINT));
}
