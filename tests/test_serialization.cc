// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file test_serialization.cc
 * @brief Unit tests for VaultSerialization
 */

#include <gtest/gtest.h>
#include "../src/core/serialization/VaultSerialization.h"
#include "../src/core/crypto/VaultCrypto.h"
#include "vault.pb.h"

using namespace CertenVault;

// ============================================================================
// Test Fixture
// ============================================================================

class VaultSerializationTest : public ::testing::Test {
protected:
    void SetUp() override {
        StoredKey ed;
        ed.id = "3f2b8c1e-0000-4000-8000-000000000001";
        ed.name = "Primary";
        ed.type = KeyType::Ed25519;
        ed.public_key.assign(32, 0x11);
        ed.private_key.assign(64, 0x22);
        ed.created_at = 1'700'000'000'000;
        ed.last_used_at = 1'700'000'100'000;
        ed.derivation_path = "m/44'/540'/0'/0'/0'";
        ed.metadata.accumulate_url = "acc://0011223344556677889900112233445566778899aabbccdd";
        ed.metadata.from_mnemonic = true;
        ed.metadata.chain_addresses = {{"solana", "2Q3G..."}, {"near", "1111"}};

        StoredKey secp;
        secp.id = "3f2b8c1e-0000-4000-8000-000000000002";
        secp.name = "EVM";
        secp.type = KeyType::Secp256k1;
        secp.public_key.assign(65, 0x04);
        secp.private_key.assign(32, 0x33);
        secp.created_at = 1'700'000'000'500;
        secp.metadata.evm_address = "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf";

        payload.keys.push_back(std::move(ed));
        payload.keys.push_back(std::move(secp));
        payload.metadata = {1'700'000'000'000, 1'700'000'200'000, 2};
        payload.mnemonic = "abandon abandon abandon abandon abandon abandon "
                           "abandon abandon abandon abandon abandon about";

        record.salt = VaultCrypto::generate_random_bytes(VaultCrypto::SALT_LENGTH);
        record.iv = VaultCrypto::generate_random_bytes(VaultCrypto::IV_LENGTH);
        record.encrypted_payload = VaultCrypto::generate_random_bytes(48);
        record.kdf_params.iterations = 100000;
    }

    std::vector<uint8_t> serialize_proto(const certenvault::EncryptedVaultRecord& proto) {
        std::string bytes;
        EXPECT_TRUE(proto.SerializeToString(&bytes));
        return {bytes.begin(), bytes.end()};
    }

    certenvault::EncryptedVaultRecord valid_proto() {
        certenvault::EncryptedVaultRecord proto;
        proto.set_version(CURRENT_VAULT_VERSION);
        proto.set_salt(std::string(VaultCrypto::SALT_LENGTH, 's'));
        proto.set_iv(std::string(VaultCrypto::IV_LENGTH, 'i'));
        proto.set_encrypted_payload(std::string(VaultCrypto::TAG_LENGTH + 4, 'c'));
        proto.mutable_kdf_params()->set_algorithm(std::string(KDF_ALGORITHM));
        proto.mutable_kdf_params()->set_iterations(1000);
        return proto;
    }

    VaultPayload payload;
    EncryptedVaultData record;
};

// ============================================================================
// Payload Tests
// ============================================================================

TEST_F(VaultSerializationTest, PayloadRoundTripPreservesEveryField) {
    auto bytes = VaultSerialization::serialize_payload(payload);
    ASSERT_TRUE(bytes.has_value());

    auto decoded = VaultSerialization::deserialize_payload(*bytes);
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->keys.size(), 2u);

    const auto& ed = decoded->keys[0];
    EXPECT_EQ(ed.id, payload.keys[0].id);
    EXPECT_EQ(ed.name, "Primary");
    EXPECT_EQ(ed.type, KeyType::Ed25519);
    EXPECT_EQ(ed.public_key, payload.keys[0].public_key);
    EXPECT_EQ(ed.private_key, payload.keys[0].private_key);
    EXPECT_EQ(ed.created_at, 1'700'000'000'000);
    EXPECT_EQ(ed.last_used_at, 1'700'000'100'000);
    EXPECT_EQ(ed.derivation_path, "m/44'/540'/0'/0'/0'");
    EXPECT_EQ(ed.metadata, payload.keys[0].metadata);

    const auto& secp = decoded->keys[1];
    EXPECT_EQ(secp.type, KeyType::Secp256k1);
    EXPECT_FALSE(secp.last_used_at.has_value());
    EXPECT_FALSE(secp.derivation_path.has_value());
    EXPECT_FALSE(secp.metadata.accumulate_url.has_value());
    EXPECT_FALSE(secp.metadata.from_mnemonic);
    EXPECT_EQ(secp.metadata.evm_address, "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");

    EXPECT_EQ(decoded->metadata, payload.metadata);
    EXPECT_EQ(decoded->mnemonic, payload.mnemonic);
}

TEST_F(VaultSerializationTest, PayloadWithoutMnemonic) {
    payload.mnemonic.reset();
    auto bytes = VaultSerialization::serialize_payload(payload);
    ASSERT_TRUE(bytes.has_value());

    auto decoded = VaultSerialization::deserialize_payload(*bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->mnemonic.has_value());
}

TEST_F(VaultSerializationTest, EmptyPayload) {
    VaultPayload empty;
    auto bytes = VaultSerialization::serialize_payload(empty);
    ASSERT_TRUE(bytes.has_value());

    auto decoded = VaultSerialization::deserialize_payload(*bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->keys.empty());
    EXPECT_EQ(decoded->metadata.key_count, 0u);
}

TEST_F(VaultSerializationTest, KeyCountIsDerivedFromKeyList) {
    payload.metadata.key_count = 99;
    auto bytes = VaultSerialization::serialize_payload(payload);
    ASSERT_TRUE(bytes.has_value());

    auto decoded = VaultSerialization::deserialize_payload(*bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->metadata.key_count, 2u);
}

TEST_F(VaultSerializationTest, StoredKeyCountMismatchIsCorrected) {
    certenvault::VaultPayloadRecord proto;
    proto.add_keys()->set_id("only");
    proto.mutable_metadata()->set_key_count(7);
    std::string bytes;
    ASSERT_TRUE(proto.SerializeToString(&bytes));

    auto decoded = VaultSerialization::deserialize_payload(
        std::span(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->metadata.key_count, 1u);
}

TEST_F(VaultSerializationTest, PayloadRejectsGarbage) {
    const std::vector<uint8_t> garbage = {0xff, 0xff, 0xff};
    auto decoded = VaultSerialization::deserialize_payload(garbage);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), VaultError::InvalidProtobuf);
}

// ============================================================================
// Record Tests
// ============================================================================

TEST_F(VaultSerializationTest, RecordRoundTrip) {
    auto bytes = VaultSerialization::serialize_record(record);
    ASSERT_TRUE(bytes.has_value());

    auto decoded = VaultSerialization::deserialize_record(*bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->version, CURRENT_VAULT_VERSION);
    EXPECT_EQ(decoded->salt, record.salt);
    EXPECT_EQ(decoded->iv, record.iv);
    EXPECT_EQ(decoded->encrypted_payload, record.encrypted_payload);
    EXPECT_EQ(decoded->kdf_params.algorithm, KDF_ALGORITHM);
    EXPECT_EQ(decoded->kdf_params.iterations, 100000);
}

TEST_F(VaultSerializationTest, RecordRejectsNewerVersion) {
    auto proto = valid_proto();
    proto.set_version(CURRENT_VAULT_VERSION + 1);

    auto decoded = VaultSerialization::deserialize_record(serialize_proto(proto));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), VaultError::UnsupportedSchema);
}

TEST_F(VaultSerializationTest, RecordRejectsUnknownKdf) {
    auto proto = valid_proto();
    proto.mutable_kdf_params()->set_algorithm("argon2id");

    auto decoded = VaultSerialization::deserialize_record(serialize_proto(proto));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), VaultError::UnsupportedSchema);
}

TEST_F(VaultSerializationTest, RecordRejectsMissingFields) {
    auto short_salt = valid_proto();
    short_salt.set_salt("short");
    auto a = VaultSerialization::deserialize_record(serialize_proto(short_salt));
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error(), VaultError::InvalidData);

    auto no_iterations = valid_proto();
    no_iterations.mutable_kdf_params()->set_iterations(0);
    auto b = VaultSerialization::deserialize_record(serialize_proto(no_iterations));
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error(), VaultError::InvalidData);

    auto truncated = valid_proto();
    truncated.set_encrypted_payload("x");
    auto c = VaultSerialization::deserialize_record(serialize_proto(truncated));
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(c.error(), VaultError::InvalidData);
}

TEST_F(VaultSerializationTest, RecordAcceptsValidProto) {
    auto decoded = VaultSerialization::deserialize_record(serialize_proto(valid_proto()));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->kdf_params.iterations, 1000);
}

TEST_F(VaultSerializationTest, RecordRejectsGarbage) {
    const std::vector<uint8_t> garbage = {0xff, 0xff, 0xff};
    auto decoded = VaultSerialization::deserialize_record(garbage);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), VaultError::InvalidProtobuf);
}

TEST_F(VaultSerializationTest, EmptyBytesAreAnOldVersion) {
    // proto3 defaults version to 0
    auto decoded = VaultSerialization::deserialize_record(std::vector<uint8_t>{});
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), VaultError::UnsupportedSchema);
}
