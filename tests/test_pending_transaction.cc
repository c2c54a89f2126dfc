// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file test_pending_transaction.cc
 * @brief Tests for pending transaction digests and request signing
 */

#include <gtest/gtest.h>
#include "../src/core/signing/PendingTransactionDigest.h"
#include "../src/core/signing/RequestSigner.h"
#include "../src/core/curves/Ed25519.h"
#include "../src/core/curves/Secp256k1.h"
#include "../src/core/storage/MemoryVaultStorage.h"
#include "../src/utils/Clock.h"
#include "../src/utils/Codec.h"

using namespace CertenVault;

namespace {

const std::string TX_HASH(64, '1');
constexpr std::string_view SIGNER_URL = "acc://alice.acme/book/1";
constexpr uint64_t TIMESTAMP = 1'700'000'000'000'000;

constexpr std::string_view EXPECTED_METADATA_HASH =
    "034aa65d7b595e317ee108727332b6b3558620d0840402b0c4e2b01fec69a63e";
constexpr std::string_view EXPECTED_DATA_FOR_SIGNATURE =
    "142df4b877cc87097f85411d8da26dad6b6bb9402c36ac89ac4962d55e0d0dc7";

}  // namespace

// ============================================================================
// PendingTransactionDigest
// ============================================================================

TEST(PendingTransactionDigestTest, UvarintEncoding) {
    EXPECT_EQ(PendingTransactionDigest::encode_uvarint(0), std::vector<uint8_t>{0x00});
    EXPECT_EQ(PendingTransactionDigest::encode_uvarint(127), std::vector<uint8_t>{0x7f});
    EXPECT_EQ(PendingTransactionDigest::encode_uvarint(300), (std::vector<uint8_t>{0xac, 0x02}));

    auto max = PendingTransactionDigest::encode_uvarint(UINT64_MAX);
    ASSERT_EQ(max.size(), 10u);
    EXPECT_EQ(max.back(), 0x01);
}

TEST(PendingTransactionDigestTest, MetadataHash) {
    auto hash = PendingTransactionDigest::metadata_hash(SIGNER_URL, 1, TIMESTAMP);
    EXPECT_EQ(Codec::to_hex(hash), EXPECTED_METADATA_HASH);
}

TEST(PendingTransactionDigestTest, DataForSignature) {
    auto tx_hash = Codec::from_hex(TX_HASH);
    ASSERT_TRUE(tx_hash.has_value());

    auto digest = PendingTransactionDigest::data_for_signature(*tx_hash, SIGNER_URL, 1, TIMESTAMP);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(Codec::to_hex(*digest), EXPECTED_DATA_FOR_SIGNATURE);
}

TEST(PendingTransactionDigestTest, VersionAndTimestampChangeDigest) {
    auto tx_hash = *Codec::from_hex(TX_HASH);
    auto base = PendingTransactionDigest::data_for_signature(tx_hash, SIGNER_URL, 1, TIMESTAMP);
    auto version = PendingTransactionDigest::data_for_signature(tx_hash, SIGNER_URL, 2, TIMESTAMP);
    auto time = PendingTransactionDigest::data_for_signature(tx_hash, SIGNER_URL, 1, TIMESTAMP + 1);
    EXPECT_NE(*base, *version);
    EXPECT_NE(*base, *time);
}

TEST(PendingTransactionDigestTest, RejectsShortTransactionHash) {
    const std::vector<uint8_t> short_hash(31, 0x11);
    auto digest = PendingTransactionDigest::data_for_signature(short_hash, SIGNER_URL, 1, TIMESTAMP);
    ASSERT_FALSE(digest.has_value());
    EXPECT_EQ(digest.error(), VaultError::InvalidData);
}

// ============================================================================
// RequestSigner::digest_for
// ============================================================================

TEST(RequestSignerDigestTest, PendingUsesLocalDerivationWithoutSuppliedValue) {
    PendingTransaction tx{TX_HASH, std::string(SIGNER_URL), 1, TIMESTAMP, std::nullopt};
    auto digest = RequestSigner::digest_for(tx);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(Codec::to_hex(digest->bytes), EXPECTED_DATA_FOR_SIGNATURE);
    EXPECT_FALSE(digest->required_type.has_value());
}

TEST(RequestSignerDigestTest, PendingPrefersSuppliedDataForSignature) {
    const std::string supplied(64, 'a');
    PendingTransaction tx{TX_HASH, std::string(SIGNER_URL), 1, TIMESTAMP, "0x" + supplied};
    auto digest = RequestSigner::digest_for(tx);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(Codec::to_hex(digest->bytes), supplied);
}

TEST(RequestSignerDigestTest, PendingWithBadHashAndNoSuppliedValueFails) {
    PendingTransaction tx{"0x1234", std::string(SIGNER_URL), 1, TIMESTAMP, std::nullopt};
    auto digest = RequestSigner::digest_for(tx);
    ASSERT_FALSE(digest.has_value());
    EXPECT_EQ(digest.error(), VaultError::InvalidData);

    tx.transaction_hash = "zz";
    digest = RequestSigner::digest_for(tx);
    ASSERT_FALSE(digest.has_value());
    EXPECT_EQ(digest.error(), VaultError::InvalidHex);
}

TEST(RequestSignerDigestTest, HashRequestsDecodeHex) {
    auto account = RequestSigner::digest_for(AccountHash{"0xabcd", std::nullopt});
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->bytes, (std::vector<uint8_t>{0xab, 0xcd}));
    EXPECT_FALSE(account->required_type.has_value());

    auto eth = RequestSigner::digest_for(EthereumHash{"abcd", "0x00"});
    ASSERT_TRUE(eth.has_value());
    EXPECT_EQ(eth->required_type, KeyType::Secp256k1);

    auto bls = RequestSigner::digest_for(BlsHash{"abcd", 7});
    ASSERT_TRUE(bls.has_value());
    EXPECT_EQ(bls->required_type, KeyType::Bls12381);
}

TEST(RequestSignerDigestTest, EmptyHashIsRejected) {
    auto digest = RequestSigner::digest_for(AccountHash{"0x", std::nullopt});
    ASSERT_FALSE(digest.has_value());
    EXPECT_EQ(digest.error(), VaultError::EmptyInput);
}

TEST(RequestSignerDigestTest, PersonalMessageUsesEip191) {
    auto digest = RequestSigner::digest_for(PersonalMessage{"hello", "0x00"});
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(Codec::to_hex(digest->bytes),
              "50b2c43fd39106bafbba0da34fc430e1f91e3c96ea2acee2bc34119f92b37750");
    EXPECT_EQ(digest->required_type, KeyType::Secp256k1);
}

TEST(RequestSignerDigestTest, IntentSignsDecodedId) {
    CrossChainIntent intent{"0x0102", "acc://a.acme", "transfer", "move funds", {}, {}, {}};
    auto digest = RequestSigner::digest_for(intent);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest->bytes, (std::vector<uint8_t>{0x01, 0x02}));
}

TEST(RequestSignerDigestTest, PreferredType) {
    EXPECT_EQ(RequestSigner::preferred_type(AccountHash{"00", {}}), KeyType::Ed25519);
    EXPECT_EQ(RequestSigner::preferred_type(EthereumHash{"00", ""}), KeyType::Secp256k1);
    EXPECT_EQ(RequestSigner::preferred_type(PersonalMessage{"m", ""}), KeyType::Secp256k1);
    EXPECT_EQ(RequestSigner::preferred_type(BlsHash{"00", {}}), KeyType::Bls12381);
}

// ============================================================================
// RequestSigner with a vault
// ============================================================================

class RequestSignerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.pbkdf2_iterations = 1000;
        vault = std::make_unique<Vault>(storage, clock, config);
        ASSERT_TRUE(vault->initialize("correct horse battery staple").has_value());

        auto ed = vault->import_key(KeyType::Ed25519,
            "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60", "Ed");
        ASSERT_TRUE(ed.has_value());
        ed_key = *ed;

        auto secp = vault->import_key(KeyType::Secp256k1,
            "0000000000000000000000000000000000000000000000000000000000000001", "Evm");
        ASSERT_TRUE(secp.has_value());
        secp_key = *secp;
    }

    SignRequest request_for(SignRequestData data) {
        SignRequest request;
        request.id = "req-1";
        request.method = std::string(method_for(data));
        request.origin = "https://app.example";
        request.data = std::move(data);
        return request;
    }

    MemoryVaultStorage storage;
    ManualClock clock;
    VaultConfig config;
    std::unique_ptr<Vault> vault;
    KeyInfo ed_key;
    KeyInfo secp_key;
};

TEST_F(RequestSignerTest, SuggestsKeyBySignerUrl) {
    ASSERT_TRUE(ed_key.metadata.key_page_url.has_value());
    AccountTransaction tx;
    tx.signer_url = *ed_key.metadata.key_page_url;
    tx.transaction_hash = TX_HASH;
    EXPECT_EQ(RequestSigner::suggest_key(*vault, tx), ed_key.id);
}

TEST_F(RequestSignerTest, SuggestsKeyByEvmAddress) {
    EthereumHash request{TX_HASH, "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf"};
    EXPECT_EQ(RequestSigner::suggest_key(*vault, request), secp_key.id);
}

TEST_F(RequestSignerTest, FallsBackToPreferredType) {
    EXPECT_EQ(RequestSigner::suggest_key(*vault, AccountHash{TX_HASH, std::nullopt}), ed_key.id);
    EXPECT_EQ(RequestSigner::suggest_key(*vault, PersonalMessage{"hi", "0xunknown"}), secp_key.id);
    EXPECT_FALSE(RequestSigner::suggest_key(*vault, BlsHash{TX_HASH, {}}).has_value());
}

TEST_F(RequestSignerTest, NoSuggestionWhileLocked) {
    vault->lock();
    EXPECT_FALSE(RequestSigner::suggest_key(*vault, AccountHash{TX_HASH, std::nullopt}).has_value());
}

TEST_F(RequestSignerTest, SignsPendingTransactionWithEd25519) {
    auto request = request_for(PendingTransaction{TX_HASH, std::string(SIGNER_URL), 1, TIMESTAMP, std::nullopt});
    auto payload = RequestSigner::sign(*vault, request, ed_key.id);
    ASSERT_TRUE(payload.has_value());

    EXPECT_EQ(payload->key_id, ed_key.id);
    EXPECT_EQ(payload->public_key, Codec::to_hex(ed_key.public_key));
    EXPECT_EQ(payload->timestamp, static_cast<int64_t>(TIMESTAMP));

    auto signature = Codec::from_hex(payload->signature);
    auto digest = Codec::from_hex(EXPECTED_DATA_FOR_SIGNATURE);
    ASSERT_TRUE(signature.has_value());
    EXPECT_TRUE(Ed25519::verify(*digest, *signature, ed_key.public_key));
}

TEST_F(RequestSignerTest, SignsEthereumHashWithSecp256k1) {
    const std::string hash(64, 'b');
    auto payload = RequestSigner::sign(*vault, request_for(EthereumHash{hash, "0x00"}), secp_key.id);
    ASSERT_TRUE(payload.has_value());
    EXPECT_FALSE(payload->timestamp.has_value());

    auto signature = Codec::from_hex(payload->signature);
    ASSERT_TRUE(signature.has_value());
    EXPECT_EQ(signature->size(), 65u);
    EXPECT_TRUE(Secp256k1::verify(*Codec::from_hex(hash), *signature, secp_key.public_key));
}

TEST_F(RequestSignerTest, RejectsCurveMismatch) {
    auto payload = RequestSigner::sign(*vault, request_for(EthereumHash{TX_HASH, "0x00"}), ed_key.id);
    ASSERT_FALSE(payload.has_value());
    EXPECT_EQ(payload.error(), VaultError::UnsupportedKeyType);
}

TEST_F(RequestSignerTest, UnknownKey) {
    auto payload = RequestSigner::sign(*vault, request_for(AccountHash{TX_HASH, std::nullopt}), "missing");
    ASSERT_FALSE(payload.has_value());
    EXPECT_EQ(payload.error(), VaultError::KeyNotFound);
}

TEST_F(RequestSignerTest, LockedVaultCannotSign) {
    vault->lock();
    auto payload = RequestSigner::sign(*vault, request_for(AccountHash{TX_HASH, std::nullopt}), ed_key.id);
    ASSERT_FALSE(payload.has_value());
    EXPECT_EQ(payload.error(), VaultError::VaultLocked);
}
