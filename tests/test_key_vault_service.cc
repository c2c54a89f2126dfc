// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file test_key_vault_service.cc
 * @brief Tests for the provider-facing KeyVaultService
 *
 * Exercises connection handling, request validation and the approve /
 * reject round trip through the sign request queue.
 */

#include <gtest/gtest.h>
#include "../src/core/services/KeyVaultService.h"
#include "../src/core/storage/MemoryVaultStorage.h"
#include "../src/utils/Clock.h"
#include "../src/utils/Codec.h"
#include <algorithm>
#include <chrono>

using namespace CertenVault;
using namespace std::chrono_literals;

namespace {

constexpr std::string_view ORIGIN = "https://app.example";
constexpr std::string_view ABANDON_PHRASE =
    "abandon abandon abandon abandon abandon abandon "
    "abandon abandon abandon abandon abandon about";
const std::string HASH(64, 'c');

}  // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class KeyVaultServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.pbkdf2_iterations = 1000;
        vault = std::make_unique<Vault>(storage, clock, config);
        queue = std::make_unique<SignRequestQueue>(clock);
        service = std::make_unique<KeyVaultService>(*vault, *queue, connections);
    }

    void TearDown() override {
        service.reset();
        queue.reset();
        vault.reset();
    }

    void setup_vault() {
        auto phrase = service->vault_initialize(PASSWORD, std::string(ABANDON_PHRASE));
        ASSERT_TRUE(phrase.has_value());
    }

    void connect() {
        auto result = service->request_accounts(ORIGIN);
        ASSERT_TRUE(result.has_value());
        ASSERT_TRUE(result->connected);
    }

    std::string key_id_of(KeyType type) {
        auto keys = service->get_keys(type);
        EXPECT_TRUE(keys.has_value());
        EXPECT_FALSE(keys->empty());
        return keys->empty() ? std::string() : keys->front().id;
    }

    static constexpr const char* PASSWORD = "correct horse battery staple";

    MemoryVaultStorage storage;
    ManualClock clock;
    VaultConfig config;
    ConnectionRegistry connections;
    std::unique_ptr<Vault> vault;
    std::unique_ptr<SignRequestQueue> queue;
    std::unique_ptr<KeyVaultService> service;
};

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_F(KeyVaultServiceTest, StatusReflectsLifecycle) {
    auto status = service->vault_status();
    ASSERT_TRUE(status.has_value());
    EXPECT_FALSE(status->is_initialized);

    setup_vault();
    status = service->vault_status();
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->is_initialized);
    EXPECT_TRUE(status->is_unlocked);
    EXPECT_TRUE(status->has_mnemonic);
    EXPECT_EQ(status->key_count, 2u);

    ASSERT_TRUE(service->vault_lock().has_value());
    EXPECT_FALSE(service->vault_status()->is_unlocked);

    ASSERT_TRUE(service->vault_unlock(PASSWORD).has_value());
    EXPECT_TRUE(service->vault_status()->is_unlocked);
}

TEST_F(KeyVaultServiceTest, WrongPasswordIsUnauthorized) {
    setup_vault();
    ASSERT_TRUE(service->vault_lock().has_value());

    auto result = service->vault_unlock("wrong password");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProviderErrorCode::UNAUTHORIZED);
    EXPECT_EQ(result.error().numeric_code(), 4100);
}

TEST_F(KeyVaultServiceTest, SecondInitializeIsInvalidRequest) {
    setup_vault();
    auto again = service->vault_initialize(PASSWORD);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ProviderErrorCode::INVALID_REQUEST);
}

TEST_F(KeyVaultServiceTest, ResetClearsQueueAndConnections) {
    setup_vault();
    connect();
    auto submission = service->request_signature(RpcMethod::SIGN_HASH, AccountHash{HASH, std::nullopt}, ORIGIN);
    ASSERT_TRUE(submission.has_value());

    ASSERT_TRUE(service->vault_reset().has_value());

    auto outcome = submission->outcome.get();
    EXPECT_EQ(outcome.status, SignRequestStatus::Rejected);
    EXPECT_FALSE(connections.is_connected(ORIGIN));
    EXPECT_FALSE(service->vault_status()->is_initialized);
}

// ============================================================================
// Key Management Tests
// ============================================================================

TEST_F(KeyVaultServiceTest, KeyOperationsWhileLockedAreUnauthorized) {
    setup_vault();
    ASSERT_TRUE(service->vault_lock().has_value());

    auto keys = service->get_keys();
    ASSERT_FALSE(keys.has_value());
    EXPECT_EQ(keys.error().code, ProviderErrorCode::UNAUTHORIZED);

    auto generated = service->generate_key(KeyType::Ed25519, "New");
    ASSERT_FALSE(generated.has_value());
    EXPECT_EQ(generated.error().code, ProviderErrorCode::UNAUTHORIZED);
}

TEST_F(KeyVaultServiceTest, DeriveAndRemoveKey) {
    setup_vault();
    auto derived = service->derive_key(KeyType::Ed25519, "Second");
    ASSERT_TRUE(derived.has_value());
    EXPECT_EQ(derived->derivation_path, "m/44'/540'/0'/0'/1'");

    ASSERT_TRUE(service->remove_key(derived->id).has_value());
    auto missing = service->remove_key(derived->id);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ProviderErrorCode::INVALID_REQUEST);
}

TEST_F(KeyVaultServiceTest, ImportKeyRejectsBadHex) {
    setup_vault();
    auto result = service->import_key(KeyType::Secp256k1, "not hex", "Bad");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProviderErrorCode::INVALID_PARAMS);
}

TEST_F(KeyVaultServiceTest, UpdateMetadataByPublicKey) {
    setup_vault();
    auto keys = service->get_keys(KeyType::Ed25519);
    ASSERT_TRUE(keys.has_value());
    const auto& key = keys->front();

    KeyReference reference;
    reference.public_key_hex = Codec::to_hex(key.public_key);
    KeyMetadataPatch patch;
    patch.key_page_url = "acc://alice.acme/book/1";

    auto updated = service->update_key_metadata(reference, patch);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->id, key.id);
    EXPECT_EQ(updated->metadata.key_page_url, "acc://alice.acme/book/1");
}

TEST_F(KeyVaultServiceTest, UpdateMetadataNeedsReference) {
    setup_vault();
    auto result = service->update_key_metadata(KeyReference{}, KeyMetadataPatch{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProviderErrorCode::INVALID_PARAMS);

    KeyReference unknown;
    unknown.public_key_hex = std::string(64, '0');
    auto missing = service->update_key_metadata(unknown, KeyMetadataPatch{});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ProviderErrorCode::INVALID_REQUEST);
}

TEST_F(KeyVaultServiceTest, MnemonicAndPrivateKeyAccess) {
    setup_vault();
    auto phrase = service->get_mnemonic();
    ASSERT_TRUE(phrase.has_value());
    EXPECT_EQ(*phrase, ABANDON_PHRASE);

    auto stored = service->get_key_with_private(key_id_of(KeyType::Secp256k1));
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(Codec::to_hex(stored->private_key),
              "1ab42cc412b618bdea3a599e3c9bae199ebf030895b039e9db1e30dafb12b727");
}

// ============================================================================
// Connection Tests
// ============================================================================

TEST_F(KeyVaultServiceTest, RequestAccountsNeedsSetup) {
    auto result = service->request_accounts(ORIGIN);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->needs_setup);
    EXPECT_FALSE(result->connected);
    EXPECT_FALSE(connections.is_connected(ORIGIN));
}

TEST_F(KeyVaultServiceTest, RequestAccountsNeedsUnlock) {
    setup_vault();
    ASSERT_TRUE(service->vault_lock().has_value());

    auto result = service->request_accounts(ORIGIN);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->needs_unlock);
    EXPECT_FALSE(result->connected);
}

TEST_F(KeyVaultServiceTest, RequestAccountsListsLiteAndEvmAccounts) {
    setup_vault();
    auto result = service->request_accounts(ORIGIN);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->connected);
    ASSERT_EQ(result->accounts.size(), 2u);

    auto lite = std::ranges::find(result->accounts, std::string("lite"), &ProviderAccount::type);
    auto evm = std::ranges::find(result->accounts, std::string("evm"), &ProviderAccount::type);
    ASSERT_NE(lite, result->accounts.end());
    ASSERT_NE(evm, result->accounts.end());
    EXPECT_TRUE(lite->url.starts_with("acc://"));
    EXPECT_TRUE(Codec::iequals_ascii(evm->url, "0x9858effd232b4033e47d90003d41ec34ecaeda94"));
    EXPECT_EQ(evm->name, "Ethereum Key 1");
}

TEST_F(KeyVaultServiceTest, GetAccountsEmptyUnlessConnectedAndUnlocked) {
    setup_vault();
    auto before = service->get_accounts(ORIGIN);
    ASSERT_TRUE(before.has_value());
    EXPECT_TRUE(before->empty());

    connect();
    EXPECT_EQ(service->get_accounts(ORIGIN)->size(), 2u);

    ASSERT_TRUE(service->vault_lock().has_value());
    EXPECT_TRUE(service->get_accounts(ORIGIN)->empty());
}

TEST_F(KeyVaultServiceTest, DisconnectForgetsOrigin) {
    setup_vault();
    connect();
    ASSERT_TRUE(service->disconnect(ORIGIN).has_value());
    EXPECT_FALSE(connections.is_connected(ORIGIN));
    EXPECT_TRUE(service->get_accounts(ORIGIN)->empty());
}

// ============================================================================
// Signature Request Validation Tests
// ============================================================================

TEST_F(KeyVaultServiceTest, UnknownMethodIsNotFound) {
    auto result = service->request_signature("eth_sendTransaction", AccountHash{HASH, std::nullopt}, ORIGIN);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProviderErrorCode::METHOD_NOT_FOUND);
}

TEST_F(KeyVaultServiceTest, AccountMethodIsInvalidRequest) {
    auto result = service->request_signature(RpcMethod::REQUEST_ACCOUNTS, AccountHash{HASH, std::nullopt}, ORIGIN);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProviderErrorCode::INVALID_REQUEST);
}

TEST_F(KeyVaultServiceTest, MismatchedDataIsInvalidParams) {
    auto result = service->request_signature(RpcMethod::ETH_SIGN_HASH, AccountHash{HASH, std::nullopt}, ORIGIN);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProviderErrorCode::INVALID_PARAMS);
}

TEST_F(KeyVaultServiceTest, UnconnectedOriginIsUnauthorized) {
    setup_vault();
    auto result = service->request_signature(RpcMethod::SIGN_HASH, AccountHash{HASH, std::nullopt}, ORIGIN);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProviderErrorCode::UNAUTHORIZED);
    EXPECT_EQ(queue->pending_count(), 0u);
}

TEST_F(KeyVaultServiceTest, LockedVaultIsUnauthorized) {
    setup_vault();
    connect();
    ASSERT_TRUE(service->vault_lock().has_value());

    auto result = service->request_signature(RpcMethod::SIGN_HASH, AccountHash{HASH, std::nullopt}, ORIGIN);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProviderErrorCode::UNAUTHORIZED);
}

TEST_F(KeyVaultServiceTest, MalformedHashIsInvalidParams) {
    setup_vault();
    connect();
    auto result = service->request_signature(RpcMethod::SIGN_HASH, AccountHash{"0xnothex", std::nullopt}, ORIGIN);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProviderErrorCode::INVALID_PARAMS);
    EXPECT_EQ(queue->pending_count(), 0u);
}

TEST_F(KeyVaultServiceTest, SignMethodClassification) {
    EXPECT_TRUE(KeyVaultService::is_sign_method(RpcMethod::PERSONAL_SIGN));
    EXPECT_TRUE(KeyVaultService::is_sign_method(RpcMethod::SIGN_INTENT));
    EXPECT_FALSE(KeyVaultService::is_sign_method(RpcMethod::GET_ACCOUNTS));
    EXPECT_FALSE(KeyVaultService::is_sign_method("eth_sign"));
}

// ============================================================================
// Approval Tests
// ============================================================================

TEST_F(KeyVaultServiceTest, ApproveDeliversSignature) {
    setup_vault();
    connect();
    auto submission = service->request_signature(RpcMethod::SIGN_HASH, AccountHash{HASH, std::nullopt}, ORIGIN);
    ASSERT_TRUE(submission.has_value());

    auto pending = service->get_pending_sign_request();
    ASSERT_TRUE(pending.has_value());
    EXPECT_EQ(pending->request.id, submission->id);
    EXPECT_EQ(pending->request.origin, ORIGIN);
    const auto ed_id = key_id_of(KeyType::Ed25519);
    EXPECT_EQ(pending->suggested_key_id, ed_id);

    auto approved = service->approve_sign_request(submission->id, ed_id);
    ASSERT_TRUE(approved.has_value());
    EXPECT_EQ(approved->key_id, ed_id);
    EXPECT_EQ(Codec::from_hex(approved->signature)->size(), 64u);

    auto result = KeyVaultService::to_provider_result(submission->outcome.get());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, *approved);
    EXPECT_FALSE(service->get_pending_sign_request().has_value());
}

TEST_F(KeyVaultServiceTest, RejectDeliversUserRejected) {
    setup_vault();
    connect();
    auto submission = service->request_signature(RpcMethod::PERSONAL_SIGN, PersonalMessage{"hi", "0x00"}, ORIGIN);
    ASSERT_TRUE(submission.has_value());

    ASSERT_TRUE(service->reject_sign_request(submission->id, "").has_value());

    auto result = KeyVaultService::to_provider_result(submission->outcome.get());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProviderErrorCode::USER_REJECTED);
    EXPECT_EQ(result.error().numeric_code(), 4001);
    EXPECT_EQ(result.error().message, KeyVaultService::DEFAULT_REJECT_REASON);
}

TEST_F(KeyVaultServiceTest, ApproveWithWrongCurveFailsRequest) {
    setup_vault();
    connect();
    auto submission = service->request_signature(RpcMethod::ETH_SIGN_HASH, EthereumHash{HASH, "0x00"}, ORIGIN);
    ASSERT_TRUE(submission.has_value());

    auto approved = service->approve_sign_request(submission->id, key_id_of(KeyType::Ed25519));
    ASSERT_FALSE(approved.has_value());
    EXPECT_EQ(approved.error().code, ProviderErrorCode::UNSUPPORTED_METHOD);

    auto outcome = submission->outcome.get();
    EXPECT_EQ(outcome.status, SignRequestStatus::Error);
    EXPECT_EQ(outcome.error, VaultError::UnsupportedKeyType);
}

TEST_F(KeyVaultServiceTest, ApproveWhileLockedFailsRequest) {
    setup_vault();
    connect();
    const auto ed_id = key_id_of(KeyType::Ed25519);
    auto submission = service->request_signature(RpcMethod::SIGN_HASH, AccountHash{HASH, std::nullopt}, ORIGIN);
    ASSERT_TRUE(submission.has_value());
    ASSERT_TRUE(service->vault_lock().has_value());

    auto approved = service->approve_sign_request(submission->id, ed_id);
    ASSERT_FALSE(approved.has_value());
    EXPECT_EQ(approved.error().numeric_code(), 4100);

    auto result = KeyVaultService::to_provider_result(submission->outcome.get());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProviderErrorCode::UNAUTHORIZED);
}

TEST_F(KeyVaultServiceTest, ApproveTwiceIsInvalidRequest) {
    setup_vault();
    connect();
    const auto ed_id = key_id_of(KeyType::Ed25519);
    auto submission = service->request_signature(RpcMethod::SIGN_HASH, AccountHash{HASH, std::nullopt}, ORIGIN);
    ASSERT_TRUE(submission.has_value());
    ASSERT_TRUE(service->approve_sign_request(submission->id, ed_id).has_value());

    auto again = service->approve_sign_request(submission->id, ed_id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ProviderErrorCode::INVALID_REQUEST);

    auto unknown = service->approve_sign_request("missing", ed_id);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ProviderErrorCode::INVALID_REQUEST);
}

TEST_F(KeyVaultServiceTest, TimedOutRequestSurfacesAsUserRejected) {
    setup_vault();
    connect();
    auto submission = service->request_signature(RpcMethod::SIGN_HASH, AccountHash{HASH, std::nullopt}, ORIGIN);
    ASSERT_TRUE(submission.has_value());

    clock.advance(SignRequestQueue::DEFAULT_TIMEOUT + 1ms);
    EXPECT_EQ(queue->cleanup(SignRequestQueue::DEFAULT_TIMEOUT), 1u);

    auto result = KeyVaultService::to_provider_result(submission->outcome.get());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProviderErrorCode::USER_REJECTED);
    EXPECT_EQ(result.error().message, SignRequestQueue::TIMEOUT_REASON);
}
