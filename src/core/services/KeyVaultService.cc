// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "KeyVaultService.h"
#include "../signing/RequestSigner.h"
#include "../../utils/Codec.h"
#include "../../utils/Log.h"
#include <array>
#include <algorithm>
#include <format>

namespace CertenVault {

namespace {

constexpr std::array SIGN_METHODS = {
    RpcMethod::SIGN_TRANSACTION,
    RpcMethod::SIGN_PENDING_TRANSACTION,
    RpcMethod::SIGN_HASH,
    RpcMethod::ETH_SIGN_HASH,
    RpcMethod::PERSONAL_SIGN,
    RpcMethod::BLS_SIGN_HASH,
    RpcMethod::SIGN_INTENT,
};

constexpr std::array ACCOUNT_METHODS = {
    RpcMethod::REQUEST_ACCOUNTS,
    RpcMethod::GET_ACCOUNTS,
    RpcMethod::DISCONNECT,
};

template<typename T>
ProviderResult<T> lift(VaultResult<T> result) {
    if (!result) {
        return std::unexpected(make_provider_error(result.error()));
    }
    return std::move(*result);
}

ProviderResult<> lift(VaultResult<> result) {
    if (!result) {
        return std::unexpected(make_provider_error(result.error()));
    }
    return {};
}

}  // namespace

KeyVaultService::KeyVaultService(Vault& vault, SignRequestQueue& queue, ConnectionRegistry& connections)
    : m_vault(vault)
    , m_queue(queue)
    , m_connections(connections) {
}

bool KeyVaultService::is_sign_method(std::string_view method) noexcept {
    return std::ranges::find(SIGN_METHODS, method) != SIGN_METHODS.end();
}

// ============================================================================
// Vault lifecycle
// ============================================================================

ProviderResult<VaultStatus> KeyVaultService::vault_status() {
    return lift(m_vault.status());
}

ProviderResult<std::string> KeyVaultService::vault_initialize(
    const Glib::ustring& password,
    std::optional<std::string> mnemonic) {
    return lift(m_vault.initialize_with_mnemonic(password, std::move(mnemonic)));
}

ProviderResult<> KeyVaultService::vault_unlock(const Glib::ustring& password) {
    return lift(m_vault.unlock(password));
}

ProviderResult<> KeyVaultService::vault_lock() {
    m_vault.lock();
    return {};
}

ProviderResult<> KeyVaultService::vault_reset() {
    m_queue.clear();
    m_connections.clear();
    return lift(m_vault.reset());
}

// ============================================================================
// Key management
// ============================================================================

ProviderResult<std::vector<KeyInfo>> KeyVaultService::get_keys(std::optional<KeyType> type) {
    if (type) {
        return lift(m_vault.get_keys_by_type(*type));
    }
    return lift(m_vault.get_all_keys());
}

ProviderResult<KeyInfo> KeyVaultService::generate_key(KeyType type, std::string_view name) {
    return lift(m_vault.generate_key(type, name));
}

ProviderResult<KeyInfo> KeyVaultService::derive_key(KeyType type, std::string_view name) {
    return lift(m_vault.derive_key_from_mnemonic(type, name));
}

ProviderResult<KeyInfo> KeyVaultService::import_key(
    KeyType type,
    std::string_view private_key_hex,
    std::string_view name) {
    return lift(m_vault.import_key(type, private_key_hex, name));
}

ProviderResult<KeyInfo> KeyVaultService::import_mnemonic(
    std::string_view mnemonic,
    KeyType type,
    std::string_view name) {
    return lift(m_vault.import_mnemonic(mnemonic, type, name));
}

ProviderResult<> KeyVaultService::remove_key(std::string_view key_id) {
    return lift(m_vault.remove_key(key_id));
}

ProviderResult<KeyInfo> KeyVaultService::update_key_metadata(
    const KeyReference& key,
    const KeyMetadataPatch& patch) {

    std::string key_id;
    if (key.key_id) {
        key_id = *key.key_id;
    } else if (key.public_key_hex) {
        auto public_key = Codec::from_hex(*key.public_key_hex);
        if (!public_key) {
            return std::unexpected(make_provider_error(public_key.error()));
        }
        auto found = m_vault.find_key_by_public_key(*public_key);
        if (!found) {
            return std::unexpected(make_provider_error(found.error()));
        }
        if (!*found) {
            return std::unexpected(make_provider_error(VaultError::KeyNotFound));
        }
        key_id = (*found)->id;
    } else {
        return std::unexpected(make_provider_error(ProviderErrorCode::INVALID_PARAMS,
                                                   "keyId or publicKey required"));
    }
    return lift(m_vault.update_key(key_id, std::nullopt, patch));
}

ProviderResult<std::string> KeyVaultService::get_mnemonic() {
    return lift(m_vault.get_mnemonic());
}

ProviderResult<StoredKey> KeyVaultService::get_key_with_private(std::string_view key_id) {
    return lift(m_vault.get_key(key_id));
}

// ============================================================================
// Connections
// ============================================================================

std::vector<ProviderAccount> KeyVaultService::accounts_for_connection() {
    std::vector<ProviderAccount> accounts;
    auto keys = m_vault.get_all_keys();
    if (!keys) {
        return accounts;
    }
    for (const auto& key : *keys) {
        if (key.type == KeyType::Ed25519 && key.metadata.accumulate_url) {
            accounts.push_back({*key.metadata.accumulate_url, "lite", Codec::to_hex(key.public_key), key.name});
        } else if (key.type == KeyType::Secp256k1 && key.metadata.evm_address) {
            accounts.push_back({*key.metadata.evm_address, "evm", Codec::to_hex(key.public_key), key.name});
        }
    }
    return accounts;
}

ProviderResult<ConnectResult> KeyVaultService::request_accounts(std::string_view origin) {
    ConnectResult result;

    auto initialized = m_vault.is_initialized();
    if (!initialized) {
        return std::unexpected(make_provider_error(initialized.error()));
    }
    if (!*initialized) {
        result.needs_setup = true;
        return result;
    }
    if (!m_vault.is_unlocked()) {
        result.needs_unlock = true;
        return result;
    }

    m_connections.connect(origin);
    result.connected = true;
    result.accounts = accounts_for_connection();
    return result;
}

ProviderResult<std::vector<ProviderAccount>> KeyVaultService::get_accounts(std::string_view origin) {
    if (!m_connections.is_connected(origin) || !m_vault.is_unlocked()) {
        return std::vector<ProviderAccount>{};
    }
    return accounts_for_connection();
}

ProviderResult<> KeyVaultService::disconnect(std::string_view origin) {
    m_connections.disconnect(origin);
    return {};
}

// ============================================================================
// Signing
// ============================================================================

ProviderResult<SignRequestQueue::Submission> KeyVaultService::request_signature(
    std::string_view method,
    SignRequestData data,
    std::string_view origin) {

    if (!is_sign_method(method)) {
        if (std::ranges::find(ACCOUNT_METHODS, method) != ACCOUNT_METHODS.end()) {
            return std::unexpected(make_provider_error(ProviderErrorCode::INVALID_REQUEST,
                                                       std::format("Not a signing method: {}", method)));
        }
        return std::unexpected(make_provider_error(ProviderErrorCode::METHOD_NOT_FOUND,
                                                   std::format("Method not found: {}", method)));
    }
    if (method_for(data) != method) {
        return std::unexpected(make_provider_error(ProviderErrorCode::INVALID_PARAMS,
                                                   std::format("Parameters do not match {}", method)));
    }
    if (!m_connections.is_connected(origin)) {
        return std::unexpected(make_provider_error(ProviderErrorCode::UNAUTHORIZED,
                                                   "Not connected. Please call connect() first."));
    }
    if (!m_vault.is_unlocked()) {
        return std::unexpected(make_provider_error(ProviderErrorCode::UNAUTHORIZED,
                                                   "Vault is locked. Please unlock first."));
    }
    if (auto digest = RequestSigner::digest_for(data); !digest) {
        return std::unexpected(make_provider_error(ProviderErrorCode::INVALID_PARAMS,
                                                   to_string(digest.error())));
    }

    return m_queue.submit(std::move(data), origin);
}

ProviderResult<SignedPayload> KeyVaultService::to_provider_result(const SignOutcome& outcome) {
    if (outcome.ok()) {
        return *outcome.result;
    }
    return std::unexpected(ProviderError{to_provider_code(outcome.error), outcome.message});
}

std::optional<PendingSignRequestView> KeyVaultService::get_pending_sign_request() {
    auto request = m_queue.get_next();
    if (!request) {
        return std::nullopt;
    }
    PendingSignRequestView view;
    view.suggested_key_id = RequestSigner::suggest_key(m_vault, request->data);
    view.request = std::move(*request);
    return view;
}

ProviderError KeyVaultService::fail_request(std::string_view request_id, VaultError error) {
    if (auto failed = m_queue.error(request_id, to_string(error), error); !failed) {
        Log::debug("Sign request {} already finished: {}", request_id, to_string(failed.error()));
    }
    return make_provider_error(error);
}

ProviderResult<SignedPayload> KeyVaultService::approve_sign_request(
    std::string_view request_id,
    std::string_view key_id) {

    auto request = m_queue.get(request_id);
    if (!request) {
        return std::unexpected(make_provider_error(VaultError::RequestNotFound));
    }
    if (is_terminal(request->status)) {
        return std::unexpected(make_provider_error(VaultError::RequestNotPending));
    }
    if (!m_vault.is_unlocked()) {
        return std::unexpected(fail_request(request_id, VaultError::VaultLocked));
    }

    if (auto approved = m_queue.update_status(request_id, SignRequestStatus::Approved); !approved) {
        return std::unexpected(make_provider_error(approved.error()));
    }

    auto payload = RequestSigner::sign(m_vault, *request, key_id);
    if (!payload) {
        return std::unexpected(fail_request(request_id, payload.error()));
    }

    if (auto completed = m_queue.complete(request_id, *payload); !completed) {
        return std::unexpected(make_provider_error(completed.error()));
    }
    return std::move(*payload);
}

ProviderResult<> KeyVaultService::reject_sign_request(std::string_view request_id, std::string_view reason) {
    const std::string_view message = reason.empty() ? DEFAULT_REJECT_REASON : reason;
    return lift(m_queue.reject(request_id, message));
}

}  // namespace CertenVault
