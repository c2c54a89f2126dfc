// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file KeyVaultService.h
 * @brief Provider-facing facade over Vault, SignRequestQueue and connections
 *
 * Each public method corresponds to one RPC the host relays from a web
 * origin or from the approval UI. Errors are reported as ProviderError with
 * EIP-1193 / JSON-RPC codes; the transport is the host's concern.
 */

#ifndef CERTENVAULT_KEY_VAULT_SERVICE_H
#define CERTENVAULT_KEY_VAULT_SERVICE_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <glibmm/ustring.h>
#include "ConnectionRegistry.h"
#include "ProviderErrors.h"
#include "../Vault.h"
#include "../signing/SignRequest.h"
#include "../signing/SignRequestQueue.h"

namespace CertenVault {

/// Account exposed to a connected origin
struct ProviderAccount {
    std::string url;         ///< acc:// lite identity or 0x address
    std::string type;        ///< "lite" or "evm"
    std::string public_key;  ///< Hex
    std::string name;
};

struct ConnectResult {
    std::vector<ProviderAccount> accounts;
    bool connected = false;
    bool needs_setup = false;
    bool needs_unlock = false;
};

/// Oldest pending request plus the key the prompt should preselect
struct PendingSignRequestView {
    SignRequest request;
    std::optional<std::string> suggested_key_id;
};

/// Identifies a key either by id or by hex public key
struct KeyReference {
    std::optional<std::string> key_id;
    std::optional<std::string> public_key_hex;
};

/**
 * @brief RPC-shaped entry points for the vault
 *
 * Signing is two-sided. request_signature() queues the request and hands
 * back a future; the approval side reads get_pending_sign_request() and
 * answers with approve_sign_request() or reject_sign_request(). A request
 * whose signing fails moves to Error and its future carries the failure.
 *
 * @code
 * KeyVaultService service(vault, queue, connections);
 * service.request_accounts("https://app.example");
 *
 * auto submission = service.request_signature(
 *     RpcMethod::SIGN_HASH, AccountHash{hash_hex, signer_url}, "https://app.example");
 * // ... approval UI calls service.approve_sign_request(id, key_id) ...
 * auto result = KeyVaultService::to_provider_result(submission->outcome.get());
 * @endcode
 */
class KeyVaultService {
public:
    static constexpr std::string_view DEFAULT_REJECT_REASON = "User rejected";

    KeyVaultService(Vault& vault, SignRequestQueue& queue, ConnectionRegistry& connections);

    KeyVaultService(const KeyVaultService&) = delete;
    KeyVaultService& operator=(const KeyVaultService&) = delete;

    // VAULT_*
    [[nodiscard]] ProviderResult<VaultStatus> vault_status();
    [[nodiscard]] ProviderResult<std::string> vault_initialize(
        const Glib::ustring& password,
        std::optional<std::string> mnemonic = std::nullopt);
    [[nodiscard]] ProviderResult<> vault_unlock(const Glib::ustring& password);
    [[nodiscard]] ProviderResult<> vault_lock();

    /// Also rejects queued requests and forgets every connected origin
    [[nodiscard]] ProviderResult<> vault_reset();

    // Key management
    [[nodiscard]] ProviderResult<std::vector<KeyInfo>> get_keys(std::optional<KeyType> type = std::nullopt);
    [[nodiscard]] ProviderResult<KeyInfo> generate_key(KeyType type, std::string_view name);
    [[nodiscard]] ProviderResult<KeyInfo> derive_key(KeyType type, std::string_view name);
    [[nodiscard]] ProviderResult<KeyInfo> import_key(KeyType type, std::string_view private_key_hex,
                                                     std::string_view name);
    [[nodiscard]] ProviderResult<KeyInfo> import_mnemonic(std::string_view mnemonic, KeyType type,
                                                          std::string_view name);
    [[nodiscard]] ProviderResult<> remove_key(std::string_view key_id);
    [[nodiscard]] ProviderResult<KeyInfo> update_key_metadata(const KeyReference& key,
                                                              const KeyMetadataPatch& patch);
    [[nodiscard]] ProviderResult<std::string> get_mnemonic();
    [[nodiscard]] ProviderResult<StoredKey> get_key_with_private(std::string_view key_id);

    // Provider connection
    [[nodiscard]] ProviderResult<ConnectResult> request_accounts(std::string_view origin);

    /// Empty unless @p origin is connected and the vault is unlocked
    [[nodiscard]] ProviderResult<std::vector<ProviderAccount>> get_accounts(std::string_view origin);
    [[nodiscard]] ProviderResult<> disconnect(std::string_view origin);

    /**
     * @brief Queue a signature request from @p origin
     *
     * @return METHOD_NOT_FOUND for an unknown method, INVALID_PARAMS when the
     *         data does not belong to @p method or its hash is malformed,
     *         UNAUTHORIZED when the origin is not connected or the vault is
     *         locked
     */
    [[nodiscard]] ProviderResult<SignRequestQueue::Submission> request_signature(
        std::string_view method,
        SignRequestData data,
        std::string_view origin);

    [[nodiscard]] static ProviderResult<SignedPayload> to_provider_result(const SignOutcome& outcome);

    // Approval side
    [[nodiscard]] std::optional<PendingSignRequestView> get_pending_sign_request();
    [[nodiscard]] ProviderResult<SignedPayload> approve_sign_request(std::string_view request_id,
                                                                     std::string_view key_id);
    [[nodiscard]] ProviderResult<> reject_sign_request(std::string_view request_id,
                                                       std::string_view reason = DEFAULT_REJECT_REASON);

    [[nodiscard]] static bool is_sign_method(std::string_view method) noexcept;

private:
    [[nodiscard]] std::vector<ProviderAccount> accounts_for_connection();
    [[nodiscard]] ProviderError fail_request(std::string_view request_id, VaultError error);

    Vault& m_vault;
    SignRequestQueue& m_queue;
    ConnectionRegistry& m_connections;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_KEY_VAULT_SERVICE_H
