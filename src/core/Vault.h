// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file Vault.h
 * @brief Password-protected multi-curve key store
 *
 * The Vault owns the decrypted key payload while unlocked and persists it,
 * encrypted, through an injected IVaultStorage on every mutation.
 */

#ifndef CERTENVAULT_VAULT_H
#define CERTENVAULT_VAULT_H

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <glibmm/ustring.h>
#include <sigc++/sigc++.h>
#include "VaultConfig.h"
#include "VaultError.h"
#include "VaultTypes.h"
#include "storage/IVaultStorage.h"
#include "../utils/Clock.h"
#include "../utils/SecureMemory.h"

namespace CertenVault {

/// Signature produced by Vault::sign together with the signer's identity
struct SignatureResult {
    std::vector<uint8_t> signature;
    std::vector<uint8_t> public_key;
    std::string key_id;
    KeyType key_type = KeyType::Ed25519;
};

/**
 * @brief Encrypted key vault with an Uninitialized / Locked / Unlocked lifecycle
 *
 * The vault is Uninitialized until initialize() or initialize_with_mnemonic()
 * writes the first record. Afterwards it is Locked (only the encrypted record
 * exists) or Unlocked (derived key and decrypted payload held in memory).
 * reset() returns it to Uninitialized.
 *
 * @section session Session timeout
 * Every public entry point first runs check_and_maybe_lock(). When the
 * session has been idle for longer than the auto-lock timeout the vault
 * locks itself before the call proceeds, so a query such as is_unlocked()
 * can cause a transition. Mutations, get_key() and sign() refresh the
 * session; listings and lookups do not.
 *
 * @section persistence Persistence
 * Each mutation serializes the whole payload, encrypts it under a fresh IV
 * and replaces the stored record. The in-memory payload only changes after
 * the write succeeds, so a failed save leaves the previous state intact.
 *
 * @section threading Thread Safety
 * All state is guarded by one mutex. signal_locked() is emitted after the
 * mutex is released, so handlers may call back into the vault.
 *
 * @code
 * MemoryVaultStorage storage;
 * SystemClock clock;
 * Vault vault(storage, clock, VaultConfig::load());
 *
 * auto mnemonic = vault.initialize_with_mnemonic("correct horse battery staple123");
 * auto key = vault.generate_key(KeyType::Ed25519, "Signing key");
 * vault.lock();
 * @endcode
 */
class Vault {
public:
    /**
     * @param storage Durable record store, must outlive the vault
     * @param clock Time source for session and key timestamps, must outlive the vault
     * @param config Iteration count and session policy
     */
    Vault(IVaultStorage& storage, const IClock& clock, VaultConfig config = {});
    ~Vault();

    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;
    Vault(Vault&&) = delete;
    Vault& operator=(Vault&&) = delete;

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------

    /// True when a record exists in storage
    [[nodiscard]] VaultResult<bool> is_initialized();

    [[nodiscard]] VaultResult<VaultStatus> status();

    /**
     * @brief Create an empty vault and leave it unlocked
     * @return VaultError::AlreadyInitialized if a record already exists
     */
    [[nodiscard]] VaultResult<> initialize(const Glib::ustring& password);

    /**
     * @brief Create a vault seeded from a recovery phrase
     *
     * Generates a 12-word phrase when @p mnemonic is empty. Derives
     * "Accumulate Key 1" (Ed25519) and "Ethereum Key 1" (secp256k1) at
     * index 0 and leaves the vault unlocked.
     *
     * @return The phrase to show the user for backup, or
     *         VaultError::AlreadyInitialized / VaultError::InvalidMnemonic
     */
    [[nodiscard]] VaultResult<std::string> initialize_with_mnemonic(
        const Glib::ustring& password,
        std::optional<std::string> mnemonic = std::nullopt);

    /**
     * @brief Decrypt the stored record
     * @return VaultError::NotInitialized, VaultError::InvalidPassword, or
     *         VaultError::UnsupportedSchema for a record from another version.
     *         On any failure the vault is Locked.
     */
    [[nodiscard]] VaultResult<> unlock(const Glib::ustring& password);

    /// Evict the derived key and payload from memory. Safe to call repeatedly.
    void lock();

    /// Runs the auto-lock check, so this query may lock the vault
    [[nodiscard]] bool is_unlocked();

    /// Restart the session timer if unlocked
    void refresh_session();

    /**
     * @brief Lock the vault if its session has expired
     * @return true if this call performed the lock
     */
    bool check_and_maybe_lock();

    /// Clamped to 60..86400 seconds
    void set_auto_lock_timeout(std::chrono::seconds timeout);
    [[nodiscard]] std::chrono::seconds auto_lock_timeout() const;

    /**
     * @brief Re-authenticate and re-encrypt under a new password and salt
     * @return VaultError::VaultLocked when locked, VaultError::InvalidPassword
     *         when @p current is wrong (the session is left untouched)
     */
    [[nodiscard]] VaultResult<> change_password(
        const Glib::ustring& current,
        const Glib::ustring& new_password);

    /// Delete the stored record and forget everything in memory
    [[nodiscard]] VaultResult<> reset();

    /// Serialized encrypted record as stored, for backup
    [[nodiscard]] VaultResult<std::vector<uint8_t>> export_vault();

    /**
     * @brief Replace the stored record with a previously exported one
     *
     * The record is validated before anything is written. The vault is
     * Locked afterwards and must be unlocked with the backup's password.
     */
    [[nodiscard]] VaultResult<> import_vault(std::span<const uint8_t> record);

    // ------------------------------------------------------------------
    // Keys (all require Unlocked, else VaultError::VaultLocked)
    // ------------------------------------------------------------------

    [[nodiscard]] VaultResult<KeyInfo> generate_key(KeyType type, std::string_view name);

    /**
     * @brief Derive the next key from the stored mnemonic
     * @param index Explicit index; when absent the next unused index for
     *              the type is chosen
     * @return VaultError::MnemonicNotAvailable for a vault without a phrase
     */
    [[nodiscard]] VaultResult<KeyInfo> derive_key_from_mnemonic(
        KeyType type,
        std::string_view name,
        std::optional<uint32_t> index = std::nullopt);

    [[nodiscard]] VaultResult<KeyInfo> import_key(
        KeyType type,
        std::string_view private_key_hex,
        std::string_view name);

    /// Derive one key from a phrase that is not stored in the vault
    [[nodiscard]] VaultResult<KeyInfo> import_mnemonic(
        std::string_view mnemonic,
        KeyType type,
        std::string_view name,
        std::optional<uint32_t> index = std::nullopt);

    [[nodiscard]] VaultResult<> remove_key(std::string_view id);

    /// Rename and/or merge @p patch into the key's metadata
    [[nodiscard]] VaultResult<KeyInfo> update_key(
        std::string_view id,
        std::optional<std::string> name,
        const KeyMetadataPatch& patch = {});

    /**
     * @brief Full key including the private key
     *
     * Reserved for signing and explicit export. Updates last_used_at, which
     * is persisted with the next mutation.
     */
    [[nodiscard]] VaultResult<StoredKey> get_key(std::string_view id);

    /// Every key with the private key redacted, in creation order
    [[nodiscard]] VaultResult<std::vector<KeyInfo>> get_all_keys();
    [[nodiscard]] VaultResult<std::vector<KeyInfo>> get_keys_by_type(KeyType type);

    [[nodiscard]] VaultResult<std::optional<KeyInfo>> find_key_by_public_key(std::span<const uint8_t> public_key);
    /// Matches accumulate_url or key_page_url
    [[nodiscard]] VaultResult<std::optional<KeyInfo>> find_key_by_accumulate_url(std::string_view url);
    /// Case-insensitive
    [[nodiscard]] VaultResult<std::optional<KeyInfo>> find_key_by_evm_address(std::string_view address);

    [[nodiscard]] VaultResult<VaultMetadata> get_metadata();
    [[nodiscard]] VaultResult<uint32_t> key_count();

    /// False while locked
    [[nodiscard]] bool has_mnemonic();

    /// @return VaultError::MnemonicNotAvailable when the vault has no phrase
    [[nodiscard]] VaultResult<std::string> get_mnemonic();

    /**
     * @brief Sign with a stored key and refresh the session
     *
     * Ed25519 and BLS12-381 sign @p message as given. secp256k1 expects a
     * 32-byte hash.
     */
    [[nodiscard]] VaultResult<SignatureResult> sign(std::string_view key_id, std::span<const uint8_t> message);

    /**
     * @brief CREATE2 address of the Certen smart account owned by a key
     * @return VaultError::InvalidAddress when @p chain_id has no account factory
     */
    [[nodiscard]] VaultResult<std::string> predict_account_address(
        std::string_view key_id,
        std::string_view adi_url,
        uint64_t chain_id,
        std::string_view implementation);

    /// Emitted on every transition to Locked, including auto-lock and reset
    [[nodiscard]] sigc::signal<void()>& signal_locked() { return m_signal_locked; }

private:
    std::unique_lock<std::mutex> acquire();

    [[nodiscard]] bool unlocked_locked() const noexcept { return m_payload.has_value(); }
    [[nodiscard]] bool expire_session_locked();
    void wipe_locked();

    [[nodiscard]] VaultResult<bool> record_exists_locked();
    [[nodiscard]] VaultResult<VaultPayload> authenticate_locked(
        const Glib::ustring& password,
        SecureVector<uint8_t>& key_out,
        EncryptedVaultData& record_out);
    [[nodiscard]] VaultResult<> create_locked(const Glib::ustring& password, VaultPayload payload);
    [[nodiscard]] VaultResult<> persist_locked(const VaultPayload& payload);
    [[nodiscard]] VaultResult<> commit_locked(VaultPayload next);
    [[nodiscard]] VaultResult<KeyInfo> add_key_locked(StoredKey key);

    [[nodiscard]] VaultResult<StoredKey> make_key(
        KeyType type,
        std::string_view name,
        KeyPair pair,
        std::optional<std::string> derivation_path,
        bool from_mnemonic) const;

    [[nodiscard]] StoredKey* find_locked(std::string_view id);

    IVaultStorage& m_storage;
    const IClock& m_clock;
    VaultConfig m_config;

    mutable std::mutex m_mutex;
    SecureVector<uint8_t> m_key;
    std::vector<uint8_t> m_salt;
    int m_kdf_iterations = 0;
    std::optional<VaultPayload> m_payload;
    int64_t m_unlock_timestamp = 0;

    sigc::signal<void()> m_signal_locked;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_VAULT_H
