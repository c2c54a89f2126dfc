// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "Vault.h"
#include "addresses/Addresses.h"
#include "addresses/ContractRegistry.h"
#include "addresses/Create2.h"
#include "crypto/VaultCrypto.h"
#include "curves/Bls12381.h"
#include "curves/Ed25519.h"
#include "curves/Secp256k1.h"
#include "hd/HdDerivation.h"
#include "hd/Mnemonic.h"
#include "serialization/VaultSerialization.h"
#include "../utils/Codec.h"
#include "../utils/Log.h"
#include "../utils/SettingsValidator.h"
#include <algorithm>
#include <ranges>

namespace CertenVault {

namespace {

constexpr std::string_view DEFAULT_ACCUMULATE_KEY_NAME = "Accumulate Key 1";
constexpr std::string_view DEFAULT_ETHEREUM_KEY_NAME = "Ethereum Key 1";

void wipe_payload(VaultPayload& payload) {
    if (payload.mnemonic) {
        secure_clear(*payload.mnemonic);
    }
    payload.keys.clear();
}

VaultResult<KeyMetadata> build_metadata(KeyType type, std::span<const uint8_t> public_key) {
    KeyMetadata metadata;
    switch (type) {
        case KeyType::Ed25519: {
            auto url = Ed25519::lite_account_url(public_key);
            if (!url) {
                return std::unexpected(url.error());
            }
            metadata.key_page_url = *url + "/1";
            metadata.accumulate_url = std::move(*url);

            auto chains = Addresses::ed25519_chain_addresses(public_key);
            if (!chains) {
                return std::unexpected(chains.error());
            }
            metadata.chain_addresses = std::move(*chains);
            break;
        }
        case KeyType::Secp256k1: {
            auto evm = Addresses::ethereum_address(public_key);
            if (!evm) {
                return std::unexpected(evm.error());
            }
            metadata.evm_address = std::move(*evm);

            auto chains = Addresses::secp256k1_chain_addresses(public_key);
            if (!chains) {
                return std::unexpected(chains.error());
            }
            metadata.chain_addresses = std::move(*chains);
            break;
        }
        case KeyType::Bls12381:
            break;
    }
    return metadata;
}

VaultResult<KeyPair> generate_pair(KeyType type) {
    switch (type) {
        case KeyType::Ed25519:
            return Ed25519::generate();
        case KeyType::Secp256k1:
            return Secp256k1::generate();
        case KeyType::Bls12381:
            return Bls12381::generate();
    }
    return std::unexpected(VaultError::UnsupportedKeyType);
}

VaultResult<KeyPair> pair_from_private_key(KeyType type, std::span<const uint8_t> private_key) {
    switch (type) {
        case KeyType::Ed25519:
            return Ed25519::from_private_key(private_key);
        case KeyType::Secp256k1:
            return Secp256k1::from_private_key(private_key);
        case KeyType::Bls12381:
            return Bls12381::from_private_key(private_key);
    }
    return std::unexpected(VaultError::UnsupportedKeyType);
}

VaultResult<std::vector<uint8_t>> sign_with(
    KeyType type,
    std::span<const uint8_t> message,
    std::span<const uint8_t> private_key) {

    switch (type) {
        case KeyType::Ed25519:
            return Ed25519::sign(message, private_key);
        case KeyType::Secp256k1:
            return Secp256k1::sign(message, private_key);
        case KeyType::Bls12381:
            return Bls12381::sign(message, private_key);
    }
    return std::unexpected(VaultError::UnsupportedKeyType);
}

template<typename Predicate>
std::optional<KeyInfo> find_key_if(const VaultPayload& payload, Predicate predicate) {
    auto it = std::ranges::find_if(payload.keys, predicate);
    if (it == payload.keys.end()) {
        return std::nullopt;
    }
    return KeyInfo::from(*it);
}

}  // namespace

Vault::Vault(IVaultStorage& storage, const IClock& clock, VaultConfig config)
    : m_storage(storage)
    , m_clock(clock)
    , m_config(std::move(config)) {
}

Vault::~Vault() {
    std::lock_guard lock(m_mutex);
    wipe_locked();
}

// ============================================================================
// Session
// ============================================================================

std::unique_lock<std::mutex> Vault::acquire() {
    check_and_maybe_lock();
    return std::unique_lock(m_mutex);
}

bool Vault::expire_session_locked() {
    if (!unlocked_locked() || !m_config.auto_lock_enabled) {
        return false;
    }
    const int64_t timeout_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(m_config.auto_lock_timeout).count();
    if (m_clock.now_ms() - m_unlock_timestamp <= timeout_ms) {
        return false;
    }
    Log::info("Session expired after {}s, locking vault", m_config.auto_lock_timeout.count());
    wipe_locked();
    return true;
}

bool Vault::check_and_maybe_lock() {
    bool expired = false;
    {
        std::lock_guard lock(m_mutex);
        expired = expire_session_locked();
    }
    if (expired) {
        m_signal_locked.emit();
    }
    return expired;
}

void Vault::wipe_locked() {
    SecureVector<uint8_t>().swap(m_key);
    m_salt.clear();
    m_kdf_iterations = 0;
    if (m_payload) {
        wipe_payload(*m_payload);
        m_payload.reset();
    }
    m_unlock_timestamp = 0;
}

bool Vault::is_unlocked() {
    auto lock = acquire();
    return unlocked_locked();
}

void Vault::refresh_session() {
    auto lock = acquire();
    if (unlocked_locked()) {
        m_unlock_timestamp = m_clock.now_ms();
    }
}

void Vault::set_auto_lock_timeout(std::chrono::seconds timeout) {
    std::lock_guard lock(m_mutex);
    const auto seconds = std::clamp<std::chrono::seconds::rep>(
        timeout.count(),
        SettingsValidator::MIN_AUTO_LOCK_TIMEOUT,
        SettingsValidator::MAX_AUTO_LOCK_TIMEOUT);
    m_config.auto_lock_timeout = std::chrono::seconds{seconds};
}

std::chrono::seconds Vault::auto_lock_timeout() const {
    std::lock_guard lock(m_mutex);
    return m_config.auto_lock_timeout;
}

// ============================================================================
// Lifecycle
// ============================================================================

VaultResult<bool> Vault::record_exists_locked() {
    if (unlocked_locked()) {
        return true;
    }
    auto stored = m_storage.load(VAULT_STORAGE_ID);
    if (!stored) {
        return std::unexpected(stored.error());
    }
    return stored->has_value();
}

VaultResult<bool> Vault::is_initialized() {
    auto lock = acquire();
    return record_exists_locked();
}

VaultResult<VaultStatus> Vault::status() {
    auto lock = acquire();
    auto initialized = record_exists_locked();
    if (!initialized) {
        return std::unexpected(initialized.error());
    }

    VaultStatus status;
    status.is_initialized = *initialized;
    status.is_unlocked = unlocked_locked();
    if (m_payload) {
        status.has_mnemonic = m_payload->mnemonic.has_value();
        status.key_count = static_cast<uint32_t>(m_payload->keys.size());
    }
    return status;
}

VaultResult<> Vault::create_locked(const Glib::ustring& password, VaultPayload payload) {
    auto exists = record_exists_locked();
    if (!exists) {
        return std::unexpected(exists.error());
    }
    if (*exists) {
        return std::unexpected(VaultError::AlreadyInitialized);
    }

    auto salt = VaultCrypto::generate_random_bytes(VaultCrypto::SALT_LENGTH);
    auto key = VaultCrypto::derive_key(password, salt, m_config.pbkdf2_iterations);
    if (!key) {
        return std::unexpected(key.error());
    }

    const int64_t now = m_clock.now_ms();
    payload.metadata.created_at = now;
    payload.metadata.last_modified = now;
    payload.metadata.key_count = static_cast<uint32_t>(payload.keys.size());

    m_key = std::move(*key);
    m_salt = std::move(salt);
    m_kdf_iterations = m_config.pbkdf2_iterations;

    if (auto saved = persist_locked(payload); !saved) {
        wipe_payload(payload);
        wipe_locked();
        return std::unexpected(saved.error());
    }

    m_payload = std::move(payload);
    m_unlock_timestamp = now;
    Log::info("Vault initialized with {} key(s)", m_payload->keys.size());
    return {};
}

VaultResult<> Vault::initialize(const Glib::ustring& password) {
    auto lock = acquire();
    return create_locked(password, VaultPayload{});
}

VaultResult<std::string> Vault::initialize_with_mnemonic(
    const Glib::ustring& password,
    std::optional<std::string> mnemonic) {

    auto lock = acquire();

    auto exists = record_exists_locked();
    if (!exists) {
        return std::unexpected(exists.error());
    }
    if (*exists) {
        return std::unexpected(VaultError::AlreadyInitialized);
    }

    std::string phrase;
    if (mnemonic) {
        phrase = Mnemonic::normalize(*mnemonic);
        secure_clear(*mnemonic);
        if (!Mnemonic::validate(phrase)) {
            secure_clear(phrase);
            return std::unexpected(VaultError::InvalidMnemonic);
        }
    } else {
        auto generated = Mnemonic::generate(Mnemonic::DEFAULT_STRENGTH);
        if (!generated) {
            return std::unexpected(generated.error());
        }
        phrase = std::move(*generated);
    }

    VaultPayload payload;
    payload.mnemonic = phrase;

    const std::pair<KeyType, std::string_view> defaults[] = {
        {KeyType::Ed25519, DEFAULT_ACCUMULATE_KEY_NAME},
        {KeyType::Secp256k1, DEFAULT_ETHEREUM_KEY_NAME},
    };
    for (const auto& [type, name] : defaults) {
        auto derived = HdDerivation::derive_from_mnemonic(type, phrase, 0, 0);
        if (!derived) {
            wipe_payload(payload);
            secure_clear(phrase);
            return std::unexpected(derived.error());
        }
        auto key = make_key(type, name, std::move(derived->key_pair), std::move(derived->path), true);
        if (!key) {
            wipe_payload(payload);
            secure_clear(phrase);
            return std::unexpected(key.error());
        }
        payload.keys.push_back(std::move(*key));
    }

    if (auto created = create_locked(password, std::move(payload)); !created) {
        secure_clear(phrase);
        return std::unexpected(created.error());
    }
    return phrase;
}

VaultResult<VaultPayload> Vault::authenticate_locked(
    const Glib::ustring& password,
    SecureVector<uint8_t>& key_out,
    EncryptedVaultData& record_out) {

    auto stored = m_storage.load(VAULT_STORAGE_ID);
    if (!stored) {
        return std::unexpected(stored.error());
    }
    if (!stored->has_value()) {
        return std::unexpected(VaultError::NotInitialized);
    }

    auto record = VaultSerialization::deserialize_record(**stored);
    if (!record) {
        Log::error("Stored vault record rejected: {}", to_string(record.error()));
        return std::unexpected(record.error());
    }

    auto key = VaultCrypto::derive_key(password, record->salt, record->kdf_params.iterations);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto plaintext = VaultCrypto::decrypt(record->encrypted_payload, record->iv, *key);
    if (!plaintext) {
        return std::unexpected(VaultError::InvalidPassword);
    }

    auto payload = VaultSerialization::deserialize_payload(*plaintext);
    if (!payload) {
        return std::unexpected(payload.error());
    }

    key_out = std::move(*key);
    record_out = std::move(*record);
    return std::move(*payload);
}

VaultResult<> Vault::unlock(const Glib::ustring& password) {
    bool was_unlocked = false;
    VaultResult<> result;
    {
        auto lock = acquire();
        SecureVector<uint8_t> key;
        EncryptedVaultData record;
        auto payload = authenticate_locked(password, key, record);
        if (!payload) {
            was_unlocked = unlocked_locked();
            wipe_locked();
            Log::warning("Unlock failed: {}", to_string(payload.error()));
            result = std::unexpected(payload.error());
        } else {
            wipe_locked();
            m_key = std::move(key);
            m_salt = std::move(record.salt);
            m_kdf_iterations = record.kdf_params.iterations;
            m_payload = std::move(*payload);
            m_unlock_timestamp = m_clock.now_ms();
            Log::info("Vault unlocked ({} keys)", m_payload->keys.size());
        }
    }
    if (was_unlocked) {
        m_signal_locked.emit();
    }
    return result;
}

void Vault::lock() {
    bool was_unlocked = false;
    {
        std::lock_guard lock(m_mutex);
        was_unlocked = unlocked_locked();
        wipe_locked();
    }
    if (was_unlocked) {
        Log::info("Vault locked");
        m_signal_locked.emit();
    }
}

VaultResult<> Vault::change_password(const Glib::ustring& current, const Glib::ustring& new_password) {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }

    SecureVector<uint8_t> old_key;
    EncryptedVaultData record;
    auto payload = authenticate_locked(current, old_key, record);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    wipe_payload(*payload);

    auto salt = VaultCrypto::generate_random_bytes(VaultCrypto::SALT_LENGTH);
    const int iterations = std::max(m_config.pbkdf2_iterations, record.kdf_params.iterations);
    auto key = VaultCrypto::derive_key(new_password, salt, iterations);
    if (!key) {
        return std::unexpected(key.error());
    }

    // Swap credentials, restoring the old ones if the write fails
    std::swap(m_key, *key);
    std::swap(m_salt, salt);
    std::swap(m_kdf_iterations, record.kdf_params.iterations);

    m_payload->metadata.last_modified = m_clock.now_ms();
    if (auto saved = persist_locked(*m_payload); !saved) {
        std::swap(m_key, *key);
        std::swap(m_salt, salt);
        std::swap(m_kdf_iterations, record.kdf_params.iterations);
        return std::unexpected(saved.error());
    }

    m_unlock_timestamp = m_clock.now_ms();
    Log::info("Vault password changed");
    return {};
}

VaultResult<> Vault::reset() {
    bool was_unlocked = false;
    VaultResult<> removed;
    {
        std::lock_guard lock(m_mutex);
        was_unlocked = unlocked_locked();
        wipe_locked();
        removed = m_storage.remove(VAULT_STORAGE_ID);
    }
    if (removed) {
        Log::warning("Vault reset, all keys deleted");
    } else {
        Log::error("Vault reset could not delete the stored record: {}", to_string(removed.error()));
    }
    if (was_unlocked) {
        m_signal_locked.emit();
    }
    return removed;
}

VaultResult<std::vector<uint8_t>> Vault::export_vault() {
    auto lock = acquire();
    auto stored = m_storage.load(VAULT_STORAGE_ID);
    if (!stored) {
        return std::unexpected(stored.error());
    }
    if (!stored->has_value()) {
        return std::unexpected(VaultError::NotInitialized);
    }
    return std::move(**stored);
}

VaultResult<> Vault::import_vault(std::span<const uint8_t> record) {
    auto parsed = VaultSerialization::deserialize_record(record);
    if (!parsed) {
        Log::warning("Rejected vault import: {}", to_string(parsed.error()));
        return std::unexpected(parsed.error());
    }
    auto bytes = VaultSerialization::serialize_record(*parsed);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    bool was_unlocked = false;
    VaultResult<> saved;
    {
        std::lock_guard lock(m_mutex);
        saved = m_storage.save(VAULT_STORAGE_ID, *bytes);
        if (saved) {
            was_unlocked = unlocked_locked();
            wipe_locked();
        }
    }
    if (!saved) {
        return std::unexpected(saved.error());
    }
    Log::info("Vault record imported");
    if (was_unlocked) {
        m_signal_locked.emit();
    }
    return {};
}

// ============================================================================
// Persistence
// ============================================================================

VaultResult<> Vault::persist_locked(const VaultPayload& payload) {
    auto plaintext = VaultSerialization::serialize_payload(payload);
    if (!plaintext) {
        return std::unexpected(plaintext.error());
    }

    // encrypt() draws a fresh IV for every call
    auto encrypted = VaultCrypto::encrypt(*plaintext, m_key);
    if (!encrypted) {
        return std::unexpected(encrypted.error());
    }

    EncryptedVaultData record;
    record.version = CURRENT_VAULT_VERSION;
    record.salt = m_salt;
    record.iv = std::move(encrypted->iv);
    record.encrypted_payload = std::move(encrypted->ciphertext);
    record.kdf_params.algorithm = std::string(KDF_ALGORITHM);
    record.kdf_params.iterations = m_kdf_iterations;

    auto bytes = VaultSerialization::serialize_record(record);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    if (auto saved = m_storage.save(VAULT_STORAGE_ID, *bytes); !saved) {
        Log::error("Failed to persist vault: {}", to_string(saved.error()));
        return std::unexpected(saved.error());
    }
    Log::debug("Vault persisted ({} keys)", payload.keys.size());
    return {};
}

VaultResult<> Vault::commit_locked(VaultPayload next) {
    const int64_t now = m_clock.now_ms();
    next.metadata.key_count = static_cast<uint32_t>(next.keys.size());
    next.metadata.last_modified = now;

    if (auto saved = persist_locked(next); !saved) {
        wipe_payload(next);
        return std::unexpected(saved.error());
    }

    wipe_payload(*m_payload);
    m_payload = std::move(next);
    m_unlock_timestamp = now;
    return {};
}

// ============================================================================
// Key creation
// ============================================================================

VaultResult<StoredKey> Vault::make_key(
    KeyType type,
    std::string_view name,
    KeyPair pair,
    std::optional<std::string> derivation_path,
    bool from_mnemonic) const {

    auto metadata = build_metadata(type, pair.public_key);
    if (!metadata) {
        return std::unexpected(metadata.error());
    }
    metadata->from_mnemonic = from_mnemonic;

    StoredKey key;
    key.id = VaultCrypto::generate_uuid();
    key.name = std::string(name);
    key.type = type;
    key.public_key = std::move(pair.public_key);
    key.private_key = std::move(pair.private_key);
    key.created_at = m_clock.now_ms();
    key.derivation_path = std::move(derivation_path);
    key.metadata = std::move(*metadata);
    return key;
}

VaultResult<KeyInfo> Vault::add_key_locked(StoredKey key) {
    VaultPayload next = *m_payload;
    next.keys.push_back(std::move(key));
    if (auto committed = commit_locked(std::move(next)); !committed) {
        return std::unexpected(committed.error());
    }

    const auto& added = m_payload->keys.back();
    Log::info("Added {} key {}", to_string(added.type), added.id);
    return KeyInfo::from(added);
}

VaultResult<KeyInfo> Vault::generate_key(KeyType type, std::string_view name) {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }

    auto pair = generate_pair(type);
    if (!pair) {
        return std::unexpected(pair.error());
    }
    auto key = make_key(type, name, std::move(*pair), std::nullopt, false);
    if (!key) {
        return std::unexpected(key.error());
    }
    return add_key_locked(std::move(*key));
}

VaultResult<KeyInfo> Vault::derive_key_from_mnemonic(
    KeyType type,
    std::string_view name,
    std::optional<uint32_t> index) {

    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    if (!m_payload->mnemonic) {
        return std::unexpected(VaultError::MnemonicNotAvailable);
    }

    if (!index) {
        std::vector<std::string> paths;
        for (const auto& key : m_payload->keys) {
            if (key.type == type && key.derivation_path) {
                paths.push_back(*key.derivation_path);
            }
        }
        index = HdDerivation::next_derivation_index(paths, HdDerivation::path_prefix(type, 0));
    }

    auto derived = HdDerivation::derive_from_mnemonic(type, *m_payload->mnemonic, 0, *index);
    if (!derived) {
        return std::unexpected(derived.error());
    }
    auto key = make_key(type, name, std::move(derived->key_pair), std::move(derived->path), true);
    if (!key) {
        return std::unexpected(key.error());
    }
    return add_key_locked(std::move(*key));
}

VaultResult<KeyInfo> Vault::import_key(KeyType type, std::string_view private_key_hex, std::string_view name) {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }

    auto bytes = Codec::from_hex(private_key_hex);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    auto pair = pair_from_private_key(type, *bytes);
    secure_clear(*bytes);
    if (!pair) {
        return std::unexpected(pair.error());
    }

    auto key = make_key(type, name, std::move(*pair), std::nullopt, false);
    if (!key) {
        return std::unexpected(key.error());
    }
    return add_key_locked(std::move(*key));
}

VaultResult<KeyInfo> Vault::import_mnemonic(
    std::string_view mnemonic,
    KeyType type,
    std::string_view name,
    std::optional<uint32_t> index) {

    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }

    std::string phrase = Mnemonic::normalize(mnemonic);
    if (!Mnemonic::validate(phrase)) {
        secure_clear(phrase);
        return std::unexpected(VaultError::InvalidMnemonic);
    }

    auto derived = HdDerivation::derive_from_mnemonic(type, phrase, 0, index.value_or(0));
    secure_clear(phrase);
    if (!derived) {
        return std::unexpected(derived.error());
    }
    auto key = make_key(type, name, std::move(derived->key_pair), std::move(derived->path), true);
    if (!key) {
        return std::unexpected(key.error());
    }
    return add_key_locked(std::move(*key));
}

// ============================================================================
// Key maintenance
// ============================================================================

StoredKey* Vault::find_locked(std::string_view id) {
    auto it = std::ranges::find(m_payload->keys, id, &StoredKey::id);
    return it == m_payload->keys.end() ? nullptr : &*it;
}

VaultResult<> Vault::remove_key(std::string_view id) {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    if (!find_locked(id)) {
        return std::unexpected(VaultError::KeyNotFound);
    }

    VaultPayload next = *m_payload;
    std::erase_if(next.keys, [id](const StoredKey& key) { return key.id == id; });
    if (auto committed = commit_locked(std::move(next)); !committed) {
        return std::unexpected(committed.error());
    }
    Log::info("Removed key {}", id);
    return {};
}

VaultResult<KeyInfo> Vault::update_key(
    std::string_view id,
    std::optional<std::string> name,
    const KeyMetadataPatch& patch) {

    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    if (!find_locked(id)) {
        return std::unexpected(VaultError::KeyNotFound);
    }

    VaultPayload next = *m_payload;
    auto it = std::ranges::find(next.keys, id, &StoredKey::id);
    if (name) {
        it->name = std::move(*name);
    }
    auto& metadata = it->metadata;
    if (patch.accumulate_url) metadata.accumulate_url = patch.accumulate_url;
    if (patch.key_page_url) metadata.key_page_url = patch.key_page_url;
    if (patch.evm_address) metadata.evm_address = patch.evm_address;
    if (patch.from_mnemonic) metadata.from_mnemonic = *patch.from_mnemonic;
    for (const auto& [chain, address] : patch.chain_addresses) {
        metadata.chain_addresses.insert_or_assign(chain, address);
    }

    if (auto committed = commit_locked(std::move(next)); !committed) {
        return std::unexpected(committed.error());
    }
    return KeyInfo::from(*find_locked(id));
}

// ============================================================================
// Key access
// ============================================================================

VaultResult<StoredKey> Vault::get_key(std::string_view id) {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    StoredKey* key = find_locked(id);
    if (!key) {
        return std::unexpected(VaultError::KeyNotFound);
    }

    const int64_t now = m_clock.now_ms();
    key->last_used_at = now;
    m_unlock_timestamp = now;
    return *key;
}

VaultResult<std::vector<KeyInfo>> Vault::get_all_keys() {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    std::vector<KeyInfo> keys;
    keys.reserve(m_payload->keys.size());
    for (const auto& key : m_payload->keys) {
        keys.push_back(KeyInfo::from(key));
    }
    return keys;
}

VaultResult<std::vector<KeyInfo>> Vault::get_keys_by_type(KeyType type) {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    std::vector<KeyInfo> keys;
    for (const auto& key : m_payload->keys) {
        if (key.type == type) {
            keys.push_back(KeyInfo::from(key));
        }
    }
    return keys;
}

VaultResult<std::optional<KeyInfo>> Vault::find_key_by_public_key(std::span<const uint8_t> public_key) {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    return find_key_if(*m_payload, [public_key](const StoredKey& key) {
        return std::ranges::equal(key.public_key, public_key);
    });
}

VaultResult<std::optional<KeyInfo>> Vault::find_key_by_accumulate_url(std::string_view url) {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    return find_key_if(*m_payload, [url](const StoredKey& key) {
        return key.metadata.accumulate_url == url || key.metadata.key_page_url == url;
    });
}

VaultResult<std::optional<KeyInfo>> Vault::find_key_by_evm_address(std::string_view address) {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    return find_key_if(*m_payload, [address](const StoredKey& key) {
        return key.metadata.evm_address && Codec::iequals_ascii(*key.metadata.evm_address, address);
    });
}

VaultResult<VaultMetadata> Vault::get_metadata() {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    return m_payload->metadata;
}

VaultResult<uint32_t> Vault::key_count() {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    return static_cast<uint32_t>(m_payload->keys.size());
}

bool Vault::has_mnemonic() {
    auto lock = acquire();
    return unlocked_locked() && m_payload->mnemonic.has_value();
}

VaultResult<std::string> Vault::get_mnemonic() {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    if (!m_payload->mnemonic) {
        return std::unexpected(VaultError::MnemonicNotAvailable);
    }
    return *m_payload->mnemonic;
}

// ============================================================================
// Signing
// ============================================================================

VaultResult<SignatureResult> Vault::sign(std::string_view key_id, std::span<const uint8_t> message) {
    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    StoredKey* key = find_locked(key_id);
    if (!key) {
        return std::unexpected(VaultError::KeyNotFound);
    }

    auto signature = sign_with(key->type, message, key->private_key);
    if (!signature) {
        Log::warning("Signing with key {} failed: {}", key->id, to_string(signature.error()));
        return std::unexpected(signature.error());
    }

    const int64_t now = m_clock.now_ms();
    key->last_used_at = now;
    m_unlock_timestamp = now;

    Log::debug("Signed {} bytes with {} key {}", message.size(), to_string(key->type), key->id);
    return SignatureResult{std::move(*signature), key->public_key, key->id, key->type};
}

VaultResult<std::string> Vault::predict_account_address(
    std::string_view key_id,
    std::string_view adi_url,
    uint64_t chain_id,
    std::string_view implementation) {

    auto lock = acquire();
    if (!unlocked_locked()) {
        return std::unexpected(VaultError::VaultLocked);
    }
    const StoredKey* key = find_locked(key_id);
    if (!key) {
        return std::unexpected(VaultError::KeyNotFound);
    }

    auto factory = ContractRegistry::account_factory(chain_id);
    if (!factory) {
        Log::warning("No account factory deployed on chain {}", chain_id);
        return std::unexpected(VaultError::InvalidAddress);
    }
    return Create2::predict_account_address(*factory, implementation, adi_url, key->public_key, chain_id);
}

}  // namespace CertenVault
