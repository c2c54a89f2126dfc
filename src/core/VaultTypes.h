// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file VaultTypes.h
 * @brief Domain structures held by the vault and its persistence layer
 *
 * Timestamps are milliseconds since the Unix epoch as reported by the
 * vault's IClock.
 */

#ifndef CERTENVAULT_VAULT_TYPES_H
#define CERTENVAULT_VAULT_TYPES_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "curves/KeyType.h"
#include "../utils/SecureMemory.h"

namespace CertenVault {

inline constexpr uint32_t CURRENT_VAULT_VERSION = 1;
inline constexpr std::string_view KDF_ALGORITHM = "pbkdf2-sha512";
inline constexpr std::string_view VAULT_STORAGE_ID = "certen_vault_v1";

/// Placeholder shown instead of private key material in key listings
inline constexpr std::string_view REDACTED_PRIVATE_KEY = "[REDACTED]";

/**
 * @brief Chain-specific data derived from a key
 *
 * At most one canonical address per chain family. chain_addresses holds
 * the non-EVM chains keyed by chain name ("solana", "osmosis", ...).
 */
struct KeyMetadata {
    std::optional<std::string> accumulate_url;
    std::optional<std::string> key_page_url;
    std::optional<std::string> evm_address;
    bool from_mnemonic = false;
    std::map<std::string, std::string> chain_addresses;

    bool operator==(const KeyMetadata&) const = default;
};

/// Partial update merged into KeyMetadata by Vault::update_key
struct KeyMetadataPatch {
    std::optional<std::string> accumulate_url;
    std::optional<std::string> key_page_url;
    std::optional<std::string> evm_address;
    std::optional<bool> from_mnemonic;
    std::map<std::string, std::string> chain_addresses;
};

/// One managed key pair, private key included
struct StoredKey {
    std::string id;
    std::string name;
    KeyType type = KeyType::Ed25519;
    std::vector<uint8_t> public_key;
    SecureVector<uint8_t> private_key;
    int64_t created_at = 0;
    std::optional<int64_t> last_used_at;
    std::optional<std::string> derivation_path;
    KeyMetadata metadata;
};

/**
 * @brief Display form of a stored key
 *
 * Carries everything a StoredKey does except the secret; private_key is
 * always REDACTED_PRIVATE_KEY.
 */
struct KeyInfo {
    std::string id;
    std::string name;
    KeyType type = KeyType::Ed25519;
    std::vector<uint8_t> public_key;
    std::string private_key{REDACTED_PRIVATE_KEY};
    int64_t created_at = 0;
    std::optional<int64_t> last_used_at;
    std::optional<std::string> derivation_path;
    KeyMetadata metadata;

    [[nodiscard]] static KeyInfo from(const StoredKey& key) {
        return KeyInfo{key.id, key.name, key.type, key.public_key,
                       std::string(REDACTED_PRIVATE_KEY), key.created_at,
                       key.last_used_at, key.derivation_path, key.metadata};
    }
};

struct VaultMetadata {
    int64_t created_at = 0;
    int64_t last_modified = 0;
    uint32_t key_count = 0;

    bool operator==(const VaultMetadata&) const = default;
};

/// Plaintext vault contents; exists only while unlocked
struct VaultPayload {
    std::vector<StoredKey> keys;
    VaultMetadata metadata;
    std::optional<std::string> mnemonic;
};

struct KdfParams {
    std::string algorithm{KDF_ALGORITHM};
    int iterations = 0;
};

/// The only form that reaches durable storage
struct EncryptedVaultData {
    uint32_t version = CURRENT_VAULT_VERSION;
    std::vector<uint8_t> salt;
    std::vector<uint8_t> iv;
    std::vector<uint8_t> encrypted_payload;
    KdfParams kdf_params;
};

struct VaultStatus {
    bool is_initialized = false;
    bool is_unlocked = false;
    bool has_mnemonic = false;
    uint32_t key_count = 0;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_VAULT_TYPES_H
