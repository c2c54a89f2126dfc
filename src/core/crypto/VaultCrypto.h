// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_VAULT_CRYPTO_H
#define CERTENVAULT_VAULT_CRYPTO_H

#include <vector>
#include <span>
#include <string>
#include <cstdint>
#include <glibmm/ustring.h>
#include "../VaultError.h"
#include "../../utils/SecureMemory.h"

namespace CertenVault {

/**
 * @brief Cryptographic operations for vault encryption
 *
 * Provides the primitives that protect the persisted key payload:
 * - PBKDF2-HMAC-SHA512 password key derivation
 * - AES-256-GCM authenticated encryption with a fresh IV per call
 * - Cryptographically secure random generation and UUIDs
 *
 * This class is stateless and thread-safe. All methods are static.
 *
 * @section security Security Features
 * - 600,000 PBKDF2 iterations by default (floor for new vaults)
 * - 256-bit salt and 256-bit key
 * - 96-bit IV for GCM, generated inside encrypt() so callers cannot reuse one
 * - 128-bit authentication tag appended to the ciphertext
 * - Decryption failure is reported only as VaultError::InvalidPassword
 *
 * @section usage Usage Example
 * @code
 * auto salt = VaultCrypto::generate_random_bytes(VaultCrypto::SALT_LENGTH);
 * auto key = VaultCrypto::derive_key("password", salt);
 * if (!key) {
 *     return std::unexpected(key.error());
 * }
 *
 * auto sealed = VaultCrypto::encrypt(plaintext, *key);
 * auto opened = VaultCrypto::decrypt(sealed->ciphertext, sealed->iv, *key);
 * @endcode
 */
class VaultCrypto {
public:
    static constexpr size_t KEY_LENGTH = 32;        ///< AES-256 key length (256 bits)
    static constexpr size_t SALT_LENGTH = 32;       ///< Salt length (256 bits)
    static constexpr size_t IV_LENGTH = 12;         ///< GCM IV length (96 bits)
    static constexpr size_t TAG_LENGTH = 16;        ///< GCM authentication tag length (128 bits)
    static constexpr int DEFAULT_PBKDF2_ITERATIONS = 600000;

    /// Output of encrypt(): the IV must be stored beside the ciphertext
    struct EncryptionResult {
        std::vector<uint8_t> iv;
        std::vector<uint8_t> ciphertext;  ///< Ciphertext with the 16-byte tag appended
    };

    /**
     * @brief Derive the vault key from a password using PBKDF2-HMAC-SHA512
     *
     * @param password User password (UTF-8 bytes are used as-is)
     * @param salt Per-vault salt
     * @param iterations PBKDF2 iteration count (must be positive)
     * @return KEY_LENGTH-byte key, or VaultError::KeyDerivationFailed
     *
     * @note Deterministic for equal inputs; the result is never logged
     */
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> derive_key(
        const Glib::ustring& password,
        std::span<const uint8_t> salt,
        int iterations = DEFAULT_PBKDF2_ITERATIONS);

    /**
     * @brief Encrypt data using AES-256-GCM with a freshly generated IV
     *
     * @param plaintext Data to encrypt
     * @param key Encryption key (must be KEY_LENGTH bytes)
     * @return IV and ciphertext+tag, or VaultError::EncryptionFailed
     */
    [[nodiscard]] static VaultResult<EncryptionResult> encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> key);

    /**
     * @brief Decrypt and authenticate data using AES-256-GCM
     *
     * @param ciphertext Encrypted data (includes authentication tag)
     * @param iv Initialization vector used for encryption
     * @param key Decryption key
     * @return Plaintext, or VaultError::InvalidPassword for any failure
     *
     * @note Wrong key, wrong IV, truncated data and tampering are
     *       deliberately indistinguishable. No partial plaintext escapes.
     */
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> decrypt(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> key);

    /**
     * @brief Generate cryptographically secure random bytes
     *
     * @throws std::runtime_error if the OpenSSL CSPRNG fails
     */
    [[nodiscard]] static std::vector<uint8_t> generate_random_bytes(size_t length);

    /**
     * @brief Generate a random RFC 4122 version 4 UUID
     * @return Lowercase "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx"
     */
    [[nodiscard]] static std::string generate_uuid();

    VaultCrypto() = delete;
    ~VaultCrypto() = delete;
    VaultCrypto(const VaultCrypto&) = delete;
    VaultCrypto& operator=(const VaultCrypto&) = delete;
    VaultCrypto(VaultCrypto&&) = delete;
    VaultCrypto& operator=(VaultCrypto&&) = delete;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_VAULT_CRYPTO_H
