// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_ED25519_H
#define CERTENVAULT_ED25519_H

#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "KeyType.h"
#include "../VaultError.h"

namespace CertenVault {

/**
 * @brief Ed25519 keys and signatures (RFC 8032) via OpenSSL EVP
 *
 * Private keys are kept in the 64-byte seed||public form. Any entry point
 * taking a private key also accepts the bare 32-byte seed.
 *
 * @code
 * auto pair = Ed25519::generate();
 * auto sig = Ed25519::sign(hash, pair->private_key);
 * bool ok = Ed25519::verify(hash, *sig, pair->public_key);
 * auto url = Ed25519::lite_account_url(pair->public_key);  // acc://...
 * @endcode
 */
class Ed25519 {
public:
    static constexpr size_t SEED_LENGTH = 32;
    static constexpr size_t PRIVATE_KEY_LENGTH = 64;  ///< seed || public key
    static constexpr size_t PUBLIC_KEY_LENGTH = 32;
    static constexpr size_t SIGNATURE_LENGTH = 64;

    /// Random key pair from the OpenSSL CSPRNG
    [[nodiscard]] static VaultResult<KeyPair> generate();

    /// Deterministic key pair from a 32-byte seed
    [[nodiscard]] static VaultResult<KeyPair> from_seed(std::span<const uint8_t> seed);

    /**
     * @brief Rebuild a key pair from stored private key bytes
     * @param private_key 32-byte seed or 64-byte seed||public
     * @return Key pair, or VaultError::InvalidKeyLength for any other size
     */
    [[nodiscard]] static VaultResult<KeyPair> from_private_key(std::span<const uint8_t> private_key);

    /// Deterministic RFC 8032 signature (64 bytes, R||S)
    [[nodiscard]] static VaultResult<std::vector<uint8_t>> sign(
        std::span<const uint8_t> message,
        std::span<const uint8_t> private_key);

    /// Returns false for any malformed input instead of failing
    [[nodiscard]] static bool verify(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature,
        std::span<const uint8_t> public_key) noexcept;

    /**
     * @brief Accumulate lite identity URL for a public key
     *
     * acc://{hex(SHA256(pub)[0..20])}{hex(SHA256(that hex)[28..32])}
     */
    [[nodiscard]] static VaultResult<std::string> lite_account_url(std::span<const uint8_t> public_key);

    /// Hex SHA-256 of the public key (Accumulate key page entry)
    [[nodiscard]] static std::string public_key_hash(std::span<const uint8_t> public_key);

    Ed25519() = delete;
    ~Ed25519() = delete;
    Ed25519(const Ed25519&) = delete;
    Ed25519& operator=(const Ed25519&) = delete;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_ED25519_H
