// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_SECP256K1_H
#define CERTENVAULT_SECP256K1_H

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "KeyType.h"
#include "../VaultError.h"

namespace CertenVault {

/**
 * @brief secp256k1 ECDSA with Ethereum conventions
 *
 * Built on libsecp256k1. Signing is deterministic (RFC 6979 nonces with
 * HMAC-SHA256), always low-S, and produces the 65-byte r||s||v form with
 * v = recovery id + 27.
 *
 * Public keys are returned uncompressed (65 bytes, 0x04 prefix) unless a
 * compressed form is requested; every function taking a public key accepts
 * both forms.
 */
class Secp256k1 {
public:
    static constexpr size_t PRIVATE_KEY_LENGTH = 32;
    static constexpr size_t COMPRESSED_PUBLIC_KEY_LENGTH = 33;
    static constexpr size_t UNCOMPRESSED_PUBLIC_KEY_LENGTH = 65;
    static constexpr size_t SIGNATURE_LENGTH = 65;      ///< r || s || v
    static constexpr size_t HASH_LENGTH = 32;
    static constexpr uint8_t RECOVERY_ID_OFFSET = 27;

    [[nodiscard]] static VaultResult<KeyPair> generate();

    /**
     * @brief Rebuild a key pair from a 32-byte secret scalar
     * @return VaultError::InvalidKeyLength for a wrong size,
     *         VaultError::InvalidPrivateKey for zero or >= curve order
     */
    [[nodiscard]] static VaultResult<KeyPair> from_private_key(std::span<const uint8_t> private_key);

    [[nodiscard]] static VaultResult<std::vector<uint8_t>> public_key_from_private(
        std::span<const uint8_t> private_key, bool compressed);

    /// Convert either encoding to the 33-byte compressed form
    [[nodiscard]] static VaultResult<std::vector<uint8_t>> compress_public_key(
        std::span<const uint8_t> public_key);

    /// Convert either encoding to the 65-byte uncompressed form
    [[nodiscard]] static VaultResult<std::vector<uint8_t>> decompress_public_key(
        std::span<const uint8_t> public_key);

    /**
     * @brief Sign a 32-byte hash
     * @return 65-byte r||s||v signature
     */
    [[nodiscard]] static VaultResult<std::vector<uint8_t>> sign(
        std::span<const uint8_t> hash,
        std::span<const uint8_t> private_key);

    /**
     * @brief Verify a signature over a 32-byte hash
     *
     * Only the first 64 bytes (r||s) are used, so both the 64-byte compact
     * and 65-byte recoverable forms are accepted. High-S signatures are
     * rejected. Never fails; malformed input yields false.
     */
    [[nodiscard]] static bool verify(
        std::span<const uint8_t> hash,
        std::span<const uint8_t> signature,
        std::span<const uint8_t> public_key) noexcept;

    /// Recover the uncompressed signer key from a 65-byte signature
    [[nodiscard]] static VaultResult<std::vector<uint8_t>> recover_public_key(
        std::span<const uint8_t> hash,
        std::span<const uint8_t> signature);

    /**
     * @brief Secret scalar addition modulo the curve order (BIP-32 CKD)
     * @return VaultError::InvalidPrivateKey if the tweak is >= n or the sum is zero
     */
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> private_key_tweak_add(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> tweak);

    /**
     * @brief Lowercase 0x-prefixed Ethereum address
     *
     * Keccak-256 of the 64-byte X||Y coordinates, last 20 bytes. Accepts
     * 65-byte, 64-byte (no prefix) and 33-byte compressed keys.
     */
    [[nodiscard]] static VaultResult<std::string> ethereum_address(std::span<const uint8_t> public_key);

    /// EIP-191: keccak256("\x19Ethereum Signed Message:\n" + len + message)
    [[nodiscard]] static std::array<uint8_t, 32> hash_personal_message(std::span<const uint8_t> message);

    [[nodiscard]] static VaultResult<std::vector<uint8_t>> sign_personal_message(
        std::span<const uint8_t> message,
        std::span<const uint8_t> private_key);

    Secp256k1() = delete;
    ~Secp256k1() = delete;
    Secp256k1(const Secp256k1&) = delete;
    Secp256k1& operator=(const Secp256k1&) = delete;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_SECP256K1_H
