// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_BLS12381_H
#define CERTENVAULT_BLS12381_H

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
#include "KeyType.h"
#include "../VaultError.h"

namespace CertenVault {

/**
 * @brief BLS12-381 signatures with public keys in G1 and signatures in G2
 *
 * Backed by the blst library. Messages are hashed to G2 with the basic
 * (NUL) ciphersuite. Key derivation follows EIP-2333, with the HKDF,
 * Lamport and modular reduction steps all done inside blst.
 */
class Bls12381 {
public:
    static constexpr size_t PRIVATE_KEY_LENGTH = 32;
    static constexpr size_t PUBLIC_KEY_LENGTH = 48;   ///< Compressed G1
    static constexpr size_t SIGNATURE_LENGTH = 96;    ///< Compressed G2
    static constexpr std::string_view SIGNATURE_DST = "BLS_SIG_BLS12381G2_XMD:SHA-256_SSWU_RO_NUL_";

    [[nodiscard]] static VaultResult<KeyPair> generate();

    /**
     * @brief Rebuild a key pair from a 32-byte big-endian secret scalar
     * @return VaultError::InvalidKeyLength for a wrong size,
     *         VaultError::InvalidPrivateKey for zero or >= group order
     */
    [[nodiscard]] static VaultResult<KeyPair> from_private_key(std::span<const uint8_t> private_key);

    [[nodiscard]] static VaultResult<std::vector<uint8_t>> sign(
        std::span<const uint8_t> message,
        std::span<const uint8_t> private_key);

    [[nodiscard]] static bool verify(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature,
        std::span<const uint8_t> public_key) noexcept;

    /// Sum of G2 signatures; VaultError::EmptyInput for an empty list
    [[nodiscard]] static VaultResult<std::vector<uint8_t>> aggregate_signatures(
        std::span<const std::vector<uint8_t>> signatures);

    /// Sum of G1 public keys; VaultError::EmptyInput for an empty list
    [[nodiscard]] static VaultResult<std::vector<uint8_t>> aggregate_public_keys(
        std::span<const std::vector<uint8_t>> public_keys);

    /**
     * @brief Verify an aggregate signature over parallel (message, key) lists
     *
     * @return VaultError::LengthMismatch when the lists differ in size;
     *         otherwise true only if every pair contributed a valid signature.
     *         Empty lists and malformed points verify as false.
     */
    [[nodiscard]] static VaultResult<bool> verify_aggregate(
        std::span<const uint8_t> aggregate_signature,
        std::span<const std::vector<uint8_t>> messages,
        std::span<const std::vector<uint8_t>> public_keys);

    [[nodiscard]] static bool is_valid_public_key(std::span<const uint8_t> public_key) noexcept;
    [[nodiscard]] static bool is_valid_signature(std::span<const uint8_t> signature) noexcept;

    /// EIP-2333 master secret key from a BIP-39 seed (at least 32 bytes)
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> derive_master_key(std::span<const uint8_t> seed);

    /// EIP-2333 child secret key
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> derive_child_key(
        std::span<const uint8_t> parent_key, uint32_t index);

    Bls12381() = delete;
    ~Bls12381() = delete;
    Bls12381(const Bls12381&) = delete;
    Bls12381& operator=(const Bls12381&) = delete;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_BLS12381_H
