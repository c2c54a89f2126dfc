// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_KEY_TYPE_H
#define CERTENVAULT_KEY_TYPE_H

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>
#include "../../utils/SecureMemory.h"

namespace CertenVault {

/// Signature scheme of a stored key. Fixed for the key's lifetime.
enum class KeyType {
    Ed25519,
    Secp256k1,
    Bls12381
};

/// Wire/storage name ("ed25519", "secp256k1", "bls12381")
[[nodiscard]] inline constexpr std::string_view to_string(KeyType type) noexcept {
    switch (type) {
        case KeyType::Ed25519:   return "ed25519";
        case KeyType::Secp256k1: return "secp256k1";
        case KeyType::Bls12381:  return "bls12381";
    }
    return "unknown";
}

[[nodiscard]] inline constexpr std::optional<KeyType> parse_key_type(std::string_view name) noexcept {
    if (name == "ed25519") return KeyType::Ed25519;
    if (name == "secp256k1") return KeyType::Secp256k1;
    if (name == "bls12381" || name == "bls12-381") return KeyType::Bls12381;
    return std::nullopt;
}

/**
 * @brief A private/public key pair as produced by a curve module
 *
 * The private key layout is curve specific: Ed25519 stores seed||public
 * (64 bytes), secp256k1 and BLS12-381 store the 32-byte big-endian scalar.
 */
struct KeyPair {
    SecureVector<uint8_t> private_key;
    std::vector<uint8_t> public_key;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_KEY_TYPE_H
