// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_CREATE2_H
#define CERTENVAULT_CREATE2_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include "../VaultError.h"
#include "../crypto/Hashes.h"

namespace CertenVault::Create2 {

/**
 * @brief Address of a contract deployed with CREATE2
 *
 * keccak256(0xff || factory || salt || init_code_hash), last 20 bytes,
 * returned in EIP-55 form.
 *
 * @param factory 0x-prefixed deployer address (20 bytes)
 * @param salt 32-byte salt, hex with optional 0x
 * @param init_code_hash 32-byte Keccak-256 of the creation code
 * @return VaultError::InvalidAddress for a bad factory,
 *         VaultError::InvalidKeyLength for a salt or hash of the wrong size,
 *         VaultError::InvalidHex for undecodable hex
 */
[[nodiscard]] VaultResult<std::string> compute_address(
    std::string_view factory,
    std::string_view salt,
    std::string_view init_code_hash);

/// Keccak-256 of creation code given as hex
[[nodiscard]] VaultResult<Hashes::Digest32> hash_init_code(std::string_view init_code_hex);

/**
 * @brief Deterministic salt for a Certen smart account
 *
 * keccak256(lowercase(adi_url without trailing '/') || owner_pubkey || uint256_be(chain_id))
 */
[[nodiscard]] VaultResult<Hashes::Digest32> account_salt(
    std::string_view adi_url,
    std::span<const uint8_t> owner_public_key,
    uint64_t chain_id);

/// Init code hash of an EIP-1167 minimal proxy pointing at @p implementation
[[nodiscard]] VaultResult<Hashes::Digest32> minimal_proxy_init_code_hash(std::string_view implementation);

/// account_salt, minimal_proxy_init_code_hash and compute_address composed
[[nodiscard]] VaultResult<std::string> predict_account_address(
    std::string_view factory,
    std::string_view implementation,
    std::string_view adi_url,
    std::span<const uint8_t> owner_public_key,
    uint64_t chain_id);

}  // namespace CertenVault::Create2

#endif  // CERTENVAULT_CREATE2_H
