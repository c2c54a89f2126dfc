// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file Addresses.h
 * @brief Chain address derivation and validation from raw public keys
 *
 * Ed25519 keys map to Solana, Aptos, Sui, TON and NEAR addresses.
 * secp256k1 keys map to Ethereum (EIP-55), TRON and the Cosmos-SDK chains.
 *
 * Functions taking a key return VaultError::InvalidKeyLength when the key
 * has the wrong size for the chain. Validators never fail; they return false.
 */

#ifndef CERTENVAULT_ADDRESSES_H
#define CERTENVAULT_ADDRESSES_H

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include "../VaultError.h"

namespace CertenVault::Addresses {

inline constexpr uint8_t TRON_ADDRESS_PREFIX = 0x41;

/// Chain name to Bech32 human-readable prefix
inline constexpr std::array<std::pair<std::string_view, std::string_view>, 14> COSMOS_CHAIN_PREFIXES{{
    {"cosmos", "cosmos"},
    {"osmosis", "osmo"},
    {"neutron", "neutron"},
    {"injective", "inj"},
    {"celestia", "celestia"},
    {"stargaze", "stars"},
    {"juno", "juno"},
    {"akash", "akash"},
    {"terra", "terra"},
    {"evmos", "evmos"},
    {"dydx", "dydx"},
    {"sei", "sei"},
    {"noble", "noble"},
    {"kujira", "kujira"},
}};

[[nodiscard]] std::optional<std::string_view> cosmos_prefix_for_chain(std::string_view chain) noexcept;

// ----------------------------------------------------------------------------
// EVM
// ----------------------------------------------------------------------------

/// EIP-55 checksummed address for a 65, 64 or 33-byte secp256k1 key
[[nodiscard]] VaultResult<std::string> ethereum_address(std::span<const uint8_t> public_key);

/**
 * @brief EIP-55 mixed-case form of a 0x-prefixed 40-hex-digit address
 * @return VaultError::InvalidAddress if @p address is not a well-formed EVM address
 */
[[nodiscard]] VaultResult<std::string> to_checksum_address(std::string_view address);

/// "0x" followed by exactly 40 hex digits; the checksum is not enforced
[[nodiscard]] bool is_valid_evm_address(std::string_view address) noexcept;

// ----------------------------------------------------------------------------
// Ed25519 chains
// ----------------------------------------------------------------------------

[[nodiscard]] VaultResult<std::string> solana_address(std::span<const uint8_t> public_key);

/// 0x + hex(SHA3-256(pubkey || 0x00)), the single-key authentication scheme
[[nodiscard]] VaultResult<std::string> aptos_address(std::span<const uint8_t> public_key);

/// 0x + hex(BLAKE2b-256(0x00 || pubkey))
[[nodiscard]] VaultResult<std::string> sui_address(std::span<const uint8_t> public_key);

/// Raw workchain-0 form "0:" + hex(SHA-256(pubkey))
[[nodiscard]] VaultResult<std::string> ton_address(std::span<const uint8_t> public_key);

/// Implicit account: hex(pubkey)
[[nodiscard]] VaultResult<std::string> near_address(std::span<const uint8_t> public_key);

/// solana, aptos, sui, ton and near addresses keyed by chain name
[[nodiscard]] VaultResult<std::map<std::string, std::string>> ed25519_chain_addresses(
    std::span<const uint8_t> public_key);

// ----------------------------------------------------------------------------
// secp256k1 chains
// ----------------------------------------------------------------------------

/// Bech32(prefix, RIPEMD160(SHA256(compressed pubkey))); accepts 33 or 65-byte keys
[[nodiscard]] VaultResult<std::string> cosmos_address(
    std::span<const uint8_t> public_key, std::string_view prefix);

/// One address per entry of COSMOS_CHAIN_PREFIXES, keyed by chain name
[[nodiscard]] VaultResult<std::map<std::string, std::string>> cosmos_addresses(
    std::span<const uint8_t> public_key);

/// Base58Check(0x41 || last 20 bytes of Keccak-256(X || Y)); accepts 33 or 65-byte keys
[[nodiscard]] VaultResult<std::string> tron_address(std::span<const uint8_t> public_key);

/// tron plus every Cosmos chain, keyed by chain name
[[nodiscard]] VaultResult<std::map<std::string, std::string>> secp256k1_chain_addresses(
    std::span<const uint8_t> public_key);

// ----------------------------------------------------------------------------
// Validation
// ----------------------------------------------------------------------------

/**
 * @brief Bech32 address carrying a 20-byte account hash
 * @param expected_prefix When set, the human-readable part must match it
 */
[[nodiscard]] bool is_valid_cosmos_address(
    std::string_view address,
    std::optional<std::string_view> expected_prefix = std::nullopt);

/// Human-readable part of a Bech32 address, or nullopt if it does not decode
[[nodiscard]] std::optional<std::string> cosmos_address_prefix(std::string_view address);

[[nodiscard]] bool is_valid_solana_address(std::string_view address);

/// 25-byte Base58Check payload starting with 0x41 (text starts with 'T')
[[nodiscard]] bool is_valid_tron_address(std::string_view address);

}  // namespace CertenVault::Addresses

#endif  // CERTENVAULT_ADDRESSES_H
