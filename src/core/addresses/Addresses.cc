// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "Addresses.h"
#include "../crypto/Hashes.h"
#include "../curves/Secp256k1.h"
#include "../../utils/Base58.h"
#include "../../utils/Bech32.h"
#include "../../utils/Codec.h"
#include <algorithm>
#include <cctype>
#include <vector>

namespace CertenVault::Addresses {

namespace {

constexpr size_t ED25519_KEY_LENGTH = 32;
constexpr size_t ADDRESS_HASH_LENGTH = 20;

bool is_ed25519_key(std::span<const uint8_t> public_key) noexcept {
    return public_key.size() == ED25519_KEY_LENGTH;
}

VaultResult<std::vector<uint8_t>> compressed_key(std::span<const uint8_t> public_key) {
    if (public_key.size() == Secp256k1::COMPRESSED_PUBLIC_KEY_LENGTH) {
        return std::vector<uint8_t>(public_key.begin(), public_key.end());
    }
    if (public_key.size() == Secp256k1::UNCOMPRESSED_PUBLIC_KEY_LENGTH) {
        return Secp256k1::compress_public_key(public_key);
    }
    return std::unexpected(VaultError::InvalidKeyLength);
}

VaultResult<std::vector<uint8_t>> uncompressed_key(std::span<const uint8_t> public_key) {
    if (public_key.size() == Secp256k1::UNCOMPRESSED_PUBLIC_KEY_LENGTH) {
        return std::vector<uint8_t>(public_key.begin(), public_key.end());
    }
    if (public_key.size() == Secp256k1::COMPRESSED_PUBLIC_KEY_LENGTH) {
        return Secp256k1::decompress_public_key(public_key);
    }
    return std::unexpected(VaultError::InvalidKeyLength);
}

}  // namespace

std::optional<std::string_view> cosmos_prefix_for_chain(std::string_view chain) noexcept {
    for (const auto& [name, prefix] : COSMOS_CHAIN_PREFIXES) {
        if (name == chain) {
            return prefix;
        }
    }
    return std::nullopt;
}

// ============================================================================
// EVM
// ============================================================================

VaultResult<std::string> ethereum_address(std::span<const uint8_t> public_key) {
    auto lower = Secp256k1::ethereum_address(public_key);
    if (!lower) {
        return std::unexpected(lower.error());
    }
    return to_checksum_address(*lower);
}

bool is_valid_evm_address(std::string_view address) noexcept {
    if (address.size() != 42 || address[0] != '0' || (address[1] != 'x' && address[1] != 'X')) {
        return false;
    }
    return std::all_of(address.begin() + 2, address.end(),
                       [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

VaultResult<std::string> to_checksum_address(std::string_view address) {
    if (!is_valid_evm_address(address)) {
        return std::unexpected(VaultError::InvalidAddress);
    }

    // EIP-55: uppercase each letter whose nibble in keccak(lower hex) is >= 8
    const std::string lower = Codec::to_lower_ascii(address.substr(2));
    const std::string hash_hex = Codec::to_hex(Hashes::keccak256(Codec::as_bytes(lower)));

    std::string result = "0x";
    result.reserve(42);
    for (size_t i = 0; i < lower.size(); ++i) {
        const char c = lower[i];
        const bool upper = std::isalpha(static_cast<unsigned char>(c)) &&
                           hash_hex[i] >= '8';
        result.push_back(upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
    }
    return result;
}

// ============================================================================
// Ed25519 chains
// ============================================================================

VaultResult<std::string> solana_address(std::span<const uint8_t> public_key) {
    if (!is_ed25519_key(public_key)) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    return Base58::encode(public_key);
}

VaultResult<std::string> aptos_address(std::span<const uint8_t> public_key) {
    if (!is_ed25519_key(public_key)) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    std::vector<uint8_t> input(public_key.begin(), public_key.end());
    input.push_back(0x00);
    return "0x" + Codec::to_hex(Hashes::sha3_256(input));
}

VaultResult<std::string> sui_address(std::span<const uint8_t> public_key) {
    if (!is_ed25519_key(public_key)) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    std::vector<uint8_t> input{0x00};
    input.insert(input.end(), public_key.begin(), public_key.end());
    return "0x" + Codec::to_hex(Hashes::blake2b_256(input));
}

VaultResult<std::string> ton_address(std::span<const uint8_t> public_key) {
    if (!is_ed25519_key(public_key)) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    return "0:" + Codec::to_hex(Hashes::sha256(public_key));
}

VaultResult<std::string> near_address(std::span<const uint8_t> public_key) {
    if (!is_ed25519_key(public_key)) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    return Codec::to_hex(public_key);
}

VaultResult<std::map<std::string, std::string>> ed25519_chain_addresses(
    std::span<const uint8_t> public_key) {
    if (!is_ed25519_key(public_key)) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    return std::map<std::string, std::string>{
        {"solana", *solana_address(public_key)},
        {"aptos", *aptos_address(public_key)},
        {"sui", *sui_address(public_key)},
        {"ton", *ton_address(public_key)},
        {"near", *near_address(public_key)},
    };
}

// ============================================================================
// secp256k1 chains
// ============================================================================

VaultResult<std::string> cosmos_address(std::span<const uint8_t> public_key, std::string_view prefix) {
    auto compressed = compressed_key(public_key);
    if (!compressed) {
        return std::unexpected(compressed.error());
    }
    if (prefix.empty()) {
        return std::unexpected(VaultError::InvalidAddress);
    }
    return Bech32::encode(prefix, Hashes::hash160(*compressed));
}

VaultResult<std::map<std::string, std::string>> cosmos_addresses(std::span<const uint8_t> public_key) {
    auto compressed = compressed_key(public_key);
    if (!compressed) {
        return std::unexpected(compressed.error());
    }
    const auto account_hash = Hashes::hash160(*compressed);

    std::map<std::string, std::string> out;
    for (const auto& [chain, prefix] : COSMOS_CHAIN_PREFIXES) {
        out.emplace(std::string(chain), Bech32::encode(prefix, account_hash));
    }
    return out;
}

VaultResult<std::string> tron_address(std::span<const uint8_t> public_key) {
    auto uncompressed = uncompressed_key(public_key);
    if (!uncompressed) {
        return std::unexpected(uncompressed.error());
    }

    const auto digest = Hashes::keccak256(std::span<const uint8_t>(*uncompressed).subspan(1));
    std::vector<uint8_t> payload{TRON_ADDRESS_PREFIX};
    payload.insert(payload.end(), digest.end() - ADDRESS_HASH_LENGTH, digest.end());
    return Base58::encode_check(payload);
}

VaultResult<std::map<std::string, std::string>> secp256k1_chain_addresses(
    std::span<const uint8_t> public_key) {
    auto addresses = cosmos_addresses(public_key);
    if (!addresses) {
        return std::unexpected(addresses.error());
    }
    auto tron = tron_address(public_key);
    if (!tron) {
        return std::unexpected(tron.error());
    }
    addresses->emplace("tron", std::move(*tron));
    return addresses;
}

// ============================================================================
// Validation
// ============================================================================

bool is_valid_cosmos_address(std::string_view address, std::optional<std::string_view> expected_prefix) {
    auto decoded = Bech32::decode(address);
    if (!decoded || decoded->data.size() != ADDRESS_HASH_LENGTH) {
        return false;
    }
    return !expected_prefix || decoded->hrp == *expected_prefix;
}

std::optional<std::string> cosmos_address_prefix(std::string_view address) {
    auto decoded = Bech32::decode(address);
    if (!decoded) {
        return std::nullopt;
    }
    return decoded->hrp;
}

bool is_valid_solana_address(std::string_view address) {
    auto decoded = Base58::decode(address);
    return decoded && decoded->size() == ED25519_KEY_LENGTH;
}

bool is_valid_tron_address(std::string_view address) {
    if (!address.starts_with('T')) {
        return false;
    }
    auto payload = Base58::decode_check(address);
    return payload && payload->size() == ADDRESS_HASH_LENGTH + 1 &&
           (*payload)[0] == TRON_ADDRESS_PREFIX;
}

}  // namespace CertenVault::Addresses
