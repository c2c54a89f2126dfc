// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "Create2.h"
#include "Addresses.h"
#include "../../utils/Codec.h"
#include <array>
#include <vector>

namespace CertenVault::Create2 {

namespace {

constexpr std::string_view PROXY_PREFIX = "3d602d80600a3d3981f3363d3d373d3d3d363d73";
constexpr std::string_view PROXY_SUFFIX = "5af43d82803e903d91602b57fd5bf3";

VaultResult<std::vector<uint8_t>> decode_address(std::string_view address) {
    if (!Addresses::is_valid_evm_address(address)) {
        return std::unexpected(VaultError::InvalidAddress);
    }
    return Codec::from_hex(address);
}

VaultResult<std::vector<uint8_t>> decode_word(std::string_view hex) {
    auto bytes = Codec::from_hex(hex);
    if (!bytes) {
        return bytes;
    }
    if (bytes->size() != 32) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    return bytes;
}

}  // namespace

VaultResult<std::string> compute_address(
    std::string_view factory,
    std::string_view salt,
    std::string_view init_code_hash) {

    auto factory_bytes = decode_address(factory);
    if (!factory_bytes) {
        return std::unexpected(factory_bytes.error());
    }
    auto salt_bytes = decode_word(salt);
    if (!salt_bytes) {
        return std::unexpected(salt_bytes.error());
    }
    auto hash_bytes = decode_word(init_code_hash);
    if (!hash_bytes) {
        return std::unexpected(hash_bytes.error());
    }

    std::vector<uint8_t> data;
    data.reserve(1 + 20 + 32 + 32);
    data.push_back(0xff);
    data.insert(data.end(), factory_bytes->begin(), factory_bytes->end());
    data.insert(data.end(), salt_bytes->begin(), salt_bytes->end());
    data.insert(data.end(), hash_bytes->begin(), hash_bytes->end());

    const auto digest = Hashes::keccak256(data);
    return Addresses::to_checksum_address("0x" + Codec::to_hex(std::span(digest).last(20)));
}

VaultResult<Hashes::Digest32> hash_init_code(std::string_view init_code_hex) {
    auto code = Codec::from_hex(init_code_hex);
    if (!code) {
        return std::unexpected(code.error());
    }
    return Hashes::keccak256(*code);
}

VaultResult<Hashes::Digest32> account_salt(
    std::string_view adi_url,
    std::span<const uint8_t> owner_public_key,
    uint64_t chain_id) {

    if (owner_public_key.empty()) {
        return std::unexpected(VaultError::EmptyInput);
    }

    std::string normalized = Codec::to_lower_ascii(adi_url);
    if (normalized.ends_with('/')) {
        normalized.pop_back();
    }

    std::vector<uint8_t> input(normalized.begin(), normalized.end());
    input.insert(input.end(), owner_public_key.begin(), owner_public_key.end());

    // uint256 big-endian
    std::array<uint8_t, 32> chain_word{};
    for (int i = 31; i >= 24; --i) {
        chain_word[static_cast<size_t>(i)] = static_cast<uint8_t>(chain_id & 0xff);
        chain_id >>= 8;
    }
    input.insert(input.end(), chain_word.begin(), chain_word.end());

    return Hashes::keccak256(input);
}

VaultResult<Hashes::Digest32> minimal_proxy_init_code_hash(std::string_view implementation) {
    if (!Addresses::is_valid_evm_address(implementation)) {
        return std::unexpected(VaultError::InvalidAddress);
    }
    std::string creation_code(PROXY_PREFIX);
    creation_code.append(Codec::to_lower_ascii(Codec::strip_hex_prefix(implementation)));
    creation_code.append(PROXY_SUFFIX);
    return hash_init_code(creation_code);
}

VaultResult<std::string> predict_account_address(
    std::string_view factory,
    std::string_view implementation,
    std::string_view adi_url,
    std::span<const uint8_t> owner_public_key,
    uint64_t chain_id) {

    auto salt = account_salt(adi_url, owner_public_key, chain_id);
    if (!salt) {
        return std::unexpected(salt.error());
    }
    auto init_hash = minimal_proxy_init_code_hash(implementation);
    if (!init_hash) {
        return std::unexpected(init_hash.error());
    }
    return compute_address(factory, Codec::to_hex(*salt), Codec::to_hex(*init_hash));
}

}  // namespace CertenVault::Create2
