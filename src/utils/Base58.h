// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_BASE58_H
#define CERTENVAULT_BASE58_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "../core/VaultError.h"

namespace CertenVault::Base58 {

/// Bitcoin-alphabet Base58; leading zero bytes become leading '1's
[[nodiscard]] std::string encode(std::span<const uint8_t> data);

/// @return Decoded bytes, or VaultError::InvalidAddress on a character outside the alphabet
[[nodiscard]] VaultResult<std::vector<uint8_t>> decode(std::string_view text);

/// Base58 of payload || first 4 bytes of SHA256(SHA256(payload))
[[nodiscard]] std::string encode_check(std::span<const uint8_t> payload);

/// @return Payload without checksum, or VaultError::InvalidAddress on a bad checksum
[[nodiscard]] VaultResult<std::vector<uint8_t>> decode_check(std::string_view text);

}  // namespace CertenVault::Base58

#endif  // CERTENVAULT_BASE58_H
