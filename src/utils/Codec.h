// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file Codec.h
 * @brief Hex and Base64 conversions used across the vault
 */

#ifndef CERTENVAULT_CODEC_H
#define CERTENVAULT_CODEC_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "../core/VaultError.h"

namespace CertenVault::Codec {

/**
 * @brief Encode bytes as lowercase hex without prefix
 */
[[nodiscard]] std::string to_hex(std::span<const uint8_t> bytes);

/**
 * @brief Decode a hex string
 *
 * Accepts an optional "0x"/"0X" prefix and either letter case.
 *
 * @return Decoded bytes, or VaultError::InvalidHex for odd length or
 *         non-hex characters
 */
[[nodiscard]] VaultResult<std::vector<uint8_t>> from_hex(std::string_view hex);

/// Strip a leading "0x"/"0X" if present
[[nodiscard]] std::string_view strip_hex_prefix(std::string_view hex) noexcept;

/// True if @p hex (after an optional prefix) is non-empty, even-length hex
[[nodiscard]] bool is_hex(std::string_view hex) noexcept;

/**
 * @brief Standard Base64 with padding (OpenSSL EVP_EncodeBlock)
 */
[[nodiscard]] std::string to_base64(std::span<const uint8_t> bytes);

/**
 * @brief Decode standard padded Base64
 * @return Decoded bytes, or VaultError::InvalidData on malformed input
 */
[[nodiscard]] VaultResult<std::vector<uint8_t>> from_base64(std::string_view text);

/// View the UTF-8 bytes of a string without copying
[[nodiscard]] inline std::span<const uint8_t> as_bytes(std::string_view text) noexcept {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

/// ASCII lowercase copy (addresses and URLs only; not Unicode-aware)
[[nodiscard]] std::string to_lower_ascii(std::string_view text);

/// Case-insensitive ASCII comparison
[[nodiscard]] bool iequals_ascii(std::string_view a, std::string_view b) noexcept;

}  // namespace CertenVault::Codec

#endif  // CERTENVAULT_CODEC_H
