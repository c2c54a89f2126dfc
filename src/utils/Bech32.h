// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_BECH32_H
#define CERTENVAULT_BECH32_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "../core/VaultError.h"

namespace CertenVault::Bech32 {

/// Human-readable part and 8-bit payload of a decoded address
struct Decoded {
    std::string hrp;
    std::vector<uint8_t> data;
};

/**
 * @brief BIP-173 Bech32 encoding of an 8-bit payload
 *
 * The payload is regrouped into 5-bit words before the checksum is
 * computed. The HRP must be lowercase.
 */
[[nodiscard]] std::string encode(std::string_view hrp, std::span<const uint8_t> data);

/**
 * @brief Decode and verify a Bech32 string
 *
 * Rejects mixed case, a missing separator, characters outside the charset,
 * a bad checksum and non-zero padding (all VaultError::InvalidAddress).
 */
[[nodiscard]] VaultResult<Decoded> decode(std::string_view text);

}  // namespace CertenVault::Bech32

#endif  // CERTENVAULT_BECH32_H
