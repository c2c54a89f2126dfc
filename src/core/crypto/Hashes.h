// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file Hashes.h
 * @brief Digest and MAC primitives shared by the curve, HD and address code
 *
 * SHA-2, SHA3-256, RIPEMD-160 and HMAC are routed through OpenSSL EVP.
 * Keccak-256 (Ethereum padding) and BLAKE2b-256 are implemented in
 * Keccak.cc and Blake2b.cc because OpenSSL 3.0 exposes neither with the
 * parameters these chains use.
 */

#ifndef CERTENVAULT_HASHES_H
#define CERTENVAULT_HASHES_H

#include <array>
#include <cstdint>
#include <span>

namespace CertenVault::Hashes {

using Digest20 = std::array<uint8_t, 20>;
using Digest32 = std::array<uint8_t, 32>;
using Digest64 = std::array<uint8_t, 64>;

[[nodiscard]] Digest32 sha256(std::span<const uint8_t> data);
[[nodiscard]] Digest32 double_sha256(std::span<const uint8_t> data);
[[nodiscard]] Digest64 sha512(std::span<const uint8_t> data);
[[nodiscard]] Digest32 sha3_256(std::span<const uint8_t> data);
[[nodiscard]] Digest20 ripemd160(std::span<const uint8_t> data);

/// RIPEMD160(SHA256(data)), the Cosmos account hash
[[nodiscard]] Digest20 hash160(std::span<const uint8_t> data);

[[nodiscard]] Digest32 hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data);
[[nodiscard]] Digest64 hmac_sha512(std::span<const uint8_t> key, std::span<const uint8_t> data);

/**
 * @brief Original Keccak-256 (multi-rate padding 0x01), as used by Ethereum
 *
 * Differs from FIPS-202 SHA3-256 only in the domain padding byte.
 */
[[nodiscard]] Digest32 keccak256(std::span<const uint8_t> data);

/**
 * @brief BLAKE2b with a 32-byte digest and no key (RFC 7693)
 */
[[nodiscard]] Digest32 blake2b_256(std::span<const uint8_t> data);

}  // namespace CertenVault::Hashes

#endif  // CERTENVAULT_HASHES_H
