// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_HD_DERIVATION_H
#define CERTENVAULT_HD_DERIVATION_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <glibmm/ustring.h>
#include "../VaultError.h"
#include "../curves/KeyType.h"

namespace CertenVault {

/// One level of a derivation path such as 44'
struct PathSegment {
    uint32_t index = 0;
    bool hardened = false;

    bool operator==(const PathSegment&) const = default;
};

/// Result of deriving a key from a mnemonic
struct DerivedKey {
    KeyPair key_pair;
    std::string path;
    uint32_t index = 0;
};

/**
 * @brief Hierarchical deterministic derivation for every supported curve
 *
 * - Ed25519: SLIP-0010, hardened segments only,
 *   path m/44'/540'/{account}'/0'/{index}'
 * - secp256k1: BIP-32, path m/44'/60'/{account}'/0/{index}
 * - BLS12-381: EIP-2333 tree with EIP-2334 path m/12381/60/{account}/0/{index}
 *
 * All functions are stateless. Seeds and intermediate chain codes are
 * held in SecureVector and wiped on destruction.
 */
class HdDerivation {
public:
    static constexpr uint32_t HARDENED_OFFSET = 0x80000000U;

    static constexpr std::string_view DEFAULT_ACCUMULATE_PATH = "m/44'/540'/0'/0'";
    static constexpr std::string_view DEFAULT_ETHEREUM_PATH = "m/44'/60'/0'/0";

    /**
     * @brief Parse "m/a/b'/c" style paths
     *
     * Hardened segments are marked with ' or h. Each index must be below
     * 2^31. "m" alone yields an empty segment list.
     *
     * @return Segments, or VaultError::InvalidDerivationPath
     */
    [[nodiscard]] static VaultResult<std::vector<PathSegment>> parse_path(std::string_view path);

    /// Path of key @p index under @p account for the curve's standard scheme
    [[nodiscard]] static std::string build_path(KeyType type, uint32_t account, uint32_t index);

    /// Prefix shared by every key of @p account (build_path without the last segment)
    [[nodiscard]] static std::string path_prefix(KeyType type, uint32_t account);

    /// SLIP-0010 Ed25519; VaultError::InvalidDerivationPath on a non-hardened segment
    [[nodiscard]] static VaultResult<KeyPair> derive_ed25519(
        std::span<const uint8_t> seed, std::string_view path);

    /// BIP-32 secp256k1
    [[nodiscard]] static VaultResult<KeyPair> derive_secp256k1(
        std::span<const uint8_t> seed, std::string_view path);

    /**
     * @brief EIP-2333 BLS12-381
     * @return VaultError::UnsupportedKeyType when built without blst,
     *         VaultError::InvalidDerivationPath on a hardened segment
     */
    [[nodiscard]] static VaultResult<KeyPair> derive_bls(
        std::span<const uint8_t> seed, std::string_view path);

    /// Dispatch to the curve-specific derivation
    [[nodiscard]] static VaultResult<KeyPair> derive_path(
        KeyType type, std::span<const uint8_t> seed, std::string_view path);

    /**
     * @brief Validate @p mnemonic, compute its seed and derive one key
     * @return VaultError::InvalidMnemonic when the phrase fails validation
     */
    [[nodiscard]] static VaultResult<DerivedKey> derive_from_mnemonic(
        KeyType type,
        std::string_view mnemonic,
        uint32_t account = 0,
        uint32_t index = 0,
        const Glib::ustring& passphrase = "");

    /**
     * @brief Next unused trailing index among paths starting with @p prefix
     *
     * Paths that do not start with the prefix, or whose last segment is not
     * numeric, are ignored.
     *
     * @return Highest trailing index plus one, or 0 when none match
     */
    [[nodiscard]] static uint32_t next_derivation_index(
        std::span<const std::string> existing_paths,
        std::string_view prefix);

    HdDerivation() = delete;
    ~HdDerivation() = delete;
    HdDerivation(const HdDerivation&) = delete;
    HdDerivation& operator=(const HdDerivation&) = delete;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_HD_DERIVATION_H
