// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_MNEMONIC_H
#define CERTENVAULT_MNEMONIC_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <glibmm/ustring.h>
#include "../VaultError.h"
#include "../../utils/SecureMemory.h"

namespace CertenVault {

/**
 * @brief BIP-39 mnemonic phrases (English wordlist)
 *
 * Phrases are handled in canonical form: words separated by a single
 * space. normalize() produces that form from user input. Case is kept as
 * given, so a phrase with uppercase letters fails validation.
 *
 * @note The 2048-iteration PBKDF2 used by to_seed() is fixed by BIP-39 and
 *       is unrelated to the vault password KDF.
 */
class Mnemonic {
public:
    static constexpr int DEFAULT_STRENGTH = 128;      ///< 12 words
    static constexpr int SEED_ITERATIONS = 2048;
    static constexpr size_t SEED_LENGTH = 64;

    /**
     * @brief Generate a random phrase
     * @param strength Entropy bits: 128, 160, 192, 224 or 256 (12 to 24 words)
     * @return Phrase, or VaultError::InvalidData for an unsupported strength
     */
    [[nodiscard]] static VaultResult<std::string> generate(int strength = DEFAULT_STRENGTH);

    /// Phrase for the given entropy (16 to 32 bytes, multiple of 4)
    [[nodiscard]] static VaultResult<std::string> from_entropy(std::span<const uint8_t> entropy);

    /// Wordlist membership, word count and checksum
    [[nodiscard]] static bool validate(std::string_view phrase);

    /// Trimmed, single-space separated copy of @p phrase
    [[nodiscard]] static std::string normalize(std::string_view phrase);

    /**
     * @brief BIP-39 seed: PBKDF2-HMAC-SHA512(NFKD(phrase), "mnemonic" + NFKD(passphrase), 2048)
     * @return 64-byte seed, or VaultError::InvalidMnemonic if validate() fails
     */
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> to_seed(
        std::string_view phrase,
        const Glib::ustring& passphrase = "");

    /// Index of @p word in the English wordlist, or -1
    [[nodiscard]] static int word_index(std::string_view word) noexcept;

    Mnemonic() = delete;
    ~Mnemonic() = delete;
    Mnemonic(const Mnemonic&) = delete;
    Mnemonic& operator=(const Mnemonic&) = delete;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_MNEMONIC_H
