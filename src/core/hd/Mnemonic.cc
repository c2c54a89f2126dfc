// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "Mnemonic.h"
#include "Bip39Wordlist.h"
#include "../crypto/Hashes.h"
#include "../crypto/VaultCrypto.h"
#include <openssl/evp.h>
#include <algorithm>
#include <sstream>

namespace CertenVault {

namespace {

std::vector<std::string> split_words(std::string_view phrase) {
    std::vector<std::string> words;
    std::istringstream stream{std::string(phrase)};
    std::string word;
    while (stream >> word) {
        words.push_back(std::move(word));
    }
    return words;
}

bool get_bit(std::span<const uint8_t> data, size_t bit) noexcept {
    return (data[bit / 8] >> (7 - bit % 8)) & 1;
}

void set_bit(std::span<uint8_t> data, size_t bit) noexcept {
    data[bit / 8] = static_cast<uint8_t>(data[bit / 8] | (1 << (7 - bit % 8)));
}

}  // namespace

int Mnemonic::word_index(std::string_view word) noexcept {
    const auto it = std::ranges::lower_bound(BIP39_ENGLISH_WORDLIST, word);
    if (it == BIP39_ENGLISH_WORDLIST.end() || *it != word) {
        return -1;
    }
    return static_cast<int>(it - BIP39_ENGLISH_WORDLIST.begin());
}

VaultResult<std::string> Mnemonic::generate(int strength) {
    if (strength < 128 || strength > 256 || strength % 32 != 0) {
        return std::unexpected(VaultError::InvalidData);
    }
    auto entropy = VaultCrypto::generate_random_bytes(static_cast<size_t>(strength / 8));
    auto phrase = from_entropy(entropy);
    secure_clear(entropy);
    return phrase;
}

VaultResult<std::string> Mnemonic::from_entropy(std::span<const uint8_t> entropy) {
    if (entropy.size() < 16 || entropy.size() > 32 || entropy.size() % 4 != 0) {
        return std::unexpected(VaultError::InvalidData);
    }

    // Entropy bits followed by the first ENT/32 bits of SHA-256(entropy)
    const auto checksum = Hashes::sha256(entropy);
    SecureVector<uint8_t> bits(entropy.begin(), entropy.end());
    bits.push_back(checksum[0]);

    const size_t total_bits = entropy.size() * 8 + entropy.size() / 4;
    const size_t word_count = total_bits / 11;

    std::string phrase;
    for (size_t w = 0; w < word_count; ++w) {
        size_t index = 0;
        for (size_t b = 0; b < 11; ++b) {
            index = (index << 1) | (get_bit(bits, w * 11 + b) ? 1 : 0);
        }
        if (w > 0) {
            phrase.push_back(' ');
        }
        phrase.append(BIP39_ENGLISH_WORDLIST[index]);
    }
    return phrase;
}

bool Mnemonic::validate(std::string_view phrase) {
    const auto words = split_words(phrase);
    if (words.size() < 12 || words.size() > 24 || words.size() % 3 != 0) {
        return false;
    }

    const size_t total_bits = words.size() * 11;
    const size_t checksum_bits = total_bits / 33;
    const size_t entropy_bits = total_bits - checksum_bits;

    SecureVector<uint8_t> bits((total_bits + 7) / 8, 0);
    for (size_t w = 0; w < words.size(); ++w) {
        const int index = word_index(words[w]);
        if (index < 0) {
            return false;
        }
        for (size_t b = 0; b < 11; ++b) {
            if ((index >> (10 - b)) & 1) {
                set_bit(bits, w * 11 + b);
            }
        }
    }

    const std::span<const uint8_t> entropy(bits.data(), entropy_bits / 8);
    const auto checksum = Hashes::sha256(entropy);
    for (size_t b = 0; b < checksum_bits; ++b) {
        if (get_bit(bits, entropy_bits + b) != get_bit(checksum, b)) {
            return false;
        }
    }
    return true;
}

std::string Mnemonic::normalize(std::string_view phrase) {
    const auto words = split_words(phrase);
    std::string out;
    for (const auto& word : words) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out.append(word);
    }
    return out;
}

VaultResult<SecureVector<uint8_t>> Mnemonic::to_seed(
    std::string_view phrase,
    const Glib::ustring& passphrase) {

    if (!validate(phrase)) {
        return std::unexpected(VaultError::InvalidMnemonic);
    }

    Glib::ustring password = Glib::ustring(normalize(phrase)).normalize(Glib::NormalizeMode::NFKD);
    Glib::ustring salt = Glib::ustring("mnemonic" + passphrase).normalize(Glib::NormalizeMode::NFKD);

    SecureVector<uint8_t> seed(SEED_LENGTH);
    const int ok = PKCS5_PBKDF2_HMAC(
        password.c_str(), static_cast<int>(password.bytes()),
        reinterpret_cast<const unsigned char*>(salt.c_str()), static_cast<int>(salt.bytes()),
        SEED_ITERATIONS, EVP_sha512(),
        static_cast<int>(SEED_LENGTH), seed.data());

    secure_clear_ustring(password);
    secure_clear_ustring(salt);

    if (ok != 1) {
        return std::unexpected(VaultError::KeyDerivationFailed);
    }
    return seed;
}

}  // namespace CertenVault
