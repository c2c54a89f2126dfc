// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "Secp256k1.h"
#include "../crypto/Hashes.h"
#include "../crypto/VaultCrypto.h"
#include "../../utils/Codec.h"
#include "../../utils/Log.h"
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <algorithm>

namespace CertenVault {

namespace {

/**
 * Process-wide context, blinded once with a random seed.
 *
 * libsecp256k1 contexts are safe to share across threads for signing and
 * verification once created.
 */
const secp256k1_context* context() {
    static secp256k1_context* ctx = [] {
        secp256k1_context* created =
            secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
        auto seed = VaultCrypto::generate_random_bytes(32);
        if (secp256k1_context_randomize(created, seed.data()) != 1) {
            Log::warning("Secp256k1: context randomization failed");
        }
        secure_clear(seed);
        return created;
    }();
    return ctx;
}

/// Parse 33-, 65- or bare 64-byte (X||Y) encodings
bool parse_public_key(std::span<const uint8_t> public_key, secp256k1_pubkey& out) {
    if (public_key.size() == 64) {
        std::array<uint8_t, Secp256k1::UNCOMPRESSED_PUBLIC_KEY_LENGTH> prefixed{};
        prefixed[0] = 0x04;
        std::copy(public_key.begin(), public_key.end(), prefixed.begin() + 1);
        return secp256k1_ec_pubkey_parse(context(), &out, prefixed.data(), prefixed.size()) == 1;
    }
    if (public_key.size() != Secp256k1::COMPRESSED_PUBLIC_KEY_LENGTH &&
        public_key.size() != Secp256k1::UNCOMPRESSED_PUBLIC_KEY_LENGTH) {
        return false;
    }
    return secp256k1_ec_pubkey_parse(context(), &out, public_key.data(), public_key.size()) == 1;
}

std::vector<uint8_t> serialize_public_key(const secp256k1_pubkey& key, bool compressed) {
    std::vector<uint8_t> out(compressed ? Secp256k1::COMPRESSED_PUBLIC_KEY_LENGTH
                                        : Secp256k1::UNCOMPRESSED_PUBLIC_KEY_LENGTH);
    size_t length = out.size();
    secp256k1_ec_pubkey_serialize(context(), out.data(), &length, &key,
                                  compressed ? SECP256K1_EC_COMPRESSED : SECP256K1_EC_UNCOMPRESSED);
    out.resize(length);
    return out;
}

}  // namespace

VaultResult<KeyPair> Secp256k1::generate() {
    // Probability of an out-of-range scalar is ~2^-128; loop anyway
    for (;;) {
        auto secret = VaultCrypto::generate_random_bytes(PRIVATE_KEY_LENGTH);
        auto pair = from_private_key(secret);
        secure_clear(secret);
        if (pair || pair.error() != VaultError::InvalidPrivateKey) {
            return pair;
        }
    }
}

VaultResult<KeyPair> Secp256k1::from_private_key(std::span<const uint8_t> private_key) {
    auto public_key = public_key_from_private(private_key, false);
    if (!public_key) {
        return std::unexpected(public_key.error());
    }

    KeyPair pair;
    pair.private_key.assign(private_key.begin(), private_key.end());
    pair.public_key = std::move(*public_key);
    return pair;
}

VaultResult<std::vector<uint8_t>> Secp256k1::public_key_from_private(
    std::span<const uint8_t> private_key, bool compressed) {

    if (private_key.size() != PRIVATE_KEY_LENGTH) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    if (secp256k1_ec_seckey_verify(context(), private_key.data()) != 1) {
        return std::unexpected(VaultError::InvalidPrivateKey);
    }

    secp256k1_pubkey key;
    if (secp256k1_ec_pubkey_create(context(), &key, private_key.data()) != 1) {
        return std::unexpected(VaultError::CryptoError);
    }
    return serialize_public_key(key, compressed);
}

VaultResult<std::vector<uint8_t>> Secp256k1::compress_public_key(std::span<const uint8_t> public_key) {
    secp256k1_pubkey key;
    if (!parse_public_key(public_key, key)) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    return serialize_public_key(key, true);
}

VaultResult<std::vector<uint8_t>> Secp256k1::decompress_public_key(std::span<const uint8_t> public_key) {
    secp256k1_pubkey key;
    if (!parse_public_key(public_key, key)) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    return serialize_public_key(key, false);
}

VaultResult<std::vector<uint8_t>> Secp256k1::sign(
    std::span<const uint8_t> hash,
    std::span<const uint8_t> private_key) {

    if (hash.size() != HASH_LENGTH) {
        return std::unexpected(VaultError::InvalidData);
    }
    if (private_key.size() != PRIVATE_KEY_LENGTH) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    if (secp256k1_ec_seckey_verify(context(), private_key.data()) != 1) {
        return std::unexpected(VaultError::InvalidPrivateKey);
    }

    // Default nonce function is RFC 6979 with HMAC-SHA256; output is always low-S
    secp256k1_ecdsa_recoverable_signature recoverable;
    if (secp256k1_ecdsa_sign_recoverable(context(), &recoverable, hash.data(), private_key.data(),
                                         secp256k1_nonce_function_rfc6979, nullptr) != 1) {
        Log::error("Secp256k1: signing failed");
        return std::unexpected(VaultError::SigningFailed);
    }

    std::vector<uint8_t> signature(SIGNATURE_LENGTH);
    int recovery_id = 0;
    secp256k1_ecdsa_recoverable_signature_serialize_compact(
        context(), signature.data(), &recovery_id, &recoverable);
    signature[64] = static_cast<uint8_t>(recovery_id + RECOVERY_ID_OFFSET);
    return signature;
}

bool Secp256k1::verify(
    std::span<const uint8_t> hash,
    std::span<const uint8_t> signature,
    std::span<const uint8_t> public_key) noexcept {

    if (hash.size() != HASH_LENGTH || signature.size() < 64) {
        return false;
    }

    secp256k1_pubkey key;
    if (!parse_public_key(public_key, key)) {
        return false;
    }
    secp256k1_ecdsa_signature parsed;
    if (secp256k1_ecdsa_signature_parse_compact(context(), &parsed, signature.data()) != 1) {
        return false;
    }
    // secp256k1_ecdsa_verify rejects high-S forms on its own
    return secp256k1_ecdsa_verify(context(), &parsed, hash.data(), &key) == 1;
}

VaultResult<std::vector<uint8_t>> Secp256k1::recover_public_key(
    std::span<const uint8_t> hash,
    std::span<const uint8_t> signature) {

    if (hash.size() != HASH_LENGTH || signature.size() != SIGNATURE_LENGTH) {
        return std::unexpected(VaultError::InvalidData);
    }
    const int v = signature[64];
    const int recovery_id = v >= RECOVERY_ID_OFFSET ? v - RECOVERY_ID_OFFSET : v;
    if (recovery_id < 0 || recovery_id > 3) {
        return std::unexpected(VaultError::InvalidData);
    }

    secp256k1_ecdsa_recoverable_signature recoverable;
    if (secp256k1_ecdsa_recoverable_signature_parse_compact(
            context(), &recoverable, signature.data(), recovery_id) != 1) {
        return std::unexpected(VaultError::InvalidData);
    }
    secp256k1_pubkey key;
    if (secp256k1_ecdsa_recover(context(), &key, &recoverable, hash.data()) != 1) {
        return std::unexpected(VaultError::InvalidData);
    }
    return serialize_public_key(key, false);
}

VaultResult<SecureVector<uint8_t>> Secp256k1::private_key_tweak_add(
    std::span<const uint8_t> private_key,
    std::span<const uint8_t> tweak) {

    if (private_key.size() != PRIVATE_KEY_LENGTH || tweak.size() != 32) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }

    SecureVector<uint8_t> out(private_key.begin(), private_key.end());
    if (secp256k1_ec_seckey_tweak_add(context(), out.data(), tweak.data()) != 1) {
        return std::unexpected(VaultError::InvalidPrivateKey);
    }
    return out;
}

VaultResult<std::string> Secp256k1::ethereum_address(std::span<const uint8_t> public_key) {
    std::vector<uint8_t> uncompressed;
    if (public_key.size() == UNCOMPRESSED_PUBLIC_KEY_LENGTH && public_key[0] == 0x04) {
        uncompressed.assign(public_key.begin() + 1, public_key.end());
    } else if (public_key.size() == 64) {
        uncompressed.assign(public_key.begin(), public_key.end());
    } else if (public_key.size() == COMPRESSED_PUBLIC_KEY_LENGTH) {
        auto expanded = decompress_public_key(public_key);
        if (!expanded) {
            return std::unexpected(expanded.error());
        }
        uncompressed.assign(expanded->begin() + 1, expanded->end());
    } else {
        return std::unexpected(VaultError::InvalidKeyLength);
    }

    const auto digest = Hashes::keccak256(uncompressed);
    return "0x" + Codec::to_hex(std::span(digest).last(20));
}

std::array<uint8_t, 32> Secp256k1::hash_personal_message(std::span<const uint8_t> message) {
    const std::string prefix = "\x19" "Ethereum Signed Message:\n" + std::to_string(message.size());
    std::vector<uint8_t> data(prefix.begin(), prefix.end());
    data.insert(data.end(), message.begin(), message.end());
    return Hashes::keccak256(data);
}

VaultResult<std::vector<uint8_t>> Secp256k1::sign_personal_message(
    std::span<const uint8_t> message,
    std::span<const uint8_t> private_key) {
    const auto digest = hash_personal_message(message);
    return sign(digest, private_key);
}

}  // namespace CertenVault
