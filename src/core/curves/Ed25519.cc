// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "Ed25519.h"
#include "../crypto/Hashes.h"
#include "../crypto/VaultCrypto.h"
#include "../../utils/Codec.h"
#include <openssl/evp.h>

namespace CertenVault {

namespace {

EVPPkeyPtr load_private(std::span<const uint8_t> seed) {
    return EVPPkeyPtr(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                   seed.data(), seed.size()));
}

}  // namespace

VaultResult<KeyPair> Ed25519::generate() {
    auto seed = VaultCrypto::generate_random_bytes(SEED_LENGTH);
    auto pair = from_seed(seed);
    secure_clear(seed);
    return pair;
}

VaultResult<KeyPair> Ed25519::from_seed(std::span<const uint8_t> seed) {
    if (seed.size() != SEED_LENGTH) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }

    EVPPkeyPtr pkey = load_private(seed);
    if (!pkey) {
        return std::unexpected(VaultError::CryptoError);
    }

    KeyPair pair;
    pair.public_key.resize(PUBLIC_KEY_LENGTH);
    size_t pub_len = PUBLIC_KEY_LENGTH;
    if (EVP_PKEY_get_raw_public_key(pkey.get(), pair.public_key.data(), &pub_len) != 1 ||
        pub_len != PUBLIC_KEY_LENGTH) {
        return std::unexpected(VaultError::CryptoError);
    }

    pair.private_key.reserve(PRIVATE_KEY_LENGTH);
    pair.private_key.assign(seed.begin(), seed.end());
    pair.private_key.insert(pair.private_key.end(), pair.public_key.begin(), pair.public_key.end());
    return pair;
}

VaultResult<KeyPair> Ed25519::from_private_key(std::span<const uint8_t> private_key) {
    if (private_key.size() != SEED_LENGTH && private_key.size() != PRIVATE_KEY_LENGTH) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    return from_seed(private_key.first(SEED_LENGTH));
}

VaultResult<std::vector<uint8_t>> Ed25519::sign(
    std::span<const uint8_t> message,
    std::span<const uint8_t> private_key) {

    if (private_key.size() != SEED_LENGTH && private_key.size() != PRIVATE_KEY_LENGTH) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }

    EVPPkeyPtr pkey = load_private(private_key.first(SEED_LENGTH));
    EVPMdContextPtr ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx) {
        return std::unexpected(VaultError::SigningFailed);
    }

    // Ed25519 is a one-shot scheme: no digest, no update calls
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return std::unexpected(VaultError::SigningFailed);
    }

    std::vector<uint8_t> signature(SIGNATURE_LENGTH);
    size_t sig_len = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &sig_len, message.data(), message.size()) != 1 ||
        sig_len != SIGNATURE_LENGTH) {
        return std::unexpected(VaultError::SigningFailed);
    }
    return signature;
}

bool Ed25519::verify(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature,
    std::span<const uint8_t> public_key) noexcept {

    if (signature.size() != SIGNATURE_LENGTH || public_key.size() != PUBLIC_KEY_LENGTH) {
        return false;
    }

    EVPPkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                                public_key.data(), public_key.size()));
    EVPMdContextPtr ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            message.data(), message.size()) == 1;
}

VaultResult<std::string> Ed25519::lite_account_url(std::span<const uint8_t> public_key) {
    if (public_key.size() != PUBLIC_KEY_LENGTH) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }

    const auto key_hash = Hashes::sha256(public_key);
    const std::string key_hex = Codec::to_hex(std::span(key_hash).first(20));

    // Checksum is over the ASCII hex text, not the raw bytes
    const auto checksum = Hashes::sha256(Codec::as_bytes(key_hex));
    const std::string checksum_hex = Codec::to_hex(std::span(checksum).last(4));

    return "acc://" + key_hex + checksum_hex;
}

std::string Ed25519::public_key_hash(std::span<const uint8_t> public_key) {
    return Codec::to_hex(Hashes::sha256(public_key));
}

}  // namespace CertenVault
