// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "Bls12381.h"
#include "../crypto/VaultCrypto.h"
#include <blst.h>
#include <memory>

namespace CertenVault {

namespace {

const byte* dst_bytes() {
    return reinterpret_cast<const byte*>(Bls12381::SIGNATURE_DST.data());
}

// Zeroizes the scalar when it leaves scope
class ScopedScalar {
public:
    ScopedScalar() = default;
    ~ScopedScalar() { OPENSSL_cleanse(&scalar_, sizeof(scalar_)); }
    ScopedScalar(const ScopedScalar&) = delete;
    ScopedScalar& operator=(const ScopedScalar&) = delete;

    blst_scalar* get() noexcept { return &scalar_; }
    const blst_scalar* get() const noexcept { return &scalar_; }

private:
    blst_scalar scalar_{};
};

bool load_secret(std::span<const uint8_t> private_key, ScopedScalar& out) {
    blst_scalar_from_bendian(out.get(), private_key.data());
    return blst_sk_check(out.get());
}

SecureVector<uint8_t> export_secret(const ScopedScalar& sk) {
    SecureVector<uint8_t> out(Bls12381::PRIVATE_KEY_LENGTH);
    blst_bendian_from_scalar(out.data(), sk.get());
    return out;
}

std::vector<uint8_t> public_key_of(const ScopedScalar& sk) {
    blst_p1 pk;
    blst_sk_to_pk_in_g1(&pk, sk.get());
    std::vector<uint8_t> out(Bls12381::PUBLIC_KEY_LENGTH);
    blst_p1_compress(out.data(), &pk);
    return out;
}

bool decode_public_key(std::span<const uint8_t> bytes, blst_p1_affine& out) {
    if (bytes.size() != Bls12381::PUBLIC_KEY_LENGTH) {
        return false;
    }
    if (blst_p1_uncompress(&out, bytes.data()) != BLST_SUCCESS) {
        return false;
    }
    return !blst_p1_affine_is_inf(&out) && blst_p1_affine_in_g1(&out);
}

bool decode_signature(std::span<const uint8_t> bytes, blst_p2_affine& out) {
    if (bytes.size() != Bls12381::SIGNATURE_LENGTH) {
        return false;
    }
    if (blst_p2_uncompress(&out, bytes.data()) != BLST_SUCCESS) {
        return false;
    }
    return blst_p2_affine_in_g2(&out);
}

}  // namespace

VaultResult<KeyPair> Bls12381::generate() {
    // blst_keygen requires at least 32 bytes of input keying material
    auto ikm = VaultCrypto::generate_random_bytes(32);
    ScopedScalar sk;
    blst_keygen(sk.get(), ikm.data(), ikm.size(), nullptr, 0);
    secure_clear(ikm);

    KeyPair pair;
    pair.private_key = export_secret(sk);
    pair.public_key = public_key_of(sk);
    return pair;
}

VaultResult<KeyPair> Bls12381::from_private_key(std::span<const uint8_t> private_key) {
    if (private_key.size() != PRIVATE_KEY_LENGTH) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }

    ScopedScalar sk;
    if (!load_secret(private_key, sk)) {
        return std::unexpected(VaultError::InvalidPrivateKey);
    }

    KeyPair pair;
    pair.private_key.assign(private_key.begin(), private_key.end());
    pair.public_key = public_key_of(sk);
    return pair;
}

VaultResult<std::vector<uint8_t>> Bls12381::sign(
    std::span<const uint8_t> message,
    std::span<const uint8_t> private_key) {

    if (private_key.size() != PRIVATE_KEY_LENGTH) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }

    ScopedScalar sk;
    if (!load_secret(private_key, sk)) {
        return std::unexpected(VaultError::InvalidPrivateKey);
    }

    blst_p2 hash;
    blst_hash_to_g2(&hash, message.data(), message.size(),
                    dst_bytes(), SIGNATURE_DST.size(), nullptr, 0);

    blst_p2 signature;
    blst_sign_pk_in_g1(&signature, &hash, sk.get());

    std::vector<uint8_t> out(SIGNATURE_LENGTH);
    blst_p2_compress(out.data(), &signature);
    return out;
}

bool Bls12381::verify(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature,
    std::span<const uint8_t> public_key) noexcept {

    blst_p1_affine pk;
    blst_p2_affine sig;
    if (!decode_public_key(public_key, pk) || !decode_signature(signature, sig)) {
        return false;
    }
    return blst_core_verify_pk_in_g1(&pk, &sig, true,
                                     message.data(), message.size(),
                                     dst_bytes(), SIGNATURE_DST.size(),
                                     nullptr, 0) == BLST_SUCCESS;
}

VaultResult<std::vector<uint8_t>> Bls12381::aggregate_signatures(
    std::span<const std::vector<uint8_t>> signatures) {

    if (signatures.empty()) {
        return std::unexpected(VaultError::EmptyInput);
    }

    blst_p2 sum;
    for (size_t i = 0; i < signatures.size(); ++i) {
        blst_p2_affine point;
        if (!decode_signature(signatures[i], point)) {
            return std::unexpected(VaultError::InvalidData);
        }
        if (i == 0) {
            blst_p2_from_affine(&sum, &point);
        } else {
            blst_p2_add_or_double_affine(&sum, &sum, &point);
        }
    }

    std::vector<uint8_t> out(SIGNATURE_LENGTH);
    blst_p2_compress(out.data(), &sum);
    return out;
}

VaultResult<std::vector<uint8_t>> Bls12381::aggregate_public_keys(
    std::span<const std::vector<uint8_t>> public_keys) {

    if (public_keys.empty()) {
        return std::unexpected(VaultError::EmptyInput);
    }

    blst_p1 sum;
    for (size_t i = 0; i < public_keys.size(); ++i) {
        blst_p1_affine point;
        if (!decode_public_key(public_keys[i], point)) {
            return std::unexpected(VaultError::InvalidData);
        }
        if (i == 0) {
            blst_p1_from_affine(&sum, &point);
        } else {
            blst_p1_add_or_double_affine(&sum, &sum, &point);
        }
    }

    std::vector<uint8_t> out(PUBLIC_KEY_LENGTH);
    blst_p1_compress(out.data(), &sum);
    return out;
}

VaultResult<bool> Bls12381::verify_aggregate(
    std::span<const uint8_t> aggregate_signature,
    std::span<const std::vector<uint8_t>> messages,
    std::span<const std::vector<uint8_t>> public_keys) {

    if (messages.size() != public_keys.size()) {
        return std::unexpected(VaultError::LengthMismatch);
    }
    if (messages.empty()) {
        return false;
    }

    blst_p2_affine sig;
    if (!decode_signature(aggregate_signature, sig)) {
        return false;
    }

    // blst_pairing is opaque; the C++ binding allocates it as uint64_t words
    const size_t words = (blst_pairing_sizeof() + sizeof(uint64_t) - 1) / sizeof(uint64_t);
    auto storage = std::make_unique<uint64_t[]>(words);
    auto* ctx = reinterpret_cast<blst_pairing*>(storage.get());
    blst_pairing_init(ctx, true, dst_bytes(), SIGNATURE_DST.size());

    for (size_t i = 0; i < messages.size(); ++i) {
        blst_p1_affine pk;
        if (!decode_public_key(public_keys[i], pk)) {
            return false;
        }
        // The signature is folded in once, with the first pair
        const blst_p2_affine* sig_arg = (i == 0) ? &sig : nullptr;
        if (blst_pairing_aggregate_pk_in_g1(ctx, &pk, sig_arg,
                                            messages[i].data(), messages[i].size(),
                                            nullptr, 0) != BLST_SUCCESS) {
            return false;
        }
    }

    blst_pairing_commit(ctx);
    return blst_pairing_finalverify(ctx, nullptr);
}

bool Bls12381::is_valid_public_key(std::span<const uint8_t> public_key) noexcept {
    blst_p1_affine pk;
    return decode_public_key(public_key, pk);
}

bool Bls12381::is_valid_signature(std::span<const uint8_t> signature) noexcept {
    blst_p2_affine sig;
    return decode_signature(signature, sig);
}

VaultResult<SecureVector<uint8_t>> Bls12381::derive_master_key(std::span<const uint8_t> seed) {
    if (seed.size() < 32) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    ScopedScalar sk;
    blst_derive_master_eip2333(sk.get(), seed.data(), seed.size());
    return export_secret(sk);
}

VaultResult<SecureVector<uint8_t>> Bls12381::derive_child_key(
    std::span<const uint8_t> parent_key, uint32_t index) {

    if (parent_key.size() != PRIVATE_KEY_LENGTH) {
        return std::unexpected(VaultError::InvalidKeyLength);
    }
    ScopedScalar parent;
    blst_scalar_from_bendian(parent.get(), parent_key.data());

    ScopedScalar child;
    blst_derive_child_eip2333(child.get(), parent.get(), index);
    return export_secret(child);
}

}  // namespace CertenVault
