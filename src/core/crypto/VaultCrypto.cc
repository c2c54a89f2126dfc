// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "VaultCrypto.h"
#include "../../utils/Codec.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <stdexcept>

namespace CertenVault {

VaultResult<SecureVector<uint8_t>> VaultCrypto::derive_key(
    const Glib::ustring& password,
    std::span<const uint8_t> salt,
    int iterations) {

    if (iterations <= 0 || salt.empty()) {
        return std::unexpected(VaultError::KeyDerivationFailed);
    }

    SecureVector<uint8_t> key(KEY_LENGTH);
    int result = PKCS5_PBKDF2_HMAC(
        password.c_str(), static_cast<int>(password.bytes()),
        salt.data(), static_cast<int>(salt.size()),
        iterations,
        EVP_sha512(),
        static_cast<int>(KEY_LENGTH),
        key.data()
    );

    if (result != 1) {
        return std::unexpected(VaultError::KeyDerivationFailed);
    }
    return key;
}

VaultResult<VaultCrypto::EncryptionResult> VaultCrypto::encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> key) {

    if (key.size() != KEY_LENGTH) {
        return std::unexpected(VaultError::EncryptionFailed);
    }

    EncryptionResult out;
    out.iv = generate_random_bytes(IV_LENGTH);

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected(VaultError::EncryptionFailed);
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), out.iv.data()) != 1) {
        return std::unexpected(VaultError::EncryptionFailed);
    }

    // GCM is a stream mode: ciphertext length equals plaintext length
    out.ciphertext.resize(plaintext.size() + TAG_LENGTH);
    int len = 0;
    int ciphertext_len = 0;

    if (EVP_EncryptUpdate(ctx.get(), out.ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        return std::unexpected(VaultError::EncryptionFailed);
    }
    ciphertext_len = len;

    if (EVP_EncryptFinal_ex(ctx.get(), out.ciphertext.data() + len, &len) != 1) {
        return std::unexpected(VaultError::EncryptionFailed);
    }
    ciphertext_len += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_LENGTH,
                            out.ciphertext.data() + ciphertext_len) != 1) {
        return std::unexpected(VaultError::EncryptionFailed);
    }
    out.ciphertext.resize(static_cast<size_t>(ciphertext_len) + TAG_LENGTH);

    return out;
}

VaultResult<SecureVector<uint8_t>> VaultCrypto::decrypt(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> key) {

    // Every failure below collapses to InvalidPassword
    if (key.size() != KEY_LENGTH || iv.size() != IV_LENGTH || ciphertext.size() < TAG_LENGTH) {
        return std::unexpected(VaultError::InvalidPassword);
    }

    const size_t body_len = ciphertext.size() - TAG_LENGTH;
    SecureVector<uint8_t> tag(ciphertext.begin() + body_len, ciphertext.end());

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected(VaultError::InvalidPassword);
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), iv.data()) != 1) {
        return std::unexpected(VaultError::InvalidPassword);
    }

    SecureVector<uint8_t> plaintext(body_len);
    int len = 0;
    int plaintext_len = 0;

    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                          ciphertext.data(), static_cast<int>(body_len)) != 1) {
        return std::unexpected(VaultError::InvalidPassword);
    }
    plaintext_len = len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_LENGTH, tag.data()) != 1) {
        return std::unexpected(VaultError::InvalidPassword);
    }

    // Finalize verifies the tag; on failure the SecureVector wipes the
    // unauthenticated bytes as it goes out of scope
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &len) != 1) {
        return std::unexpected(VaultError::InvalidPassword);
    }
    plaintext_len += len;

    plaintext.resize(static_cast<size_t>(plaintext_len));
    return plaintext;
}

std::vector<uint8_t> VaultCrypto::generate_random_bytes(size_t length) {
    std::vector<uint8_t> bytes(length);
    if (length == 0) {
        return bytes;
    }
    if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
        // PRNG failure is a security event: never hand out predictable data
        OPENSSL_cleanse(bytes.data(), bytes.size());
        throw std::runtime_error("CSPRNG failure: RAND_bytes() failed");
    }
    return bytes;
}

std::string VaultCrypto::generate_uuid() {
    auto bytes = generate_random_bytes(16);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);

    const std::string hex = Codec::to_hex(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

}  // namespace CertenVault
