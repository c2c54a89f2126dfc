// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "Hashes.h"
#include "../../utils/SecureMemory.h"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

namespace CertenVault::Hashes {

namespace {

// EVP digests only fail on allocation or provider errors; neither leaves a
// usable result, so they are treated like a CSPRNG failure.
template<size_t N>
std::array<uint8_t, N> evp_digest(const EVP_MD* md, std::span<const uint8_t> data) {
    std::array<uint8_t, N> out{};
    unsigned int len = 0;
    if (md == nullptr ||
        EVP_Digest(data.data(), data.size(), out.data(), &len, md, nullptr) != 1 ||
        len != N) {
        throw std::runtime_error("EVP_Digest failed");
    }
    return out;
}

template<size_t N>
std::array<uint8_t, N> hmac(const EVP_MD* md,
                            std::span<const uint8_t> key,
                            std::span<const uint8_t> data) {
    std::array<uint8_t, N> out{};
    unsigned int len = 0;
    if (HMAC(md, key.data(), static_cast<int>(key.size()),
             data.data(), data.size(), out.data(), &len) == nullptr ||
        len != N) {
        throw std::runtime_error("HMAC failed");
    }
    return out;
}

}  // namespace

Digest32 sha256(std::span<const uint8_t> data) {
    return evp_digest<32>(EVP_sha256(), data);
}

Digest32 double_sha256(std::span<const uint8_t> data) {
    const auto first = sha256(data);
    return sha256(first);
}

Digest64 sha512(std::span<const uint8_t> data) {
    return evp_digest<64>(EVP_sha512(), data);
}

Digest32 sha3_256(std::span<const uint8_t> data) {
    return evp_digest<32>(EVP_sha3_256(), data);
}

Digest20 ripemd160(std::span<const uint8_t> data) {
    return evp_digest<20>(EVP_ripemd160(), data);
}

Digest20 hash160(std::span<const uint8_t> data) {
    const auto inner = sha256(data);
    return ripemd160(inner);
}

Digest32 hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data) {
    return hmac<32>(EVP_sha256(), key, data);
}

Digest64 hmac_sha512(std::span<const uint8_t> key, std::span<const uint8_t> data) {
    return hmac<64>(EVP_sha512(), key, data);
}

}  // namespace CertenVault::Hashes
