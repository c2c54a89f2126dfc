// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol
//
// Blake2b.cc - Unkeyed BLAKE2b with a 32-byte digest (RFC 7693)

#include "Hashes.h"
#include "../../utils/SecureMemory.h"
#include <cstring>

namespace CertenVault::Hashes {

namespace {

constexpr size_t BLOCK_BYTES = 128;
constexpr size_t OUT_BYTES = 32;

constexpr uint64_t IV[8] = {
    0x6a09e667f3bcc908ULL, 0xbb67ae8584caa73bULL,
    0x3c6ef372fe94f82bULL, 0xa54ff53a5f1d36f1ULL,
    0x510e527fade682d1ULL, 0x9b05688c2b3e6c1fULL,
    0x1f83d9abfb41bd6bULL, 0x5be0cd19137e2179ULL
};

constexpr uint8_t SIGMA[12][16] = {
    { 0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15 },
    { 14, 10, 4, 8, 9, 15, 13, 6, 1, 12, 0, 2, 11, 7, 5, 3 },
    { 11, 8, 12, 0, 5, 2, 15, 13, 10, 14, 3, 6, 7, 1, 9, 4 },
    { 7, 9, 3, 1, 13, 12, 11, 14, 2, 6, 5, 10, 4, 0, 15, 8 },
    { 9, 0, 5, 7, 2, 4, 10, 15, 14, 1, 11, 12, 6, 8, 3, 13 },
    { 2, 12, 6, 10, 0, 11, 8, 3, 4, 13, 7, 5, 15, 14, 1, 9 },
    { 12, 5, 1, 15, 14, 13, 4, 10, 0, 7, 6, 3, 9, 2, 8, 11 },
    { 13, 11, 7, 14, 12, 1, 3, 9, 5, 0, 15, 4, 8, 6, 2, 10 },
    { 6, 15, 14, 9, 11, 3, 0, 8, 12, 2, 13, 7, 1, 4, 10, 5 },
    { 10, 2, 8, 4, 7, 6, 1, 5, 15, 11, 9, 14, 3, 12, 13, 0 },
    { 0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15 },
    { 14, 10, 4, 8, 9, 15, 13, 6, 1, 12, 0, 2, 11, 7, 5, 3 }
};

constexpr uint64_t rotr64(uint64_t x, int n) noexcept {
    return (x >> n) | (x << (64 - n));
}

uint64_t load_le64(const uint8_t* p) noexcept {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

void mix(uint64_t v[16], int a, int b, int c, int d, uint64_t x, uint64_t y) noexcept {
    v[a] = v[a] + v[b] + x;
    v[d] = rotr64(v[d] ^ v[a], 32);
    v[c] = v[c] + v[d];
    v[b] = rotr64(v[b] ^ v[c], 24);
    v[a] = v[a] + v[b] + y;
    v[d] = rotr64(v[d] ^ v[a], 16);
    v[c] = v[c] + v[d];
    v[b] = rotr64(v[b] ^ v[c], 63);
}

void compress(uint64_t h[8], const uint8_t* block, uint64_t bytes_total, bool last) noexcept {
    uint64_t m[16];
    uint64_t v[16];
    for (int i = 0; i < 16; ++i) {
        m[i] = load_le64(block + 8 * i);
    }
    for (int i = 0; i < 8; ++i) {
        v[i] = h[i];
        v[i + 8] = IV[i];
    }
    // Inputs here never exceed 2^64 bytes, so the high counter word stays 0
    v[12] ^= bytes_total;
    if (last) {
        v[14] = ~v[14];
    }

    for (int r = 0; r < 12; ++r) {
        const uint8_t* s = SIGMA[r];
        mix(v, 0, 4, 8, 12, m[s[0]], m[s[1]]);
        mix(v, 1, 5, 9, 13, m[s[2]], m[s[3]]);
        mix(v, 2, 6, 10, 14, m[s[4]], m[s[5]]);
        mix(v, 3, 7, 11, 15, m[s[6]], m[s[7]]);
        mix(v, 0, 5, 10, 15, m[s[8]], m[s[9]]);
        mix(v, 1, 6, 11, 12, m[s[10]], m[s[11]]);
        mix(v, 2, 7, 8, 13, m[s[12]], m[s[13]]);
        mix(v, 3, 4, 9, 14, m[s[14]], m[s[15]]);
    }

    for (int i = 0; i < 8; ++i) {
        h[i] ^= v[i] ^ v[i + 8];
    }
    OPENSSL_cleanse(m, sizeof(m));
    OPENSSL_cleanse(v, sizeof(v));
}

}  // namespace

Digest32 blake2b_256(std::span<const uint8_t> data) {
    uint64_t h[8];
    std::memcpy(h, IV, sizeof(h));
    // Parameter block: digest length 32, no key, fanout 1, depth 1
    h[0] ^= 0x01010000ULL ^ OUT_BYTES;

    uint64_t processed = 0;
    size_t offset = 0;
    // Keep at least one (possibly partial) block for the final compression
    while (data.size() - offset > BLOCK_BYTES) {
        processed += BLOCK_BYTES;
        compress(h, data.data() + offset, processed, false);
        offset += BLOCK_BYTES;
    }

    uint8_t block[BLOCK_BYTES] = {};
    const size_t remaining = data.size() - offset;
    if (remaining > 0) {
        std::memcpy(block, data.data() + offset, remaining);
    }
    processed += remaining;
    compress(h, block, processed, true);

    Digest32 out{};
    for (size_t i = 0; i < OUT_BYTES; ++i) {
        out[i] = static_cast<uint8_t>(h[i / 8] >> (8 * (i % 8)));
    }
    OPENSSL_cleanse(h, sizeof(h));
    OPENSSL_cleanse(block, sizeof(block));
    return out;
}

}  // namespace CertenVault::Hashes
