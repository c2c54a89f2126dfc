// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol
//
// Keccak.cc - Keccak-256 sponge with the original 0x01 multi-rate padding

#include "Hashes.h"
#include "../../utils/SecureMemory.h"
#include <cstring>

namespace CertenVault::Hashes {

namespace {

constexpr size_t KECCAK256_RATE = 136;  // (1600 - 2*256) / 8
constexpr int KECCAK_ROUNDS = 24;

constexpr uint64_t ROUND_CONSTANTS[KECCAK_ROUNDS] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

// Rotation offsets and lane permutation for the combined rho/pi step
constexpr int RHO[24] = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};
constexpr int PI[24] = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

constexpr uint64_t rotl64(uint64_t x, int n) noexcept {
    return (x << n) | (x >> (64 - n));
}

void keccak_f1600(uint64_t state[25]) noexcept {
    uint64_t bc[5];
    for (int round = 0; round < KECCAK_ROUNDS; ++round) {
        // theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = state[i] ^ state[i + 5] ^ state[i + 10] ^ state[i + 15] ^ state[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            const uint64_t t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) {
                state[j + i] ^= t;
            }
        }

        // rho and pi
        uint64_t current = state[1];
        for (int i = 0; i < 24; ++i) {
            const int j = PI[i];
            const uint64_t tmp = state[j];
            state[j] = rotl64(current, RHO[i]);
            current = tmp;
        }

        // chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) {
                bc[i] = state[j + i];
            }
            for (int i = 0; i < 5; ++i) {
                state[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // iota
        state[0] ^= ROUND_CONSTANTS[round];
    }
}

uint64_t load_le64(const uint8_t* p) noexcept {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

void absorb_block(uint64_t state[25], const uint8_t* block) noexcept {
    for (size_t i = 0; i < KECCAK256_RATE / 8; ++i) {
        state[i] ^= load_le64(block + 8 * i);
    }
    keccak_f1600(state);
}

}  // namespace

Digest32 keccak256(std::span<const uint8_t> data) {
    uint64_t state[25] = {};

    size_t offset = 0;
    while (data.size() - offset >= KECCAK256_RATE) {
        absorb_block(state, data.data() + offset);
        offset += KECCAK256_RATE;
    }

    // Final block: pad10*1 with the Keccak domain byte 0x01
    uint8_t block[KECCAK256_RATE] = {};
    const size_t remaining = data.size() - offset;
    if (remaining > 0) {
        std::memcpy(block, data.data() + offset, remaining);
    }
    block[remaining] ^= 0x01;
    block[KECCAK256_RATE - 1] ^= 0x80;
    absorb_block(state, block);

    Digest32 out{};
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>(state[i / 8] >> (8 * (i % 8)));
    }

    OPENSSL_cleanse(state, sizeof(state));
    OPENSSL_cleanse(block, sizeof(block));
    return out;
}

}  // namespace CertenVault::Hashes
