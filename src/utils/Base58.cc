// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "Base58.h"
#include "../core/crypto/Hashes.h"
#include <algorithm>
#include <cstring>

namespace CertenVault::Base58 {

namespace {

constexpr char ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr size_t CHECKSUM_LENGTH = 4;

int digit_value(char c) noexcept {
    const char* pos = std::strchr(ALPHABET, c);
    if (c == '\0' || pos == nullptr) {
        return -1;
    }
    return static_cast<int>(pos - ALPHABET);
}

}  // namespace

std::string encode(std::span<const uint8_t> data) {
    const size_t zeros = static_cast<size_t>(
        std::ranges::find_if(data, [](uint8_t b) { return b != 0; }) - data.begin());

    // log(256) / log(58) ~= 1.365; base-58 digits, little-endian
    std::vector<uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
    size_t length = 0;
    for (size_t i = zeros; i < data.size(); ++i) {
        int carry = data[i];
        size_t j = 0;
        for (; j < length || carry != 0; ++j) {
            carry += 256 * digits[j];
            digits[j] = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    std::string out(zeros, '1');
    for (size_t i = 0; i < length; ++i) {
        out.push_back(ALPHABET[digits[length - 1 - i]]);
    }
    return out;
}

VaultResult<std::vector<uint8_t>> decode(std::string_view text) {
    const size_t ones = static_cast<size_t>(
        std::ranges::find_if(text, [](char c) { return c != '1'; }) - text.begin());

    // log(58) / log(256) ~= 0.733; bytes, little-endian
    std::vector<uint8_t> bytes((text.size() - ones) * 733 / 1000 + 1, 0);
    size_t length = 0;
    for (size_t i = ones; i < text.size(); ++i) {
        int carry = digit_value(text[i]);
        if (carry < 0) {
            return std::unexpected(VaultError::InvalidAddress);
        }
        size_t j = 0;
        for (; j < length || carry != 0; ++j) {
            carry += 58 * bytes[j];
            bytes[j] = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        length = j;
    }

    std::vector<uint8_t> out(ones, 0);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(bytes[length - 1 - i]);
    }
    return out;
}

std::string encode_check(std::span<const uint8_t> payload) {
    std::vector<uint8_t> data(payload.begin(), payload.end());
    const auto checksum = Hashes::double_sha256(payload);
    data.insert(data.end(), checksum.begin(), checksum.begin() + CHECKSUM_LENGTH);
    return encode(data);
}

VaultResult<std::vector<uint8_t>> decode_check(std::string_view text) {
    auto decoded = decode(text);
    if (!decoded) {
        return decoded;
    }
    if (decoded->size() < CHECKSUM_LENGTH) {
        return std::unexpected(VaultError::InvalidAddress);
    }

    std::vector<uint8_t> payload(decoded->begin(), decoded->end() - CHECKSUM_LENGTH);
    const auto checksum = Hashes::double_sha256(payload);
    if (!std::equal(checksum.begin(), checksum.begin() + CHECKSUM_LENGTH,
                    decoded->end() - CHECKSUM_LENGTH)) {
        return std::unexpected(VaultError::InvalidAddress);
    }
    return payload;
}

}  // namespace CertenVault::Base58
