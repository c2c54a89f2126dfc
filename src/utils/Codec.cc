// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "Codec.h"
#include <openssl/evp.h>
#include <algorithm>

namespace CertenVault::Codec {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

char lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

}  // namespace

std::string to_hex(std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0f]);
    }
    return out;
}

std::string_view strip_hex_prefix(std::string_view hex) noexcept {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    return hex;
}

VaultResult<std::vector<uint8_t>> from_hex(std::string_view hex) {
    hex = strip_hex_prefix(hex);
    if (hex.size() % 2 != 0) {
        return std::unexpected(VaultError::InvalidHex);
    }

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hex_value(hex[i]);
        const int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::unexpected(VaultError::InvalidHex);
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

bool is_hex(std::string_view hex) noexcept {
    hex = strip_hex_prefix(hex);
    if (hex.empty() || hex.size() % 2 != 0) {
        return false;
    }
    return std::ranges::all_of(hex, [](char c) { return hex_value(c) >= 0; });
}

std::string to_base64(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return {};
    }
    std::string out(4 * ((bytes.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        bytes.data(), static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

VaultResult<std::vector<uint8_t>> from_base64(std::string_view text) {
    if (text.empty()) {
        return std::vector<uint8_t>{};
    }
    if (text.size() % 4 != 0) {
        return std::unexpected(VaultError::InvalidData);
    }

    std::vector<uint8_t> out(3 * text.size() / 4);
    const int decoded = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (decoded < 0) {
        return std::unexpected(VaultError::InvalidData);
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() > 1 && text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

std::string to_lower_ascii(std::string_view text) {
    std::string out(text);
    std::ranges::transform(out, out.begin(), lower);
    return out;
}

bool iequals_ascii(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return lower(x) == lower(y); });
}

}  // namespace CertenVault::Codec
