// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "Bech32.h"
#include <cstring>

namespace CertenVault::Bech32 {

namespace {

constexpr char CHARSET[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
constexpr size_t CHECKSUM_WORDS = 6;
constexpr size_t MAX_LENGTH = 90;

uint32_t polymod(const std::vector<uint8_t>& values) {
    constexpr uint32_t GEN[5] = {0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3};
    uint32_t chk = 1;
    for (uint8_t v : values) {
        const uint8_t top = static_cast<uint8_t>(chk >> 25);
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        for (int i = 0; i < 5; ++i) {
            if ((top >> i) & 1) {
                chk ^= GEN[i];
            }
        }
    }
    return chk;
}

std::vector<uint8_t> expand_hrp(std::string_view hrp) {
    std::vector<uint8_t> out;
    out.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        out.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) >> 5));
    }
    out.push_back(0);
    for (char c : hrp) {
        out.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) & 0x1f));
    }
    return out;
}

// Regroup bits; returns false on invalid padding when pad == false
bool convert_bits(std::span<const uint8_t> in, int from_bits, int to_bits, bool pad,
                  std::vector<uint8_t>& out) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t max_value = (1u << to_bits) - 1;
    for (uint8_t value : in) {
        if ((value >> from_bits) != 0) {
            return false;
        }
        acc = (acc << from_bits) | value;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & max_value));
        }
    }
    if (pad) {
        if (bits > 0) {
            out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & max_value));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & max_value) != 0) {
        return false;
    }
    return true;
}

}  // namespace

std::string encode(std::string_view hrp, std::span<const uint8_t> data) {
    std::vector<uint8_t> words;
    convert_bits(data, 8, 5, true, words);

    std::vector<uint8_t> values = expand_hrp(hrp);
    values.insert(values.end(), words.begin(), words.end());
    values.insert(values.end(), CHECKSUM_WORDS, 0);
    const uint32_t mod = polymod(values) ^ 1;

    std::string out(hrp);
    out.push_back('1');
    for (uint8_t w : words) {
        out.push_back(CHARSET[w]);
    }
    for (size_t i = 0; i < CHECKSUM_WORDS; ++i) {
        out.push_back(CHARSET[(mod >> (5 * (5 - i))) & 0x1f]);
    }
    return out;
}

VaultResult<Decoded> decode(std::string_view text) {
    if (text.size() < 8 || text.size() > MAX_LENGTH) {
        return std::unexpected(VaultError::InvalidAddress);
    }

    bool has_lower = false;
    bool has_upper = false;
    for (char c : text) {
        if (c < 33 || c > 126) {
            return std::unexpected(VaultError::InvalidAddress);
        }
        has_lower |= (c >= 'a' && c <= 'z');
        has_upper |= (c >= 'A' && c <= 'Z');
    }
    if (has_lower && has_upper) {
        return std::unexpected(VaultError::InvalidAddress);
    }

    std::string lowered(text);
    for (char& c : lowered) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }

    const size_t sep = lowered.rfind('1');
    if (sep == std::string::npos || sep == 0 || sep + 1 + CHECKSUM_WORDS > lowered.size()) {
        return std::unexpected(VaultError::InvalidAddress);
    }

    Decoded result;
    result.hrp = lowered.substr(0, sep);

    std::vector<uint8_t> words;
    for (size_t i = sep + 1; i < lowered.size(); ++i) {
        const char* pos = std::strchr(CHARSET, lowered[i]);
        if (pos == nullptr) {
            return std::unexpected(VaultError::InvalidAddress);
        }
        words.push_back(static_cast<uint8_t>(pos - CHARSET));
    }

    std::vector<uint8_t> values = expand_hrp(result.hrp);
    values.insert(values.end(), words.begin(), words.end());
    if (polymod(values) != 1) {
        return std::unexpected(VaultError::InvalidAddress);
    }

    words.resize(words.size() - CHECKSUM_WORDS);
    if (!convert_bits(words, 5, 8, false, result.data)) {
        return std::unexpected(VaultError::InvalidAddress);
    }
    return result;
}

}  // namespace CertenVault::Bech32
