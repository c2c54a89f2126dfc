// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "HdDerivation.h"
#include "Mnemonic.h"
#include "../crypto/Hashes.h"
#include "../curves/Ed25519.h"
#include "../curves/Secp256k1.h"
#include "../../utils/Codec.h"
#include "../../utils/Log.h"
#include "../curves/Bls12381.h"
#include <charconv>
#include <format>

namespace CertenVault {

namespace {

constexpr std::string_view ED25519_SEED_KEY = "ed25519 seed";
constexpr std::string_view BITCOIN_SEED_KEY = "Bitcoin seed";

// Private key and chain code of one tree node
struct ExtendedKey {
    SecureVector<uint8_t> key;
    SecureVector<uint8_t> chain_code;
};

ExtendedKey split_hmac(Hashes::Digest64& digest) {
    ExtendedKey out;
    out.key.assign(digest.begin(), digest.begin() + 32);
    out.chain_code.assign(digest.begin() + 32, digest.end());
    secure_clear(digest);
    return out;
}

void append_ser32(SecureVector<uint8_t>& data, uint32_t value) {
    data.push_back(static_cast<uint8_t>(value >> 24));
    data.push_back(static_cast<uint8_t>(value >> 16));
    data.push_back(static_cast<uint8_t>(value >> 8));
    data.push_back(static_cast<uint8_t>(value));
}

bool parse_u32(std::string_view text, uint32_t& out) {
    if (text.empty()) {
        return false;
    }
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc{} && ptr == end;
}

}  // namespace

VaultResult<std::vector<PathSegment>> HdDerivation::parse_path(std::string_view path) {
    if (path.empty() || (path[0] != 'm' && path[0] != 'M')) {
        return std::unexpected(VaultError::InvalidDerivationPath);
    }
    std::vector<PathSegment> segments;
    if (path.size() == 1) {
        return segments;
    }
    if (path[1] != '/') {
        return std::unexpected(VaultError::InvalidDerivationPath);
    }

    std::string_view rest = path.substr(2);
    while (true) {
        const auto slash = rest.find('/');
        std::string_view token = rest.substr(0, slash);

        PathSegment segment;
        if (!token.empty() && (token.back() == '\'' || token.back() == 'h' || token.back() == 'H')) {
            segment.hardened = true;
            token.remove_suffix(1);
        }
        if (!parse_u32(token, segment.index) || segment.index >= HARDENED_OFFSET) {
            return std::unexpected(VaultError::InvalidDerivationPath);
        }
        segments.push_back(segment);

        if (slash == std::string_view::npos) {
            break;
        }
        rest = rest.substr(slash + 1);
    }
    return segments;
}

std::string HdDerivation::path_prefix(KeyType type, uint32_t account) {
    switch (type) {
        case KeyType::Ed25519:
            return std::format("m/44'/540'/{}'/0'", account);
        case KeyType::Secp256k1:
            return std::format("m/44'/60'/{}'/0", account);
        case KeyType::Bls12381:
            return std::format("m/12381/60/{}/0", account);
    }
    return {};
}

std::string HdDerivation::build_path(KeyType type, uint32_t account, uint32_t index) {
    // SLIP-0010 Ed25519 cannot derive non-hardened children
    const char* suffix = (type == KeyType::Ed25519) ? "'" : "";
    return std::format("{}/{}{}", path_prefix(type, account), index, suffix);
}

VaultResult<KeyPair> HdDerivation::derive_ed25519(std::span<const uint8_t> seed, std::string_view path) {
    auto segments = parse_path(path);
    if (!segments) {
        return std::unexpected(segments.error());
    }

    auto digest = Hashes::hmac_sha512(Codec::as_bytes(ED25519_SEED_KEY), seed);
    ExtendedKey node = split_hmac(digest);

    for (const auto& segment : *segments) {
        if (!segment.hardened) {
            Log::debug("Ed25519 derivation rejected non-hardened segment in {}", path);
            return std::unexpected(VaultError::InvalidDerivationPath);
        }
        SecureVector<uint8_t> data;
        data.reserve(37);
        data.push_back(0x00);
        data.insert(data.end(), node.key.begin(), node.key.end());
        append_ser32(data, segment.index | HARDENED_OFFSET);

        digest = Hashes::hmac_sha512(node.chain_code, data);
        node = split_hmac(digest);
    }

    return Ed25519::from_seed(node.key);
}

VaultResult<KeyPair> HdDerivation::derive_secp256k1(std::span<const uint8_t> seed, std::string_view path) {
    auto segments = parse_path(path);
    if (!segments) {
        return std::unexpected(segments.error());
    }

    auto digest = Hashes::hmac_sha512(Codec::as_bytes(BITCOIN_SEED_KEY), seed);
    ExtendedKey node = split_hmac(digest);
    if (!Secp256k1::from_private_key(node.key)) {
        return std::unexpected(VaultError::KeyDerivationFailed);
    }

    for (const auto& segment : *segments) {
        SecureVector<uint8_t> data;
        data.reserve(37);
        if (segment.hardened) {
            data.push_back(0x00);
            data.insert(data.end(), node.key.begin(), node.key.end());
            append_ser32(data, segment.index | HARDENED_OFFSET);
        } else {
            auto pub = Secp256k1::public_key_from_private(node.key, true);
            if (!pub) {
                return std::unexpected(VaultError::KeyDerivationFailed);
            }
            data.insert(data.end(), pub->begin(), pub->end());
            append_ser32(data, segment.index);
        }

        digest = Hashes::hmac_sha512(node.chain_code, data);
        ExtendedKey child = split_hmac(digest);

        // child key = parse256(IL) + k (mod n)
        auto sum = Secp256k1::private_key_tweak_add(node.key, child.key);
        if (!sum) {
            return std::unexpected(VaultError::KeyDerivationFailed);
        }
        node.key = std::move(*sum);
        node.chain_code = std::move(child.chain_code);
    }

    return Secp256k1::from_private_key(node.key);
}

VaultResult<KeyPair> HdDerivation::derive_bls(std::span<const uint8_t> seed, std::string_view path) {
    auto segments = parse_path(path);
    if (!segments) {
        return std::unexpected(segments.error());
    }

    auto key = Bls12381::derive_master_key(seed);
    if (!key) {
        return std::unexpected(key.error());
    }
    for (const auto& segment : *segments) {
        if (segment.hardened) {
            return std::unexpected(VaultError::InvalidDerivationPath);
        }
        key = Bls12381::derive_child_key(*key, segment.index);
        if (!key) {
            return std::unexpected(key.error());
        }
    }
    return Bls12381::from_private_key(*key);
}

VaultResult<KeyPair> HdDerivation::derive_path(
    KeyType type, std::span<const uint8_t> seed, std::string_view path) {
    switch (type) {
        case KeyType::Ed25519:   return derive_ed25519(seed, path);
        case KeyType::Secp256k1: return derive_secp256k1(seed, path);
        case KeyType::Bls12381:  return derive_bls(seed, path);
    }
    return std::unexpected(VaultError::UnsupportedKeyType);
}

VaultResult<DerivedKey> HdDerivation::derive_from_mnemonic(
    KeyType type,
    std::string_view mnemonic,
    uint32_t account,
    uint32_t index,
    const Glib::ustring& passphrase) {

    auto seed = Mnemonic::to_seed(mnemonic, passphrase);
    if (!seed) {
        return std::unexpected(seed.error());
    }

    DerivedKey derived;
    derived.path = build_path(type, account, index);
    derived.index = index;

    auto pair = derive_path(type, *seed, derived.path);
    if (!pair) {
        Log::warning("Derivation failed for {}: {}", derived.path, to_string(pair.error()));
        return std::unexpected(pair.error());
    }
    derived.key_pair = std::move(*pair);
    return derived;
}

uint32_t HdDerivation::next_derivation_index(
    std::span<const std::string> existing_paths,
    std::string_view prefix) {

    bool found = false;
    uint32_t highest = 0;
    for (const auto& path : existing_paths) {
        if (!std::string_view(path).starts_with(prefix)) {
            continue;
        }
        std::string_view tail(path);
        if (tail.ends_with('\'')) {
            tail.remove_suffix(1);
        }
        const auto slash = tail.rfind('/');
        if (slash == std::string_view::npos) {
            continue;
        }
        uint32_t value = 0;
        if (!parse_u32(tail.substr(slash + 1), value)) {
            continue;
        }
        if (!found || value > highest) {
            highest = value;
            found = true;
        }
    }
    return found ? highest + 1 : 0;
}

}  // namespace CertenVault
