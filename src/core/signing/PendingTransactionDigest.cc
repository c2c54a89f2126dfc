// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "PendingTransactionDigest.h"
#include "../../utils/Codec.h"

namespace CertenVault {

namespace {

void append_u64_le(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

}  // namespace

std::vector<uint8_t> PendingTransactionDigest::encode_uvarint(uint64_t value) {
    std::vector<uint8_t> out;
    while (value >= 0x80) {
        out.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value));
    return out;
}

Hashes::Digest32 PendingTransactionDigest::metadata_hash(
    std::string_view signer_url,
    uint64_t signer_version,
    uint64_t timestamp) {

    std::vector<uint8_t> buffer = encode_uvarint(signer_url.size());
    const auto url = Codec::as_bytes(signer_url);
    buffer.insert(buffer.end(), url.begin(), url.end());
    append_u64_le(buffer, signer_version);
    append_u64_le(buffer, timestamp);
    return Hashes::sha256(buffer);
}

VaultResult<Hashes::Digest32> PendingTransactionDigest::data_for_signature(
    std::span<const uint8_t> transaction_hash,
    std::string_view signer_url,
    uint64_t signer_version,
    uint64_t timestamp) {

    if (transaction_hash.size() != HASH_LENGTH) {
        return std::unexpected(VaultError::InvalidData);
    }

    const auto metadata = metadata_hash(signer_url, signer_version, timestamp);
    std::vector<uint8_t> buffer(transaction_hash.begin(), transaction_hash.end());
    buffer.insert(buffer.end(), metadata.begin(), metadata.end());
    return Hashes::sha256(buffer);
}

}  // namespace CertenVault
