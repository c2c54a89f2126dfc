// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_PENDING_TRANSACTION_DIGEST_H
#define CERTENVAULT_PENDING_TRANSACTION_DIGEST_H

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
#include "../VaultError.h"
#include "../crypto/Hashes.h"

namespace CertenVault {

/**
 * @brief Signature digest for a signer joining a pending transaction
 *
 * @code
 * metadata_hash      = SHA256(varint(len(signer_url)) || signer_url
 *                             || u64_le(signer_version) || u64_le(timestamp))
 * data_for_signature = SHA256(transaction_hash || metadata_hash)
 * @endcode
 *
 * The varint is unsigned LEB128.
 */
class PendingTransactionDigest {
public:
    static constexpr size_t HASH_LENGTH = 32;

    /// Unsigned LEB128 encoding of @p value
    [[nodiscard]] static std::vector<uint8_t> encode_uvarint(uint64_t value);

    [[nodiscard]] static Hashes::Digest32 metadata_hash(
        std::string_view signer_url,
        uint64_t signer_version,
        uint64_t timestamp);

    /**
     * @return VaultError::InvalidData unless @p transaction_hash is 32 bytes
     */
    [[nodiscard]] static VaultResult<Hashes::Digest32> data_for_signature(
        std::span<const uint8_t> transaction_hash,
        std::string_view signer_url,
        uint64_t signer_version,
        uint64_t timestamp);

    PendingTransactionDigest() = delete;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_PENDING_TRANSACTION_DIGEST_H
