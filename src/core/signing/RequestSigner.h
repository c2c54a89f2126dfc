// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_REQUEST_SIGNER_H
#define CERTENVAULT_REQUEST_SIGNER_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "SignRequest.h"
#include "../Vault.h"

namespace CertenVault {

/// Bytes handed to the curve signer, and the curve they are meant for
struct SigningDigest {
    std::vector<uint8_t> bytes;
    std::optional<KeyType> required_type;  ///< Empty when any curve may sign
};

/**
 * @brief Turns an approved SignRequest into a signature
 *
 * Each request kind maps to exactly one digest:
 * - AccountTransaction: transaction_hash
 * - PendingTransaction: data_for_signature (caller value wins over the
 *   locally derived one, see PendingTransactionDigest)
 * - AccountHash: hash
 * - EthereumHash: hash, secp256k1 only
 * - PersonalMessage: EIP-191 hash of the message, secp256k1 only
 * - BlsHash: hash, BLS12-381 only
 * - CrossChainIntent: hex-decoded intent_id
 */
class RequestSigner {
public:
    /**
     * @return VaultError::InvalidHex for undecodable hashes,
     *         VaultError::EmptyInput for an empty hash
     */
    [[nodiscard]] static VaultResult<SigningDigest> digest_for(const SignRequestData& data);

    /// Curve used when no key matches the request's signer or address
    [[nodiscard]] static KeyType preferred_type(const SignRequestData& data) noexcept;

    /**
     * @brief Key the approval prompt should preselect
     *
     * Matches signer_url against accumulate_url / key_page_url and address
     * against evm_address, then falls back to the first key of the
     * preferred type. Empty when locked or no key fits.
     */
    [[nodiscard]] static std::optional<std::string> suggest_key(Vault& vault, const SignRequestData& data);

    /**
     * @brief Sign @p request with the vault key @p key_id
     * @return VaultError::UnsupportedKeyType when the key's curve does not
     *         match the request kind, or any digest, lookup or signing error
     */
    [[nodiscard]] static VaultResult<SignedPayload> sign(
        Vault& vault,
        const SignRequest& request,
        std::string_view key_id);

    RequestSigner() = delete;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_REQUEST_SIGNER_H
