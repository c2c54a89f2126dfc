// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol
/**
 * @file VaultSerialization.h
 * @brief Protobuf encoding of the vault record and its decrypted payload
 *
 * Converts between the domain structures in VaultTypes.h and the messages
 * generated from vault.proto.
 */

#ifndef CERTENVAULT_VAULT_SERIALIZATION_H
#define CERTENVAULT_VAULT_SERIALIZATION_H

#include "../VaultError.h"
#include "../VaultTypes.h"
#include <cstdint>
#include <span>
#include <vector>

namespace CertenVault {

/**
 * @class VaultSerialization
 * @brief Static utility class for vault serialization
 *
 * Two layers are handled:
 * - EncryptedVaultData, the persisted record (salt, IV, ciphertext, KDF)
 * - VaultPayload, the plaintext that is encrypted into that record
 *
 * Serialized payload bytes contain private keys and the mnemonic. They are
 * returned in a SecureVector and every intermediate buffer is wiped.
 *
 * ## Thread Safety
 * All methods are thread-safe; no state is shared between calls.
 *
 * ## Example Usage
 * @code
 * auto bytes = VaultSerialization::serialize_payload(payload);
 * auto encrypted = VaultCrypto::encrypt(*bytes, key);
 *
 * auto record = VaultSerialization::deserialize_record(stored_bytes);
 * if (!record && record.error() == VaultError::UnsupportedSchema) {
 *     // written by a newer release
 * }
 * @endcode
 */
class VaultSerialization {
public:
    /// Upper bound on any message accepted by the deserializers
    static constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

    /**
     * @brief Encode the decrypted payload
     * @return Serialized bytes, or VaultError::SerializationFailed
     */
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> serialize_payload(const VaultPayload& payload);

    /**
     * @brief Decode a decrypted payload
     *
     * key_count is recomputed from the key list so the invariant holds even
     * if the stored metadata disagrees.
     *
     * @return VaultPayload, or VaultError::InvalidProtobuf
     */
    [[nodiscard]] static VaultResult<VaultPayload> deserialize_payload(std::span<const uint8_t> data);

    /**
     * @brief Encode the persisted record
     * @return Serialized bytes, or VaultError::SerializationFailed
     */
    [[nodiscard]] static VaultResult<std::vector<uint8_t>> serialize_record(const EncryptedVaultData& record);

    /**
     * @brief Decode and validate a persisted record
     *
     * @return EncryptedVaultData, or
     *         - VaultError::InvalidProtobuf if the bytes do not parse
     *         - VaultError::UnsupportedSchema for a version other than
     *           CURRENT_VAULT_VERSION or an unknown KDF algorithm
     *         - VaultError::InvalidData for missing or wrong-size fields
     */
    [[nodiscard]] static VaultResult<EncryptedVaultData> deserialize_record(std::span<const uint8_t> data);

    VaultSerialization() = delete;  ///< Static-only class, no instances
    ~VaultSerialization() = delete;  ///< Static-only class, no instances
    VaultSerialization(const VaultSerialization&) = delete;  ///< No copy
    VaultSerialization& operator=(const VaultSerialization&) = delete;  ///< No copy
    VaultSerialization(VaultSerialization&&) = delete;  ///< No move
    VaultSerialization& operator=(VaultSerialization&&) = delete;  ///< No move
};

}  // namespace CertenVault

#endif  // CERTENVAULT_VAULT_SERIALIZATION_H
