// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file IVaultStorage.h
 * @brief Interface for durable vault record storage
 *
 * Separates where the encrypted record lives from the vault logic so the
 * Vault can be tested against an in-memory store.
 */

#ifndef CERTENVAULT_IVAULT_STORAGE_H
#define CERTENVAULT_IVAULT_STORAGE_H

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>
#include "../VaultError.h"

namespace CertenVault {

/**
 * @brief Key to bytes store for the encrypted vault record
 *
 * Values are opaque serialized EncryptedVaultData; implementations never
 * see plaintext.
 *
 * Design Principles:
 * - One record per storage identifier
 * - save() replaces the record completely, never partially
 * - std::expected for explicit error handling
 *
 * @note Implementations need not be thread-safe; Vault serializes access
 */
class IVaultStorage {
public:
    virtual ~IVaultStorage() = default;

    /**
     * @brief Load the record stored under @p id
     * @return Bytes, std::nullopt when nothing is stored, or
     *         StorageReadFailed / FilePermissionDenied
     */
    [[nodiscard]] virtual VaultResult<std::optional<std::vector<uint8_t>>> load(std::string_view id) = 0;

    /**
     * @brief Store @p data under @p id, replacing any previous record
     * @return Success or StorageWriteFailed
     */
    [[nodiscard]] virtual VaultResult<> save(std::string_view id, std::span<const uint8_t> data) = 0;

    /**
     * @brief Delete the record under @p id; deleting nothing succeeds
     */
    [[nodiscard]] virtual VaultResult<> remove(std::string_view id) = 0;

protected:
    IVaultStorage() = default;
    IVaultStorage(const IVaultStorage&) = default;
    IVaultStorage& operator=(const IVaultStorage&) = default;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_IVAULT_STORAGE_H
