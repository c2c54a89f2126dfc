// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_MEMORY_VAULT_STORAGE_H
#define CERTENVAULT_MEMORY_VAULT_STORAGE_H

#include <map>
#include <mutex>
#include <string>
#include "IVaultStorage.h"

namespace CertenVault {

/**
 * @brief In-process IVaultStorage for tests and embedding hosts
 *
 * Records are lost when the object is destroyed. save_count() lets tests
 * observe that every mutation re-persists.
 */
class MemoryVaultStorage final : public IVaultStorage {
public:
    MemoryVaultStorage() = default;

    [[nodiscard]] VaultResult<std::optional<std::vector<uint8_t>>> load(std::string_view id) override;
    [[nodiscard]] VaultResult<> save(std::string_view id, std::span<const uint8_t> data) override;
    [[nodiscard]] VaultResult<> remove(std::string_view id) override;

    [[nodiscard]] size_t save_count() const;

    /// Make subsequent save() calls fail with StorageWriteFailed
    void set_fail_writes(bool fail);

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::vector<uint8_t>, std::less<>> m_records;
    size_t m_save_count = 0;
    bool m_fail_writes = false;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_MEMORY_VAULT_STORAGE_H
