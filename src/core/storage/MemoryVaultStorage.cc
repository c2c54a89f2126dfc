// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "MemoryVaultStorage.h"

namespace CertenVault {

VaultResult<std::optional<std::vector<uint8_t>>> MemoryVaultStorage::load(std::string_view id) {
    std::lock_guard lock(m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return std::optional<std::vector<uint8_t>>{};
    }
    return std::optional<std::vector<uint8_t>>{it->second};
}

VaultResult<> MemoryVaultStorage::save(std::string_view id, std::span<const uint8_t> data) {
    std::lock_guard lock(m_mutex);
    if (m_fail_writes) {
        return std::unexpected(VaultError::StorageWriteFailed);
    }
    m_records.insert_or_assign(std::string(id), std::vector<uint8_t>(data.begin(), data.end()));
    ++m_save_count;
    return {};
}

VaultResult<> MemoryVaultStorage::remove(std::string_view id) {
    std::lock_guard lock(m_mutex);
    auto it = m_records.find(id);
    if (it != m_records.end()) {
        m_records.erase(it);
    }
    return {};
}

size_t MemoryVaultStorage::save_count() const {
    std::lock_guard lock(m_mutex);
    return m_save_count;
}

void MemoryVaultStorage::set_fail_writes(bool fail) {
    std::lock_guard lock(m_mutex);
    m_fail_writes = fail;
}

}  // namespace CertenVault
