// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_FILE_VAULT_STORAGE_H
#define CERTENVAULT_FILE_VAULT_STORAGE_H

#include <string>
#include "IVaultStorage.h"

namespace CertenVault {

/**
 * @brief IVaultStorage backed by files in one directory
 *
 * Identifier "certen_vault_v1" maps to "<directory>/certen_vault_v1.vault".
 * All file access goes through VaultIO (atomic writes, 0600, O_NOFOLLOW).
 * The directory is created on first save.
 */
class FileVaultStorage final : public IVaultStorage {
public:
    explicit FileVaultStorage(std::string directory);

    [[nodiscard]] VaultResult<std::optional<std::vector<uint8_t>>> load(std::string_view id) override;
    [[nodiscard]] VaultResult<> save(std::string_view id, std::span<const uint8_t> data) override;
    [[nodiscard]] VaultResult<> remove(std::string_view id) override;

    [[nodiscard]] const std::string& directory() const noexcept { return m_directory; }

    /// Full path of the file holding @p id
    [[nodiscard]] std::string path_for(std::string_view id) const;

    /// $XDG_DATA_HOME/certen-vault (via Glib::get_user_data_dir)
    [[nodiscard]] static std::string default_directory();

private:
    std::string m_directory;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_FILE_VAULT_STORAGE_H
