// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "FileVaultStorage.h"
#include "../io/VaultIO.h"
#include "../../utils/Log.h"
#include <glibmm/miscutils.h>
#include <algorithm>
#include <utility>

namespace CertenVault {

namespace {

constexpr std::string_view FILE_EXTENSION = ".vault";

// Identifiers become file names; path separators and dot-only names are refused
bool is_safe_identifier(std::string_view id) noexcept {
    if (id.empty() || id == "." || id == "..") {
        return false;
    }
    return std::ranges::none_of(id, [](char c) { return c == '/' || c == '\0'; });
}

}  // namespace

FileVaultStorage::FileVaultStorage(std::string directory)
    : m_directory(std::move(directory)) {
}

std::string FileVaultStorage::default_directory() {
    return Glib::build_filename(Glib::get_user_data_dir(), "certen-vault");
}

std::string FileVaultStorage::path_for(std::string_view id) const {
    return Glib::build_filename(m_directory, std::string(id) + std::string(FILE_EXTENSION));
}

VaultResult<std::optional<std::vector<uint8_t>>> FileVaultStorage::load(std::string_view id) {
    if (!is_safe_identifier(id)) {
        return std::unexpected(VaultError::StorageReadFailed);
    }
    return VaultIO::read_file(path_for(id));
}

VaultResult<> FileVaultStorage::save(std::string_view id, std::span<const uint8_t> data) {
    if (!is_safe_identifier(id)) {
        return std::unexpected(VaultError::StorageWriteFailed);
    }
    if (auto dir = VaultIO::ensure_directory(m_directory); !dir) {
        return dir;
    }
    auto result = VaultIO::write_file(path_for(id), data);
    if (result) {
        Log::debug("Saved vault record '{}' ({} bytes)", id, data.size());
    }
    return result;
}

VaultResult<> FileVaultStorage::remove(std::string_view id) {
    if (!is_safe_identifier(id)) {
        return std::unexpected(VaultError::StorageWriteFailed);
    }
    return VaultIO::remove_file(path_for(id));
}

}  // namespace CertenVault
