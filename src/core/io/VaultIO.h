// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file VaultIO.h
 * @brief Secure file I/O for the persisted vault record
 *
 * Contains the VaultIO utility class used by FileVaultStorage: atomic
 * writes, owner-only permissions and symlink-safe reads.
 */

#ifndef CERTENVAULT_VAULTIO_H
#define CERTENVAULT_VAULTIO_H

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "../VaultError.h"

namespace CertenVault {

/**
 * @brief Utility class for secure vault file I/O operations
 *
 * @section features Features
 * - Atomic file writes using a temporary file and rename(2)
 * - Files created with 0600 permissions
 * - Directory fsync after rename for durability
 * - Reads refuse symlinks and files readable by group or others
 *
 * @section limitations Limitations
 * - No file locking. Two processes writing the same vault race and the
 *   last rename wins.
 *
 * @section usage Usage Example
 * @code
 * auto written = VaultIO::write_file("/home/u/.local/share/certen/certen_vault_v1.vault", bytes);
 * auto loaded = VaultIO::read_file(path);
 * if (loaded && !loaded->has_value()) {
 *     // no vault yet
 * }
 * @endcode
 *
 * @note This is a utility class with deleted constructors (static methods only)
 */
class VaultIO {
public:
    /// Largest file read_file() will load
    static constexpr size_t MAX_FILE_SIZE = 64 * 1024 * 1024;

    /**
     * @brief Read a whole file
     *
     * Opens with O_NOFOLLOW and checks permissions with fstat on the same
     * descriptor, so the file checked is the file read.
     *
     * @param path Path to the vault file
     * @return File contents, std::nullopt if the file does not exist, or
     *         - VaultError::FilePermissionDenied for group/other access bits
     *           or a symlink
     *         - VaultError::StorageReadFailed for any other failure
     */
    [[nodiscard]] static VaultResult<std::optional<std::vector<uint8_t>>> read_file(const std::string& path);

    /**
     * @brief Write a file atomically
     *
     * Data goes to "<path>.tmp" (created 0600), is fsynced, then renamed over
     * @p path. The parent directory is fsynced afterwards.
     *
     * @return VaultError::StorageWriteFailed on any failure; the temporary
     *         file is removed and the original left untouched
     *
     * @post File permissions are 0600
     */
    [[nodiscard]] static VaultResult<> write_file(const std::string& path, std::span<const uint8_t> data);

    /**
     * @brief Delete a file; a missing file is not an error
     * @return VaultError::StorageWriteFailed if the file exists and cannot be removed
     */
    [[nodiscard]] static VaultResult<> remove_file(const std::string& path);

    /**
     * @brief Create @p path (and parents) with 0700 permissions if missing
     * @return VaultError::StorageWriteFailed on failure
     */
    [[nodiscard]] static VaultResult<> ensure_directory(const std::string& path);

    VaultIO() = delete;
    ~VaultIO() = delete;
    VaultIO(const VaultIO&) = delete;
    VaultIO& operator=(const VaultIO&) = delete;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_VAULTIO_H
