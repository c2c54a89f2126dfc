// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file VaultIO.cc
 * @brief Implementation of secure vault file I/O operations
 */

#include "VaultIO.h"
#include "../../utils/Log.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace CertenVault {

namespace {

// Closes the descriptor when it leaves scope
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    /// Close explicitly so the caller can check the result
    [[nodiscard]] bool close() noexcept {
        const int fd = fd_;
        fd_ = -1;
        return ::close(fd) == 0;
    }

private:
    int fd_;
};

bool write_all(int fd, std::span<const uint8_t> data) {
    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

void sync_parent_directory(const std::string& path) {
    std::string dir = std::filesystem::path(path).parent_path().string();
    if (dir.empty()) {
        dir = ".";
    }
    FileDescriptor dir_fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (dir_fd.valid() && ::fsync(dir_fd.get()) != 0) {
        Log::warning("Failed to sync directory {}: {}", dir, std::strerror(errno));
    }
}

}  // namespace

VaultResult<std::optional<std::vector<uint8_t>>> VaultIO::read_file(const std::string& path) {
    // O_NOFOLLOW prevents symlink attacks; fstat on the same fd avoids TOCTOU
    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
    if (!fd.valid()) {
        if (errno == ENOENT) {
            return std::optional<std::vector<uint8_t>>{};
        }
        if (errno == ELOOP) {
            Log::error("Refusing to read vault through symlink: {}", path);
            return std::unexpected(VaultError::FilePermissionDenied);
        }
        Log::error("Failed to open vault file {}: {}", path, std::strerror(errno));
        return std::unexpected(VaultError::StorageReadFailed);
    }

    struct stat st {};
    if (::fstat(fd.get(), &st) != 0) {
        Log::error("Failed to stat vault file {}: {}", path, std::strerror(errno));
        return std::unexpected(VaultError::StorageReadFailed);
    }
    if (!S_ISREG(st.st_mode)) {
        Log::error("Vault path is not a regular file: {}", path);
        return std::unexpected(VaultError::StorageReadFailed);
    }
    if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
        Log::error("Vault file has insecure permissions {:o} (must be owner-only): {}",
                   st.st_mode & 0777, path);
        return std::unexpected(VaultError::FilePermissionDenied);
    }
    if (static_cast<size_t>(st.st_size) > MAX_FILE_SIZE) {
        Log::error("Vault file exceeds maximum size ({} bytes)", st.st_size);
        return std::unexpected(VaultError::StorageReadFailed);
    }

    std::vector<uint8_t> data(static_cast<size_t>(st.st_size));
    size_t total = 0;
    while (total < data.size()) {
        const ssize_t n = ::read(fd.get(), data.data() + total, data.size() - total);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            Log::error("Error reading vault file {}: {}", path, std::strerror(errno));
            return std::unexpected(VaultError::StorageReadFailed);
        }
        if (n == 0) {
            break;
        }
        total += static_cast<size_t>(n);
    }
    data.resize(total);
    return std::optional<std::vector<uint8_t>>{std::move(data)};
}

VaultResult<> VaultIO::write_file(const std::string& path, std::span<const uint8_t> data) {
    const std::string temp_path = path + ".tmp";

    {
        FileDescriptor fd(::open(temp_path.c_str(),
                                 O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC,
                                 S_IRUSR | S_IWUSR));
        if (!fd.valid()) {
            Log::error("Failed to create temporary vault file {}: {}", temp_path, std::strerror(errno));
            return std::unexpected(VaultError::StorageWriteFailed);
        }

        // O_CREAT does not change the mode of a pre-existing temp file
        const bool ok = ::fchmod(fd.get(), S_IRUSR | S_IWUSR) == 0 &&
                        write_all(fd.get(), data) &&
                        ::fsync(fd.get()) == 0 &&
                        fd.close();
        if (!ok) {
            Log::error("Failed to write vault data to {}: {}", temp_path, std::strerror(errno));
            ::unlink(temp_path.c_str());
            return std::unexpected(VaultError::StorageWriteFailed);
        }
    }

    // Atomic rename (POSIX guarantees atomicity)
    if (::rename(temp_path.c_str(), path.c_str()) != 0) {
        Log::error("Failed to replace vault file {}: {}", path, std::strerror(errno));
        ::unlink(temp_path.c_str());
        return std::unexpected(VaultError::StorageWriteFailed);
    }

    sync_parent_directory(path);
    return {};
}

VaultResult<> VaultIO::remove_file(const std::string& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        Log::error("Failed to remove vault file {}: {}", path, std::strerror(errno));
        return std::unexpected(VaultError::StorageWriteFailed);
    }
    sync_parent_directory(path);
    return {};
}

VaultResult<> VaultIO::ensure_directory(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return {};
    }
    fs::create_directories(path, ec);
    if (ec) {
        Log::error("Failed to create vault directory {}: {}", path, ec.message());
        return std::unexpected(VaultError::StorageWriteFailed);
    }
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        Log::warning("Failed to restrict permissions on {}: {}", path, ec.message());
    }
    Log::info("Created vault directory: {}", path);
    return {};
}

}  // namespace CertenVault
