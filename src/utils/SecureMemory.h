// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file SecureMemory.h
 * @brief Secure memory handling utilities
 *
 * RAII wrappers for OpenSSL handles and zeroizing containers for key
 * material. Private keys, seeds, derived vault keys and passwords pass
 * through these types so they are wiped even on early returns.
 */

#ifndef CERTENVAULT_SECURE_MEMORY_H
#define CERTENVAULT_SECURE_MEMORY_H

#include <array>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <glibmm/ustring.h>

namespace CertenVault {

/**
 * @brief Custom deleter for EVP_CIPHER_CTX that securely frees context
 */
struct EVPCipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};

/// Deleter for message digest contexts
struct EVPMdContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

/// Deleter for asymmetric keys
struct EVPPkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

/**
 * @brief Secure allocator for std::vector that zeros memory on deallocation
 *
 * @tparam T Type of elements (typically uint8_t for crypto buffers)
 *
 * @code
 * SecureVector<uint8_t> seed = Mnemonic::to_seed(phrase);
 * // ... derive keys ...
 * // Automatically zeroized on destruction
 * @endcode
 */
template<typename T>
class SecureAllocator : public std::allocator<T> {
public:
    template<typename U>
    struct rebind {
        using other = SecureAllocator<U>;
    };

    SecureAllocator() noexcept = default;

    template<typename U>
    SecureAllocator(const SecureAllocator<U>&) noexcept {}

    /**
     * @brief Deallocate and securely zero memory
     * @param p Pointer to memory to deallocate
     * @param n Number of elements
     */
    void deallocate(T* p, std::size_t n) {
        if (p) {
            OPENSSL_cleanse(p, n * sizeof(T));
            std::allocator<T>::deallocate(p, n);
        }
    }
};

template<typename T, typename U>
bool operator==(const SecureAllocator<T>&, const SecureAllocator<U>&) noexcept { return true; }

/**
 * @brief std::vector with secure allocator
 *
 * Use for any buffer holding private keys, seeds, chain codes or plaintext
 * vault payloads.
 */
template<typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

using EVPCipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherContextDeleter>;
using EVPMdContextPtr = std::unique_ptr<EVP_MD_CTX, EVPMdContextDeleter>;
using EVPPkeyPtr = std::unique_ptr<EVP_PKEY, EVPPkeyDeleter>;

/**
 * @brief Securely clear a std::array
 *
 * @code
 * std::array<uint8_t, 64> digest = Hashes::hmac_sha512(key, data);
 * // Use digest...
 * secure_clear(digest);
 * @endcode
 */
template<size_t N>
inline void secure_clear(std::array<uint8_t, N>& arr) {
    OPENSSL_cleanse(arr.data(), arr.size());
}

/// Securely clear a byte vector and release its contents
inline void secure_clear(std::vector<uint8_t>& bytes) {
    if (!bytes.empty()) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
        bytes.clear();
    }
}

/// Securely clear a std::string (hex private keys, mnemonics)
inline void secure_clear(std::string& str) {
    if (!str.empty()) {
        OPENSSL_cleanse(str.data(), str.size());
        str.clear();
    }
}

/**
 * @brief Securely clear a Glib::ustring containing sensitive data
 *
 * @param str String to clear (typically a password)
 */
inline void secure_clear_ustring(Glib::ustring& str) {
    if (!str.empty()) {
        OPENSSL_cleanse(const_cast<char*>(str.data()), str.bytes());
        str.clear();
    }
}

/**
 * @brief RAII wrapper for Glib::ustring with automatic secure destruction
 *
 * Used by the command-line host for passwords read from the terminal.
 *
 * @code
 * SecureString password{read_password("Password: ")};
 * auto result = vault.unlock(password.get());
 * // Automatically securely cleared on scope exit
 * @endcode
 */
class SecureString {
public:
    explicit SecureString(Glib::ustring str) : str_(std::move(str)) {}

    ~SecureString() {
        secure_clear_ustring(str_);
    }

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    SecureString(SecureString&& other) noexcept
        : str_(std::move(other.str_)) {
        secure_clear_ustring(other.str_);
    }

    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            secure_clear_ustring(str_);
            str_ = std::move(other.str_);
            secure_clear_ustring(other.str_);
        }
        return *this;
    }

    [[nodiscard]] const Glib::ustring& get() const noexcept {
        return str_;
    }

private:
    Glib::ustring str_;
};

} // namespace CertenVault

#endif // CERTENVAULT_SECURE_MEMORY_H
