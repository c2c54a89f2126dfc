// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol
//
// VaultError.h - Error types for key vault operations
// C++23 std::expected-based error handling

#ifndef CERTENVAULT_VAULT_ERROR_H
#define CERTENVAULT_VAULT_ERROR_H

#include <expected>
#include <string>
#include <string_view>

namespace CertenVault {

// Comprehensive error types for vault operations
enum class VaultError {
    // Lifecycle
    AlreadyInitialized,
    NotInitialized,
    VaultLocked,

    // Authentication
    InvalidPassword,

    // Storage
    StorageReadFailed,
    StorageWriteFailed,
    FilePermissionDenied,

    // Cryptography
    EncryptionFailed,
    KeyDerivationFailed,
    CryptoError,
    SigningFailed,

    // Data operations
    SerializationFailed,
    InvalidProtobuf,
    InvalidData,
    UnsupportedSchema,

    // Input validation
    InvalidHex,
    InvalidKeyLength,
    InvalidPrivateKey,
    UnsupportedKeyType,
    InvalidMnemonic,
    InvalidDerivationPath,
    InvalidAddress,
    LengthMismatch,
    EmptyInput,

    // Keys
    KeyNotFound,
    MnemonicNotAvailable,

    // Sign requests
    RequestNotFound,
    RequestNotPending,
    UserRejected,
    Timeout,

    // Generic
    UnknownError
};

// Convert error enum to human-readable string
inline constexpr std::string_view to_string(VaultError error) noexcept {
    switch (error) {
        case VaultError::AlreadyInitialized:
            return "Vault already initialized";
        case VaultError::NotInitialized:
            return "Vault not initialized";
        case VaultError::VaultLocked:
            return "Vault is locked";
        case VaultError::InvalidPassword:
            return "Invalid password";
        case VaultError::StorageReadFailed:
            return "Failed to read vault storage";
        case VaultError::StorageWriteFailed:
            return "Failed to write vault storage";
        case VaultError::FilePermissionDenied:
            return "Permission denied";
        case VaultError::EncryptionFailed:
            return "Encryption failed";
        case VaultError::KeyDerivationFailed:
            return "Key derivation failed";
        case VaultError::CryptoError:
            return "Cryptographic operation failed";
        case VaultError::SigningFailed:
            return "Signing failed";
        case VaultError::SerializationFailed:
            return "Failed to serialize data";
        case VaultError::InvalidProtobuf:
            return "Invalid protobuf format";
        case VaultError::InvalidData:
            return "Invalid data format";
        case VaultError::UnsupportedSchema:
            return "Unsupported vault version";
        case VaultError::InvalidHex:
            return "Invalid hex string";
        case VaultError::InvalidKeyLength:
            return "Invalid key length";
        case VaultError::InvalidPrivateKey:
            return "Invalid private key";
        case VaultError::UnsupportedKeyType:
            return "Unsupported key type";
        case VaultError::InvalidMnemonic:
            return "Invalid mnemonic phrase";
        case VaultError::InvalidDerivationPath:
            return "Invalid derivation path";
        case VaultError::InvalidAddress:
            return "Invalid address";
        case VaultError::LengthMismatch:
            return "Input lengths do not match";
        case VaultError::EmptyInput:
            return "Input must not be empty";
        case VaultError::KeyNotFound:
            return "Key not found";
        case VaultError::MnemonicNotAvailable:
            return "No mnemonic stored in vault";
        case VaultError::RequestNotFound:
            return "Sign request not found";
        case VaultError::RequestNotPending:
            return "Sign request is no longer pending";
        case VaultError::UserRejected:
            return "User rejected the request";
        case VaultError::Timeout:
            return "Request timeout";
        case VaultError::UnknownError:
            return "Unknown error occurred";
    }
    return "Unknown error";
}

// Helper type aliases
template<typename T = void>
using VaultResult = std::expected<T, VaultError>;

} // namespace CertenVault

#endif // CERTENVAULT_VAULT_ERROR_H
