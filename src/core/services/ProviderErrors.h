// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file ProviderErrors.h
 * @brief Numeric error codes returned across the provider RPC surface
 *
 * Codes follow EIP-1193 (4xxx) and JSON-RPC 2.0 (-326xx).
 */

#ifndef CERTENVAULT_PROVIDER_ERRORS_H
#define CERTENVAULT_PROVIDER_ERRORS_H

#include <expected>
#include <string>
#include <string_view>
#include "../VaultError.h"

namespace CertenVault {

enum class ProviderErrorCode : int {
    USER_REJECTED = 4001,
    UNAUTHORIZED = 4100,
    UNSUPPORTED_METHOD = 4200,
    INVALID_REQUEST = -32600,
    METHOD_NOT_FOUND = -32601,
    INVALID_PARAMS = -32602,
    INTERNAL_ERROR = -32603
};

struct ProviderError {
    ProviderErrorCode code = ProviderErrorCode::INTERNAL_ERROR;
    std::string message;

    [[nodiscard]] int numeric_code() const noexcept { return static_cast<int>(code); }
};

template<typename T = void>
using ProviderResult = std::expected<T, ProviderError>;

/**
 * @brief Provider code for a vault error
 *
 * Rejections and timeouts both surface as USER_REJECTED; a locked vault as
 * UNAUTHORIZED so callers can prompt for unlock instead of reporting a
 * missing key.
 */
[[nodiscard]] constexpr ProviderErrorCode to_provider_code(VaultError error) noexcept {
    switch (error) {
        case VaultError::UserRejected:
        case VaultError::Timeout:
            return ProviderErrorCode::USER_REJECTED;
        case VaultError::VaultLocked:
        case VaultError::NotInitialized:
        case VaultError::InvalidPassword:
            return ProviderErrorCode::UNAUTHORIZED;
        case VaultError::UnsupportedKeyType:
            return ProviderErrorCode::UNSUPPORTED_METHOD;
        case VaultError::KeyNotFound:
        case VaultError::RequestNotFound:
        case VaultError::RequestNotPending:
        case VaultError::AlreadyInitialized:
        case VaultError::MnemonicNotAvailable:
            return ProviderErrorCode::INVALID_REQUEST;
        case VaultError::InvalidHex:
        case VaultError::InvalidKeyLength:
        case VaultError::InvalidPrivateKey:
        case VaultError::InvalidMnemonic:
        case VaultError::InvalidDerivationPath:
        case VaultError::InvalidAddress:
        case VaultError::LengthMismatch:
        case VaultError::EmptyInput:
        case VaultError::InvalidData:
            return ProviderErrorCode::INVALID_PARAMS;
        default:
            return ProviderErrorCode::INTERNAL_ERROR;
    }
}

[[nodiscard]] inline ProviderError make_provider_error(VaultError error) {
    return ProviderError{to_provider_code(error), std::string(to_string(error))};
}

[[nodiscard]] inline ProviderError make_provider_error(ProviderErrorCode code, std::string_view message) {
    return ProviderError{code, std::string(message)};
}

}  // namespace CertenVault

#endif  // CERTENVAULT_PROVIDER_ERRORS_H
