// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

/**
 * @file SignRequest.h
 * @brief Sign request kinds, lifecycle states and completion outcomes
 */

#ifndef CERTENVAULT_SIGN_REQUEST_H
#define CERTENVAULT_SIGN_REQUEST_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include "../VaultError.h"

namespace CertenVault {

/// Provider RPC method names
namespace RpcMethod {
inline constexpr std::string_view REQUEST_ACCOUNTS = "acc_requestAccounts";
inline constexpr std::string_view GET_ACCOUNTS = "acc_getAccounts";
inline constexpr std::string_view DISCONNECT = "acc_disconnect";
inline constexpr std::string_view SIGN_TRANSACTION = "acc_signTransaction";
inline constexpr std::string_view SIGN_PENDING_TRANSACTION = "acc_signPendingTransaction";
inline constexpr std::string_view SIGN_HASH = "acc_signHash";
inline constexpr std::string_view ETH_SIGN_HASH = "eth_signHash";
inline constexpr std::string_view PERSONAL_SIGN = "personal_sign";
inline constexpr std::string_view BLS_SIGN_HASH = "bls_signHash";
inline constexpr std::string_view SIGN_INTENT = "certen_signIntent";
}  // namespace RpcMethod

/// Hashes and ids below are hex strings, with or without a 0x prefix

struct AccountTransaction {
    std::string principal;
    std::string signer_url;
    std::optional<uint64_t> signer_version;
    std::string transaction_hash;
    std::optional<std::string> transaction_type;
    std::optional<std::string> human_readable;
};

/// Signature on a transaction already pending on the network (multi-sig)
struct PendingTransaction {
    std::string transaction_hash;
    std::string signer_url;
    uint64_t signer_version = 1;
    uint64_t timestamp = 0;
    std::optional<std::string> data_for_signature;
};

struct AccountHash {
    std::string hash;
    std::optional<std::string> signer_url;
};

struct EthereumHash {
    std::string hash;
    std::string address;
};

/// EIP-191 message; @c message is UTF-8 text
struct PersonalMessage {
    std::string message;
    std::string address;
};

struct BlsHash {
    std::string hash;
    std::optional<uint64_t> validator_index;
};

struct CrossChainIntent {
    std::string intent_id;
    std::string adi_url;
    std::string action_type;
    std::string description;
    std::optional<std::string> target_chain;
    std::optional<std::string> target_address;
    std::optional<std::string> amount;
};

using SignRequestData = std::variant<
    AccountTransaction,
    PendingTransaction,
    AccountHash,
    EthereumHash,
    PersonalMessage,
    BlsHash,
    CrossChainIntent>;

/// RPC method that carries @p data
[[nodiscard]] inline std::string_view method_for(const SignRequestData& data) noexcept {
    struct Visitor {
        std::string_view operator()(const AccountTransaction&) const { return RpcMethod::SIGN_TRANSACTION; }
        std::string_view operator()(const PendingTransaction&) const { return RpcMethod::SIGN_PENDING_TRANSACTION; }
        std::string_view operator()(const AccountHash&) const { return RpcMethod::SIGN_HASH; }
        std::string_view operator()(const EthereumHash&) const { return RpcMethod::ETH_SIGN_HASH; }
        std::string_view operator()(const PersonalMessage&) const { return RpcMethod::PERSONAL_SIGN; }
        std::string_view operator()(const BlsHash&) const { return RpcMethod::BLS_SIGN_HASH; }
        std::string_view operator()(const CrossChainIntent&) const { return RpcMethod::SIGN_INTENT; }
    };
    return std::visit(Visitor{}, data);
}

enum class SignRequestStatus {
    Pending,
    Approved,
    Rejected,
    Completed,
    Error
};

[[nodiscard]] inline constexpr std::string_view to_string(SignRequestStatus status) noexcept {
    switch (status) {
        case SignRequestStatus::Pending:   return "pending";
        case SignRequestStatus::Approved:  return "approved";
        case SignRequestStatus::Rejected:  return "rejected";
        case SignRequestStatus::Completed: return "completed";
        case SignRequestStatus::Error:     return "error";
    }
    return "unknown";
}

/// Rejected, Completed and Error are final
[[nodiscard]] inline constexpr bool is_terminal(SignRequestStatus status) noexcept {
    return status == SignRequestStatus::Rejected ||
           status == SignRequestStatus::Completed ||
           status == SignRequestStatus::Error;
}

struct SignRequest {
    std::string id;
    std::string method;
    std::string origin;
    int64_t timestamp = 0;
    SignRequestData data;
    SignRequestStatus status = SignRequestStatus::Pending;
    std::optional<int64_t> finished_at;  ///< Set on the terminal transition
};

/// Signature returned to the requesting origin, hex encoded
struct SignedPayload {
    std::string signature;
    std::string public_key;
    std::string key_id;
    std::optional<int64_t> timestamp;

    bool operator==(const SignedPayload&) const = default;
};

/**
 * @brief Final result delivered to a request's completion callback
 *
 * Exactly one of @c result or (@c error, @c message) is meaningful.
 */
struct SignOutcome {
    SignRequestStatus status = SignRequestStatus::Pending;
    std::optional<SignedPayload> result;
    VaultError error = VaultError::UnknownError;
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return result.has_value(); }
};

using CompletionCallback = std::function<void(const SignOutcome&)>;

}  // namespace CertenVault

#endif  // CERTENVAULT_SIGN_REQUEST_H
