// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "RequestSigner.h"
#include "PendingTransactionDigest.h"
#include "../curves/Secp256k1.h"
#include "../../utils/Codec.h"
#include "../../utils/Log.h"
#include <algorithm>

namespace CertenVault {

namespace {

VaultResult<std::vector<uint8_t>> decode_hash(std::string_view hex) {
    if (Codec::strip_hex_prefix(hex).empty()) {
        return std::unexpected(VaultError::EmptyInput);
    }
    return Codec::from_hex(hex);
}

VaultResult<SigningDigest> digest_of(std::string_view hex, std::optional<KeyType> required_type = std::nullopt) {
    auto bytes = decode_hash(hex);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return SigningDigest{std::move(*bytes), required_type};
}

VaultResult<SigningDigest> pending_digest(const PendingTransaction& tx) {
    std::optional<Hashes::Digest32> local;
    if (auto tx_hash = decode_hash(tx.transaction_hash); tx_hash) {
        auto computed = PendingTransactionDigest::data_for_signature(
            *tx_hash, tx.signer_url, tx.signer_version, tx.timestamp);
        if (computed) {
            local = *computed;
        }
    }

    if (tx.data_for_signature) {
        auto supplied = decode_hash(*tx.data_for_signature);
        if (!supplied) {
            return std::unexpected(supplied.error());
        }
        if (local && !std::ranges::equal(*supplied, *local)) {
            Log::warning("Supplied dataForSignature differs from local derivation for {}", tx.signer_url);
        }
        return SigningDigest{std::move(*supplied), std::nullopt};
    }

    if (!local) {
        auto tx_hash = decode_hash(tx.transaction_hash);
        return std::unexpected(tx_hash ? VaultError::InvalidData : tx_hash.error());
    }
    Log::warning("No dataForSignature supplied for {}, using local derivation", tx.signer_url);
    return SigningDigest{std::vector<uint8_t>(local->begin(), local->end()), std::nullopt};
}

struct DigestVisitor {
    VaultResult<SigningDigest> operator()(const AccountTransaction& tx) const {
        return digest_of(tx.transaction_hash);
    }
    VaultResult<SigningDigest> operator()(const PendingTransaction& tx) const {
        return pending_digest(tx);
    }
    VaultResult<SigningDigest> operator()(const AccountHash& request) const {
        return digest_of(request.hash);
    }
    VaultResult<SigningDigest> operator()(const EthereumHash& request) const {
        return digest_of(request.hash, KeyType::Secp256k1);
    }
    VaultResult<SigningDigest> operator()(const PersonalMessage& request) const {
        const auto hash = Secp256k1::hash_personal_message(Codec::as_bytes(request.message));
        return SigningDigest{std::vector<uint8_t>(hash.begin(), hash.end()), KeyType::Secp256k1};
    }
    VaultResult<SigningDigest> operator()(const BlsHash& request) const {
        return digest_of(request.hash, KeyType::Bls12381);
    }
    VaultResult<SigningDigest> operator()(const CrossChainIntent& intent) const {
        return digest_of(intent.intent_id);
    }
};

std::optional<std::string> by_signer_url(Vault& vault, const std::optional<std::string>& url) {
    if (!url || url->empty()) {
        return std::nullopt;
    }
    auto found = vault.find_key_by_accumulate_url(*url);
    if (found && *found) {
        return (*found)->id;
    }
    return std::nullopt;
}

std::optional<std::string> by_evm_address(Vault& vault, std::string_view address) {
    if (address.empty()) {
        return std::nullopt;
    }
    auto found = vault.find_key_by_evm_address(address);
    if (found && *found) {
        return (*found)->id;
    }
    return std::nullopt;
}

}  // namespace

VaultResult<SigningDigest> RequestSigner::digest_for(const SignRequestData& data) {
    return std::visit(DigestVisitor{}, data);
}

KeyType RequestSigner::preferred_type(const SignRequestData& data) noexcept {
    if (std::holds_alternative<EthereumHash>(data) || std::holds_alternative<PersonalMessage>(data)) {
        return KeyType::Secp256k1;
    }
    if (std::holds_alternative<BlsHash>(data)) {
        return KeyType::Bls12381;
    }
    return KeyType::Ed25519;
}

std::optional<std::string> RequestSigner::suggest_key(Vault& vault, const SignRequestData& data) {
    std::optional<std::string> match;
    if (const auto* tx = std::get_if<AccountTransaction>(&data)) {
        match = by_signer_url(vault, tx->signer_url);
    } else if (const auto* pending = std::get_if<PendingTransaction>(&data)) {
        match = by_signer_url(vault, pending->signer_url);
    } else if (const auto* hash = std::get_if<AccountHash>(&data)) {
        match = by_signer_url(vault, hash->signer_url);
    } else if (const auto* eth = std::get_if<EthereumHash>(&data)) {
        match = by_evm_address(vault, eth->address);
    } else if (const auto* message = std::get_if<PersonalMessage>(&data)) {
        match = by_evm_address(vault, message->address);
    }
    if (match) {
        return match;
    }

    auto keys = vault.get_keys_by_type(preferred_type(data));
    if (!keys || keys->empty()) {
        return std::nullopt;
    }
    return keys->front().id;
}

VaultResult<SignedPayload> RequestSigner::sign(Vault& vault, const SignRequest& request, std::string_view key_id) {
    auto digest = digest_for(request.data);
    if (!digest) {
        return std::unexpected(digest.error());
    }

    auto keys = vault.get_all_keys();
    if (!keys) {
        return std::unexpected(keys.error());
    }
    auto key = std::ranges::find(*keys, key_id, &KeyInfo::id);
    if (key == keys->end()) {
        return std::unexpected(VaultError::KeyNotFound);
    }
    if (digest->required_type && key->type != *digest->required_type) {
        Log::warning("Request {} needs a {} key, {} is {}", request.id,
                     to_string(*digest->required_type), key->id, to_string(key->type));
        return std::unexpected(VaultError::UnsupportedKeyType);
    }

    auto signature = vault.sign(key_id, digest->bytes);
    if (!signature) {
        return std::unexpected(signature.error());
    }

    SignedPayload payload;
    payload.signature = Codec::to_hex(signature->signature);
    payload.public_key = Codec::to_hex(signature->public_key);
    payload.key_id = signature->key_id;
    if (const auto* pending = std::get_if<PendingTransaction>(&request.data)) {
        payload.timestamp = static_cast<int64_t>(pending->timestamp);
    }
    return payload;
}

}  // namespace CertenVault
