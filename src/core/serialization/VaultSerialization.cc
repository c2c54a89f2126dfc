// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "VaultSerialization.h"
#include "vault.pb.h"
#include "../crypto/VaultCrypto.h"
#include "../../utils/Log.h"
#include <openssl/crypto.h>
#include <string>

namespace CertenVault {

namespace {

void wipe_string(std::string* str) {
    if (str && !str->empty()) {
        OPENSSL_cleanse(str->data(), str->size());
    }
}

template<typename Bytes>
void assign_bytes(std::string* out, const Bytes& bytes) {
    out->assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

// Protobuf frees without clearing; scrub secrets before the message dies
void wipe_payload_record(certenvault::VaultPayloadRecord& record) {
    for (auto& key : *record.mutable_keys()) {
        wipe_string(key.mutable_private_key());
    }
    if (record.has_mnemonic()) {
        wipe_string(record.mutable_mnemonic());
    }
}

certenvault::KeyTypeRecord to_record(KeyType type) {
    switch (type) {
        case KeyType::Ed25519:   return certenvault::KEY_TYPE_ED25519;
        case KeyType::Secp256k1: return certenvault::KEY_TYPE_SECP256K1;
        case KeyType::Bls12381:  return certenvault::KEY_TYPE_BLS12381;
    }
    return certenvault::KEY_TYPE_ED25519;
}

std::optional<KeyType> from_record(certenvault::KeyTypeRecord type) {
    switch (type) {
        case certenvault::KEY_TYPE_ED25519:   return KeyType::Ed25519;
        case certenvault::KEY_TYPE_SECP256K1: return KeyType::Secp256k1;
        case certenvault::KEY_TYPE_BLS12381:  return KeyType::Bls12381;
        default: return std::nullopt;
    }
}

void fill_metadata(const KeyMetadata& metadata, certenvault::KeyMetadataRecord* out) {
    if (metadata.accumulate_url) {
        out->set_accumulate_url(*metadata.accumulate_url);
    }
    if (metadata.key_page_url) {
        out->set_key_page_url(*metadata.key_page_url);
    }
    if (metadata.evm_address) {
        out->set_evm_address(*metadata.evm_address);
    }
    out->set_mnemonic(metadata.from_mnemonic);
    for (const auto& [chain, address] : metadata.chain_addresses) {
        (*out->mutable_chain_addresses())[chain] = address;
    }
}

KeyMetadata read_metadata(const certenvault::KeyMetadataRecord& record) {
    KeyMetadata metadata;
    if (record.has_accumulate_url()) {
        metadata.accumulate_url = record.accumulate_url();
    }
    if (record.has_key_page_url()) {
        metadata.key_page_url = record.key_page_url();
    }
    if (record.has_evm_address()) {
        metadata.evm_address = record.evm_address();
    }
    metadata.from_mnemonic = record.mnemonic();
    for (const auto& [chain, address] : record.chain_addresses()) {
        metadata.chain_addresses.emplace(chain, address);
    }
    return metadata;
}

template<typename Message>
bool parse_bounded(Message& message, std::span<const uint8_t> data, std::string_view what) {
    if (data.size() > VaultSerialization::MAX_MESSAGE_SIZE) {
        Log::error("VaultSerialization: {} exceeds maximum size ({} bytes > {} bytes)",
                   what, data.size(), VaultSerialization::MAX_MESSAGE_SIZE);
        return false;
    }
    if (!message.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
        Log::error("VaultSerialization: Failed to parse {}", what);
        return false;
    }
    return true;
}

}  // namespace

VaultResult<SecureVector<uint8_t>>
VaultSerialization::serialize_payload(const VaultPayload& payload) {
    certenvault::VaultPayloadRecord record;

    for (const auto& key : payload.keys) {
        auto* out = record.add_keys();
        out->set_id(key.id);
        out->set_name(key.name);
        out->set_type(to_record(key.type));
        assign_bytes(out->mutable_public_key(), key.public_key);
        assign_bytes(out->mutable_private_key(), key.private_key);
        out->set_created_at(key.created_at);
        if (key.last_used_at) {
            out->set_last_used_at(*key.last_used_at);
        }
        if (key.derivation_path) {
            out->set_derivation_path(*key.derivation_path);
        }
        fill_metadata(key.metadata, out->mutable_metadata());
    }

    auto* metadata = record.mutable_metadata();
    metadata->set_created_at(payload.metadata.created_at);
    metadata->set_last_modified(payload.metadata.last_modified);
    metadata->set_key_count(static_cast<uint32_t>(payload.keys.size()));

    if (payload.mnemonic) {
        record.set_mnemonic(*payload.mnemonic);
    }

    std::string serialized;
    const bool ok = record.SerializeToString(&serialized);
    wipe_payload_record(record);
    if (!ok) {
        Log::error("VaultSerialization: Failed to serialize vault payload");
        wipe_string(&serialized);
        return std::unexpected(VaultError::SerializationFailed);
    }

    SecureVector<uint8_t> result(serialized.begin(), serialized.end());
    wipe_string(&serialized);
    return result;
}

VaultResult<VaultPayload>
VaultSerialization::deserialize_payload(std::span<const uint8_t> data) {
    certenvault::VaultPayloadRecord record;
    if (!parse_bounded(record, data, "vault payload")) {
        wipe_payload_record(record);
        return std::unexpected(VaultError::InvalidProtobuf);
    }

    VaultPayload payload;
    payload.keys.reserve(static_cast<size_t>(record.keys_size()));

    for (const auto& in : record.keys()) {
        auto type = from_record(in.type());
        if (!type) {
            Log::error("VaultSerialization: Unknown key type {} in payload", static_cast<int>(in.type()));
            wipe_payload_record(record);
            return std::unexpected(VaultError::InvalidProtobuf);
        }

        StoredKey key;
        key.id = in.id();
        key.name = in.name();
        key.type = *type;
        key.public_key.assign(in.public_key().begin(), in.public_key().end());
        key.private_key.assign(in.private_key().begin(), in.private_key().end());
        key.created_at = in.created_at();
        if (in.has_last_used_at()) {
            key.last_used_at = in.last_used_at();
        }
        if (in.has_derivation_path()) {
            key.derivation_path = in.derivation_path();
        }
        key.metadata = read_metadata(in.metadata());
        payload.keys.push_back(std::move(key));
    }

    payload.metadata.created_at = record.metadata().created_at();
    payload.metadata.last_modified = record.metadata().last_modified();
    payload.metadata.key_count = static_cast<uint32_t>(payload.keys.size());
    if (record.metadata().key_count() != payload.metadata.key_count) {
        Log::warning("VaultSerialization: Stored key count {} corrected to {}",
                     record.metadata().key_count(), payload.metadata.key_count);
    }

    if (record.has_mnemonic()) {
        payload.mnemonic = record.mnemonic();
    }

    wipe_payload_record(record);
    return payload;
}

VaultResult<std::vector<uint8_t>>
VaultSerialization::serialize_record(const EncryptedVaultData& data) {
    certenvault::EncryptedVaultRecord record;
    record.set_version(data.version);
    assign_bytes(record.mutable_salt(), data.salt);
    assign_bytes(record.mutable_iv(), data.iv);
    assign_bytes(record.mutable_encrypted_payload(), data.encrypted_payload);
    record.mutable_kdf_params()->set_algorithm(data.kdf_params.algorithm);
    record.mutable_kdf_params()->set_iterations(data.kdf_params.iterations);

    std::string serialized;
    if (!record.SerializeToString(&serialized)) {
        Log::error("VaultSerialization: Failed to serialize vault record");
        return std::unexpected(VaultError::SerializationFailed);
    }
    return std::vector<uint8_t>(serialized.begin(), serialized.end());
}

VaultResult<EncryptedVaultData>
VaultSerialization::deserialize_record(std::span<const uint8_t> data) {
    certenvault::EncryptedVaultRecord record;
    if (!parse_bounded(record, data, "vault record")) {
        return std::unexpected(VaultError::InvalidProtobuf);
    }

    if (record.version() != CURRENT_VAULT_VERSION) {
        Log::warning("VaultSerialization: Unsupported vault version {}", record.version());
        return std::unexpected(VaultError::UnsupportedSchema);
    }
    if (record.kdf_params().algorithm() != KDF_ALGORITHM) {
        Log::warning("VaultSerialization: Unsupported KDF '{}'", record.kdf_params().algorithm());
        return std::unexpected(VaultError::UnsupportedSchema);
    }
    if (record.kdf_params().iterations() <= 0 ||
        record.salt().size() != VaultCrypto::SALT_LENGTH ||
        record.iv().size() != VaultCrypto::IV_LENGTH ||
        record.encrypted_payload().size() < VaultCrypto::TAG_LENGTH) {
        Log::error("VaultSerialization: Vault record is missing required fields");
        return std::unexpected(VaultError::InvalidData);
    }

    EncryptedVaultData out;
    out.version = record.version();
    out.salt.assign(record.salt().begin(), record.salt().end());
    out.iv.assign(record.iv().begin(), record.iv().end());
    out.encrypted_payload.assign(record.encrypted_payload().begin(), record.encrypted_payload().end());
    out.kdf_params.algorithm = record.kdf_params().algorithm();
    out.kdf_params.iterations = record.kdf_params().iterations();
    return out;
}

}  // namespace CertenVault
