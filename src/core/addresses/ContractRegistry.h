// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_CONTRACT_REGISTRY_H
#define CERTENVAULT_CONTRACT_REGISTRY_H

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace CertenVault {

/// Certen protocol contracts on one EVM chain; empty optionals are not deployed
struct ChainContracts {
    uint64_t chain_id = 0;
    std::string_view name;
    bool is_testnet = false;
    std::string_view explorer_url;
    std::optional<std::string_view> account_factory;
    std::optional<std::string_view> anchor;
    std::optional<std::string_view> bls_zk_verifier;
};

/**
 * @brief Static table of known chains and their deployed contracts
 */
class ContractRegistry {
public:
    /// ERC-4337 EntryPoint, identical on every EVM chain
    static constexpr std::string_view ERC4337_ENTRYPOINT = "0x5FF137D4b0FDCD49DcA30c7CF57E578a026d2789";

    [[nodiscard]] static std::span<const ChainContracts> all_chains() noexcept;

    /// Entry for @p chain_id, or nullptr when the chain is unknown
    [[nodiscard]] static const ChainContracts* find(uint64_t chain_id) noexcept;

    /// Account factory address, if one is deployed on @p chain_id
    [[nodiscard]] static std::optional<std::string_view> account_factory(uint64_t chain_id) noexcept;

    /// True when factory, anchor and verifier are all deployed
    [[nodiscard]] static bool is_fully_deployed(uint64_t chain_id) noexcept;

    [[nodiscard]] static std::vector<uint64_t> supported_chain_ids();

    /// "<explorer>/address/<factory>" for the account factory, if deployed
    [[nodiscard]] static std::optional<std::string> factory_explorer_url(uint64_t chain_id);

    ContractRegistry() = delete;
    ~ContractRegistry() = delete;
    ContractRegistry(const ContractRegistry&) = delete;
    ContractRegistry& operator=(const ContractRegistry&) = delete;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_CONTRACT_REGISTRY_H
