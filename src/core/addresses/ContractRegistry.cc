// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "ContractRegistry.h"
#include <array>
#include <format>

namespace CertenVault {

namespace {

constexpr std::array<ChainContracts, 18> CHAINS{{
    // Mainnets
    {1, "Ethereum", false, "https://etherscan.io", {}, {}, {}},
    {42161, "Arbitrum", false, "https://arbiscan.io", {}, {}, {}},
    {43114, "Avalanche", false, "https://snowtrace.io", {}, {}, {}},
    {8453, "Base", false, "https://basescan.org", {}, {}, {}},
    {56, "Binance Smart Chain", false, "https://bscscan.com", {}, {}, {}},
    {10, "Optimism", false, "https://optimistic.etherscan.io", {}, {}, {}},
    {137, "Polygon", false, "https://polygonscan.com", {}, {}, {}},
    {324, "zkSync", false, "https://explorer.zksync.io", {}, {}, {}},
    {1284, "Moonbeam", false, "https://moonscan.io", {}, {}, {}},

    // Testnets
    {11155111, "Ethereum Sepolia", true, "https://sepolia.etherscan.io",
     "0xbd9D33310358C8A10254175dD297e2CA8cd623c3",
     "0xEb17eBd351D2e040a0cB3026a3D04BEc182d8b98",
     "0x631B6444216b981561034655349F8a28962DcC5F"},
    {421614, "Arbitrum Sepolia", true, "https://sepolia.arbiscan.io", {}, {}, {}},
    {43113, "Avalanche Fuji", true, "https://testnet.snowtrace.io", {}, {}, {}},
    {84532, "Base Sepolia", true, "https://sepolia-explorer.base.org", {}, {}, {}},
    {97, "BSC Testnet", true, "https://testnet.bscscan.com", {}, {}, {}},
    {11155420, "Optimism Sepolia", true, "https://sepolia-optimistic.etherscan.io", {}, {}, {}},
    {80002, "Polygon Amoy", true, "https://amoy.polygonscan.com", {}, {}, {}},
    {300, "zkSync Sepolia", true, "https://sepolia.explorer.zksync.io", {}, {}, {}},
    {1287, "Moonbeam Moonbase Alpha", true, "https://moonbase.moonscan.io", {}, {}, {}},
}};

}  // namespace

std::span<const ChainContracts> ContractRegistry::all_chains() noexcept {
    return CHAINS;
}

const ChainContracts* ContractRegistry::find(uint64_t chain_id) noexcept {
    for (const auto& chain : CHAINS) {
        if (chain.chain_id == chain_id) {
            return &chain;
        }
    }
    return nullptr;
}

std::optional<std::string_view> ContractRegistry::account_factory(uint64_t chain_id) noexcept {
    const auto* chain = find(chain_id);
    if (!chain) {
        return std::nullopt;
    }
    return chain->account_factory;
}

bool ContractRegistry::is_fully_deployed(uint64_t chain_id) noexcept {
    const auto* chain = find(chain_id);
    return chain && chain->account_factory && chain->anchor && chain->bls_zk_verifier;
}

std::vector<uint64_t> ContractRegistry::supported_chain_ids() {
    std::vector<uint64_t> ids;
    ids.reserve(CHAINS.size());
    for (const auto& chain : CHAINS) {
        ids.push_back(chain.chain_id);
    }
    return ids;
}

std::optional<std::string> ContractRegistry::factory_explorer_url(uint64_t chain_id) {
    const auto* chain = find(chain_id);
    if (!chain || !chain->account_factory) {
        return std::nullopt;
    }
    return std::format("{}/address/{}", chain->explorer_url, *chain->account_factory);
}

}  // namespace CertenVault
