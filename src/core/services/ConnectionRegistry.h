// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_CONNECTION_REGISTRY_H
#define CERTENVAULT_CONNECTION_REGISTRY_H

#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace CertenVault {

/// Origins that completed acc_requestAccounts and may request signatures
class ConnectionRegistry {
public:
    void connect(std::string_view origin);

    /// @return true if the origin was connected
    bool disconnect(std::string_view origin);

    [[nodiscard]] bool is_connected(std::string_view origin) const;
    [[nodiscard]] std::vector<std::string> origins() const;

    void clear();

private:
    mutable std::mutex m_mutex;
    std::set<std::string, std::less<>> m_origins;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_CONNECTION_REGISTRY_H
