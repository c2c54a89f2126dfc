// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "ConnectionRegistry.h"
#include "../../utils/Log.h"

namespace CertenVault {

void ConnectionRegistry::connect(std::string_view origin) {
    std::lock_guard lock(m_mutex);
    if (m_origins.emplace(origin).second) {
        Log::info("Origin connected: {}", origin);
    }
}

bool ConnectionRegistry::disconnect(std::string_view origin) {
    std::lock_guard lock(m_mutex);
    auto it = m_origins.find(origin);
    if (it == m_origins.end()) {
        return false;
    }
    m_origins.erase(it);
    Log::info("Origin disconnected: {}", origin);
    return true;
}

bool ConnectionRegistry::is_connected(std::string_view origin) const {
    std::lock_guard lock(m_mutex);
    return m_origins.contains(origin);
}

std::vector<std::string> ConnectionRegistry::origins() const {
    std::lock_guard lock(m_mutex);
    return {m_origins.begin(), m_origins.end()};
}

void ConnectionRegistry::clear() {
    std::lock_guard lock(m_mutex);
    m_origins.clear();
}

}  // namespace CertenVault
