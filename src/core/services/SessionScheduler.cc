// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "SessionScheduler.h"
#include "../../utils/Log.h"
#include "../../utils/SettingsValidator.h"

namespace CertenVault {

namespace {

std::chrono::seconds clamp_interval(std::chrono::seconds interval, const char* name) {
    const auto requested = static_cast<int>(interval.count());
    const int clamped = SettingsValidator::clamp_check_interval(requested);
    if (clamped != requested) {
        Log::warning("SessionScheduler: {} {} seconds clamped to {} (valid range: {}-{})",
                     name, requested, clamped,
                     SettingsValidator::MIN_CHECK_INTERVAL, SettingsValidator::MAX_CHECK_INTERVAL);
    }
    return std::chrono::seconds(clamped);
}

}  // namespace

SessionScheduler::SessionScheduler(Vault& vault, SignRequestQueue& queue, const VaultConfig& config)
    : m_vault(vault),
      m_queue(queue),
      m_auto_lock_check_enabled(config.auto_lock_enabled),
      m_auto_lock_check_interval(clamp_interval(config.auto_lock_check_interval, "Auto-lock check interval")),
      m_request_cleanup_interval(clamp_interval(config.request_cleanup_interval, "Request cleanup interval")),
      m_request_timeout(SettingsValidator::clamp_sign_request_timeout(
          static_cast<int>(config.sign_request_timeout.count()))) {
}

SessionScheduler::~SessionScheduler() {
    stop();
}

void SessionScheduler::start() {
    if (m_auto_lock_check_enabled && !m_auto_lock_connection.connected()) {
        connect_auto_lock_timer();
    }
    if (!m_cleanup_connection.connected()) {
        connect_cleanup_timer();
    }
    Log::info("SessionScheduler: Started (auto-lock check {}s, cleanup {}s)",
              m_auto_lock_check_interval.count(), m_request_cleanup_interval.count());
}

void SessionScheduler::stop() {
    if (m_auto_lock_connection.connected()) {
        m_auto_lock_connection.disconnect();
    }
    if (m_cleanup_connection.connected()) {
        m_cleanup_connection.disconnect();
        Log::debug("SessionScheduler: Timers stopped");
    }
}

void SessionScheduler::set_auto_lock_check_enabled(bool enabled) {
    if (m_auto_lock_check_enabled == enabled) {
        return;
    }
    m_auto_lock_check_enabled = enabled;

    if (!m_auto_lock_check_enabled) {
        m_auto_lock_connection.disconnect();
        Log::info("SessionScheduler: Auto-lock check disabled");
    } else {
        if (m_cleanup_connection.connected()) {
            connect_auto_lock_timer();
        }
        Log::info("SessionScheduler: Auto-lock check enabled every {} seconds",
                  m_auto_lock_check_interval.count());
    }
}

void SessionScheduler::set_auto_lock_check_interval(std::chrono::seconds interval) {
    const auto clamped = clamp_interval(interval, "Auto-lock check interval");
    if (clamped == m_auto_lock_check_interval) {
        return;
    }
    m_auto_lock_check_interval = clamped;
    if (is_auto_lock_timer_active()) {
        connect_auto_lock_timer();
    }
}

void SessionScheduler::set_request_cleanup_interval(std::chrono::seconds interval) {
    const auto clamped = clamp_interval(interval, "Request cleanup interval");
    if (clamped == m_request_cleanup_interval) {
        return;
    }
    m_request_cleanup_interval = clamped;
    if (is_cleanup_timer_active()) {
        connect_cleanup_timer();
    }
}

void SessionScheduler::set_request_timeout(std::chrono::seconds timeout) {
    m_request_timeout = std::chrono::seconds(
        SettingsValidator::clamp_sign_request_timeout(static_cast<int>(timeout.count())));
}

void SessionScheduler::connect_auto_lock_timer() {
    m_auto_lock_connection.disconnect();
    m_auto_lock_connection = Glib::signal_timeout().connect_seconds(
        sigc::mem_fun(*this, &SessionScheduler::on_auto_lock_timeout),
        static_cast<unsigned int>(m_auto_lock_check_interval.count()));
}

void SessionScheduler::connect_cleanup_timer() {
    m_cleanup_connection.disconnect();
    m_cleanup_connection = Glib::signal_timeout().connect_seconds(
        sigc::mem_fun(*this, &SessionScheduler::on_cleanup_timeout),
        static_cast<unsigned int>(m_request_cleanup_interval.count()));
}

bool SessionScheduler::run_auto_lock_check() {
    if (!m_vault.check_and_maybe_lock()) {
        return false;
    }
    Log::info("SessionScheduler: Vault auto-locked after inactivity");
    m_signal_auto_locked.emit();
    return true;
}

size_t SessionScheduler::run_request_cleanup() {
    const size_t expired = m_queue.cleanup(m_request_timeout);
    if (expired > 0) {
        Log::info("SessionScheduler: {} sign request(s) timed out", expired);
    }
    return expired;
}

bool SessionScheduler::on_auto_lock_timeout() {
    run_auto_lock_check();
    return true;  // Keep repeating
}

bool SessionScheduler::on_cleanup_timeout() {
    run_request_cleanup();
    return true;
}

}  // namespace CertenVault
