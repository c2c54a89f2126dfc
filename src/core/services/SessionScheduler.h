// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_SESSION_SCHEDULER_H
#define CERTENVAULT_SESSION_SCHEDULER_H

#include <chrono>
#include <cstddef>
#include <glibmm/main.h>
#include <sigc++/sigc++.h>
#include "../Vault.h"
#include "../VaultConfig.h"
#include "../signing/SignRequestQueue.h"

namespace CertenVault {

/**
 * @brief Periodic session checks driven by the Glib main loop
 *
 * The vault and the request queue own no timers. This class supplies the
 * two periodic calls they rely on:
 * - an auto-lock check that lets the vault notice an idle session
 * - a sweep that times out stale sign requests
 *
 * Both intervals are clamped to 5-3600 seconds. The tick handlers are
 * public so hosts and tests can drive them without a running main loop.
 *
 * @code
 * SessionScheduler scheduler(vault, queue, config);
 * scheduler.signal_auto_locked().connect([] { Log::info("Session expired"); });
 * scheduler.start();
 * main_loop->run();
 * @endcode
 *
 * All methods must be called from the thread running the default main
 * context.
 */
class SessionScheduler {
public:
    SessionScheduler(Vault& vault, SignRequestQueue& queue, const VaultConfig& config);
    ~SessionScheduler();

    SessionScheduler(const SessionScheduler&) = delete;
    SessionScheduler& operator=(const SessionScheduler&) = delete;
    SessionScheduler(SessionScheduler&&) = delete;
    SessionScheduler& operator=(SessionScheduler&&) = delete;

    /// Connect both timers; a no-op for timers already running
    void start();

    /// Disconnect both timers
    void stop();

    void set_auto_lock_check_enabled(bool enabled);
    [[nodiscard]] bool is_auto_lock_check_enabled() const noexcept { return m_auto_lock_check_enabled; }

    void set_auto_lock_check_interval(std::chrono::seconds interval);
    [[nodiscard]] std::chrono::seconds auto_lock_check_interval() const noexcept { return m_auto_lock_check_interval; }

    void set_request_cleanup_interval(std::chrono::seconds interval);
    [[nodiscard]] std::chrono::seconds request_cleanup_interval() const noexcept { return m_request_cleanup_interval; }

    /// Age after which a pending request is rejected, clamped to 30-3600 seconds
    void set_request_timeout(std::chrono::seconds timeout);
    [[nodiscard]] std::chrono::seconds request_timeout() const noexcept { return m_request_timeout; }

    [[nodiscard]] bool is_auto_lock_timer_active() const noexcept { return m_auto_lock_connection.connected(); }
    [[nodiscard]] bool is_cleanup_timer_active() const noexcept { return m_cleanup_connection.connected(); }

    /// @return true if this check locked the vault
    bool run_auto_lock_check();

    /// @return Number of requests that were timed out
    size_t run_request_cleanup();

    /// Emitted when an auto-lock check caused the vault to lock
    [[nodiscard]] sigc::signal<void()>& signal_auto_locked() { return m_signal_auto_locked; }

private:
    bool on_auto_lock_timeout();
    bool on_cleanup_timeout();

    void connect_auto_lock_timer();
    void connect_cleanup_timer();

    Vault& m_vault;
    SignRequestQueue& m_queue;

    bool m_auto_lock_check_enabled;
    std::chrono::seconds m_auto_lock_check_interval;
    std::chrono::seconds m_request_cleanup_interval;
    std::chrono::seconds m_request_timeout;

    sigc::connection m_auto_lock_connection;
    sigc::connection m_cleanup_connection;
    sigc::signal<void()> m_signal_auto_locked;
};

}  // namespace CertenVault

#endif  // CERTENVAULT_SESSION_SCHEDULER_H
