// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_SETTINGS_VALIDATOR_H
#define CERTENVAULT_SETTINGS_VALIDATOR_H

#include <algorithm>
#include <string>
#include <giomm/settings.h>

namespace CertenVault {

/**
 * @brief Validates and enforces security constraints on GSettings values
 *
 * The schema already restricts ranges, but a user can edit or replace the
 * compiled schema. Every getter clamps again at read time so values such
 * as the PBKDF2 iteration count can never drop below the security floor.
 *
 * The clamp_* helpers apply the same bounds to values that do not come
 * from GSettings (command-line flags, API callers).
 *
 * @note This is a static utility class and cannot be instantiated.
 */
class SettingsValidator final {
public:
    static inline constexpr int MIN_PBKDF2_ITERATIONS{600000};
    static inline constexpr int MAX_PBKDF2_ITERATIONS{10000000};
    static inline constexpr int DEFAULT_PBKDF2_ITERATIONS{600000};

    static inline constexpr int MIN_AUTO_LOCK_TIMEOUT{60};       // 1 minute
    static inline constexpr int MAX_AUTO_LOCK_TIMEOUT{86400};    // 24 hours
    static inline constexpr int DEFAULT_AUTO_LOCK_TIMEOUT{900};  // 15 minutes

    static inline constexpr int MIN_SIGN_REQUEST_TIMEOUT{30};    // seconds
    static inline constexpr int MAX_SIGN_REQUEST_TIMEOUT{3600};
    static inline constexpr int DEFAULT_SIGN_REQUEST_TIMEOUT{300};

    static inline constexpr int MIN_GRACE_PERIOD_MS{0};
    static inline constexpr int MAX_GRACE_PERIOD_MS{60000};
    static inline constexpr int DEFAULT_GRACE_PERIOD_MS{5000};

    static inline constexpr int MIN_CHECK_INTERVAL{5};           // seconds
    static inline constexpr int MAX_CHECK_INTERVAL{3600};
    static inline constexpr int DEFAULT_AUTO_LOCK_CHECK_INTERVAL{60};
    static inline constexpr int DEFAULT_REQUEST_CLEANUP_INTERVAL{300};

    [[nodiscard]] static constexpr int clamp_pbkdf2_iterations(int value) noexcept {
        return std::clamp(value, MIN_PBKDF2_ITERATIONS, MAX_PBKDF2_ITERATIONS);
    }

    [[nodiscard]] static constexpr int clamp_auto_lock_timeout(int seconds) noexcept {
        return std::clamp(seconds, MIN_AUTO_LOCK_TIMEOUT, MAX_AUTO_LOCK_TIMEOUT);
    }

    [[nodiscard]] static constexpr int clamp_sign_request_timeout(int seconds) noexcept {
        return std::clamp(seconds, MIN_SIGN_REQUEST_TIMEOUT, MAX_SIGN_REQUEST_TIMEOUT);
    }

    [[nodiscard]] static constexpr int clamp_grace_period(int ms) noexcept {
        return std::clamp(ms, MIN_GRACE_PERIOD_MS, MAX_GRACE_PERIOD_MS);
    }

    [[nodiscard]] static constexpr int clamp_check_interval(int seconds) noexcept {
        return std::clamp(seconds, MIN_CHECK_INTERVAL, MAX_CHECK_INTERVAL);
    }

    /**
     * @brief Get PBKDF2 iterations for new vaults with validation
     * @param settings GSettings instance (must not be null)
     * @return Validated iteration count (never below 600000)
     */
    [[nodiscard]] static int get_pbkdf2_iterations(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        return clamp_pbkdf2_iterations(settings->get_int("pbkdf2-iterations"));
    }

    /**
     * @brief Get auto-lock timeout with validation
     * @param settings GSettings instance (must not be null)
     * @return Validated auto-lock timeout in seconds (60-86400)
     */
    [[nodiscard]] static int get_auto_lock_timeout(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        return clamp_auto_lock_timeout(settings->get_int("auto-lock-timeout"));
    }

    [[nodiscard]] static bool is_auto_lock_enabled(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        return settings->get_boolean("auto-lock-enabled");
    }

    /// Seconds before a pending sign request is force-rejected (30-3600)
    [[nodiscard]] static int get_sign_request_timeout(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        return clamp_sign_request_timeout(settings->get_int("sign-request-timeout"));
    }

    /// Milliseconds a finished request stays readable (0-60000)
    [[nodiscard]] static int get_sign_request_grace_period(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        return clamp_grace_period(settings->get_int("sign-request-grace-period"));
    }

    [[nodiscard]] static int get_auto_lock_check_interval(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        return clamp_check_interval(settings->get_int("auto-lock-check-interval"));
    }

    [[nodiscard]] static int get_request_cleanup_interval(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        return clamp_check_interval(settings->get_int("request-cleanup-interval"));
    }

    /// Configured vault directory; empty means the default location
    [[nodiscard]] static std::string get_vault_directory(const Glib::RefPtr<Gio::Settings>& settings) {
        return settings->get_string("vault-directory").raw();
    }

private:
    SettingsValidator() = delete;                                    // No instantiation
    ~SettingsValidator() = delete;                                   // No destruction
    SettingsValidator(const SettingsValidator&) = delete;            // No copy
    SettingsValidator& operator=(const SettingsValidator&) = delete; // No copy assignment
    SettingsValidator(SettingsValidator&&) = delete;                 // No move
    SettingsValidator& operator=(SettingsValidator&&) = delete;      // No move assignment
};

}  // namespace CertenVault

#endif // CERTENVAULT_SETTINGS_VALIDATOR_H
