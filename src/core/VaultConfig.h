// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#ifndef CERTENVAULT_VAULT_CONFIG_H
#define CERTENVAULT_VAULT_CONFIG_H

#include <chrono>
#include <string>
#include <giomm/settings.h>
#include "../utils/SettingsValidator.h"

namespace CertenVault {

/// GSettings schema holding the runtime preferences
inline constexpr const char* SETTINGS_SCHEMA_ID = "com.certen.keyvault";

/**
 * @brief Runtime configuration for Vault, SignRequestQueue and SessionScheduler
 *
 * Default-constructed values match the schema defaults, so hosts without an
 * installed schema still run. from_settings() reads every key through
 * SettingsValidator.
 *
 * pbkdf2_iterations is taken as given here; tests inject small counts to
 * keep runs fast. Production values arrive through from_settings(), which
 * enforces the 600000 floor.
 */
struct VaultConfig {
    int pbkdf2_iterations = SettingsValidator::DEFAULT_PBKDF2_ITERATIONS;
    bool auto_lock_enabled = true;
    std::chrono::seconds auto_lock_timeout{SettingsValidator::DEFAULT_AUTO_LOCK_TIMEOUT};
    std::chrono::seconds sign_request_timeout{SettingsValidator::DEFAULT_SIGN_REQUEST_TIMEOUT};
    std::chrono::milliseconds sign_request_grace_period{SettingsValidator::DEFAULT_GRACE_PERIOD_MS};
    std::chrono::seconds auto_lock_check_interval{SettingsValidator::DEFAULT_AUTO_LOCK_CHECK_INTERVAL};
    std::chrono::seconds request_cleanup_interval{SettingsValidator::DEFAULT_REQUEST_CLEANUP_INTERVAL};
    std::string vault_directory;  ///< Empty selects FileVaultStorage::default_directory()

    /// Validated configuration from @p settings (must not be null)
    [[nodiscard]] static VaultConfig from_settings(const Glib::RefPtr<Gio::Settings>& settings);

    /**
     * @brief Configuration from the installed schema, or defaults
     *
     * Returns the defaults when the com.certen.keyvault schema is not
     * installed instead of letting GLib abort.
     */
    [[nodiscard]] static VaultConfig load();
};

}  // namespace CertenVault

#endif  // CERTENVAULT_VAULT_CONFIG_H
