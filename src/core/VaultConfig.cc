// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include "VaultConfig.h"
#include "../utils/Log.h"
#include <giomm/settingsschemasource.h>

namespace CertenVault {

VaultConfig VaultConfig::from_settings(const Glib::RefPtr<Gio::Settings>& settings) {
    VaultConfig config;
    config.pbkdf2_iterations = SettingsValidator::get_pbkdf2_iterations(settings);
    config.auto_lock_enabled = SettingsValidator::is_auto_lock_enabled(settings);
    config.auto_lock_timeout = std::chrono::seconds{SettingsValidator::get_auto_lock_timeout(settings)};
    config.sign_request_timeout = std::chrono::seconds{SettingsValidator::get_sign_request_timeout(settings)};
    config.sign_request_grace_period =
        std::chrono::milliseconds{SettingsValidator::get_sign_request_grace_period(settings)};
    config.auto_lock_check_interval =
        std::chrono::seconds{SettingsValidator::get_auto_lock_check_interval(settings)};
    config.request_cleanup_interval =
        std::chrono::seconds{SettingsValidator::get_request_cleanup_interval(settings)};
    config.vault_directory = SettingsValidator::get_vault_directory(settings);
    return config;
}

VaultConfig VaultConfig::load() {
    // Gio::Settings::create() aborts on a missing schema, so look it up first
    auto source = Gio::SettingsSchemaSource::get_default();
    if (!source || !source->lookup(SETTINGS_SCHEMA_ID, true)) {
        Log::debug("Settings schema {} not installed, using defaults", SETTINGS_SCHEMA_ID);
        return VaultConfig{};
    }
    return from_settings(Gio::Settings::create(SETTINGS_SCHEMA_ID));
}

}  // namespace CertenVault
