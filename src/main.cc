// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Certen Protocol

#include <glibmm/init.h>
#include <glibmm/optioncontext.h>
#include <glibmm/optionentry.h>
#include <glibmm/optiongroup.h>
#include <giomm/init.h>
#include <termios.h>
#include <unistd.h>
#include <algorithm>
#include <cstdlib>
#include <format>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include "config.h"
#include "core/Vault.h"
#include "core/VaultConfig.h"
#include "core/addresses/ContractRegistry.h"
#include "core/storage/FileVaultStorage.h"
#include "utils/Clock.h"
#include "utils/Codec.h"
#include "utils/Log.h"
#include "utils/SecureMemory.h"

using namespace CertenVault;

namespace {

constexpr const char* COMMAND_SUMMARY =
    "Commands:\n"
    "  status                 Show whether a vault exists\n"
    "  init                   Create a vault (add --mnemonic to restore a phrase)\n"
    "  list                   List stored keys\n"
    "  generate               Generate a random key (--type, --name)\n"
    "  derive                 Derive the next key from the vault phrase (--type, --name, --index)\n"
    "  import                 Import a hex private key read from stdin (--type, --name)\n"
    "  remove KEY-ID          Delete a key\n"
    "  address KEY-ID         Show chain addresses (--adi and --chain-id predict the smart account)\n"
    "  sign-hash KEY-ID HEX   Sign a hex digest\n"
    "  export                 Print the encrypted vault record as base64\n"
    "  reset                  Delete the vault (asks for confirmation unless --yes)";

struct CliOptions {
    std::string vault_dir;
    Glib::ustring key_type = "ed25519";
    Glib::ustring name;
    Glib::ustring adi_url;
    Glib::ustring implementation;
    int index = -1;
    int chain_id = 11155111;
    bool with_mnemonic = false;
    bool assume_yes = false;
    bool verbose = false;
};

int fail(VaultError error) {
    std::cerr << "certen-vault: " << to_string(error) << '\n';
    return EXIT_FAILURE;
}

int usage_error(std::string_view message) {
    std::cerr << "certen-vault: " << message << '\n';
    return 2;
}

/// Read one line from stdin with terminal echo disabled
SecureString read_secret(std::string_view prompt) {
    std::cerr << prompt << std::flush;

    termios saved{};
    const bool is_tty = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &saved) == 0;
    if (is_tty) {
        termios silent = saved;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        ::tcsetattr(STDIN_FILENO, TCSANOW, &silent);
    }

    std::string line;
    std::getline(std::cin, line);

    if (is_tty) {
        ::tcsetattr(STDIN_FILENO, TCSANOW, &saved);
        std::cerr << '\n';
    }

    SecureString secret{Glib::ustring(line)};
    secure_clear(line);
    return secret;
}

VaultResult<> unlock(Vault& vault) {
    SecureString password = read_secret("Password: ");
    return vault.unlock(password.get());
}

void print_key(const KeyInfo& key) {
    std::cout << std::format("{}  {:<9}  {}\n", key.id, to_string(key.type), key.name);
    if (key.metadata.accumulate_url) {
        std::cout << "    accumulate  " << *key.metadata.accumulate_url << '\n';
    }
    if (key.metadata.evm_address) {
        std::cout << "    evm         " << *key.metadata.evm_address << '\n';
    }
    if (key.derivation_path) {
        std::cout << "    path        " << *key.derivation_path << '\n';
    }
}

std::optional<KeyType> key_type_of(const CliOptions& options) {
    return parse_key_type(options.key_type.raw());
}

// ============================================================================
// Commands
// ============================================================================

int cmd_status(Vault& vault) {
    auto status = vault.status();
    if (!status) {
        return fail(status.error());
    }
    std::cout << "initialized: " << (status->is_initialized ? "yes" : "no") << '\n';
    return EXIT_SUCCESS;
}

int cmd_init(Vault& vault, const CliOptions& options) {
    SecureString password = read_secret("New password: ");
    SecureString confirm = read_secret("Repeat password: ");
    if (password.get() != confirm.get()) {
        return usage_error("passwords do not match");
    }

    std::optional<std::string> phrase;
    if (options.with_mnemonic) {
        SecureString entered = read_secret("Recovery phrase: ");
        phrase = entered.get().raw();
    }

    auto mnemonic = vault.initialize_with_mnemonic(password.get(), std::move(phrase));
    if (!mnemonic) {
        return fail(mnemonic.error());
    }
    if (!options.with_mnemonic) {
        std::cout << "Write down this recovery phrase and keep it offline:\n\n"
                  << *mnemonic << "\n\n";
        secure_clear(*mnemonic);
    }

    auto keys = vault.get_all_keys();
    if (!keys) {
        return fail(keys.error());
    }
    for (const auto& key : *keys) {
        print_key(key);
    }
    return EXIT_SUCCESS;
}

int cmd_list(Vault& vault) {
    auto keys = vault.get_all_keys();
    if (!keys) {
        return fail(keys.error());
    }
    if (keys->empty()) {
        std::cout << "No keys\n";
    }
    for (const auto& key : *keys) {
        print_key(key);
    }
    return EXIT_SUCCESS;
}

int cmd_add_key(Vault& vault, const std::string& command, const CliOptions& options) {
    auto type = key_type_of(options);
    if (!type) {
        return usage_error(std::format("unknown key type '{}'", options.key_type.raw()));
    }

    VaultResult<KeyInfo> key = std::unexpected(VaultError::UnknownError);
    if (command == "generate") {
        key = vault.generate_key(*type, options.name.raw());
    } else if (command == "derive") {
        std::optional<uint32_t> index;
        if (options.index >= 0) {
            index = static_cast<uint32_t>(options.index);
        }
        key = vault.derive_key_from_mnemonic(*type, options.name.raw(), index);
    } else {
        SecureString private_key = read_secret("Private key (hex): ");
        key = vault.import_key(*type, private_key.get().raw(), options.name.raw());
    }

    if (!key) {
        return fail(key.error());
    }
    print_key(*key);
    return EXIT_SUCCESS;
}

int cmd_remove(Vault& vault, const std::string& key_id) {
    if (auto removed = vault.remove_key(key_id); !removed) {
        return fail(removed.error());
    }
    std::cout << "Removed " << key_id << '\n';
    return EXIT_SUCCESS;
}

int cmd_address(Vault& vault, const std::string& key_id, const CliOptions& options) {
    auto keys = vault.get_all_keys();
    if (!keys) {
        return fail(keys.error());
    }
    auto it = std::ranges::find(*keys, key_id, &KeyInfo::id);
    if (it == keys->end()) {
        return fail(VaultError::KeyNotFound);
    }

    print_key(*it);
    if (it->metadata.key_page_url) {
        std::cout << "    key page    " << *it->metadata.key_page_url << '\n';
    }
    for (const auto& [chain, address] : it->metadata.chain_addresses) {
        std::cout << std::format("    {:<11} {}\n", chain, address);
    }

    if (!options.adi_url.empty()) {
        const auto chain_id = static_cast<uint64_t>(options.chain_id);
        auto predicted = vault.predict_account_address(key_id, options.adi_url.raw(), chain_id,
                                                       options.implementation.raw());
        if (!predicted) {
            return fail(predicted.error());
        }
        const auto* chain = ContractRegistry::find(chain_id);
        std::cout << std::format("    account     {} ({})\n", *predicted,
                                 chain ? chain->name : std::string_view("unknown chain"));
    }
    return EXIT_SUCCESS;
}

int cmd_sign_hash(Vault& vault, const std::string& key_id, const std::string& hash_hex) {
    auto hash = Codec::from_hex(hash_hex);
    if (!hash) {
        return fail(hash.error());
    }
    if (hash->empty()) {
        return fail(VaultError::EmptyInput);
    }
    auto signature = vault.sign(key_id, *hash);
    if (!signature) {
        return fail(signature.error());
    }
    std::cout << "signature   " << Codec::to_hex(signature->signature) << '\n'
              << "public key  " << Codec::to_hex(signature->public_key) << '\n';
    return EXIT_SUCCESS;
}

int cmd_export(Vault& vault) {
    auto record = vault.export_vault();
    if (!record) {
        return fail(record.error());
    }
    std::cout << Codec::to_base64(*record) << '\n';
    return EXIT_SUCCESS;
}

int cmd_reset(Vault& vault, const CliOptions& options) {
    if (!options.assume_yes) {
        std::cerr << "This permanently deletes every key. Type 'reset' to continue: " << std::flush;
        std::string answer;
        std::getline(std::cin, answer);
        if (answer != "reset") {
            return usage_error("reset cancelled");
        }
    }
    if (auto reset = vault.reset(); !reset) {
        return fail(reset.error());
    }
    std::cout << "Vault deleted\n";
    return EXIT_SUCCESS;
}

bool needs_unlock(const std::string& command) {
    return command == "list" || command == "generate" || command == "derive" ||
           command == "import" || command == "remove" || command == "address" ||
           command == "sign-hash";
}

}  // namespace

int main(int argc, char* argv[]) {
    Glib::init();
    Gio::init();

    CliOptions options;

    Glib::OptionContext context("COMMAND [ARGS...]");
    context.set_summary(COMMAND_SUMMARY);
    Glib::OptionGroup group("vault", "Vault options", "Show vault options");

    Glib::OptionEntry dir_entry;
    dir_entry.set_long_name("vault-dir");
    dir_entry.set_short_name('d');
    dir_entry.set_arg_description("DIR");
    dir_entry.set_description("Directory holding the vault file");
    group.add_entry_filename(dir_entry, options.vault_dir);

    Glib::OptionEntry type_entry;
    type_entry.set_long_name("type");
    type_entry.set_short_name('t');
    type_entry.set_arg_description("ed25519|secp256k1|bls12381");
    type_entry.set_description("Key type for generate, derive and import");
    group.add_entry(type_entry, options.key_type);

    Glib::OptionEntry name_entry;
    name_entry.set_long_name("name");
    name_entry.set_short_name('n');
    name_entry.set_arg_description("NAME");
    name_entry.set_description("Display name for a new key");
    group.add_entry(name_entry, options.name);

    Glib::OptionEntry index_entry;
    index_entry.set_long_name("index");
    index_entry.set_arg_description("N");
    index_entry.set_description("Derivation index for derive (default: next unused)");
    group.add_entry(index_entry, options.index);

    Glib::OptionEntry mnemonic_entry;
    mnemonic_entry.set_long_name("mnemonic");
    mnemonic_entry.set_description("Restore init from an existing recovery phrase");
    group.add_entry(mnemonic_entry, options.with_mnemonic);

    Glib::OptionEntry adi_entry;
    adi_entry.set_long_name("adi");
    adi_entry.set_arg_description("URL");
    adi_entry.set_description("ADI URL for smart account prediction");
    group.add_entry(adi_entry, options.adi_url);

    Glib::OptionEntry chain_entry;
    chain_entry.set_long_name("chain-id");
    chain_entry.set_arg_description("ID");
    chain_entry.set_description("EVM chain for smart account prediction (default: 11155111)");
    group.add_entry(chain_entry, options.chain_id);

    Glib::OptionEntry impl_entry;
    impl_entry.set_long_name("implementation");
    impl_entry.set_arg_description("ADDRESS");
    impl_entry.set_description("Account implementation for smart account prediction");
    group.add_entry(impl_entry, options.implementation);

    Glib::OptionEntry yes_entry;
    yes_entry.set_long_name("yes");
    yes_entry.set_short_name('y');
    yes_entry.set_description("Do not ask for confirmation");
    group.add_entry(yes_entry, options.assume_yes);

    Glib::OptionEntry verbose_entry;
    verbose_entry.set_long_name("verbose");
    verbose_entry.set_short_name('v');
    verbose_entry.set_description("Log debug messages");
    group.add_entry(verbose_entry, options.verbose);

    context.set_main_group(group);

    try {
        context.parse(argc, argv);
    } catch (const Glib::Error& e) {
        return usage_error(e.what());
    }

    if (options.verbose) {
        Log::set_level(Log::Level::Debug);
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        std::cerr << context.get_help();
        return 2;
    }
    const std::string command = args.front();

    VaultConfig config = VaultConfig::load();
    if (!options.vault_dir.empty()) {
        config.vault_directory = options.vault_dir;
    }
    if (config.vault_directory.empty()) {
        config.vault_directory = FileVaultStorage::default_directory();
    }
    Log::debug("{} {} using {}", PROJECT_NAME, VERSION, config.vault_directory);

    FileVaultStorage storage(config.vault_directory);
    SystemClock clock;
    Vault vault(storage, clock, config);

    const std::map<std::string, size_t> arity = {
        {"status", 0}, {"init", 0}, {"list", 0}, {"generate", 0}, {"derive", 0},
        {"import", 0}, {"remove", 1}, {"address", 1}, {"sign-hash", 2},
        {"export", 0}, {"reset", 0},
    };
    auto expected = arity.find(command);
    if (expected == arity.end()) {
        return usage_error(std::format("unknown command '{}'", command));
    }
    if (args.size() - 1 != expected->second) {
        return usage_error(std::format("'{}' takes {} argument(s)", command, expected->second));
    }

    if (needs_unlock(command)) {
        if (auto unlocked = unlock(vault); !unlocked) {
            return fail(unlocked.error());
        }
    }

    int status = EXIT_SUCCESS;
    if (command == "status") {
        status = cmd_status(vault);
    } else if (command == "init") {
        status = cmd_init(vault, options);
    } else if (command == "list") {
        status = cmd_list(vault);
    } else if (command == "generate" || command == "derive" || command == "import") {
        status = cmd_add_key(vault, command, options);
    } else if (command == "remove") {
        status = cmd_remove(vault, args[1]);
    } else if (command == "address") {
        status = cmd_address(vault, args[1], options);
    } else if (command == "sign-hash") {
        status = cmd_sign_hash(vault, args[1], args[2]);
    } else if (command == "export") {
        status = cmd_export(vault);
    } else if (command == "reset") {
        status = cmd_reset(vault, options);
    }

    vault.lock();
    return status;
}
