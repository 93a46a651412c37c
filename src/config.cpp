#include "config.hpp"
#include "io.hpp"
#include "logging.hpp"
#include "obscure.hpp"
#include "util.hpp"

#include <stdexcept>

// -------- Config entry --------
std::optional<ConfigValue> ConfigEntry::get(const std::string& key) const {
    const ConfigValue* v = find_path(data_, split_path(key));
    if (!v) {
        return std::nullopt;
    }

    if (v->is_string() && sensitive_fields_.count(key) > 0) {
        try {
            return ConfigValue(reveal(v->as_string()));
        }
        catch (const ObscureError&) {
            // stored in plain text
            return *v;
        }
    }
    return *v;
}

ConfigValue ConfigEntry::get(const std::string& key, const ConfigValue& fallback) const {
    std::optional<ConfigValue> v = get(key);
    return v ? *v : fallback;
}

ConfigMap ConfigEntry::get_all(bool reveal_secrets) const {
    ConfigMap out = data_;
    if (!reveal_secrets) {
        return out;
    }

    for_each_leaf(out, [this](const std::string& path, ConfigValue& v) {
        if (!v.is_string()) return;
        if (sensitive_fields_.count(path) == 0 && !is_obscured(v.as_string())) return;
        try {
            v = ConfigValue(reveal(v.as_string()));
        }
        catch (const ObscureError&) {
            // left as stored
        }
        });
    return out;
}


// -------- Config manager --------
static void require_valid_name(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("Config name cannot be empty");
    }
    if (!valid_config_name(name)) {
        throw std::invalid_argument("Invalid config name: '" + name + "'");
    }
}

ConfigManager::ConfigManager(
    std::string directory,
    const std::string& format,
    std::optional<ConfigSchema> schema,
    std::optional<std::string> password,
    PasswordSources sources
)
    : dir_(std::move(directory)),
      handler_(make_format_handler(format)),
      schema_(std::move(schema)),
      password_(std::move(password)),
      sources_(std::move(sources))
{
    while (dir_.size() > 1 && dir_.back() == '/') dir_.pop_back();
    if (password_ && password_->empty()) {
        throw std::invalid_argument("Password cannot be empty");
    }
    load_all();
}

ConfigManager::~ConfigManager() {
    wipe_password();
}

void ConfigManager::wipe_password() {
    if (password_ && !password_->empty()) {
        sodium_memzero(&(*password_)[0], password_->size());
    }
    password_.reset();
}

std::string ConfigManager::config_file(const std::string& name) const {
    return dir_ + "/" + name + handler_->get_extension();
}

void ConfigManager::load_all() {
    if (!is_directory(dir_)) {
        audit_log_level(LogLevel::DEBUG,
            "Config directory not found: " + dir_,
            "load_all",
            "skipped");
        return;
    }

    // A wrong password only fails the store when it opens none of the
    // encrypted files; a partial rotation leaves files under two passwords.
    size_t opened_encrypted = 0;
    std::optional<InvalidPasswordError> wrong_password;

    const std::string ext = handler_->get_extension();
    for (const std::string& fname : list_files_with_extension(dir_, ext)) {
        const std::string name = fname.substr(0, fname.size() - ext.size());
        try {
            if (load_entry(name)) {
                ++opened_encrypted;
            }
        }
        catch (const InvalidPasswordError& e) {
            audit_log_level(LogLevel::ERROR,
                "Failed to load config '" + name + "': " + e.what(),
                "load_config",
                "failure");
            if (!wrong_password) {
                wrong_password = e;
            }
        }
        catch (const VaultConfigError& e) {
            audit_log_level(LogLevel::ERROR,
                "Failed to load config '" + name + "': " + e.what(),
                "load_config",
                "failure");
        }
        catch (const std::invalid_argument& e) {
            audit_log_level(LogLevel::ERROR,
                "Skipping file '" + fname + "': " + e.what(),
                "load_config",
                "failure");
        }
    }
    password_lookup_failed_ = false;

    if (wrong_password && opened_encrypted == 0) {
        throw *wrong_password;
    }
}

void ConfigManager::load_config(const std::string& name) {
    load_entry(name);
}

bool ConfigManager::load_entry(const std::string& name) {
    require_valid_name(name);

    const std::string path = config_file(name);
    if (!path_exists(path)) {
        throw ConfigNotFoundError("Config '" + name + "' not found");
    }
    check_file_ownership_and_perms(path);

    std::string text;
    if (!read_file(path, text)) {
        throw VaultConfigError("Failed to read config file: " + path);
    }

    const bool encrypted = has_encryption_prefix(text);
    if (encrypted) {
        if (::is_encrypted(text) && !password_) {
            if (password_lookup_failed_) {
                throw PasswordUnavailableError("No password available for encrypted config '" + name + "'");
            }
            try {
                password_ = get_password("Config password: ", false, sources_);
            }
            catch (const PasswordUnavailableError&) {
                password_lookup_failed_ = true;
                throw;
            }
        }
        // the version is checked before any key is derived
        std::string plain = decrypt(text, password_ ? *password_ : std::string());
        text.swap(plain);
        if (!plain.empty()) {
            sodium_memzero(&plain[0], plain.size());
        }
    }

    if (!is_valid_utf8(text)) {
        throw FormatError("Config '" + name + "' is not valid UTF-8");
    }

    ConfigMap data = handler_->load(text);
    if (!text.empty()) {
        sodium_memzero(&text[0], text.size());
    }

    std::set<std::string> sensitive;
    if (schema_) {
        data = schema_->validate(data);
        sensitive = schema_->get_sensitive_fields();
    }

    configs_.insert_or_assign(name, ConfigEntry(name, std::move(data), std::move(sensitive)));

    audit_log_level(LogLevel::DEBUG,
        "Loaded config '" + name + "' from " + path,
        "load_config",
        "success");
    return encrypted;
}

void ConfigManager::write_entry(const ConfigEntry& entry, const std::optional<std::string>& password) const {
    if (!ensure_dir_exists(dir_, S_IRWXU)) {
        throw VaultConfigError("Cannot create config directory: " + dir_);
    }

    std::string text = handler_->dump(entry.data());
    if (password) {
        std::string sealed = encrypt(text, *password);
        sodium_memzero(&text[0], text.size());
        text.swap(sealed);
    }

    const std::string path = config_file(entry.name());
    if (!atomic_write_file(path, reinterpret_cast<const byte*>(text.data()), text.size())) {
        throw VaultConfigError("Failed to write config '" + entry.name() + "' to " + path);
    }
    if (chmod(path.c_str(), S_IRUSR | S_IWUSR) != 0) {
        audit_log_level(LogLevel::WARN,
            "chmod 0600 failed on " + path,
            "save_config",
            "failure");
    }

    audit_log_level(LogLevel::DEBUG,
        "Saved config '" + entry.name() + "' to " + path,
        "save_config",
        "success");
}

std::vector<std::string> ConfigManager::list_configs() const {
    std::vector<std::string> names;
    names.reserve(configs_.size());
    for (const auto& kv : configs_) {
        names.push_back(kv.first);
    }
    return names;
}

const ConfigEntry* ConfigManager::get_config(const std::string& name) const {
    auto it = configs_.find(name);
    return it == configs_.end() ? nullptr : &it->second;
}

bool ConfigManager::has_config(const std::string& name) const {
    return configs_.count(name) > 0;
}

void ConfigManager::add_config(const std::string& name, const ConfigMap& config, bool obscure_passwords) {
    require_valid_name(name);

    ConfigMap data = schema_ ? schema_->validate(config) : config;

    std::set<std::string> sensitive;
    if (schema_) {
        sensitive = schema_->get_sensitive_fields();
    }

    if (obscure_passwords) {
        for (const std::string& field : sensitive) {
            ConfigValue* v = find_path(data, split_path(field));
            if (!v || !v->is_string() || is_obscured(v->as_string())) continue;

            if (take_obscure_warning()) {
                audit_log_level(LogLevel::WARN,
                    "Obscured values are NOT encrypted: the obfuscation key is public. "
                    "Set an encryption password to protect secrets.",
                    "obscure",
                    "warning");
            }
            *v = ConfigValue(obscure(v->as_string()));
        }
    }

    ConfigEntry entry(name, std::move(data), std::move(sensitive));
    write_entry(entry, password_);
    configs_.insert_or_assign(name, std::move(entry));

    audit_log_level(LogLevel::INFO,
        "Added config '" + name + "'",
        "add_config",
        "success");
}

bool ConfigManager::remove_config(const std::string& name) {
    auto it = configs_.find(name);
    if (it == configs_.end()) {
        return false;
    }

    const std::string path = config_file(name);
    if (!secure_delete_file(path)) {
        throw VaultConfigError("Failed to delete config file: " + path);
    }

    configs_.erase(it);
    audit_log_level(LogLevel::INFO,
        "Removed config '" + name + "'",
        "remove_config",
        "success");
    return true;
}

void ConfigManager::rewrite_all(const std::optional<std::string>& password, const char* event) {
    std::optional<std::string> old_password = password_;
    password_ = password;

    size_t rewritten = 0;
    for (const auto& kv : configs_) {
        try {
            write_entry(kv.second, password_);
        }
        catch (const std::exception& e) {
            wipe_password();
            password_ = std::move(old_password);
            if (rewritten > 0) {
                audit_log_level(LogLevel::ALERT,
                    std::to_string(rewritten) + " of " + std::to_string(configs_.size()) +
                    " configs were already rewritten before '" + kv.first +
                    "' failed; they no longer match the restored password",
                    event,
                    "partial");
            }
            throw EncryptionError("Failed to re-encrypt config '" + kv.first + "': " + e.what());
        }
        ++rewritten;
    }

    if (old_password && !old_password->empty()) {
        sodium_memzero(&(*old_password)[0], old_password->size());
    }
}

void ConfigManager::set_encryption_password(const std::string& password) {
    if (password.empty()) {
        throw std::invalid_argument("Password cannot be empty");
    }
    rewrite_all(password, "set_encryption_password");
    audit_log_level(LogLevel::INFO,
        "Updated encryption password for all configs",
        "set_encryption_password",
        "success");
}

void ConfigManager::remove_encryption() {
    rewrite_all(std::nullopt, "remove_encryption");
    audit_log_level(LogLevel::INFO,
        "Removed encryption from all configs",
        "remove_encryption",
        "success");
}
