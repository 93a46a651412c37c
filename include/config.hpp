#pragma once
#include "crypto.hpp"
#include "errors.hpp"
#include "formats.hpp"
#include "schema.hpp"
#include "value.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

// -------- Config entry --------
// One named mapping. Sensitive values are stored obscured and revealed on read.
class ConfigEntry {
public:
    ConfigEntry(std::string name, ConfigMap data, std::set<std::string> sensitive_fields = {})
        : name_(std::move(name)),
          data_(std::move(data)),
          sensitive_fields_(std::move(sensitive_fields)) {}

    const std::string& name() const { return name_; }
    const ConfigMap& data() const { return data_; }
    const std::set<std::string>& sensitive_fields() const { return sensitive_fields_; }

    // Dotted lookup. Reveals only when `key` is a tracked sensitive path;
    // a value that fails to reveal is returned as stored.
    std::optional<ConfigValue> get(const std::string& key) const;
    ConfigValue get(const std::string& key, const ConfigValue& fallback) const;

    // Copy of the mapping. With reveal_secrets, every string leaf that is
    // tracked as sensitive or looks obscured is revealed when possible.
    ConfigMap get_all(bool reveal_secrets = true) const;

private:
    std::string name_;
    ConfigMap data_;
    std::set<std::string> sensitive_fields_;
};


// -------- Config manager --------
// Owns <directory>/<name><extension> for one format. Either every entry is
// encrypted under the held password or none is.
class ConfigManager {
public:
    // Loads every matching file. A file that fails to load is logged and
    // skipped. InvalidPasswordError propagates only when no encrypted file
    // opened under the password. Throws FormatError for an unknown format.
    ConfigManager(
        std::string directory,
        const std::string& format = "toml",
        std::optional<ConfigSchema> schema = std::nullopt,
        std::optional<std::string> password = std::nullopt,
        PasswordSources sources = default_password_sources()
    );
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    std::vector<std::string> list_configs() const;
    const ConfigEntry* get_config(const std::string& name) const; // nullptr if absent
    bool has_config(const std::string& name) const;

    // Validates, obscures sensitive plain strings (when enabled), writes the
    // file, then replaces the in-memory entry.
    void add_config(const std::string& name, const ConfigMap& config, bool obscure_passwords = true);

    // Secure-deletes the file. False if no such entry.
    bool remove_config(const std::string& name);

    // (Re)reads one entry from disk. Throws ConfigNotFoundError, FormatError,
    // DecryptionError (also for other envelope versions), InvalidPasswordError,
    // PasswordUnavailableError, SchemaValidationError.
    void load_config(const std::string& name);

    // Rewrites every entry under `password`. On failure the previous password
    // is restored and EncryptionError thrown; files rewritten before the
    // failure stay under the new password.
    void set_encryption_password(const std::string& password);
    // Rewrites every entry in plaintext; same failure contract.
    void remove_encryption();

    bool is_encrypted() const { return password_.has_value(); }

    const std::string& directory() const { return dir_; }
    std::string format_name() const { return handler_->get_name(); }
    std::string extension() const { return handler_->get_extension(); }
    const std::optional<ConfigSchema>& schema() const { return schema_; }

private:
    std::string config_file(const std::string& name) const;
    void load_all();
    bool load_entry(const std::string& name); // true if the file was encrypted
    void write_entry(const ConfigEntry& entry, const std::optional<std::string>& password) const;
    void rewrite_all(const std::optional<std::string>& password, const char* event);
    void wipe_password();

    std::string dir_;
    std::unique_ptr<FormatHandler> handler_;
    std::optional<ConfigSchema> schema_;
    std::optional<std::string> password_;
    PasswordSources sources_;
    std::map<std::string, ConfigEntry> configs_;
    bool password_lookup_failed_ = false; // set while load_all runs
};
