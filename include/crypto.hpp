#pragma once
#include "vaultconfig_common.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "secure_key.hpp"

#include <functional>
#include <string>
#include <vector>

// -------- Password -> key --------
// SHA-256("[" + password + "]" + PASSWORD_SALT). A single fast hash: this is
// not a brute-force resistant KDF. Throws std::invalid_argument on "".
SecureKey derive_key(const std::string& password);

// -------- libsodium secretbox helpers --------
bool seal_blob(
    const SecureKey& key,
    const byte* plaintext,
    size_t plen,
    std::vector<byte>& out      // nonce[24] || ciphertext || mac[16]
);

bool open_blob(
    const SecureKey& key,
    const byte* blob,           // nonce[24] || ciphertext || mac[16]
    size_t blob_len,
    std::vector<byte>& out_plain
);

// -------- Envelope --------
// Output:
//   VAULTCONFIG_ENCRYPT_V0:
//   base64(nonce || ciphertext || mac)
// Throws EncryptionError.
std::string encrypt(const std::string& plaintext, const std::string& password);

// Throws DecryptionError (see DecryptionError::Kind) for malformed envelopes
// and InvalidPasswordError when authentication fails.
std::string decrypt(const std::string& blob, const std::string& password);

// First non-blank line equals ENCRYPTION_HEADER exactly
bool is_encrypted(const std::string& blob);

// First non-blank line starts with ENCRYPTION_PREFIX (any envelope version)
bool has_encryption_prefix(const std::string& blob);

// -------- Password resolution --------
struct PasswordSources {
    // name -> value or nullptr
    std::function<const char*(const char* name)> getenv;
    // run a shell command; extra_env is set in the child. False on failure.
    std::function<bool(const std::string& cmd,
        const std::vector<std::pair<std::string, std::string>>& extra_env,
        std::string& out)> run_command;
    std::function<bool()> is_terminal;
    std::function<std::string(const char* prompt)> prompt;
};

// Process environment, /bin/sh, isatty(stdin), echo-less terminal prompt
PasswordSources default_password_sources();

// Order: VAULTCONFIG_PASSWORD, VAULTCONFIG_PASSWORD_COMMAND (trimmed stdout,
// VAULTCONFIG_PASSWORD_CHANGE=1 when `changing`), prompt on a terminal.
// Throws PasswordUnavailableError.
std::string get_password(
    const char* prompt = "Config password: ",
    bool changing = false,
    const PasswordSources& sources = default_password_sources()
);

struct PasswordCheck {
    std::string password;
    std::vector<std::string> warnings;
};

// Rejects empty / whitespace-only (std::invalid_argument); warns about
// leading or trailing whitespace, which is preserved.
PasswordCheck check_password(const std::string& password);
