#include "crypto.hpp"
#include "util.hpp"

#include <stdexcept>

// -------- Password -> key --------
SecureKey derive_key(const std::string& password) { // SHA-256 over "[pw]" + salt
    if (password.empty()) {
        throw std::invalid_argument("Password cannot be empty");
    }
    if (!ensure_sodium_ready()) {
        throw std::runtime_error("derive_key: libsodium unavailable");
    }

    std::string material;
    material.reserve(password.size() + 2 + std::strlen(PASSWORD_SALT));
    material += '[';
    material += password;
    material += ']';
    material += PASSWORD_SALT;

    SecureKey key(KEY_LEN);
    crypto_hash_sha256(key.data(),
        reinterpret_cast<const byte*>(material.data()),
        material.size());

    sodium_memzero(&material[0], material.size());
    return key;
}


// -------- libsodium secretbox helpers --------
bool seal_blob( // XSalsa20-Poly1305 with a fresh random nonce
    const SecureKey& key,
    const byte* plaintext,
    size_t plen,
    std::vector<byte>& out
)
{
    if (plen > 0 && !plaintext) {
        audit_log_level(LogLevel::ERROR,
            "seal_blob: non-zero length but plaintext null",
            "crypto_module",
            "failure");
        return false;
    }

    if (plen > MAX_CONFIG_SIZE) {
        audit_log_level(LogLevel::WARN,
            "seal_blob: plaintext too large",
            "crypto_module",
            "failure");
        return false;
    }

    if (!ensure_sodium_ready()) {
        return false;
    }

    out.assign(NONCE_LEN + plen + MAC_LEN, 0);
    byte* nonce = out.data();
    byte* ct = nonce + NONCE_LEN;
    byte* mac = ct + plen;

    randombytes_buf(nonce, NONCE_LEN);

    if (crypto_secretbox_detached(ct, mac, plaintext, plen, nonce, key.data()) != 0) {
        audit_log_level(LogLevel::ERROR,
            "seal_blob: crypto_secretbox_detached failed",
            "crypto_module",
            "failure");
        sodium_memzero(out.data(), out.size());
        out.clear();
        return false;
    }
    return true;
}

bool open_blob( // verify + decrypt nonce || ciphertext || mac
    const SecureKey& key,
    const byte* blob,
    size_t blob_len,
    std::vector<byte>& out_plain
)
{
    out_plain.clear();

    if (!blob || blob_len < NONCE_LEN + MAC_LEN) {
        audit_log_level(LogLevel::WARN,
            "open_blob: ciphertext too small or null",
            "crypto_module",
            "failure");
        return false;
    }

    const byte* nonce = blob;
    const byte* ct = blob + NONCE_LEN;
    const size_t ct_len = blob_len - NONCE_LEN - MAC_LEN;
    const byte* mac = ct + ct_len;

    std::vector<byte> plain(ct_len);
    if (crypto_secretbox_open_detached(plain.data(), ct, mac, ct_len, nonce, key.data()) != 0) {
        // wrong key, corrupted or tampered ciphertext
        audit_log_level(LogLevel::WARN,
            "open_blob: authentication failed",
            "crypto_module",
            "failure");
        return false;
    }

    out_plain = std::move(plain);
    return true;
}


// -------- Envelope --------
std::string encrypt(const std::string& plaintext, const std::string& password) {
    std::vector<byte> sealed;
    try {
        SecureKey key = derive_key(password);
        if (!seal_blob(key,
            reinterpret_cast<const byte*>(plaintext.data()),
            plaintext.size(),
            sealed)) {
            throw EncryptionError("Failed to encrypt config: secretbox failure");
        }
    }
    catch (const std::invalid_argument& e) {
        throw EncryptionError(std::string("Failed to encrypt config: ") + e.what());
    }
    catch (const std::runtime_error& e) {
        if (dynamic_cast<const EncryptionError*>(&e)) throw;
        throw EncryptionError(std::string("Failed to encrypt config: ") + e.what());
    }

    std::string out = ENCRYPTION_HEADER;
    out += '\n';
    out += to_base64(sealed.data(), sealed.size(), sodium_base64_VARIANT_ORIGINAL);
    out += '\n';
    return out;
}

// Trimmed, non-blank lines
static std::vector<std::string> content_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        std::string t = trim(line);
        if (!t.empty()) lines.push_back(std::move(t));
    }
    return lines;
}

std::string decrypt(const std::string& blob, const std::string& password) {
    const std::vector<std::string> lines = content_lines(blob);

    if (lines.empty()) {
        throw DecryptionError(DecryptionError::Kind::NotEncrypted,
            "Empty config data");
    }

    const std::string& header = lines[0];
    if (header.compare(0, std::strlen(ENCRYPTION_PREFIX), ENCRYPTION_PREFIX) != 0) {
        throw DecryptionError(DecryptionError::Kind::NotEncrypted,
            "Config is not encrypted (missing encryption header)");
    }

    if (header != ENCRYPTION_HEADER) {
        const size_t colon = header.find(':');
        const std::string version = colon == std::string::npos ? "unknown" : header.substr(0, colon);
        throw DecryptionError(DecryptionError::Kind::UnsupportedVersion,
            "Unsupported encryption version: " + version + ". Expected " + ENCRYPTION_HEADER);
    }

    if (lines.size() < 2) {
        throw DecryptionError(DecryptionError::Kind::NoPayload,
            "No encrypted data found after header");
    }

    std::vector<byte> sealed;
    if (!from_base64(lines[1], sodium_base64_VARIANT_ORIGINAL, sealed)) {
        throw DecryptionError(DecryptionError::Kind::InvalidEncoding,
            "Invalid base64 encoding in encrypted payload");
    }
    if (sealed.size() < NONCE_LEN + MAC_LEN) {
        throw DecryptionError(DecryptionError::Kind::Other,
            "Failed to decrypt config: payload too short");
    }

    std::vector<byte> plain;
    try {
        SecureKey key = derive_key(password);
        if (!open_blob(key, sealed.data(), sealed.size(), plain)) {
            throw InvalidPasswordError("Invalid password or corrupted data");
        }
    }
    catch (const std::invalid_argument& e) {
        throw DecryptionError(DecryptionError::Kind::Other,
            std::string("Failed to decrypt config: ") + e.what());
    }

    std::string out(plain.begin(), plain.end());
    if (!plain.empty()) {
        sodium_memzero(plain.data(), plain.size());
    }
    return out;
}

// First trimmed non-blank line; "" if none
static std::string first_content_line(const std::string& text) {
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        std::string t = trim(line);
        if (!t.empty()) {
            return t;
        }
    }
    return "";
}

bool is_encrypted(const std::string& blob) {
    return first_content_line(blob) == ENCRYPTION_HEADER;
}

bool has_encryption_prefix(const std::string& blob) {
    return first_content_line(blob).rfind(ENCRYPTION_PREFIX, 0) == 0;
}


// -------- Password resolution --------
PasswordSources default_password_sources() {
    PasswordSources s;
    s.getenv = [](const char* name) -> const char* { return std::getenv(name); };
    s.run_command = run_shell_command;
    s.is_terminal = []() { return isatty(STDIN_FILENO) == 1; };
    s.prompt = [](const char* prompt) { return prompt_secret(prompt); };
    return s;
}

std::string get_password(const char* prompt, bool changing, const PasswordSources& sources) {
    const char* env_pw = sources.getenv ? sources.getenv(ENV_PASSWORD) : nullptr;
    if (env_pw && *env_pw) {
        return std::string(env_pw);
    }

    const char* cmd = sources.getenv ? sources.getenv(ENV_PASSWORD_COMMAND) : nullptr;
    if (cmd && *cmd && sources.run_command) {
        std::vector<std::pair<std::string, std::string>> extra_env;
        if (changing) {
            extra_env.emplace_back(ENV_PASSWORD_CHANGE, "1");
        }
        std::string output;
        if (!sources.run_command(cmd, extra_env, output)) {
            audit_log_level(LogLevel::ERROR,
                "Password command failed",
                "get_password",
                "failure");
            throw PasswordUnavailableError("Password command failed");
        }
        std::string pw = trim(output);
        if (!output.empty()) {
            sodium_memzero(&output[0], output.size());
        }
        if (!pw.empty()) {
            return pw;
        }
    }

    if (sources.is_terminal && sources.is_terminal() && sources.prompt) {
        std::string pw = sources.prompt(prompt);
        if (!pw.empty()) {
            return pw;
        }
    }

    throw PasswordUnavailableError("No password provided and cannot prompt (not a TTY)");
}

PasswordCheck check_password(const std::string& password) {
    if (password.empty()) {
        throw std::invalid_argument("Password cannot be empty");
    }

    PasswordCheck result;
    const std::string stripped = trim(password);
    if (stripped.empty()) {
        throw std::invalid_argument("Password must contain at least one non-whitespace character");
    }
    if (stripped != password) {
        result.warnings.emplace_back("Password has leading/trailing whitespace (preserved)");
    }
    if (password.size() > MAX_PASS_LEN) {
        result.warnings.emplace_back("Password is longer than " + std::to_string(MAX_PASS_LEN) + " bytes");
    }
    result.password = password;
    return result;
}
