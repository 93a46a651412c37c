#pragma once
#include <stdexcept>
#include <string>

// -------- Error taxonomy --------
class VaultConfigError : public std::runtime_error {
public:
    explicit VaultConfigError(const std::string& msg)
        : std::runtime_error(msg) {}
};

class FormatError : public VaultConfigError {
public:
    using VaultConfigError::VaultConfigError;
};

class EncryptionError : public VaultConfigError {
public:
    using VaultConfigError::VaultConfigError;
};

class DecryptionError : public VaultConfigError {
public:
    enum class Kind {
        NotEncrypted,       // first line missing or not an envelope header
        UnsupportedVersion, // envelope header of another version
        NoPayload,          // header without payload line
        InvalidEncoding,    // payload is not base64
        Other
    };

    DecryptionError(Kind kind, const std::string& msg)
        : VaultConfigError(msg), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Wrong password or tampered payload. Deliberately not a DecryptionError.
class InvalidPasswordError : public VaultConfigError {
public:
    using VaultConfigError::VaultConfigError;
};

class ConfigNotFoundError : public VaultConfigError {
public:
    using VaultConfigError::VaultConfigError;
};

class ConfigExistsError : public VaultConfigError {
public:
    using VaultConfigError::VaultConfigError;
};

class SchemaValidationError : public VaultConfigError {
public:
    SchemaValidationError(std::string field, const std::string& msg)
        : VaultConfigError(msg), field_(std::move(field)) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

class ObscureError : public VaultConfigError {
public:
    using VaultConfigError::VaultConfigError;
};

class PasswordUnavailableError : public VaultConfigError {
public:
    using VaultConfigError::VaultConfigError;
};
