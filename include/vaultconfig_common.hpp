#pragma once

#include <sodium.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <fcntl.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <sstream>
#include <cerrno>
#include <limits>
#include <algorithm>

// -------- Envelope constants --------
inline constexpr const char* ENCRYPTION_HEADER = "VAULTCONFIG_ENCRYPT_V0:";
inline constexpr const char* ENCRYPTION_PREFIX = "VAULTCONFIG_ENCRYPT_";
inline constexpr const char* PASSWORD_SALT = "[vaultconfig-secure]";
inline constexpr size_t KEY_LEN = crypto_secretbox_KEYBYTES;     // 32, SHA-256 sized
inline constexpr size_t NONCE_LEN = crypto_secretbox_NONCEBYTES; // 24 (XSalsa20)
inline constexpr size_t MAC_LEN = crypto_secretbox_MACBYTES;     // 16 (Poly1305)

// -------- Obfuscation constants --------
inline constexpr size_t OBSCURE_IV_LEN = 16; // AES block size

// -------- Environment --------
inline constexpr const char* ENV_PASSWORD = "VAULTCONFIG_PASSWORD";
inline constexpr const char* ENV_PASSWORD_COMMAND = "VAULTCONFIG_PASSWORD_COMMAND";
inline constexpr const char* ENV_PASSWORD_CHANGE = "VAULTCONFIG_PASSWORD_CHANGE";
inline constexpr const char* ENV_CONFIG_DIR = "VAULTCONFIG_DIR";
inline constexpr const char* ENV_LOG_PATH = "VAULTCONFIG_LOG";
inline constexpr const char* ENV_LOG_LEVEL = "VAULTCONFIG_LOG_LEVEL";

// limits
inline constexpr size_t MAX_PASS_LEN = 1024;
inline constexpr size_t MAX_NAME_LEN = 255;
inline constexpr size_t MAX_CONFIG_SIZE = 10 * 1024 * 1024; // 10 MB hard cap
inline constexpr size_t MAX_COMMAND_OUTPUT = 1024 * 1024;

using byte = unsigned char;
