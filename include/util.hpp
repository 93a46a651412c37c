#pragma once
#include "vaultconfig_common.hpp"
#include "logging.hpp"

#include <string>
#include <vector>
#include <utility>

// ---------- libsodium ----------
// sodium_init() once per process; false if the library cannot initialize
bool ensure_sodium_ready();

// ---------- SessionID ----------
std::string generate_session_id();

// ---------- String helpers ----------
std::string trim(const std::string& s);
std::string to_lower(std::string s);
void strip_cr(std::string& s);

// ---------- Text checks ----------
bool is_valid_utf8(const std::string& s);
// true if every code point is printable (no control, separator or format chars;
// plain space allowed)
bool is_printable_text(const std::string& s);

// ---------- Helpers: input validation ----------
bool contains_control_or_tab_or_null(const std::string& s);
bool valid_config_name(const std::string& s);

// ---------- Base64 (libsodium variants) ----------
std::string to_base64(const byte* bin, size_t len, int variant);
bool from_base64(const std::string& b64, int variant, std::vector<byte>& out);

// ---------- Secure input ----------
std::string prompt_secret(const char* prompt);

// ---------- External commands ----------
// Runs `/bin/sh -c cmd` with extra environment entries, capturing stdout.
// False on spawn failure or non-zero exit status.
bool run_shell_command(
    const std::string& cmd,
    const std::vector<std::pair<std::string, std::string>>& extra_env,
    std::string& out
);
