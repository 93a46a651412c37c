#pragma once
#include "vaultconfig_common.hpp"
#include "errors.hpp"

#include <array>
#include <string>

// -------- Field obfuscation --------
// NOT encryption. Every installation shares OBSCURE_KEY, so anyone holding this
// library can reveal an obscured value. It only keeps secrets from being read
// off a screen or a config file at a glance. Use the envelope in crypto.hpp for
// real protection.

// AES-256 key shared by all vaultconfig installations. Not configurable.
inline constexpr std::array<byte, 32> OBSCURE_KEY = {
    0xA7, 0x3B, 0x9F, 0x2C, 0xE1, 0x5D, 0x4A, 0x8E,
    0xB6, 0xF4, 0xC9, 0x7A, 0x3E, 0x91, 0x5C, 0xD2,
    0x8B, 0x4F, 0xA3, 0x6E, 0x1B, 0xC5, 0x7D, 0x9A,
    0x2F, 0xE8, 0x4B, 0xA6, 0x3C, 0xD1, 0x5E, 0x92,
};

// base64url-nopad(IV[16] || AES-256-CTR(plaintext)); "" for "".
// Random IV: two calls never return the same text.
std::string obscure(const std::string& plaintext);

// Inverse of obscure(). Throws ObscureError when the input is not base64url,
// shorter than an IV, or does not decrypt to UTF-8.
std::string reveal(const std::string& obscured);

// Heuristic: reveal() succeeds and the result is printable.
// Printable-looking base64 can false-positive, non-printable secrets
// false-negative.
bool is_obscured(const std::string& value);

// true exactly once per process; the caller logs the obfuscation warning
bool take_obscure_warning();
