#include "obscure.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <openssl/evp.h>

#include <atomic>

static std::atomic<bool> g_obscure_warning_pending{ true };

bool take_obscure_warning() {
    return g_obscure_warning_pending.exchange(false);
}

// AES-256-CTR; the same operation encrypts and decrypts
static bool aes_ctr_crypt(const byte iv[OBSCURE_IV_LEN],
    const byte* in,
    size_t in_len,
    std::vector<byte>& out)
{
    out.assign(in_len + OBSCURE_IV_LEN, 0);
    if (in_len > static_cast<size_t>((std::numeric_limits<int>::max)())) {
        return false;
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        audit_log_level(LogLevel::ERROR,
            "aes_ctr_crypt: EVP_CIPHER_CTX_new failed",
            "obscure_module",
            "failure");
        return false;
    }

    int len1 = 0, len2 = 0;
    bool ok = EVP_EncryptInit_ex(ctx, EVP_aes_256_ctr(), nullptr, OBSCURE_KEY.data(), iv) == 1 &&
        EVP_EncryptUpdate(ctx, out.data(), &len1, in, static_cast<int>(in_len)) == 1 &&
        EVP_EncryptFinal_ex(ctx, out.data() + len1, &len2) == 1;
    EVP_CIPHER_CTX_free(ctx);

    if (!ok) {
        audit_log_level(LogLevel::ERROR,
            "aes_ctr_crypt: EVP cipher operation failed",
            "obscure_module",
            "failure");
        return false;
    }
    out.resize(static_cast<size_t>(len1 + len2));
    return true;
}

std::string obscure(const std::string& plaintext) {
    if (plaintext.empty()) {
        return "";
    }
    if (!ensure_sodium_ready()) {
        throw ObscureError("Failed to obscure value: random source unavailable");
    }

    byte iv[OBSCURE_IV_LEN];
    randombytes_buf(iv, sizeof(iv));

    std::vector<byte> ct;
    if (!aes_ctr_crypt(iv,
        reinterpret_cast<const byte*>(plaintext.data()),
        plaintext.size(),
        ct)) {
        throw ObscureError("Failed to obscure value: cipher failure");
    }

    std::vector<byte> blob(iv, iv + OBSCURE_IV_LEN);
    blob.insert(blob.end(), ct.begin(), ct.end());
    return to_base64(blob.data(), blob.size(), sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

std::string reveal(const std::string& obscured) {
    if (obscured.empty()) {
        return "";
    }

    // accept padded input as well
    std::string b64 = obscured;
    while (!b64.empty() && b64.back() == '=') b64.pop_back();

    std::vector<byte> blob;
    if (!from_base64(b64, sodium_base64_VARIANT_URLSAFE_NO_PADDING, blob)) {
        throw ObscureError("Failed to reveal password - is it obscured? invalid base64");
    }
    if (blob.size() < OBSCURE_IV_LEN) {
        throw ObscureError("Failed to reveal password - is it obscured? input too short");
    }

    std::vector<byte> plain;
    if (!aes_ctr_crypt(blob.data(),
        blob.data() + OBSCURE_IV_LEN,
        blob.size() - OBSCURE_IV_LEN,
        plain)) {
        throw ObscureError("Failed to reveal password: cipher failure");
    }

    std::string out(plain.begin(), plain.end());
    if (!is_valid_utf8(out)) {
        sodium_memzero(&out[0], out.size());
        throw ObscureError("Failed to reveal password - is it obscured? result is not UTF-8");
    }
    return out;
}

bool is_obscured(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    try {
        return is_printable_text(reveal(value));
    }
    catch (const ObscureError&) {
        return false;
    }
}
