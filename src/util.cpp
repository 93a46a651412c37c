#include "util.hpp"

#include <sys/wait.h>
#include <termios.h>

#include <array>
#include <cctype>
#include <iostream>


// ---------- libsodium ----------
bool ensure_sodium_ready() {
    static const bool ready = (sodium_init() >= 0);
    if (!ready) {
        std::fprintf(stderr, "libsodium initialization failed\n");
    }
    return ready;
}


// ---------- SessionID ----------
std::string generate_session_id() {
    std::array<byte, 16> buf{};
    if (ensure_sodium_ready()) {
        randombytes_buf(buf.data(), buf.size());
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(32);

    for (size_t i = 0; i < buf.size(); ++i) {
        out[2 * i] = hex[(buf[i] >> 4) & 0x0F];
        out[2 * i + 1] = hex[buf[i] & 0x0F];
    }
    return out;
}


// ---------- String helpers ----------
std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void strip_cr(std::string& s) {
    if (!s.empty() && s.back() == '\r') s.pop_back();
}


// ---------- Text checks ----------
// Decodes one code point at s[i]; returns its length or 0 when malformed.
static size_t decode_utf8(const std::string& s, size_t i, uint32_t& cp) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    size_t len;
    uint32_t min;
    if (c < 0x80) { cp = c; return 1; }
    else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; min = 0x80; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; min = 0x800; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; min = 0x10000; }
    else return 0;

    if (i + len > s.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        const unsigned char cc = static_cast<unsigned char>(s[i + k]);
        if ((cc & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF) return 0;        // overlong / out of range
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;     // surrogates
    return len;
}

bool is_valid_utf8(const std::string& s) {
    uint32_t cp = 0;
    for (size_t i = 0; i < s.size();) {
        size_t n = decode_utf8(s, i, cp);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

static bool is_printable_cp(uint32_t cp) {
    if (cp < 0x20 || (cp >= 0x7F && cp <= 0xA0)) return false; // C0, DEL, C1, NBSP
    if (cp == 0xAD) return false;                              // soft hyphen
    if (cp == 0x1680 || cp == 0x180E) return false;
    if (cp >= 0x2000 && cp <= 0x200F) return false;            // spaces, zero-width, marks
    if (cp >= 0x2028 && cp <= 0x202F) return false;            // line/para sep, embeddings
    if (cp >= 0x205F && cp <= 0x206F) return false;
    if (cp == 0x3000 || cp == 0xFEFF) return false;
    if (cp >= 0xE000 && cp <= 0xF8FF) return false;            // private use
    if (cp >= 0xFFF0 && cp <= 0xFFFF) return false;
    if (cp >= 0xF0000) return false;                           // supplementary private use
    return true;
}

bool is_printable_text(const std::string& s) {
    uint32_t cp = 0;
    for (size_t i = 0; i < s.size();) {
        size_t n = decode_utf8(s, i, cp);
        if (n == 0 || !is_printable_cp(cp)) return false;
        i += n;
    }
    return true;
}


// ---------- Helpers: input validation ----------
bool contains_control_or_tab_or_null(const std::string& s) {
    for (unsigned char c : s) {
        if (c == '\t' || c == '\0') return true;
        if ((c < 0x20) && c != '\n' && c != '\r') return true; // other control chars
    }
    return false;
}

bool valid_config_name(const std::string& s) {
    if (s.empty() || s.size() > MAX_NAME_LEN) return false;
    if (s == "." || s == "..") return false;
    if (s.find('/') != std::string::npos) return false;
    return !contains_control_or_tab_or_null(s) && s.find('\n') == std::string::npos;
}


// ---------- Base64 ----------
std::string to_base64(const byte* bin, size_t len, int variant) {
    if (!bin && len > 0) return "";
    size_t out_len = sodium_base64_encoded_len(len, variant);
    if (out_len == 0) return "";
    std::string out;
    out.resize(out_len);
    sodium_bin2base64(&out[0], out_len, bin, len, variant);
    // trim at first null
    size_t pos = out.find('\0');
    if (pos != std::string::npos) out.resize(pos);
    return out;
}

bool from_base64(const std::string& b64, int variant, std::vector<byte>& out) {
    out.clear();
    if (b64.empty()) return true;
    std::vector<byte> buf(b64.size());
    size_t out_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(buf.data(),
        buf.size(),
        b64.c_str(),
        b64.size(),
        nullptr,
        &out_len,
        &end,
        variant) != 0) {
        return false;
    }
    // reject trailing garbage after the last valid character
    if (end != b64.c_str() + b64.size()) return false;
    if (out_len > buf.size()) return false;
    buf.resize(out_len);
    out = std::move(buf);
    return true;
}


// ---------- Secure input ----------
static void disable_echo(bool disable) {
    termios tty;
    if (tcgetattr(STDIN_FILENO, &tty) != 0) return;

    if (disable) tty.c_lflag &= ~ECHO;
    else         tty.c_lflag |= ECHO;

    tcsetattr(STDIN_FILENO, TCSANOW, &tty);
}

std::string prompt_secret(const char* prompt) {
    std::cerr << prompt;
    std::fflush(stderr);

    disable_echo(true);

    std::string s;
    std::getline(std::cin, s);

    disable_echo(false);
    std::cerr << "\n";

    strip_cr(s);
    return s;
}


// ---------- External commands ----------
bool run_shell_command(
    const std::string& cmd,
    const std::vector<std::pair<std::string, std::string>>& extra_env,
    std::string& out)
{
    int pipefd[2];
    if (pipe(pipefd) != 0) return false;

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        return false;
    }

    if (pid == 0) {
        // child: stdout -> pipe write end
        dup2(pipefd[1], STDOUT_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);

        for (const auto& kv : extra_env) {
            setenv(kv.first.c_str(), kv.second.c_str(), 1);
        }

        execl("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    // parent: read from pipe
    close(pipefd[1]);
    std::string s;
    char buf[4096];
    ssize_t r;

    while ((r = read(pipefd[0], buf, sizeof(buf))) != 0) {
        if (r < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (s.size() + static_cast<size_t>(r) > MAX_COMMAND_OUTPUT) {
            // Avoid insane sizes; truncate
            s.append(buf, buf + (MAX_COMMAND_OUTPUT - s.size()));
            break;
        }
        s.append(buf, buf + r);
    }
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return false;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return false;
    }

    out = std::move(s);
    return true;
}
