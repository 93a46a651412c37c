#include "logging.hpp"
#include "util.hpp"

#include <pwd.h>
#include <ctime>
#include <cctype>

LogContext g_log_ctx;

static std::string g_audit_log_path;
static LogLevel g_min_level = LogLevel::WARN;
static bool g_log_ctx_ready = false;


// ---------------- Get username ----------------
static std::string get_system_username() {
    uid_t uid = geteuid();
    struct passwd* pw = getpwuid(uid);
    if (pw && pw->pw_name) {
        return std::string(pw->pw_name);
    }
    const char* envUser = std::getenv("USER");
    if (envUser && *envUser) {
        return std::string(envUser);
    }
    return "unknown";
}


// ---------------- Global logging context init ----------------
void init_log_context() {
    g_log_ctx.userId = get_system_username();
    g_log_ctx.sessionId = generate_session_id();
    g_log_ctx_ready = true;
}

void set_audit_log_path(const std::string& path) {
    g_audit_log_path = path;
}

void set_log_level(LogLevel lvl) {
    g_min_level = lvl;
}

LogLevel get_log_level() {
    return g_min_level;
}

bool parse_log_level(const std::string& s, LogLevel& out) {
    std::string v = to_lower(trim(s));
    if (v == "debug") out = LogLevel::DEBUG;
    else if (v == "info") out = LogLevel::INFO;
    else if (v == "warn" || v == "warning") out = LogLevel::WARN;
    else if (v == "error") out = LogLevel::ERROR;
    else if (v == "alert") out = LogLevel::ALERT;
    else return false;
    return true;
}

void configure_logging_from_env() {
    const char* path = std::getenv(ENV_LOG_PATH);
    if (path && *path) {
        set_audit_log_path(path);
    }
    const char* lvl = std::getenv(ENV_LOG_LEVEL);
    if (lvl && *lvl) {
        LogLevel parsed;
        if (parse_log_level(lvl, parsed)) {
            set_log_level(parsed);
        }
        else {
            audit_log_level(LogLevel::WARN,
                std::string("Ignoring unknown log level: ") + lvl,
                "logging",
                "failure");
        }
    }
}


// ---------------- Logging (levels) ----------------
static const char* log_level_str(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::ALERT: return "ALERT";
    default:              return "UNKNOWN";
    }
}

void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event,
    const std::string& outcome
)
{
    if (static_cast<int>(lvl) < static_cast<int>(g_min_level)) {
        return;
    }
    if (!g_log_ctx_ready) {
        init_log_context();
    }

    FILE* f = nullptr;
    if (!g_audit_log_path.empty()) {
        f = std::fopen(g_audit_log_path.c_str(), "a");
        if (!f) {
            std::fprintf(stderr, "[audit-fail] %s: %s\n",
                log_level_str(lvl),
                entry.c_str());
            return;
        }
        fchmod(fileno(f), S_IRUSR | S_IWUSR);
    }
    FILE* out = f ? f : stderr;

    // timestamp
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);

    char tbuf[64];
    if (std::strftime(tbuf, sizeof(tbuf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
        std::strncpy(tbuf, "0000-00-00 00:00:00", sizeof(tbuf));
        tbuf[sizeof(tbuf) - 1] = '\0';
    }

    // sanitize message fields to avoid newlines in log entries
    auto sanitize = [](const std::string& s) {
        std::string r = s;
        for (char& c : r) {
            if (c == '\n' || c == '\r') c = ' ';
        }
        return r;
        };

    std::string s_entry = sanitize(entry);
    std::string s_event = sanitize(event);
    std::string s_outcome = sanitize(outcome);

    // timestamp | level | user | session | event | outcome | message
    std::fprintf(
        out,
        "%s | %s | user=%s | session=%s | event=%s | outcome=%s | %s\n",
        tbuf,
        log_level_str(lvl),
        g_log_ctx.userId.c_str(),
        g_log_ctx.sessionId.c_str(),
        s_event.c_str(),
        s_outcome.c_str(),
        s_entry.c_str()
    );

    std::fflush(out);
    if (f) {
        fsync(fileno(f));
        std::fclose(f);
    }
}
