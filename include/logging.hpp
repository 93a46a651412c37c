#pragma once
#include "vaultconfig_common.hpp"

// -------- Logging (levels) --------
enum class LogLevel { DEBUG, INFO, WARN, ERROR, ALERT }; // levels

struct LogContext {
    std::string userId;
    std::string sessionId;
};

extern LogContext g_log_ctx;

// Initialize global logging context (user, session id)
void init_log_context();

// Append to this file instead of stderr. Empty path = stderr.
void set_audit_log_path(const std::string& path);

// Entries below this level are dropped (default WARN)
void set_log_level(LogLevel lvl);
LogLevel get_log_level();

// "debug", "info", "warn", "error", "alert"; false on anything else
bool parse_log_level(const std::string& s, LogLevel& out);

// Reads VAULTCONFIG_LOG and VAULTCONFIG_LOG_LEVEL
void configure_logging_from_env();

// Log with level, message, optional event + outcome
// audit_log_level(LogLevel::INFO, "Added config 'db'", "add_config", "success");
void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event = "",
    const std::string& outcome = ""
);
