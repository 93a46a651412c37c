#include "cli.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <cstdio>

int main(int argc, char** argv) {
    init_log_context();
    configure_logging_from_env();

    if (!ensure_sodium_ready()) {
        std::fprintf(stderr, "An unexpected error occurred. Check audit log.\n");
        audit_log_level(LogLevel::ERROR,
            "libsodium initialization failed",
            "session",
            "failure");
        return 1;
    }

    return run_cli(argc, argv, default_password_sources());
}
