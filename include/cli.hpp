#pragma once

#include "crypto.hpp"

// Runs one vaultconfig command line (argv[0] is the program name) and
// returns the process exit status. Errors are reported on stderr.
int run_cli(int argc, char** argv, const PasswordSources& sources = default_password_sources());
