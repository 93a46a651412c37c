#pragma once
#include "vaultconfig_common.hpp"
#include "logging.hpp"

#include <string>
#include <vector>

// -------- Directory helpers --------
// Creates the directory (and missing parents) with `mode`. False if the path
// exists but is not a directory or cannot be created.
bool ensure_dir_exists(const std::string& path, mode_t mode = S_IRWXU);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);

// Regular files in `dir` ending in `extension`, sorted by name
std::vector<std::string> list_files_with_extension(const std::string& dir, const std::string& extension);

// -------- Ownership and permission checks ----------
// Logs a WARN when the file is not owned by the effective user or is
// group/other accessible. Missing files pass.
bool check_file_ownership_and_perms(const std::string& path);

// -------- File content --------
// Binary read, refusing files larger than MAX_CONFIG_SIZE
bool read_file(const std::string& path, std::string& out);

// temp file (0600) + fsync + rename over `path`
bool atomic_write_file(const std::string& path, const byte* buf, size_t len);

// Overwrites with zeros, then unlinks. Refuses symlinks and foreign files.
// A missing file counts as deleted.
bool secure_delete_file(const std::string& path);
