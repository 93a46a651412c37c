#include "io.hpp"
#include "util.hpp"
#include "logging.hpp"

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>
#include <errno.h>

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

// ---------- Path helpers ----------
bool path_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool ensure_dir_exists(const std::string& path, mode_t mode) {
    if (path.empty()) return false;

    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            audit_log_level(LogLevel::ERROR,
                path + " exists but is not a directory",
                "io_module",
                "failure");
            return false;
        }
        return true;
    }

    // parents first
    const size_t slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0) {
        if (!ensure_dir_exists(path.substr(0, slash), mode)) {
            return false;
        }
    }

    if (mkdir(path.c_str(), mode) != 0 && errno != EEXIST) {
        audit_log_level(LogLevel::ERROR,
            "Failed to create directory " + path + ": " + strerror(errno),
            "io_module",
            "failure");
        return false;
    }
    return true;
}

std::vector<std::string> list_files_with_extension(const std::string& dir, const std::string& extension) {
    std::vector<std::string> names;
    DIR* d = opendir(dir.c_str());
    if (!d) {
        return names;
    }

    while (struct dirent* ent = readdir(d)) {
        const std::string fname = ent->d_name;
        if (fname.size() <= extension.size()) continue;
        if (fname.compare(fname.size() - extension.size(), extension.size(), extension) != 0) continue;

        struct stat st;
        const std::string full = dir + "/" + fname;
        if (stat(full.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;

        names.push_back(fname);
    }
    closedir(d);

    std::sort(names.begin(), names.end());
    return names;
}


// -------- Ownership and permission checks ----------
bool check_file_ownership_and_perms(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return errno == ENOENT;
    }

    bool ok = true;
    if (st.st_uid != geteuid()) {
        audit_log_level(LogLevel::WARN,
            "File ownership violation: " + path,
            "io_module",
            "failure");
        ok = false;
    }
    // No group/other access expected
    if ((st.st_mode & 0077) != 0) {
        audit_log_level(LogLevel::WARN,
            "Insecure file permissions on: " + path,
            "io_module",
            "failure");
        ok = false;
    }
    return ok;
}


// -------- File content --------
bool read_file(const std::string& path, std::string& out) {
    out.clear();
    FILE* f = fopen(path.c_str(), "rb");
    if (!f) {
        audit_log_level(LogLevel::DEBUG,
            "read_file: fopen failed: " + path,
            "io_module",
            "failure");
        return false;
    }

    if (fseek(f, 0, SEEK_END) != 0) {
        fclose(f);
        audit_log_level(LogLevel::ERROR,
            "fseek end failed",
            "io_module",
            "failure");
        return false;
    }
    long sz = ftell(f);
    if (sz < 0) {
        fclose(f);
        audit_log_level(LogLevel::ERROR,
            "ftell failed",
            "io_module",
            "failure");
        return false;
    }
    if ((unsigned long)sz > MAX_CONFIG_SIZE) {
        audit_log_level(LogLevel::WARN,
            "Config file too large or corrupt: " + path,
            "io_module",
            "failure");
        fclose(f);
        return false;
    }
    if (fseek(f, 0, SEEK_SET) != 0) {
        fclose(f);
        audit_log_level(LogLevel::ERROR,
            "fseek set failed",
            "io_module",
            "failure");
        return false;
    }

    size_t size = static_cast<size_t>(sz);
    out.resize(size);
    if (size > 0) {
        size_t r = fread(&out[0], 1, size, f);
        if (r != size) {
            fclose(f);
            out.clear();
            audit_log_level(LogLevel::ERROR,
                "fread failed on " + path,
                "io_module",
                "failure");
            return false;
        }
    }

    fclose(f);
    return true;
}

// -------- Atomic file write helper --------
bool atomic_write_file(const std::string& path, const byte* buf, size_t len) {
    if (!buf && len > 0) return false;
    if (len > MAX_CONFIG_SIZE) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: attempt to write huge file",
            "io_module",
            "failure");
        return false;
    }

    std::string tmpl = path + ".tmpXXXXXX";
    std::vector<char> temp(tmpl.begin(), tmpl.end());
    temp.push_back('\0');

    int fd = mkostemp(temp.data(), O_CLOEXEC);
    if (fd < 0) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: mkostemp failed: " + std::string(strerror(errno)),
            "io_module",
            "failure");
        return false;
    }
    // set perms to 0600
    if (fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: fchmod failed",
            "io_module",
            "failure");
        close(fd);
        unlink(temp.data());
        return false;
    }

    size_t written = 0;
    while (written < len) {
        ssize_t w = write(fd, buf + written, len - written);
        if (w < 0) {
            if (errno == EINTR) continue;
            audit_log_level(LogLevel::ERROR,
                "atomic_write_file: write failed: " + std::string(strerror(errno)),
                "io_module",
                "failure");
            close(fd);
            unlink(temp.data());
            return false;
        }
        written += static_cast<size_t>(w);
    }

    if (fsync(fd) != 0) {
        audit_log_level(LogLevel::WARN,
            "atomic_write_file: fsync failed",
            "io_module",
            "failure");
    }
    if (close(fd) != 0) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: close failed",
            "io_module",
            "failure");
        unlink(temp.data());
        return false;
    }
    if (rename(temp.data(), path.c_str()) != 0) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: rename failed: " + std::string(strerror(errno)),
            "io_module",
            "failure");
        unlink(temp.data());
        return false;
    }
    return true;
}


// -------- Secure deletion --------
bool secure_delete_file(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return errno == ENOENT;
    }

    if (S_ISLNK(st.st_mode)) {
        audit_log_level(LogLevel::WARN,
            "secure_delete_file: refused to delete symlink: " + path,
            "io_module",
            "failure");
        return false;
    }

    if (st.st_uid != geteuid()) {
        audit_log_level(LogLevel::WARN,
            "secure_delete_file: refused, wrong owner",
            "io_module",
            "failure");
        return false;
    }

    FILE* f = fopen(path.c_str(), "r+b");
    if (f) {
        long lsz = st.st_size;
        if (lsz > 0 && (unsigned long)lsz <= MAX_CONFIG_SIZE) {
            rewind(f);
            std::vector<byte> zeros((size_t)lsz, 0);
            if (fwrite(zeros.data(), 1, zeros.size(), f) != zeros.size()) {
                audit_log_level(LogLevel::WARN,
                    "secure_delete_file: overwrite incomplete: " + path,
                    "io_module",
                    "failure");
            }
            fflush(f);
            fsync(fileno(f));
        }
        fclose(f);
    }

    if (std::remove(path.c_str()) != 0) {
        audit_log_level(LogLevel::ERROR,
            "secure_delete_file: remove failed: " + path,
            "io_module",
            "failure");
        return false;
    }
    return true;
}
