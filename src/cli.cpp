#include "cli.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "formats.hpp"
#include "io.hpp"
#include "logging.hpp"
#include "obscure.hpp"
#include "schema.hpp"
#include "util.hpp"
#include "vaultconfig_common.hpp"

#include <pwd.h>

#include <cstdio>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

// ---------------- argument model ----------------
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options; // --opt VALUE
    std::set<std::string> flags;                // --flag
};

static const std::set<std::string> kValueOptions = {
    "--default", "--to", "--output", "--from", "--schema"
};

static const std::map<std::string, std::string> kShortFlags = {
    { "-r", "--reveal" }, { "-y", "--yes" }, { "-c", "--create" }, { "-e", "--encrypt" }
};

static void print_usage() {
    std::cerr <<
        "Usage: vaultconfig [-d DIR] [-f FORMAT] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  init [--encrypt]                       create the config directory\n"
        "  list                                   list config names\n"
        "  show NAME [--reveal]                   print a config\n"
        "  get NAME KEY [--reveal] [--default V]  print one value (dotted key)\n"
        "  set NAME KEY=VALUE... [--obscure] [--create]\n"
        "  unset NAME KEY...\n"
        "  delete NAME [--yes]\n"
        "  copy SRC DST\n"
        "  rename OLD NEW\n"
        "  export NAME [--to FORMAT] [--output FILE] [--reveal]\n"
        "  import NAME FILE [--from FORMAT] [--overwrite]\n"
        "  encrypt set|remove|check\n"
        "  validate NAME --schema FILE\n"
        "\n"
        "Formats: toml, ini, yaml. Password sources: VAULTCONFIG_PASSWORD,\n"
        "VAULTCONFIG_PASSWORD_COMMAND, terminal prompt.\n";
}

// false on an unknown option or a missing option value
static bool parse_command_args(int argc, char** argv, int index, CommandArgs& out) {
    for (int i = index; i < argc; ++i) {
        std::string arg = argv[i];
        auto short_it = kShortFlags.find(arg);
        if (short_it != kShortFlags.end()) {
            arg = short_it->second;
        }

        if (arg.rfind("--", 0) != 0 || arg == "--") {
            out.positional.push_back(arg);
            continue;
        }

        const size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            const std::string key = arg.substr(0, eq);
            if (!kValueOptions.count(key)) {
                std::cerr << "Unknown option: " << key << "\n";
                return false;
            }
            out.options[key] = arg.substr(eq + 1);
            continue;
        }

        if (kValueOptions.count(arg)) {
            if (i + 1 >= argc) {
                std::cerr << "Option " << arg << " requires a value\n";
                return false;
            }
            out.options[arg] = argv[++i];
            continue;
        }

        static const std::set<std::string> known_flags = {
            "--reveal", "--obscure", "--create", "--yes", "--overwrite", "--encrypt"
        };
        if (!known_flags.count(arg)) {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
        out.flags.insert(arg);
    }
    return true;
}

// ---------------- directory + format defaults ----------------
static std::string get_user_home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        struct passwd* pw = getpwuid(geteuid());
        if (pw && pw->pw_dir) {
            home = pw->pw_dir;
        }
    }
    if (!home || !*home) return ".";
    return std::string(home);
}

static std::string default_config_dir() {
    const char* env_dir = std::getenv(ENV_CONFIG_DIR);
    if (env_dir && *env_dir) return env_dir;

    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/vaultconfig";

    return get_user_home_dir() + "/.config/vaultconfig";
}

// Format of the files already present; toml for an empty directory
static std::string detect_dir_format(const std::string& dir) {
    if (!list_files_with_extension(dir, ".toml").empty()) return "toml";
    if (!list_files_with_extension(dir, ".ini").empty()) return "ini";
    if (!list_files_with_extension(dir, ".yaml").empty() ||
        !list_files_with_extension(dir, ".yml").empty()) return "yaml";
    return "toml";
}

// Import source format from the file name, falling back to content sniffing
static std::string format_for_file(const std::string& path, const std::string& content) {
    const size_t dot = path.find_last_of('.');
    if (dot != std::string::npos && path.find('/', dot) == std::string::npos) {
        const std::string ext = to_lower(path.substr(dot + 1));
        if (ext == "toml" || ext == "ini" || ext == "yaml" || ext == "yml") {
            return ext == "yml" ? "yaml" : ext;
        }
    }
    return detect_format(content);
}


// ---------------- interactive helpers ----------------
static bool confirm(const std::string& question, bool assume_yes) {
    if (assume_yes) return true;
    if (!isatty(STDIN_FILENO)) {
        std::cerr << question << " Refusing without --yes (not a terminal).\n";
        return false;
    }
    std::cerr << question << " [y/N] ";
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    strip_cr(answer);
    answer = to_lower(trim(answer));
    return answer == "y" || answer == "yes";
}

// Prompts twice on a terminal; otherwise uses the non-interactive sources
static std::string read_new_password(const PasswordSources& sources) {
    std::string pw;
    if (sources.is_terminal()) {
        pw = sources.prompt("Enter new encryption password: ");
        std::string confirm_pw = sources.prompt("Confirm password: ");
        const bool match = pw.size() == confirm_pw.size() &&
            (pw.empty() || sodium_memcmp(pw.data(), confirm_pw.data(), pw.size()) == 0);
        if (!confirm_pw.empty()) {
            sodium_memzero(&confirm_pw[0], confirm_pw.size());
        }
        if (!match) {
            audit_log_level(LogLevel::WARN,
                "Password confirmation did not match",
                "read_new_password",
                "failure");
            throw VaultConfigError("Passwords do not match");
        }
    }
    else {
        pw = get_password("New config password: ", true, sources);
    }

    PasswordCheck check = check_password(pw);
    for (const std::string& w : check.warnings) {
        std::cerr << "Warning: " << w << "\n";
    }
    if (!pw.empty()) {
        sodium_memzero(&pw[0], pw.size());
    }
    return check.password;
}

static void print_value_tree(const ConfigMap& data, int indent) {
    const std::string pad(static_cast<size_t>(indent) * 2, ' ');
    for (const auto& kv : data) {
        if (kv.second.is_map()) {
            std::cout << pad << kv.first << ":\n";
            print_value_tree(kv.second.as_map(), indent + 1);
        }
        else {
            std::cout << pad << kv.first << ": " << kv.second.to_text() << "\n";
        }
    }
}

static int fail(const std::string& msg) {
    std::cerr << "Error: " << msg << "\n";
    return 1;
}

static bool require_args(const CommandArgs& a, size_t min, size_t max) {
    if (a.positional.size() < min || a.positional.size() > max) {
        print_usage();
        return false;
    }
    return true;
}


// ---------------- commands ----------------
static int cmd_init(const std::string& dir, const std::string& format, const CommandArgs& a,
    const PasswordSources& sources) {
    if (!require_args(a, 0, 0)) return 1;

    if (is_directory(dir) && !list_files_with_extension(dir, "").empty()) {
        std::cerr << "Warning: directory " << dir << " already exists and is not empty\n";
    }
    if (!ensure_dir_exists(dir, S_IRWXU)) {
        return fail("Cannot create config directory: " + dir);
    }

    std::optional<std::string> password;
    if (a.flags.count("--encrypt")) {
        password = read_new_password(sources);
    }

    ConfigManager manager(dir, format, std::nullopt, password, sources);
    if (password && !password->empty()) {
        sodium_memzero(&(*password)[0], password->size());
    }

    audit_log_level(LogLevel::INFO,
        "Initialized config directory " + dir,
        "init",
        "success");
    std::cout << "Initialized config directory: " << dir << "\n"
        << "  Format: " << manager.format_name() << "\n"
        << "  Encrypted: " << (manager.is_encrypted() ? "Yes" : "No") << "\n";
    return 0;
}

static int cmd_list(ConfigManager& manager, const CommandArgs& a) {
    if (!require_args(a, 0, 0)) return 1;
    for (const std::string& name : manager.list_configs()) {
        std::cout << name << "\n";
    }
    return 0;
}

static int cmd_show(ConfigManager& manager, const CommandArgs& a) {
    if (!require_args(a, 1, 1)) return 1;
    const std::string& name = a.positional[0];
    const ConfigEntry* entry = manager.get_config(name);
    if (!entry) return fail("Config '" + name + "' not found");

    const bool reveal_secrets = a.flags.count("--reveal") > 0;
    std::cout << "Configuration: " << name << "\n\n";
    print_value_tree(entry->get_all(reveal_secrets), 0);
    if (!reveal_secrets) {
        std::cout << "\nNote: Use --reveal to show obscured passwords\n";
    }
    return 0;
}

static int cmd_get(ConfigManager& manager, const CommandArgs& a) {
    if (!require_args(a, 2, 2)) return 1;
    const std::string& name = a.positional[0];
    const std::string& key = a.positional[1];
    const ConfigEntry* entry = manager.get_config(name);
    if (!entry) return fail("Config '" + name + "' not found");

    std::optional<ConfigValue> value;
    if (a.flags.count("--reveal")) {
        value = entry->get(key);
    }
    else if (const ConfigValue* raw = find_path(entry->data(), split_path(key))) {
        value = *raw;
    }

    if (!value) {
        auto def = a.options.find("--default");
        if (def == a.options.end()) return fail("Key '" + key + "' not found");
        std::cout << def->second << "\n";
        return 0;
    }

    if (value->is_map()) {
        print_value_tree(value->as_map(), 0);
    }
    else {
        std::cout << value->to_text() << "\n";
    }
    return 0;
}

static int cmd_set(ConfigManager& manager, const CommandArgs& a) {
    if (a.positional.size() < 2) {
        print_usage();
        return 1;
    }
    const std::string& name = a.positional[0];
    const ConfigEntry* entry = manager.get_config(name);
    if (!entry && !a.flags.count("--create")) {
        return fail("Config '" + name + "' not found (use --create to create it)");
    }

    ConfigMap data = entry ? entry->data() : ConfigMap{};
    const bool obscure_value = a.flags.count("--obscure") > 0;

    for (size_t i = 1; i < a.positional.size(); ++i) {
        const std::string& assignment = a.positional[i];
        const size_t eq = assignment.find('=');
        if (eq == std::string::npos) {
            return fail("Invalid assignment '" + assignment + "'. Use key=value format");
        }
        const std::string key = trim(assignment.substr(0, eq));
        if (key.empty()) {
            return fail("Invalid assignment '" + assignment + "': empty key");
        }

        ConfigValue value = parse_scalar(trim(assignment.substr(eq + 1)));
        if (obscure_value && value.is_string()) {
            if (take_obscure_warning()) {
                std::cerr << "Warning: obscured values are NOT encrypted; "
                    "anyone with vaultconfig can reveal them.\n";
            }
            value = ConfigValue(obscure(value.as_string()));
        }
        set_path(data, split_path(key), std::move(value));
    }

    manager.add_config(name, data, false);
    std::cout << "Updated config: " << name << "\n";
    return 0;
}

static int cmd_unset(ConfigManager& manager, const CommandArgs& a) {
    if (a.positional.size() < 2) {
        print_usage();
        return 1;
    }
    const std::string& name = a.positional[0];
    const ConfigEntry* entry = manager.get_config(name);
    if (!entry) return fail("Config '" + name + "' not found");

    ConfigMap data = entry->data();
    std::string removed, not_found;
    for (size_t i = 1; i < a.positional.size(); ++i) {
        const std::string& key = a.positional[i];
        std::string& list = erase_path(data, split_path(key)) ? removed : not_found;
        if (!list.empty()) list += ", ";
        list += key;
    }

    if (!removed.empty()) {
        manager.add_config(name, data, false);
        std::cout << "Removed keys from config '" << name << "': " << removed << "\n";
    }
    if (!not_found.empty()) {
        std::cerr << "Warning: Keys not found: " << not_found << "\n";
    }
    return 0;
}

static int cmd_delete(ConfigManager& manager, const CommandArgs& a) {
    if (!require_args(a, 1, 1)) return 1;
    const std::string& name = a.positional[0];
    if (!manager.has_config(name)) return fail("Config '" + name + "' not found");

    if (!confirm("Are you sure you want to delete config '" + name + "'?", a.flags.count("--yes") > 0)) {
        return 1;
    }
    manager.remove_config(name);
    std::cout << "Deleted config: " << name << "\n";
    return 0;
}

static int cmd_copy(ConfigManager& manager, const CommandArgs& a, bool remove_source) {
    if (!require_args(a, 2, 2)) return 1;
    const std::string& src = a.positional[0];
    const std::string& dst = a.positional[1];

    const ConfigEntry* entry = manager.get_config(src);
    if (!entry) return fail("Config '" + src + "' not found");
    if (manager.has_config(dst)) {
        throw ConfigExistsError("Config '" + dst + "' already exists");
    }

    manager.add_config(dst, entry->data(), false);
    if (remove_source) {
        manager.remove_config(src);
        std::cout << "Renamed '" << src << "' to '" << dst << "'\n";
    }
    else {
        std::cout << "Copied '" << src << "' to '" << dst << "'\n";
    }
    return 0;
}

static int cmd_export(ConfigManager& manager, const CommandArgs& a) {
    if (!require_args(a, 1, 1)) return 1;
    const std::string& name = a.positional[0];
    const ConfigEntry* entry = manager.get_config(name);
    if (!entry) return fail("Config '" + name + "' not found");

    auto to = a.options.find("--to");
    auto handler = make_format_handler(to == a.options.end() ? manager.format_name() : to->second);
    const std::string text = handler->dump(entry->get_all(a.flags.count("--reveal") > 0));

    auto out = a.options.find("--output");
    if (out == a.options.end()) {
        std::cout << text;
        return 0;
    }
    if (!atomic_write_file(out->second, reinterpret_cast<const byte*>(text.data()), text.size())) {
        return fail("Failed to write " + out->second);
    }
    std::cout << "Exported to: " << out->second << "\n";
    return 0;
}

static int cmd_import(ConfigManager& manager, const CommandArgs& a) {
    if (!require_args(a, 2, 2)) return 1;
    const std::string& name = a.positional[0];
    const std::string& path = a.positional[1];

    if (manager.has_config(name) && !a.flags.count("--overwrite")) {
        throw ConfigExistsError("Config '" + name + "' already exists (use --overwrite to replace it)");
    }

    std::string content;
    if (!read_file(path, content)) return fail("Cannot read " + path);

    auto from = a.options.find("--from");
    const std::string format = from != a.options.end() ? from->second : format_for_file(path, content);
    if (format.empty()) return fail("Cannot detect the format of " + path + " (use --from)");

    manager.add_config(name, make_format_handler(format)->load(content));
    std::cout << "Imported config: " << name << "\n";
    return 0;
}

static int cmd_encrypt(ConfigManager& manager, const CommandArgs& a, const PasswordSources& sources) {
    if (!require_args(a, 1, 1)) return 1;
    const std::string& action = a.positional[0];

    if (action == "set") {
        std::string pw = read_new_password(sources);
        manager.set_encryption_password(pw);
        sodium_memzero(&pw[0], pw.size());
        std::cout << "Encryption password updated\n";
        return 0;
    }
    if (action == "remove") {
        if (!confirm("Remove encryption? Configs will be stored in plaintext.", a.flags.count("--yes") > 0)) {
            return 1;
        }
        manager.remove_encryption();
        std::cout << "Encryption removed\n";
        return 0;
    }
    if (action == "check") {
        std::cout << (manager.is_encrypted() ? "Configs are encrypted\n" : "Configs are NOT encrypted\n");
        return 0;
    }
    print_usage();
    return 1;
}

static int cmd_validate(ConfigManager& manager, const CommandArgs& a) {
    if (!require_args(a, 1, 1)) return 1;
    const std::string& name = a.positional[0];
    const ConfigEntry* entry = manager.get_config(name);
    if (!entry) return fail("Config '" + name + "' not found");

    auto schema_opt = a.options.find("--schema");
    if (schema_opt == a.options.end()) {
        std::cerr << "Warning: No schema provided, skipping validation\n";
        std::cout << "Config '" << name << "' exists and is readable\n";
        return 0;
    }

    ConfigSchema schema = load_schema_file(schema_opt->second);
    try {
        schema.validate(entry->data());
    }
    catch (const SchemaValidationError& e) {
        std::cerr << "Validation failed: " << e.what() << "\n";
        return 1;
    }
    std::cout << "Config '" << name << "' is valid\n";
    return 0;
}

static int dispatch(const std::string& cmd, const std::string& dir, const std::string& format, const CommandArgs& a,
    const PasswordSources& sources) {
    if (cmd == "init") {
        return cmd_init(dir, format.empty() ? "toml" : format, a, sources);
    }

    if (!is_directory(dir)) {
        return fail("Config directory not found: " + dir + " (run 'vaultconfig init' first)");
    }
    ConfigManager manager(dir, format.empty() ? detect_dir_format(dir) : format, std::nullopt, std::nullopt, sources);

    if (cmd == "list")     return cmd_list(manager, a);
    if (cmd == "show")     return cmd_show(manager, a);
    if (cmd == "get")      return cmd_get(manager, a);
    if (cmd == "set")      return cmd_set(manager, a);
    if (cmd == "unset")    return cmd_unset(manager, a);
    if (cmd == "delete")   return cmd_delete(manager, a);
    if (cmd == "copy")     return cmd_copy(manager, a, false);
    if (cmd == "rename")   return cmd_copy(manager, a, true);
    if (cmd == "export")   return cmd_export(manager, a);
    if (cmd == "import")   return cmd_import(manager, a);
    if (cmd == "encrypt")  return cmd_encrypt(manager, a, sources);
    if (cmd == "validate") return cmd_validate(manager, a);

    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage();
    return 1;
}

// -----------------------------------------------------------------------
// entry point
// -----------------------------------------------------------------------
int run_cli(int argc, char** argv, const PasswordSources& sources) {
    // global flags
    std::string dir;
    std::string format;
    int index = 1;
    for (; index < argc; ++index) {
        const std::string arg = argv[index];
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        }
        if (arg == "-d" || arg == "--dir" || arg == "-f" || arg == "--format") {
            if (index + 1 >= argc) {
                print_usage();
                return 1;
            }
            (arg == "-d" || arg == "--dir" ? dir : format) = argv[++index];
            continue;
        }
        break;
    }

    if (index >= argc) {
        print_usage();
        return 1;
    }

    const std::string cmd = argv[index++];
    CommandArgs args;
    if (!parse_command_args(argc, argv, index, args)) {
        print_usage();
        return 1;
    }
    if (dir.empty()) {
        dir = default_config_dir();
    }

    try {
        return dispatch(cmd, dir, format, args, sources);
    }
    catch (const InvalidPasswordError& e) {
        audit_log_level(LogLevel::WARN,
            "Wrong password for " + dir,
            cmd,
            "failure");
        return fail(e.what());
    }
    catch (const VaultConfigError& e) {
        audit_log_level(LogLevel::ERROR,
            std::string("Command failed: ") + e.what(),
            cmd,
            "failure");
        return fail(e.what());
    }
    catch (const std::invalid_argument& e) {
        return fail(e.what());
    }
    catch (const std::exception& e) {
        audit_log_level(LogLevel::ERROR,
            std::string("Unexpected error: ") + e.what(),
            cmd,
            "failure");
        std::fprintf(stderr, "An unexpected error occurred. Check audit log.\n");
        return 1;
    }
}
