#include "formats.hpp"
#include "util.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cmath>

// -------- Plain scalar resolution --------
// Quoted scalars are always strings. Plain scalars resolve in this order:
// null, bool (YAML 1.1 spellings), int, float, string.

static bool resolve_null(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

static bool resolve_bool(const std::string& s, bool& out) {
    const std::string l = to_lower(s);
    if (l == "true" || l == "yes" || l == "on") { out = true; return true; }
    if (l == "false" || l == "no" || l == "off") { out = false; return true; }
    return false;
}

static bool resolve_int(const std::string& s, std::int64_t& out) {
    size_t i = 0;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
    if (i == s.size()) return false;
    for (size_t k = i; k < s.size(); ++k) {
        if (!std::isdigit(static_cast<unsigned char>(s[k]))) return false;
    }
    errno = 0;
    long long v = std::strtoll(s.c_str(), nullptr, 10);
    if (errno == ERANGE) return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

static bool resolve_float(const std::string& s, double& out) {
    const std::string l = to_lower(s);
    if (l == ".inf" || l == "+.inf") { out = HUGE_VAL; return true; }
    if (l == "-.inf") { out = -HUGE_VAL; return true; }
    if (l == ".nan") { out = std::nan(""); return true; }

    // [-+]? digits [. digits] [e [-+] digits], at least one digit before the exponent
    size_t i = 0;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
    size_t digits = 0;
    bool dot = false, exp = false;
    for (; i < s.size(); ++i) {
        const char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) { ++digits; continue; }
        if (c == '.' && !dot && !exp) { dot = true; continue; }
        if ((c == 'e' || c == 'E') && !exp && digits > 0) {
            exp = true;
            if (i + 1 < s.size() && (s[i + 1] == '-' || s[i + 1] == '+')) ++i;
            if (i + 1 >= s.size()) return false;
            continue;
        }
        return false;
    }
    if (digits == 0 || (!dot && !exp)) return false;
    out = std::strtod(s.c_str(), nullptr);
    return true;
}

// true if a plain scalar with this text would not load back as a string
static bool needs_quotes(const std::string& s) {
    bool b;
    std::int64_t i;
    double d;
    return resolve_null(s) || resolve_bool(s, b) || resolve_int(s, i) || resolve_float(s, d);
}

static ConfigValue from_scalar(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (node.Tag() != "?") {
        return ConfigValue(text); // quoted or explicitly tagged
    }
    bool b;
    std::int64_t i;
    double d;
    if (resolve_null(text)) return ConfigValue(std::string());
    if (resolve_bool(text, b)) return ConfigValue(b);
    if (resolve_int(text, i)) return ConfigValue(i);
    if (resolve_float(text, d)) return ConfigValue(d);
    return ConfigValue(text);
}

static ConfigMap from_yaml_map(const YAML::Node& node, const std::string& prefix) {
    ConfigMap out;
    for (const auto& kv : node) {
        const std::string key = kv.first.Scalar();
        const std::string path = prefix.empty() ? key : prefix + "." + key;
        const YAML::Node& v = kv.second;
        switch (v.Type()) {
        case YAML::NodeType::Map:
            out[key] = ConfigValue(from_yaml_map(v, path));
            break;
        case YAML::NodeType::Scalar:
            out[key] = from_scalar(v);
            break;
        case YAML::NodeType::Null:
            out[key] = ConfigValue(std::string());
            break;
        default:
            throw FormatError("Failed to parse YAML: sequences are not supported (key '" + path + "')");
        }
    }
    return out;
}

static void emit_map(YAML::Emitter& out, const ConfigMap& data) {
    out << YAML::BeginMap;
    for (const auto& kv : data) {
        out << YAML::Key << kv.first << YAML::Value;
        const ConfigValue& v = kv.second;
        switch (v.kind()) {
        case ConfigValue::Kind::String:
            if (needs_quotes(v.as_string())) {
                out << YAML::DoubleQuoted << v.as_string();
            }
            else {
                out << v.as_string();
            }
            break;
        case ConfigValue::Kind::Integer:
            out << static_cast<long long>(v.as_integer());
            break;
        case ConfigValue::Kind::Float: {
            const double d = v.as_float();
            if (std::isnan(d)) out << ".nan";
            else if (std::isinf(d)) out << (d > 0 ? ".inf" : "-.inf");
            else out << format_double(d);
            break;
        }
        case ConfigValue::Kind::Boolean:
            out << v.as_bool();
            break;
        case ConfigValue::Kind::Map:
            emit_map(out, v.as_map());
            break;
        }
    }
    out << YAML::EndMap;
}

ConfigMap YamlFormat::load(const std::string& text) const {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    }
    catch (const YAML::Exception& e) {
        throw FormatError(std::string("Failed to parse YAML: ") + e.what());
    }

    if (!root || root.IsNull()) {
        return ConfigMap{};
    }
    if (!root.IsMap()) {
        throw FormatError("YAML root must be a mapping");
    }
    try {
        return from_yaml_map(root, "");
    }
    catch (const YAML::Exception& e) {
        throw FormatError(std::string("Failed to parse YAML: ") + e.what());
    }
}

std::string YamlFormat::dump(const ConfigMap& data) const {
    YAML::Emitter out;
    emit_map(out, data);
    if (!out.good()) {
        throw FormatError("Failed to serialize to YAML: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

bool YamlFormat::detect(const std::string& text) const {
    if (is_blank(text)) return false;
    try {
        YAML::Node root = YAML::Load(text);
        return root.IsMap() && root.size() > 0;
    }
    catch (const YAML::Exception&) {
        return false;
    }
}
