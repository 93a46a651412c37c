#include "value.hpp"
#include "util.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstdio>


// -------- Leaf rendering --------
const char* kind_name(ConfigValue::Kind kind) {
    switch (kind) {
    case ConfigValue::Kind::String:  return "string";
    case ConfigValue::Kind::Integer: return "integer";
    case ConfigValue::Kind::Float:   return "float";
    case ConfigValue::Kind::Boolean: return "boolean";
    case ConfigValue::Kind::Map:     return "mapping";
    default:                         return "unknown";
    }
}

std::string format_double(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";

    char buf[64];
    for (int prec = 15; prec <= 17; ++prec) {
        std::snprintf(buf, sizeof(buf), "%.*g", prec, d);
        if (std::strtod(buf, nullptr) == d) break;
    }
    std::string s(buf);
    if (s.find_first_of(".eE") == std::string::npos) {
        s += ".0";
    }
    return s;
}

std::string ConfigValue::to_text() const {
    switch (kind()) {
    case Kind::String:  return as_string();
    case Kind::Integer: return std::to_string(as_integer());
    case Kind::Float:   return format_double(as_float());
    case Kind::Boolean: return as_bool() ? "true" : "false";
    case Kind::Map:     return "{...}";
    }
    return "";
}


// -------- CLI scalar parsing --------
bool parse_int64(const std::string& s, std::int64_t& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno == ERANGE || end != s.c_str() + s.size()) return false;
    if (std::isspace(static_cast<unsigned char>(s[0]))) return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

bool parse_finite_double(const std::string& s, double& out) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) return false;
    // decimal only; strtod would also take hex floats ("0x1p3")
    if (s.find_first_of("xXpP") != std::string::npos) return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno == ERANGE || end != s.c_str() + s.size()) return false;
    if (!std::isfinite(v)) return false; // "inf"/"nan" stay strings
    out = v;
    return true;
}

ConfigValue parse_scalar(const std::string& text) {
    std::int64_t i = 0;
    if (parse_int64(text, i)) return ConfigValue(i);

    double d = 0.0;
    if (parse_finite_double(text, d)) return ConfigValue(d);

    std::string lower = to_lower(text);
    if (lower == "true" || lower == "yes") return ConfigValue(true);
    if (lower == "false" || lower == "no") return ConfigValue(false);

    return ConfigValue(text);
}


// -------- Dotted path operations --------
ConfigPath split_path(const std::string& dotted) {
    ConfigPath out;
    size_t start = 0;
    for (size_t pos = 0; pos <= dotted.size(); ++pos) {
        if (pos == dotted.size() || dotted[pos] == '.') {
            out.emplace_back(dotted.substr(start, pos - start));
            start = pos + 1;
        }
    }
    return out;
}

std::string join_path(const ConfigPath& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i) out += '.';
        out += path[i];
    }
    return out;
}

const ConfigValue* find_path(const ConfigMap& root, const ConfigPath& path) {
    if (path.empty()) return nullptr;
    const ConfigMap* cur = &root;
    for (size_t i = 0; i < path.size(); ++i) {
        auto it = cur->find(path[i]);
        if (it == cur->end()) return nullptr;
        if (i + 1 == path.size()) return &it->second;
        if (!it->second.is_map()) return nullptr;
        cur = &it->second.as_map();
    }
    return nullptr;
}

ConfigValue* find_path(ConfigMap& root, const ConfigPath& path) {
    const ConfigMap& croot = root;
    return const_cast<ConfigValue*>(find_path(croot, path));
}

void set_path(ConfigMap& root, const ConfigPath& path, ConfigValue value) {
    if (path.empty()) return;
    ConfigMap* cur = &root;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        ConfigValue& slot = (*cur)[path[i]];
        if (!slot.is_map()) {
            slot = ConfigValue(ConfigMap{});
        }
        cur = &slot.as_map();
    }
    (*cur)[path.back()] = std::move(value);
}

bool erase_path(ConfigMap& root, const ConfigPath& path) {
    if (path.empty()) return false;
    ConfigMap* cur = &root;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        auto it = cur->find(path[i]);
        if (it == cur->end() || !it->second.is_map()) return false;
        cur = &it->second.as_map();
    }
    return cur->erase(path.back()) > 0;
}

void for_each_leaf(ConfigMap& root,
    const std::function<void(const std::string& path, ConfigValue& value)>& fn)
{
    struct Frame {
        ConfigMap* map;
        ConfigMap::iterator it;
        std::string prefix;
    };

    std::vector<Frame> stack;
    stack.push_back({ &root, root.begin(), "" });

    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.it == top.map->end()) {
            stack.pop_back();
            continue;
        }
        std::string full = top.prefix.empty() ? top.it->first : top.prefix + "." + top.it->first;
        ConfigValue& v = top.it->second;
        ++top.it;
        if (v.is_map()) {
            ConfigMap& child = v.as_map();
            stack.push_back({ &child, child.begin(), std::move(full) }); // invalidates `top`
        }
        else {
            fn(full, v);
        }
    }
}

std::map<std::string, ConfigValue> flatten(const ConfigMap& root) {
    std::map<std::string, ConfigValue> out;
    ConfigMap copy = root;
    for_each_leaf(copy, [&out](const std::string& path, ConfigValue& v) {
        out.emplace(path, std::move(v));
        });
    return out;
}
