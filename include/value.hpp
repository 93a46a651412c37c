#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

class ConfigValue;

// Keys are kept sorted; file formats emit them in this order.
using ConfigMap = std::map<std::string, ConfigValue>;
using ConfigPath = std::vector<std::string>;

// -------- Tagged configuration value --------
class ConfigValue {
public:
    enum class Kind { String, Integer, Float, Boolean, Map };

    ConfigValue() : data_(std::string()) {}
    ConfigValue(const char* s) : data_(std::string(s)) {}
    ConfigValue(std::string s) : data_(std::move(s)) {}
    ConfigValue(int v) : data_(static_cast<std::int64_t>(v)) {}
    ConfigValue(long v) : data_(static_cast<std::int64_t>(v)) {}
    ConfigValue(long long v) : data_(static_cast<std::int64_t>(v)) {}
    ConfigValue(double v) : data_(v) {}
    ConfigValue(bool v) : data_(v) {}
    ConfigValue(ConfigMap m) : data_(std::move(m)) {}

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    bool is_string() const { return kind() == Kind::String; }
    bool is_integer() const { return kind() == Kind::Integer; }
    bool is_float() const { return kind() == Kind::Float; }
    bool is_bool() const { return kind() == Kind::Boolean; }
    bool is_map() const { return kind() == Kind::Map; }

    // Accessors throw std::bad_variant_access on a kind mismatch
    const std::string& as_string() const { return std::get<std::string>(data_); }
    std::string& as_string() { return std::get<std::string>(data_); }
    std::int64_t as_integer() const { return std::get<std::int64_t>(data_); }
    double as_float() const { return std::get<double>(data_); }
    bool as_bool() const { return std::get<bool>(data_); }
    const ConfigMap& as_map() const { return std::get<ConfigMap>(data_); }
    ConfigMap& as_map() { return std::get<ConfigMap>(data_); }

    // Textual form of a leaf (maps render as "{...}")
    std::string to_text() const;

    bool operator==(const ConfigValue& o) const { return data_ == o.data_; }
    bool operator!=(const ConfigValue& o) const { return !(*this == o); }

private:
    // order must match Kind
    std::variant<std::string, std::int64_t, double, bool, ConfigMap> data_;
};

const char* kind_name(ConfigValue::Kind kind);

// Shortest decimal that parses back to the same double; always has '.' or 'e'
std::string format_double(double d);

// Whole-string decimal parsing; no surrounding whitespace, no hex
bool parse_int64(const std::string& s, std::int64_t& out);
bool parse_finite_double(const std::string& s, double& out);

// CLI-style parsing: integer, float, boolean (true/yes/false/no), else string
ConfigValue parse_scalar(const std::string& text);

// -------- Dotted path operations --------
ConfigPath split_path(const std::string& dotted);
std::string join_path(const ConfigPath& path);

const ConfigValue* find_path(const ConfigMap& root, const ConfigPath& path);
ConfigValue* find_path(ConfigMap& root, const ConfigPath& path);

// Creates intermediate maps, replacing non-map values on the way
void set_path(ConfigMap& root, const ConfigPath& path, ConfigValue value);

// False if any segment is missing
bool erase_path(ConfigMap& root, const ConfigPath& path);

// Visits every non-map value with its dot-joined path, depth first, in key order.
// Iterative: nesting depth does not grow the call stack.
void for_each_leaf(ConfigMap& root,
    const std::function<void(const std::string& path, ConfigValue& value)>& fn);

// {"a": {"b": 1}} -> {"a.b": 1}
std::map<std::string, ConfigValue> flatten(const ConfigMap& root);
