#include "formats.hpp"

#include <toml++/toml.hpp>

#include <sstream>

static ConfigMap from_toml_table(const toml::table& tbl, const std::string& prefix);

static ConfigValue from_toml_node(const toml::node& node, const std::string& path) {
    switch (node.type()) {
    case toml::node_type::string:
        return ConfigValue(node.as_string()->get());
    case toml::node_type::integer:
        return ConfigValue(node.as_integer()->get());
    case toml::node_type::floating_point:
        return ConfigValue(node.as_floating_point()->get());
    case toml::node_type::boolean:
        return ConfigValue(node.as_boolean()->get());
    case toml::node_type::table:
        return ConfigValue(from_toml_table(*node.as_table(), path));
    case toml::node_type::date:
    case toml::node_type::time:
    case toml::node_type::date_time: {
        // kept as their TOML spelling
        std::ostringstream os;
        node.visit([&os](auto&& val) { os << val; });
        return ConfigValue(os.str());
    }
    case toml::node_type::array:
        throw FormatError("Failed to parse TOML: arrays are not supported (key '" + path + "')");
    default:
        throw FormatError("Failed to parse TOML: unsupported value at '" + path + "'");
    }
}

static ConfigMap from_toml_table(const toml::table& tbl, const std::string& prefix) {
    ConfigMap out;
    for (auto&& [key, node] : tbl) {
        std::string k(key.str());
        std::string path = prefix.empty() ? k : prefix + "." + k;
        out.emplace(k, from_toml_node(node, path));
    }
    return out;
}

static toml::table to_toml_table(const ConfigMap& data) {
    toml::table tbl;
    for (const auto& kv : data) {
        const ConfigValue& v = kv.second;
        switch (v.kind()) {
        case ConfigValue::Kind::String:
            tbl.insert_or_assign(kv.first, v.as_string());
            break;
        case ConfigValue::Kind::Integer:
            tbl.insert_or_assign(kv.first, v.as_integer());
            break;
        case ConfigValue::Kind::Float:
            tbl.insert_or_assign(kv.first, v.as_float());
            break;
        case ConfigValue::Kind::Boolean:
            tbl.insert_or_assign(kv.first, v.as_bool());
            break;
        case ConfigValue::Kind::Map:
            tbl.insert_or_assign(kv.first, to_toml_table(v.as_map()));
            break;
        }
    }
    return tbl;
}

ConfigMap TomlFormat::load(const std::string& text) const {
    toml::table tbl;
    try {
        tbl = toml::parse(text);
    }
    catch (const toml::parse_error& err) {
        std::ostringstream msg;
        msg << "Failed to parse TOML: " << err.description()
            << " (line " << err.source().begin.line
            << ", column " << err.source().begin.column << ")";
        throw FormatError(msg.str());
    }
    return from_toml_table(tbl, "");
}

std::string TomlFormat::dump(const ConfigMap& data) const {
    std::ostringstream os;
    os << to_toml_table(data) << "\n";
    return os.str();
}

bool TomlFormat::detect(const std::string& text) const {
    if (is_blank(text)) return false;
    try {
        toml::table tbl = toml::parse(text);
        return !tbl.empty();
    }
    catch (const toml::parse_error&) {
        return false;
    }
}
