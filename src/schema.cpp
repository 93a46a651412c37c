#include "schema.hpp"
#include "formats.hpp"
#include "io.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <cmath>

// -------- Field types --------
const char* field_type_name(FieldType t) {
    switch (t) {
    case FieldType::String:  return "string";
    case FieldType::Integer: return "integer";
    case FieldType::Float:   return "float";
    case FieldType::Boolean: return "boolean";
    }
    return "string";
}

FieldType parse_field_type(const std::string& name) {
    const std::string n = to_lower(trim(name));
    if (n == "int" || n == "integer") return FieldType::Integer;
    if (n == "float") return FieldType::Float;
    if (n == "bool" || n == "boolean") return FieldType::Boolean;
    return FieldType::String;
}

static SchemaValidationError type_error(const std::string& field, const ConfigValue& value, FieldType type) {
    return SchemaValidationError(field,
        "Field '" + field + "' expects " + field_type_name(type) +
        ", got " + kind_name(value.kind()) +
        (value.is_map() ? std::string() : " '" + value.to_text() + "'"));
}


// -------- Coercion --------
ConfigValue coerce_value(const std::string& field, const ConfigValue& value, FieldType type) {
    if (value.is_map()) {
        throw type_error(field, value, type);
    }

    switch (type) {
    case FieldType::String:
        if (value.is_string()) return value;
        return ConfigValue(value.to_text());

    case FieldType::Integer: {
        if (value.is_integer()) return value;
        if (value.is_float()) {
            const double d = value.as_float();
            if (std::isfinite(d) && std::floor(d) == d &&
                d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
                return ConfigValue(static_cast<std::int64_t>(d));
            }
        }
        if (value.is_string()) {
            std::int64_t i = 0;
            if (parse_int64(trim(value.as_string()), i)) return ConfigValue(i);
        }
        throw type_error(field, value, type);
    }

    case FieldType::Float: {
        if (value.is_float()) return value;
        if (value.is_integer()) return ConfigValue(static_cast<double>(value.as_integer()));
        if (value.is_string()) {
            double d = 0.0;
            if (parse_finite_double(trim(value.as_string()), d)) return ConfigValue(d);
        }
        throw type_error(field, value, type);
    }

    case FieldType::Boolean: {
        if (value.is_bool()) return value;
        if (value.is_integer() && (value.as_integer() == 0 || value.as_integer() == 1)) {
            return ConfigValue(value.as_integer() == 1);
        }
        if (value.is_string()) {
            const std::string s = to_lower(trim(value.as_string()));
            if (s == "true" || s == "yes" || s == "on" || s == "1") return ConfigValue(true);
            if (s == "false" || s == "no" || s == "off" || s == "0") return ConfigValue(false);
        }
        throw type_error(field, value, type);
    }
    }
    throw type_error(field, value, type);
}


// -------- Schema --------
ConfigMap ConfigSchema::validate(const ConfigMap& data) const {
    ConfigMap out = data;

    for (const auto& kv : fields_) {
        const std::string& name = kv.first;
        const FieldDef& def = kv.second;
        const ConfigPath path = split_path(name);

        ConfigValue* current = find_path(out, path);
        if (!current) {
            if (def.required) {
                throw SchemaValidationError(name, "Missing required field: " + name);
            }
            if (def.default_value) {
                set_path(out, path, *def.default_value);
            }
            continue;
        }

        *current = coerce_value(name, *current, def.type);
    }
    return out;
}

std::set<std::string> ConfigSchema::get_sensitive_fields() const {
    std::set<std::string> out;
    for (const auto& kv : fields_) {
        if (kv.second.sensitive) out.insert(kv.first);
    }
    return out;
}

ConfigSchema create_simple_schema(std::map<std::string, FieldDef> fields) {
    return ConfigSchema(std::move(fields));
}


// -------- External definitions --------
static bool field_flag(const std::string& field, const ConfigMap& attrs, const char* key) {
    auto it = attrs.find(key);
    if (it == attrs.end()) return false;
    return coerce_value(field + "." + key, it->second, FieldType::Boolean).as_bool();
}

ConfigSchema schema_from_map(const ConfigMap& definition) {
    auto fields_it = definition.find("fields");
    if (fields_it == definition.end() || !fields_it->second.is_map()) {
        throw SchemaValidationError("fields", "Schema must contain a 'fields' mapping");
    }

    std::map<std::string, FieldDef> fields;
    for (const auto& kv : fields_it->second.as_map()) {
        const std::string& name = kv.first;
        if (!kv.second.is_map()) {
            throw SchemaValidationError(name,
                "Schema entry for '" + name + "' must be a mapping");
        }
        const ConfigMap& attrs = kv.second.as_map();

        FieldDef def;
        auto type_it = attrs.find("type");
        if (type_it != attrs.end()) {
            def.type = parse_field_type(type_it->second.to_text());
        }
        def.required = field_flag(name, attrs, "required");
        def.sensitive = field_flag(name, attrs, "sensitive");

        auto desc_it = attrs.find("description");
        if (desc_it != attrs.end()) {
            def.description = desc_it->second.to_text();
        }

        auto default_it = attrs.find("default");
        const bool null_default = default_it != attrs.end() &&
            default_it->second.is_string() && default_it->second.as_string().empty() &&
            def.type != FieldType::String; // YAML `default:` with no value
        if (default_it != attrs.end() && !null_default) {
            def.default_value = coerce_value(name, default_it->second, def.type);
        }

        fields.emplace(name, std::move(def));
    }

    return ConfigSchema(std::move(fields));
}

ConfigSchema load_schema_file(const std::string& path) {
    std::string text;
    if (!read_file(path, text)) {
        throw VaultConfigError("Cannot read schema file: " + path);
    }

    YamlFormat yaml;
    ConfigSchema schema = schema_from_map(yaml.load(text));

    audit_log_level(LogLevel::DEBUG,
        "Loaded schema with " + std::to_string(schema.fields().size()) + " fields from " + path,
        "load_schema",
        "success");
    return schema;
}
