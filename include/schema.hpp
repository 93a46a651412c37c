#pragma once
#include "errors.hpp"
#include "value.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>

// -------- Field declarations --------
enum class FieldType { String, Integer, Float, Boolean };

const char* field_type_name(FieldType t);

// "str", "string", "int", "integer", "float", "bool", "boolean";
// anything else is String
FieldType parse_field_type(const std::string& name);

struct FieldDef {
    FieldType type = FieldType::String;
    std::optional<ConfigValue> default_value;
    bool required = false;
    bool sensitive = false;
    std::string description;
};

// Converts a leaf to the declared type or throws SchemaValidationError naming `field`
ConfigValue coerce_value(const std::string& field, const ConfigValue& value, FieldType type);

// -------- Schema --------
// Field names are dotted paths ("database.password" addresses a nested key).
class ConfigSchema {
public:
    ConfigSchema() = default;
    explicit ConfigSchema(std::map<std::string, FieldDef> fields)
        : fields_(std::move(fields)) {}

    // Returns a copy of `data` with declared fields type-checked and coerced and
    // absent optional fields filled from their defaults. Undeclared keys pass
    // through untouched. Throws SchemaValidationError.
    ConfigMap validate(const ConfigMap& data) const;

    std::set<std::string> get_sensitive_fields() const;

    const std::map<std::string, FieldDef>& fields() const { return fields_; }

private:
    std::map<std::string, FieldDef> fields_;
};

ConfigSchema create_simple_schema(std::map<std::string, FieldDef> fields);

// Expects {"fields": {name: {type, default, required, sensitive, description}}}.
// Throws SchemaValidationError on a malformed definition.
ConfigSchema schema_from_map(const ConfigMap& definition);

// YAML (or JSON) schema file; throws VaultConfigError when it cannot be read,
// FormatError when it does not parse.
ConfigSchema load_schema_file(const std::string& path);
