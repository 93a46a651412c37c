#pragma once
#include "errors.hpp"
#include "value.hpp"

#include <memory>
#include <string>
#include <vector>

// -------- Pluggable text serialization --------
class FormatHandler {
public:
    virtual ~FormatHandler() = default;

    // Throws FormatError carrying the parser diagnostic
    virtual ConfigMap load(const std::string& text) const = 0;
    // Throws FormatError when the mapping cannot be represented
    virtual std::string dump(const ConfigMap& data) const = 0;

    virtual std::string get_extension() const = 0;
    virtual std::string get_name() const = 0;

    // Best-effort: parse and check shape. Never true for blank input.
    // Several formats may accept the same text.
    virtual bool detect(const std::string& text) const = 0;
};

class TomlFormat : public FormatHandler {
public:
    ConfigMap load(const std::string& text) const override;
    std::string dump(const ConfigMap& data) const override;
    std::string get_extension() const override { return ".toml"; }
    std::string get_name() const override { return "toml"; }
    bool detect(const std::string& text) const override;
};

// Two-level only (section -> key -> value). Leaves are written as text and
// always load back as strings.
class IniFormat : public FormatHandler {
public:
    ConfigMap load(const std::string& text) const override;
    std::string dump(const ConfigMap& data) const override;
    std::string get_extension() const override { return ".ini"; }
    std::string get_name() const override { return "ini"; }
    bool detect(const std::string& text) const override;
};

class YamlFormat : public FormatHandler {
public:
    ConfigMap load(const std::string& text) const override;
    std::string dump(const ConfigMap& data) const override;
    std::string get_extension() const override { return ".yaml"; }
    std::string get_name() const override { return "yaml"; }
    bool detect(const std::string& text) const override;
};

// "toml", "ini", "yaml" ("yml" accepted). Throws FormatError otherwise.
std::unique_ptr<FormatHandler> make_format_handler(const std::string& name);

std::vector<std::string> supported_formats();

// First format (toml, yaml, ini) whose detect() accepts the text; "" if none
std::string detect_format(const std::string& text);

// true if the text contains nothing but whitespace
bool is_blank(const std::string& text);
