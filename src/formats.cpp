#include "formats.hpp"
#include "util.hpp"

#include <cctype>

std::vector<std::string> supported_formats() {
    return { "toml", "ini", "yaml" };
}

std::unique_ptr<FormatHandler> make_format_handler(const std::string& name) {
    const std::string n = to_lower(trim(name));
    if (n == "toml") return std::make_unique<TomlFormat>();
    if (n == "ini") return std::make_unique<IniFormat>();
    if (n == "yaml" || n == "yml") return std::make_unique<YamlFormat>();

    std::string list;
    for (const auto& f : supported_formats()) {
        if (!list.empty()) list += ", ";
        list += f;
    }
    throw FormatError("Unsupported format: " + name + ". Supported formats: " + list);
}

std::string detect_format(const std::string& text) {
    if (is_blank(text)) return "";
    for (const char* name : { "toml", "yaml", "ini" }) {
        if (make_format_handler(name)->detect(text)) return name;
    }
    return "";
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
}
