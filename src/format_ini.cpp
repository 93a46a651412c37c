#include "formats.hpp"
#include "util.hpp"

#include <sstream>

// -------- INI parsing --------
// [section] headers, "key = value" or "key: value", full-line '#' / ';'
// comments, indented continuation lines. Key case is preserved.

static std::string parse_error(size_t line_no, const std::string& what) {
    return "Failed to parse INI: " + what + " (line " + std::to_string(line_no) + ")";
}

static ConfigMap parse_ini(const std::string& text) {
    ConfigMap out;
    std::istringstream iss(text);
    std::string raw;
    size_t line_no = 0;

    ConfigMap* section = nullptr;
    std::string last_key;        // target of continuation lines
    size_t last_key_indent = 0;
    size_t pending_blank = 0;    // blank lines inside a multi-line value

    while (std::getline(iss, raw)) {
        ++line_no;
        strip_cr(raw);

        const std::string line = trim(raw);
        const size_t indent = raw.find_first_not_of(" \t");

        if (line.empty()) {
            if (!last_key.empty()) ++pending_blank;
            continue;
        }
        if (line[0] == '#' || line[0] == ';') {
            continue;
        }

        // continuation of the previous value
        if (!last_key.empty() && indent != std::string::npos && indent > last_key_indent) {
            std::string& v = (*section)[last_key].as_string();
            v.append(pending_blank + 1, '\n');
            v += line;
            pending_blank = 0;
            continue;
        }
        pending_blank = 0;

        if (line.front() == '[') {
            if (line.back() != ']') {
                throw FormatError(parse_error(line_no, "unterminated section header"));
            }
            std::string name = trim(line.substr(1, line.size() - 2));
            if (name.empty()) {
                throw FormatError(parse_error(line_no, "empty section name"));
            }
            if (out.count(name)) {
                throw FormatError(parse_error(line_no, "duplicate section '" + name + "'"));
            }
            section = &out.emplace(name, ConfigValue(ConfigMap{})).first->second.as_map();
            last_key.clear();
            continue;
        }

        if (!section) {
            throw FormatError(parse_error(line_no, "key outside of any section (no section header)"));
        }

        const size_t sep = line.find_first_of("=:");
        if (sep == std::string::npos) {
            throw FormatError(parse_error(line_no, "expected 'key = value'"));
        }
        std::string key = trim(line.substr(0, sep));
        std::string value = trim(line.substr(sep + 1));
        if (key.empty()) {
            throw FormatError(parse_error(line_no, "empty key"));
        }
        if (section->count(key)) {
            throw FormatError(parse_error(line_no, "duplicate key '" + key + "'"));
        }
        section->emplace(key, ConfigValue(std::move(value)));
        last_key = key;
        last_key_indent = indent == std::string::npos ? 0 : indent;
    }
    return out;
}

ConfigMap IniFormat::load(const std::string& text) const {
    return parse_ini(text);
}

std::string IniFormat::dump(const ConfigMap& data) const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& sec : data) {
        if (!sec.second.is_map()) {
            throw FormatError("INI format requires nested structure: section '" + sec.first +
                "' contains " + kind_name(sec.second.kind()) + ", not a mapping");
        }
        if (!first) oss << '\n';
        first = false;

        oss << '[' << sec.first << "]\n";
        for (const auto& kv : sec.second.as_map()) {
            if (kv.second.is_map()) {
                throw FormatError("INI format supports only two levels: '" +
                    sec.first + "." + kv.first + "' is a mapping");
            }
            std::string text = kv.second.to_text();
            // multi-line values continue on indented lines
            std::string folded;
            folded.reserve(text.size());
            for (char c : text) {
                folded.push_back(c);
                if (c == '\n') folded.push_back('\t');
            }
            oss << kv.first << " = " << folded << '\n';
        }
    }
    return oss.str();
}

bool IniFormat::detect(const std::string& text) const {
    if (is_blank(text)) return false;
    try {
        return !parse_ini(text).empty();
    }
    catch (const FormatError&) {
        return false;
    }
}
