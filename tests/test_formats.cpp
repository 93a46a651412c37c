#include "formats.hpp"

#include <gtest/gtest.h>

#include <cmath>

static ConfigMap sample_nested() {
    ConfigMap db{
        { "host", ConfigValue("localhost") },
        { "port", ConfigValue(5432) },
        { "ratio", ConfigValue(0.25) },
        { "enabled", ConfigValue(true) },
    };
    ConfigMap pool{ { "size", ConfigValue(8) } };
    db["pool"] = ConfigValue(pool);
    return ConfigMap{
        { "name", ConfigValue("service") },
        { "db", ConfigValue(db) },
    };
}

// Every leaf rendered as text, the way INI loads it back
static ConfigMap stringify(const ConfigMap& m) {
    ConfigMap out;
    for (const auto& kv : m) {
        out[kv.first] = kv.second.is_map() ? ConfigValue(stringify(kv.second.as_map()))
            : ConfigValue(kv.second.to_text());
    }
    return out;
}

// -------- Registry --------
TEST(FormatRegistryTest, MakesKnownHandlers) {
    EXPECT_EQ(make_format_handler("toml")->get_extension(), ".toml");
    EXPECT_EQ(make_format_handler("ini")->get_name(), "ini");
    EXPECT_EQ(make_format_handler("yml")->get_name(), "yaml");
    EXPECT_EQ(make_format_handler("YAML")->get_extension(), ".yaml");
}

TEST(FormatRegistryTest, UnknownFormatListsSupported) {
    try {
        make_format_handler("xml");
        FAIL() << "expected FormatError";
    }
    catch (const FormatError& e) {
        EXPECT_NE(std::string(e.what()).find("Unsupported format: xml"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("toml, ini, yaml"), std::string::npos);
    }
}

TEST(FormatRegistryTest, DetectFormat) {
    EXPECT_EQ(detect_format("name = \"x\"\n[db]\nport = 1\n"), "toml");
    EXPECT_EQ(detect_format("name: x\ndb:\n  port: 1\n"), "yaml");
    EXPECT_EQ(detect_format("[server]\nhost = example.org\n"), "ini");
    EXPECT_EQ(detect_format("   \n\t\n"), "");
    EXPECT_EQ(detect_format("just some words"), "");
}

TEST(FormatRegistryTest, DetectionIsNotExclusive) {
    const std::string text = "[server]\nport = 8080\n";
    EXPECT_TRUE(TomlFormat().detect(text));
    EXPECT_TRUE(IniFormat().detect(text));
}

TEST(FormatRegistryTest, BlankNeverDetects) {
    for (const char* name : { "toml", "ini", "yaml" }) {
        auto h = make_format_handler(name);
        EXPECT_FALSE(h->detect("")) << name;
        EXPECT_FALSE(h->detect(" \n\n  ")) << name;
    }
}

// -------- TOML --------
TEST(TomlFormatTest, RoundTripPreservesTypes) {
    TomlFormat toml;
    const ConfigMap m = sample_nested();
    EXPECT_EQ(toml.load(toml.dump(m)), m);
}

TEST(TomlFormatTest, ParseErrorIsFormatError) {
    EXPECT_THROW(TomlFormat().load("key = = broken"), FormatError);
}

TEST(TomlFormatTest, ArraysRejected) {
    EXPECT_THROW(TomlFormat().load("ports = [1, 2, 3]\n"), FormatError);
}

TEST(TomlFormatTest, DatesLoadAsText) {
    ConfigMap m = TomlFormat().load("day = 1979-05-27\n");
    ASSERT_TRUE(m.at("day").is_string());
    EXPECT_EQ(m.at("day").as_string(), "1979-05-27");
}

TEST(TomlFormatTest, EmptyDocument) {
    EXPECT_TRUE(TomlFormat().load("").empty());
    EXPECT_FALSE(TomlFormat().detect("# only a comment\n"));
}

// -------- YAML --------
TEST(YamlFormatTest, RoundTripPreservesTypes) {
    YamlFormat yaml;
    const ConfigMap m = sample_nested();
    EXPECT_EQ(yaml.load(yaml.dump(m)), m);
}

TEST(YamlFormatTest, AmbiguousStringsStayStrings) {
    YamlFormat yaml;
    const ConfigMap m{
        { "a", ConfigValue("true") },
        { "b", ConfigValue("123") },
        { "c", ConfigValue("") },
        { "d", ConfigValue("null") },
        { "e", ConfigValue("1.5") },
        { "f", ConfigValue("off") },
    };
    EXPECT_EQ(yaml.load(yaml.dump(m)), m);
}

TEST(YamlFormatTest, PlainScalarResolution) {
    ConfigMap m = YamlFormat().load(
        "flag: yes\n"
        "quoted: 'yes'\n"
        "count: 12\n"
        "pi: 3.14\n"
        "big: .inf\n"
        "nothing: ~\n"
        "empty:\n"
        "word: hello\n");
    EXPECT_EQ(m.at("flag"), ConfigValue(true));
    EXPECT_EQ(m.at("quoted"), ConfigValue("yes"));
    EXPECT_EQ(m.at("count"), ConfigValue(12));
    EXPECT_EQ(m.at("pi"), ConfigValue(3.14));
    ASSERT_TRUE(m.at("big").is_float());
    EXPECT_TRUE(std::isinf(m.at("big").as_float()));
    EXPECT_EQ(m.at("nothing"), ConfigValue(""));
    EXPECT_EQ(m.at("empty"), ConfigValue(""));
    EXPECT_EQ(m.at("word"), ConfigValue("hello"));
}

TEST(YamlFormatTest, RootMustBeMapping) {
    try {
        YamlFormat().load("- a\n- b\n");
        FAIL() << "expected FormatError";
    }
    catch (const FormatError& e) {
        EXPECT_NE(std::string(e.what()).find("must be a mapping"), std::string::npos);
    }
}

TEST(YamlFormatTest, SequencesRejected) {
    EXPECT_THROW(YamlFormat().load("hosts:\n  - a\n  - b\n"), FormatError);
}

TEST(YamlFormatTest, EmptyDocumentIsEmptyMapping) {
    EXPECT_TRUE(YamlFormat().load("").empty());
    EXPECT_TRUE(YamlFormat().load("# nothing\n").empty());
}

TEST(YamlFormatTest, MalformedIsFormatError) {
    EXPECT_THROW(YamlFormat().load("a: [unclosed\n"), FormatError);
}

// -------- INI --------
TEST(IniFormatTest, RoundTripAsStrings) {
    IniFormat ini;
    ConfigMap m{
        { "server", ConfigValue(ConfigMap{
            { "host", ConfigValue("example.org") },
            { "port", ConfigValue(8080) },
            { "debug", ConfigValue(true) },
            { "ratio", ConfigValue(0.5) },
        }) },
        { "auth", ConfigValue(ConfigMap{ { "user", ConfigValue("admin") } }) },
    };
    EXPECT_EQ(ini.load(ini.dump(m)), stringify(m));
}

TEST(IniFormatTest, NonMappingTopLevelRejected) {
    try {
        IniFormat().dump(ConfigMap{ { "top", ConfigValue("not-a-mapping") } });
        FAIL() << "expected FormatError";
    }
    catch (const FormatError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("nested structure"), std::string::npos);
        EXPECT_NE(msg.find("top"), std::string::npos);
    }
}

TEST(IniFormatTest, ThirdLevelRejected) {
    ConfigMap m;
    set_path(m, split_path("a.b.c"), ConfigValue(1));
    EXPECT_THROW(IniFormat().dump(m), FormatError);
}

TEST(IniFormatTest, MultiLineValues) {
    IniFormat ini;
    ConfigMap m{ { "s", ConfigValue(ConfigMap{ { "text", ConfigValue("line1\n\nline3") } }) } };
    EXPECT_EQ(ini.load(ini.dump(m)), m);
}

TEST(IniFormatTest, ParsesCommentsSeparatorsAndCase) {
    ConfigMap m = IniFormat().load(
        "; leading comment\n"
        "[Main]\n"
        "# note\n"
        "HostName = example.org\n"
        "port: 22\n"
        "\n"
        "[other]\n"
        "key=value with spaces  \n");
    const ConfigMap& sec = m.at("Main").as_map();
    EXPECT_EQ(sec.at("HostName"), ConfigValue("example.org"));
    EXPECT_EQ(sec.at("port"), ConfigValue("22"));
    EXPECT_EQ(m.at("other").as_map().at("key"), ConfigValue("value with spaces"));
}

TEST(IniFormatTest, ParseErrors) {
    IniFormat ini;
    EXPECT_THROW(ini.load("key = before section\n"), FormatError);
    EXPECT_THROW(ini.load("[a]\nk = 1\nk = 2\n"), FormatError);
    EXPECT_THROW(ini.load("[a]\n[a]\n"), FormatError);
    EXPECT_THROW(ini.load("[a]\nno separator here\n"), FormatError);
    EXPECT_THROW(ini.load("[unterminated\n"), FormatError);
}

TEST(IniFormatTest, ErrorNamesLine) {
    try {
        IniFormat().load("[a]\nk = 1\nbroken\n");
        FAIL() << "expected FormatError";
    }
    catch (const FormatError& e) {
        EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos);
    }
}
