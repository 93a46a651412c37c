#include "io.hpp"
#include "logging.hpp"
#include "util.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

// -------- String and text helpers --------
TEST(UtilTest, TrimAndLower) {
    EXPECT_EQ(trim("  a b \t\n"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("MiXeD"), "mixed");
    std::string s = "line\r";
    strip_cr(s);
    EXPECT_EQ(s, "line");
}

TEST(UtilTest, Utf8AndPrintable) {
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("\xD0\xBF\xD0\xB0"));
    EXPECT_FALSE(is_valid_utf8("\xC3\x28"));
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80")); // surrogate

    EXPECT_TRUE(is_printable_text("hello world"));
    EXPECT_FALSE(is_printable_text("tab\there"));
    EXPECT_FALSE(is_printable_text("bell\x07"));
    EXPECT_FALSE(is_printable_text("zero\xE2\x80\x8Bwidth"));
}

TEST(UtilTest, ConfigNames) {
    EXPECT_TRUE(valid_config_name("db"));
    EXPECT_TRUE(valid_config_name("my-app_prod.v2"));
    EXPECT_FALSE(valid_config_name(""));
    EXPECT_FALSE(valid_config_name("."));
    EXPECT_FALSE(valid_config_name(".."));
    EXPECT_FALSE(valid_config_name("a/b"));
    EXPECT_FALSE(valid_config_name("bad\nname"));
    EXPECT_FALSE(valid_config_name(std::string(MAX_NAME_LEN + 1, 'a')));
}

TEST(UtilTest, Base64Variants) {
    const byte data[] = { 0xFB, 0xFF, 0x00, 0x10 };
    const std::string orig = to_base64(data, sizeof(data), sodium_base64_VARIANT_ORIGINAL);
    const std::string url = to_base64(data, sizeof(data), sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    EXPECT_EQ(orig, "+/8AEA==");
    EXPECT_EQ(url, "-_8AEA");

    std::vector<byte> back;
    ASSERT_TRUE(from_base64(url, sodium_base64_VARIANT_URLSAFE_NO_PADDING, back));
    EXPECT_EQ(back, std::vector<byte>(data, data + sizeof(data)));

    EXPECT_FALSE(from_base64("+/8AEA==junk", sodium_base64_VARIANT_ORIGINAL, back));
    EXPECT_TRUE(from_base64("", sodium_base64_VARIANT_ORIGINAL, back));
    EXPECT_TRUE(back.empty());
}

TEST(UtilTest, SessionIdIsHex) {
    const std::string id = generate_session_id();
    EXPECT_EQ(id.size(), 32u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(id, generate_session_id());
}

// -------- External commands --------
TEST(ShellCommandTest, CapturesStdout) {
    std::string out;
    ASSERT_TRUE(run_shell_command("printf 'abc\\n'", {}, out));
    EXPECT_EQ(out, "abc\n");
}

TEST(ShellCommandTest, PassesExtraEnvironment) {
    std::string out;
    ASSERT_TRUE(run_shell_command("printf '%s' \"$VAULTCONFIG_TEST_FLAG\"",
        { { "VAULTCONFIG_TEST_FLAG", "set" } }, out));
    EXPECT_EQ(out, "set");
}

TEST(ShellCommandTest, NonZeroExitFails) {
    std::string out = "untouched";
    EXPECT_FALSE(run_shell_command("echo partial; exit 3", {}, out));
    EXPECT_EQ(out, "untouched");
}

// -------- Logging --------
TEST(LoggingTest, ParseLevels) {
    LogLevel lvl = LogLevel::DEBUG;
    EXPECT_TRUE(parse_log_level("alert", lvl));
    EXPECT_EQ(lvl, LogLevel::ALERT);
    EXPECT_TRUE(parse_log_level("INFO", lvl));
    EXPECT_EQ(lvl, LogLevel::INFO);
    EXPECT_FALSE(parse_log_level("verbose", lvl));
}

class LoggingFileTest : public TempDirTest {
protected:
    void TearDown() override {
        set_audit_log_path("");
        set_log_level(LogLevel::WARN);
        TempDirTest::TearDown();
    }
};

TEST_F(LoggingFileTest, WritesAboveThresholdToFile) {
    const std::string log = path("audit.log");
    set_audit_log_path(log);
    set_log_level(LogLevel::INFO);

    audit_log_level(LogLevel::DEBUG, "hidden entry", "test", "skipped");
    audit_log_level(LogLevel::ERROR, "visible\nentry", "test_event", "failure");

    const std::string text = read_text(log);
    EXPECT_EQ(text.find("hidden entry"), std::string::npos);
    EXPECT_NE(text.find("| ERROR |"), std::string::npos);
    EXPECT_NE(text.find("event=test_event"), std::string::npos);
    EXPECT_NE(text.find("outcome=failure"), std::string::npos);
    EXPECT_NE(text.find("visible entry"), std::string::npos);
    EXPECT_EQ(file_mode(log), 0600u);
}

// -------- File helpers --------
TEST_F(TempDirTest, AtomicWriteCreatesOwnerOnlyFile) {
    const std::string f = path("out.txt");
    const std::string body = "hello";
    ASSERT_TRUE(atomic_write_file(f, reinterpret_cast<const byte*>(body.data()), body.size()));
    EXPECT_EQ(read_text(f), "hello");
    EXPECT_EQ(file_mode(f), 0600u);

    std::string back;
    ASSERT_TRUE(read_file(f, back));
    EXPECT_EQ(back, "hello");
}

TEST_F(TempDirTest, AtomicWriteReplacesExisting) {
    const std::string f = path("out.txt");
    write_text(f, "old contents that are longer");
    const std::string body = "new";
    ASSERT_TRUE(atomic_write_file(f, reinterpret_cast<const byte*>(body.data()), body.size()));
    EXPECT_EQ(read_text(f), "new");
}

TEST_F(TempDirTest, EnsureDirCreatesParents) {
    const std::string nested = path("a/b/c");
    ASSERT_TRUE(ensure_dir_exists(nested));
    EXPECT_TRUE(is_directory(nested));
    EXPECT_EQ(file_mode(nested), 0700u);

    write_text(path("file"), "x");
    EXPECT_FALSE(ensure_dir_exists(path("file")));
}

TEST_F(TempDirTest, ListFilesWithExtension) {
    write_text(path("b.toml"), "");
    write_text(path("a.toml"), "");
    write_text(path("c.yaml"), "");
    write_text(path(".toml"), "");
    ASSERT_TRUE(ensure_dir_exists(path("dir.toml")));

    EXPECT_EQ(list_files_with_extension(dir_, ".toml"), (std::vector<std::string>{ "a.toml", "b.toml" }));
}

TEST_F(TempDirTest, SecureDeleteRemovesFile) {
    const std::string f = path("secret.toml");
    write_text(f, "password = \"x\"\n");
    EXPECT_TRUE(secure_delete_file(f));
    EXPECT_FALSE(path_exists(f));
    EXPECT_TRUE(secure_delete_file(f)); // already gone
}

TEST_F(TempDirTest, SecureDeleteRefusesSymlink) {
    const std::string target = path("target");
    const std::string link = path("link.toml");
    write_text(target, "keep");
    ASSERT_EQ(symlink(target.c_str(), link.c_str()), 0);

    EXPECT_FALSE(secure_delete_file(link));
    EXPECT_EQ(read_text(target), "keep");
}
