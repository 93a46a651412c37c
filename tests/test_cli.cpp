#include "cli.hpp"
#include "io.hpp"
#include "test_support.hpp"
#include "util.hpp"

#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

struct CliResult {
    int status = -1;
    std::string out;
    std::string err;
};

// Swaps std::cout / std::cerr for string buffers while alive
class StreamCapture {
public:
    StreamCapture()
        : old_out_(std::cout.rdbuf(out_.rdbuf())),
          old_err_(std::cerr.rdbuf(err_.rdbuf())) {}

    ~StreamCapture() {
        std::cout.rdbuf(old_out_);
        std::cerr.rdbuf(old_err_);
    }

    std::string out() const { return out_.str(); }
    std::string err() const { return err_.str(); }

private:
    std::ostringstream out_;
    std::ostringstream err_;
    std::streambuf* old_out_;
    std::streambuf* old_err_;
};

class CliTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        ASSERT_TRUE(ensure_sodium_ready());
        fake_ = std::make_shared<FakeSources>();
    }

    // runs "vaultconfig -d <dir> args..."
    CliResult run(const std::vector<std::string>& args) {
        std::vector<std::string> words = { "vaultconfig", "-d", dir_ };
        words.insert(words.end(), args.begin(), args.end());
        std::vector<char*> argv;
        for (std::string& w : words) {
            argv.push_back(&w[0]);
        }
        argv.push_back(nullptr);

        CliResult result;
        StreamCapture capture;
        result.status = run_cli(static_cast<int>(words.size()), argv.data(), make_sources(fake_));
        result.out = capture.out();
        result.err = capture.err();
        return result;
    }

    std::string input_file(const std::string& name, const std::string& text) {
        const std::string dir = path("inputs");
        EXPECT_TRUE(ensure_dir_exists(dir));
        write_text(dir + "/" + name, text);
        return dir + "/" + name;
    }

    std::shared_ptr<FakeSources> fake_;
};

static bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

// -------- Values --------
TEST_F(CliTest, SetGetUnset) {
    CliResult r = run({ "set", "app", "host=localhost", "port=8080", "--create" });
    ASSERT_EQ(r.status, 0) << r.err;
    EXPECT_TRUE(path_exists(path("app.toml")));

    r = run({ "get", "app", "port" });
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(r.out, "8080\n");

    r = run({ "unset", "app", "port", "missing" });
    EXPECT_EQ(r.status, 0);
    EXPECT_TRUE(contains(r.out, "port"));
    EXPECT_TRUE(contains(r.err, "Keys not found: missing"));

    r = run({ "get", "app", "port" });
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "Key 'port' not found"));

    r = run({ "get", "app", "port", "--default", "1" });
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(r.out, "1\n");

    r = run({ "get", "app", "host" });
    EXPECT_EQ(r.out, "localhost\n");
}

TEST_F(CliTest, SetWithoutCreateOnMissingConfig) {
    CliResult r = run({ "set", "ghost", "k=v" });
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "--create"));
    EXPECT_FALSE(path_exists(path("ghost.toml")));
}

TEST_F(CliTest, MissingDirectoryReported) {
    dir_ += "/absent";
    CliResult r = run({ "list" });
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "Config directory not found"));
}

// -------- Copy and rename --------
TEST_F(CliTest, CopyAndRename) {
    ASSERT_EQ(run({ "set", "app", "port=1", "--create" }).status, 0);

    CliResult r = run({ "copy", "app", "app2" });
    ASSERT_EQ(r.status, 0) << r.err;
    EXPECT_TRUE(path_exists(path("app2.toml")));

    r = run({ "copy", "app", "app2" });
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "already exists"));

    r = run({ "rename", "app2", "app3" });
    ASSERT_EQ(r.status, 0) << r.err;
    EXPECT_TRUE(path_exists(path("app3.toml")));
    EXPECT_FALSE(path_exists(path("app2.toml")));

    r = run({ "rename", "app3", "app" });
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(path_exists(path("app3.toml")));

    r = run({ "list" });
    EXPECT_EQ(r.out, "app\napp3\n");
}

// -------- Export and import --------
TEST_F(CliTest, ExportToIniNeedsSections) {
    ASSERT_EQ(run({ "set", "flat", "host=h", "--create" }).status, 0);
    CliResult r = run({ "export", "flat", "--to", "ini" });
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "nested structure"));

    ASSERT_EQ(run({ "set", "svc", "db.host=h", "db.port=5", "--create" }).status, 0);
    const std::string out_file = path("svc.ini");
    r = run({ "export", "svc", "--to", "ini", "--output", out_file });
    ASSERT_EQ(r.status, 0) << r.err;
    const std::string text = read_text(out_file);
    EXPECT_TRUE(contains(text, "[db]"));
    EXPECT_TRUE(contains(text, "port = 5"));
}

TEST_F(CliTest, ImportDetectsFormat) {
    const std::string yaml_file = input_file("web.yaml", "server:\n  port: 80\n");
    CliResult r = run({ "import", "web", yaml_file });
    ASSERT_EQ(r.status, 0) << r.err;
    EXPECT_EQ(run({ "get", "web", "server.port" }).out, "80\n");

    // no usable extension; the content decides
    const std::string txt_file = input_file("settings.txt", "name = \"demo\"\n\n[db]\nport = 5\n");
    r = run({ "import", "imp", txt_file });
    ASSERT_EQ(r.status, 0) << r.err;
    EXPECT_EQ(run({ "get", "imp", "db.port" }).out, "5\n");
    EXPECT_EQ(run({ "get", "imp", "name" }).out, "demo\n");

    r = run({ "import", "web", txt_file });
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "already exists"));
    EXPECT_EQ(run({ "get", "web", "server.port" }).out, "80\n");

    r = run({ "import", "web", txt_file, "--overwrite" });
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(run({ "get", "web", "db.port" }).out, "5\n");
}

TEST_F(CliTest, ImportUndetectableContent) {
    const std::string blank = input_file("empty.txt", "\n  \n");
    CliResult r = run({ "import", "x", blank });
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "--from"));
}

// -------- Encryption --------
TEST_F(CliTest, EncryptSetCheckRemove) {
    ASSERT_EQ(run({ "set", "app", "token=abc", "--create" }).status, 0);
    fake_->env[ENV_PASSWORD] = "pw";

    CliResult r = run({ "encrypt", "set" });
    ASSERT_EQ(r.status, 0) << r.err;
    const std::string sealed = read_text(path("app.toml"));
    EXPECT_TRUE(is_encrypted(sealed));
    EXPECT_FALSE(contains(sealed, "abc"));

    r = run({ "encrypt", "check" });
    EXPECT_EQ(r.out, "Configs are encrypted\n");
    EXPECT_EQ(run({ "get", "app", "token" }).out, "abc\n");

    // without a password the encrypted file is skipped
    fake_->env.clear();
    r = run({ "get", "app", "token" });
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "not found"));

    fake_->env[ENV_PASSWORD] = "pw";
    r = run({ "encrypt", "remove", "--yes" });
    ASSERT_EQ(r.status, 0) << r.err;
    EXPECT_FALSE(is_encrypted(read_text(path("app.toml"))));

    fake_->env.clear();
    r = run({ "encrypt", "check" });
    EXPECT_EQ(r.out, "Configs are NOT encrypted\n");
}

TEST_F(CliTest, WrongPasswordIsAnError) {
    ASSERT_EQ(run({ "set", "app", "k=1", "--create" }).status, 0);
    fake_->env[ENV_PASSWORD] = "right";
    ASSERT_EQ(run({ "encrypt", "set" }).status, 0);

    fake_->env[ENV_PASSWORD] = "wrong";
    CliResult r = run({ "list" });
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "Error:"));
}

// -------- Usage --------
TEST_F(CliTest, UnknownCommandAndOption) {
    CliResult r = run({ "frobnicate" });
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "Unknown command: frobnicate"));

    r = run({ "list", "--bogus" });
    EXPECT_EQ(r.status, 1);
    EXPECT_TRUE(contains(r.err, "Unknown option: --bogus"));
}
