#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <cstdlib>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::string saved_home;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sftpdrive_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "home");
        fs::create_directories(test_dir / "project");

        if (const char* home = std::getenv("HOME")) saved_home = home;
        setenv("HOME", (test_dir / "home").c_str(), 1);
    }

    void TearDown() override {
        if (saved_home.empty()) {
            unsetenv("HOME");
        } else {
            setenv("HOME", saved_home.c_str(), 1);
        }
        fs::remove_all(test_dir);
    }

    void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    fs::path project() const { return test_dir / "project"; }
};

TEST_F(ConfigTest, ProjectFile) {
    write_file(project() / "sftpdrive.yaml",
               "host: build-box\n"
               "cwd: /tmp\n"
               "label: deploy\n"
               "verbosity: unknown-and-error\n");
    auto r = Config::load_project(project());
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& s = r.value.session();
    EXPECT_EQ(s.host, "build-box");
    EXPECT_EQ(s.cwd, "/tmp");
    EXPECT_EQ(s.label, "deploy");
    EXPECT_EQ(s.verbosity, VerbosityMode::UnknownAndError);
    EXPECT_EQ(s.program, "sftp");
    EXPECT_EQ(r.value.source(), project() / "sftpdrive.yaml");
}

TEST_F(ConfigTest, MissingFile) {
    auto r = Config::load_project(project());
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Config not found"), std::string::npos);
}

TEST_F(ConfigTest, UnknownVerbosity) {
    write_file(project() / "sftpdrive.yaml", "host: h\nverbosity: chatty\n");
    auto r = Config::load_project(project());
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("chatty"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYaml) {
    write_file(project() / "sftpdrive.yaml", "host: [unterminated\n");
    auto r = Config::load_project(project());
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Failed to parse"), std::string::npos);
}

TEST_F(ConfigTest, ProgramArgs) {
    write_file(project() / "sftpdrive.yaml",
               "host: h\nprogram: /usr/bin/sftp\nargs: [\"-q\", \"-b\", \"-\", \"h\"]\n");
    auto r = Config::load_project(project());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.session().program, "/usr/bin/sftp");
    ASSERT_EQ(r.value.session().program_args.size(), 4u);
    EXPECT_EQ(r.value.session().program_args[0], "-q");

    write_file(project() / "sftpdrive.yaml", "host: h\nargs: h2\n");
    r = Config::load_project(project());
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.session().program_args.size(), 1u);
    EXPECT_EQ(r.value.session().program_args[0], "h2");
}

TEST_F(ConfigTest, QuietModeRejected) {
    write_file(project() / "sftpdrive.yaml", "host: h\nargs: [\"-q\", \"h\"]\n");
    auto r = Config::load_project(project());
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("-q"), std::string::npos);
}

TEST_F(ConfigTest, DefaultTemplateArgsAreUsable) {
    ASSERT_TRUE(create_default_global_config().is_ok());
    std::ifstream in(get_global_config_path());
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text.find("[\"-q\""), std::string::npos);

    // The commented example must itself pass validation once uncommented.
    auto pos = text.find("# args:");
    ASSERT_NE(pos, std::string::npos);
    auto line = text.substr(pos + 2, text.find('\n', pos) - pos - 2);
    write_file(project() / "sftpdrive.yaml", "host: h\n" + line + "\n");
    auto r = Config::load_project(project());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.session().program_args.empty());
}

TEST_F(ConfigTest, DefaultLogFile) {
    write_file(project() / "sftpdrive.yaml", "host: h\nlog_file: default\n");
    auto r = Config::load_project(project());
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(fs::path(r.value.session().log_file), get_default_log_path());
    EXPECT_EQ(get_default_log_path(), test_dir / "home" / ".sftpdrive" / "debug.log");
}

TEST_F(ConfigTest, ProjectOverridesGlobal) {
    write_file(get_global_config_path(), "host: global-host\nlabel: global\nverbosity: silent\n");
    write_file(project() / "sftpdrive.yaml", "label: project\n");
    auto r = Config::load(project());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.session().host, "global-host");
    EXPECT_EQ(r.value.session().label, "project");
    EXPECT_EQ(r.value.session().verbosity, VerbosityMode::Silent);
}

TEST_F(ConfigTest, LoadRequiresHost) {
    write_file(project() / "sftpdrive.yaml", "label: nohost\n");
    auto r = Config::load(project());
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("No host configured"), std::string::npos);
}

TEST_F(ConfigTest, CreateDefaultGlobalConfigNeverOverwrites) {
    EXPECT_FALSE(global_config_exists());
    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_TRUE(global_config_exists());

    // The template has an empty host, so it loads but does not name one.
    auto r = Config::load_global();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.session().host.empty());

    write_file(get_global_config_path(), "host: mine\n");
    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_EQ(Config::load_global().value.session().host, "mine");
}

TEST(VerbosityTest, NamesRoundTrip) {
    for (auto mode : {VerbosityMode::Normal, VerbosityMode::Verbose, VerbosityMode::Silent,
                      VerbosityMode::OnlyUnknown, VerbosityMode::UnknownAndError}) {
        auto parsed = parse_verbosity(verbosity_name(mode));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, mode);
    }
    EXPECT_FALSE(parse_verbosity("loud").has_value());
}
