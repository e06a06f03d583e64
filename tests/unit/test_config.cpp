#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include "../../src/core/config/config.hpp"

using namespace Clawweb::Core;

TEST(ConfigTest, Defaults) {
    char* argv[] = {(char*)"clawweb", (char*)"http://root.example/"};
    auto  config = Config::parse(2, argv);
    EXPECT_EQ(config.url, "http://root.example/");
    EXPECT_EQ(config.depth, 30);
    EXPECT_FALSE(config.links_only);
    EXPECT_TRUE(config.confine.empty());
    EXPECT_TRUE(config.exclude.empty());
    EXPECT_EQ(config.threads, 1);
    EXPECT_FALSE(config.show_help);
}

TEST(ConfigTest, ShortAndLongFlags) {
    char* argv[] = {(char*)"clawweb", (char*)"-l", (char*)"-d", (char*)"3", (char*)"http://h/"};
    auto  config = Config::parse(5, argv);
    EXPECT_TRUE(config.links_only);
    EXPECT_EQ(config.depth, 3);

    char* long_argv[] = {
        (char*)"clawweb", (char*)"--links", (char*)"--depth", (char*)"7", (char*)"http://h/"};
    auto long_config = Config::parse(5, long_argv);
    EXPECT_TRUE(long_config.links_only);
    EXPECT_EQ(long_config.depth, 7);
}

TEST(ConfigTest, ScopeOptions) {
    char* argv[] = {(char*)"clawweb",
                    (char*)"http://h/docs/",
                    (char*)"--confine",
                    (char*)"http://h/docs/",
                    (char*)"--exclude",
                    (char*)"http://h/docs/old",
                    (char*)"--exclude",
                    (char*)"http://h/docs/tmp",
                    (char*)"--threads",
                    (char*)"8"};
    auto  config = Config::parse(10, argv);
    EXPECT_EQ(config.confine, "http://h/docs/");
    ASSERT_EQ(config.exclude.size(), 2);
    EXPECT_EQ(config.exclude[1], "http://h/docs/tmp");
    EXPECT_EQ(config.threads, 8);
}

TEST(ConfigTest, MissingUrlIsNotAParseError) {
    char* argv[] = {(char*)"clawweb", (char*)"-d", (char*)"2"};
    auto  config = Config::parse(3, argv);
    EXPECT_TRUE(config.url.empty());
}

TEST(ConfigTest, TrailingArgumentsAreIgnored) {
    char* argv[] = {(char*)"clawweb", (char*)"http://h/", (char*)"extra", (char*)"more"};
    auto  config = Config::parse(4, argv);
    EXPECT_EQ(config.url, "http://h/");
}

TEST(ConfigTest, UnknownOptionThrows) {
    char* argv[] = {(char*)"clawweb", (char*)"--bogus", (char*)"http://h/"};
    EXPECT_THROW(Config::parse(3, argv), std::runtime_error);
}

TEST(ConfigTest, BadValuesThrow) {
    char* argv[] = {(char*)"clawweb", (char*)"--depth", (char*)"deep", (char*)"http://h/"};
    EXPECT_THROW(Config::parse(4, argv), std::runtime_error);

    char* threads_argv[] = {(char*)"clawweb", (char*)"--threads", (char*)"0", (char*)"http://h/"};
    EXPECT_THROW(Config::parse(4, threads_argv), std::runtime_error);
}

TEST(ConfigTest, HelpFlag) {
    char* argv[] = {(char*)"clawweb", (char*)"--help"};
    auto  config = Config::parse(2, argv);
    EXPECT_TRUE(config.show_help);

    std::ostringstream out;
    Config::print_usage(out);
    EXPECT_NE(out.str().find("--links"), std::string::npos);
    EXPECT_NE(out.str().find("--depth"), std::string::npos);
}

TEST(ConfigTest, YamlLoading) {
    std::ofstream ofs("test_clawweb.yaml");
    ofs << "depth: 4\n"
           "confine: \"http://h/docs/\"\n"
           "threads: 3\n"
           "timeout: 5\n"
           "user_agent: \"TestAgent/1.0\"\n"
           "exclude:\n"
           "  - \"http://h/a\"\n"
           "  - \"http://h/b\"\n";
    ofs.close();

    char* argv[] = {
        (char*)"clawweb", (char*)"--config", (char*)"test_clawweb.yaml", (char*)"http://h/docs/"};
    auto config = Config::parse(4, argv);

    EXPECT_EQ(config.depth, 4);
    EXPECT_EQ(config.confine, "http://h/docs/");
    EXPECT_EQ(config.threads, 3);
    EXPECT_EQ(config.timeout, 5);
    EXPECT_EQ(config.user_agent, "TestAgent/1.0");
    EXPECT_EQ(config.exclude.size(), 2);

    std::remove("test_clawweb.yaml");
}

TEST(ConfigTest, CliOverridesYaml) {
    std::ofstream ofs("test_ovr.yaml");
    ofs << "depth: 20\nthreads: 2";
    ofs.close();

    char* argv[] = {(char*)"clawweb",
                    (char*)"--config",
                    (char*)"test_ovr.yaml",
                    (char*)"--depth",
                    (char*)"9",
                    (char*)"http://h/"};
    auto  config = Config::parse(6, argv);

    EXPECT_EQ(config.depth, 9);
    EXPECT_EQ(config.threads, 2);

    std::remove("test_ovr.yaml");
}

TEST(ConfigTest, InvalidYaml) {
    std::ofstream ofs("invalid.yaml");
    ofs << "depth: [not an integer]";
    ofs.close();

    const char* argv[] = {"clawweb", "--config", "invalid.yaml"};
    EXPECT_THROW(Config::parse(3, (char**)argv), std::runtime_error);
    std::remove("invalid.yaml");
}

TEST(ConfigTest, NonExistentFile) {
    const char* argv[] = {"clawweb", "--config", "does_not_exist.yaml"};
    EXPECT_THROW(Config::parse(3, (char**)argv), std::runtime_error);
}

TEST(ConfigTest, EmptyConfig) {
    std::ofstream ofs("empty.yaml");
    ofs << "";
    ofs.close();

    char* argv[] = {(char*)"clawweb", (char*)"--config", (char*)"empty.yaml"};
    auto  config = Config::parse(3, argv);
    EXPECT_EQ(config.depth, 30);

    std::remove("empty.yaml");
}
