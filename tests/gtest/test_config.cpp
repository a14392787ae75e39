// =============================================================================
// Configuration and Logging Tests
// =============================================================================

#include <gtest/gtest.h>
#include "geohash/config.hpp"
#include "geohash/logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

using namespace geohash;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("GH_DEFAULT_PRECISION");
        unsetenv("GH_OUTPUT");
        unsetenv("GH_LOG_LEVEL");
        Config::getInstance().clear();
        set_log_output(log_);
    }

    void TearDown() override {
        Config::getInstance().clear();
        set_log_output(std::cout);
        if (!path_.empty()) {
            std::filesystem::remove(path_);
        }
    }

    std::string write_file(const std::string& contents) {
        path_ = (std::filesystem::temp_directory_path() /
                 ("geohash_config_test_" + std::to_string(::getpid()) + ".env")).string();
        std::ofstream out(path_);
        out << contents;
        return path_;
    }

    std::ostringstream log_;
    std::string path_;
};

TEST_F(ConfigTest, DefaultsWithoutFile) {
    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load());

    EXPECT_EQ(config.default_precision(), Precision::House);
    EXPECT_EQ(config.get<std::string>("geohash.output"), "text");
    EXPECT_EQ(config.get<std::string>("log.level"), "info");
}

TEST_F(ConfigTest, FileOverridesEnvironment) {
    setenv("GH_DEFAULT_PRECISION", "6", 1);
    std::string file = write_file(
        "# geohash settings\n"
        "; alternate comment\n"
        "\n"
        "  geohash.default_precision =  5  \n"
        "geohash.output=csv\n");

    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load(file));
    unsetenv("GH_DEFAULT_PRECISION");

    EXPECT_EQ(config.default_precision(), Precision::City);
    EXPECT_EQ(config.get<std::string>("geohash.output"), "csv");
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
    setenv("GH_DEFAULT_PRECISION", "6", 1);
    setenv("GH_OUTPUT", "csv", 1);

    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load());
    unsetenv("GH_DEFAULT_PRECISION");
    unsetenv("GH_OUTPUT");

    EXPECT_EQ(config.default_precision(), Precision::Street);
    EXPECT_EQ(config.get<std::string>("geohash.output"), "csv");
}

TEST_F(ConfigTest, InvalidPrecisionFailsValidation) {
    std::string file = write_file("geohash.default_precision=13\n");
    EXPECT_FALSE(Config::getInstance().load(file));
    EXPECT_NE(log_.str().find("Invalid default precision"), std::string::npos);
}

TEST_F(ConfigTest, UnknownOutputFallsBackToText) {
    std::string file = write_file("geohash.output=xml\nlog.level=verbose\n");

    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load(file));
    EXPECT_EQ(config.get<std::string>("geohash.output"), "text");
    EXPECT_EQ(config.get<std::string>("log.level"), "info");
}

TEST_F(ConfigTest, MissingFileIsIgnored) {
    EXPECT_TRUE(Config::getInstance().load("/nonexistent/geohash.env"));
    EXPECT_EQ(Config::getInstance().default_precision(), Precision::House);
}

TEST_F(ConfigTest, TypedGet) {
    Config& config = Config::getInstance();
    config.set("int.good", "42");
    config.set("int.bad", "12abc");
    config.set("double", "2.5");
    config.set("flag.on", "Yes");
    config.set("flag.off", "0");

    EXPECT_EQ(config.get<int>("int.good", 0), 42);
    EXPECT_EQ(config.get<int>("int.bad", 7), 7);
    EXPECT_EQ(config.get<int>("missing", 3), 3);
    EXPECT_DOUBLE_EQ(config.get<double>("double", 0.0), 2.5);
    EXPECT_TRUE(config.get<bool>("flag.on", false));
    EXPECT_FALSE(config.get<bool>("flag.off", true));
    EXPECT_TRUE(config.has("double"));
    EXPECT_FALSE(config.has("missing"));
}

TEST_F(ConfigTest, ParseLogLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("error", level));
    EXPECT_EQ(level, LogLevel::ERROR);

    EXPECT_FALSE(parse_log_level("loud", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

TEST_F(ConfigTest, LoggerHonoursLevel) {
    set_log_level(LogLevel::WARN);
    LOG_INFO("hidden message");
    LOG_WARN("visible message ", 42);
    set_log_level(LogLevel::INFO);

    std::string output = log_.str();
    EXPECT_EQ(output.find("hidden message"), std::string::npos);
    EXPECT_NE(output.find("WARN"), std::string::npos);
    EXPECT_NE(output.find("visible message 42"), std::string::npos);
}
