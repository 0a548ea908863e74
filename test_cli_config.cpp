#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "cli_config.h"

namespace fs = std::filesystem;

class CliConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("MODELCTL_HOST");
        unsetenv("MODELCTL_LOG_DIR");
        unsetenv("MODELCTL_CONFIG");

        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_directory = fs::temp_directory_path() / ("modelctl_config_test_" + std::string(info->name()));
        fs::remove_all(m_directory);
        fs::create_directories(m_directory);
        m_path = (m_directory / "config.yaml").string();
    }

    void TearDown() override {
        unsetenv("MODELCTL_HOST");
        unsetenv("MODELCTL_LOG_DIR");
        unsetenv("MODELCTL_CONFIG");
        std::error_code ec;
        fs::remove_all(m_directory, ec);
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(m_path);
        file << content;
    }

    fs::path m_directory;
    std::string m_path;
};

TEST_F(CliConfigTest, Defaults) {
    CliConfig config;
    EXPECT_EQ(config.host, "http://127.0.0.1:11434");
    EXPECT_EQ(config.pollIntervalMs, 250);
    EXPECT_EQ(config.requestTimeout, 30);
    EXPECT_FALSE(config.logDirectory.empty());
    EXPECT_TRUE(config.sourcePath.empty());
}

TEST_F(CliConfigTest, LoadFileReadsAllKeys) {
    writeConfig(
        "host: example.com:8080\n"
        "log_directory: /var/log/modelctl\n"
        "poll_interval_ms: 100\n"
        "request_timeout: 5\n");

    CliConfig config;
    std::string errorMessage;
    ASSERT_TRUE(ConfigLoader::loadFile(m_path, config, errorMessage)) << errorMessage;
    EXPECT_EQ(config.host, "http://example.com:8080");
    EXPECT_EQ(config.logDirectory, "/var/log/modelctl");
    EXPECT_EQ(config.pollIntervalMs, 100);
    EXPECT_EQ(config.requestTimeout, 5);
    EXPECT_EQ(config.sourcePath, m_path);
}

TEST_F(CliConfigTest, InvalidNumbersKeepDefaults) {
    writeConfig(
        "poll_interval_ms: -5\n"
        "request_timeout: soon\n");

    CliConfig config;
    std::string errorMessage;
    ASSERT_TRUE(ConfigLoader::loadFile(m_path, config, errorMessage)) << errorMessage;
    EXPECT_EQ(config.pollIntervalMs, 250);
    EXPECT_EQ(config.requestTimeout, 30);
}

TEST_F(CliConfigTest, EmptyFileIsAccepted) {
    writeConfig("");

    CliConfig config;
    std::string errorMessage;
    EXPECT_TRUE(ConfigLoader::loadFile(m_path, config, errorMessage)) << errorMessage;
    EXPECT_EQ(config.host, "http://127.0.0.1:11434");
}

TEST_F(CliConfigTest, NonMappingIsRejected) {
    writeConfig("- just\n- a list\n");

    CliConfig config;
    std::string errorMessage;
    EXPECT_FALSE(ConfigLoader::loadFile(m_path, config, errorMessage));
    EXPECT_NE(errorMessage.find("mapping"), std::string::npos);
}

TEST_F(CliConfigTest, MalformedYamlIsRejected) {
    writeConfig("host: [unclosed\n");

    CliConfig config;
    std::string errorMessage;
    EXPECT_FALSE(ConfigLoader::loadFile(m_path, config, errorMessage));
    EXPECT_NE(errorMessage.find(m_path), std::string::npos);
}

TEST_F(CliConfigTest, EnvironmentOverridesFile) {
    writeConfig(
        "host: example.com\n"
        "log_directory: /from/file\n");
    setenv("MODELCTL_CONFIG", m_path.c_str(), 1);
    setenv("MODELCTL_HOST", "https://models.internal", 1);
    setenv("MODELCTL_LOG_DIR", "/from/env", 1);

    CliConfig config = ConfigLoader::load();
    EXPECT_EQ(config.sourcePath, m_path);
    EXPECT_EQ(config.host, "https://models.internal:443");
    EXPECT_EQ(config.logDirectory, "/from/env");
}

TEST_F(CliConfigTest, ExplicitConfigPathComesFirst) {
    setenv("MODELCTL_CONFIG", m_path.c_str(), 1);
    std::vector<std::string> paths = ConfigLoader::candidatePaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), m_path);
    EXPECT_EQ(paths.back(), "config.yaml");
}

TEST_F(CliConfigTest, NormalizeHost) {
    EXPECT_EQ(ConfigLoader::normalizeHost(""), "http://127.0.0.1:11434");
    EXPECT_EQ(ConfigLoader::normalizeHost("example.com"), "http://example.com:11434");
    EXPECT_EQ(ConfigLoader::normalizeHost("example.com:56789"), "http://example.com:56789");
    EXPECT_EQ(ConfigLoader::normalizeHost(":1234"), "http://127.0.0.1:1234");
    EXPECT_EQ(ConfigLoader::normalizeHost("http://example.com"), "http://example.com:80");
    EXPECT_EQ(ConfigLoader::normalizeHost("https://example.com"), "https://example.com:443");
    EXPECT_EQ(ConfigLoader::normalizeHost("https://example.com/path/"), "https://example.com:443/path");
    EXPECT_EQ(ConfigLoader::normalizeHost("  \"10.0.0.1\"  "), "http://10.0.0.1:11434");
    EXPECT_EQ(ConfigLoader::normalizeHost("[::1]"), "http://[::1]:11434");
    EXPECT_EQ(ConfigLoader::normalizeHost("[::1]:8080"), "http://[::1]:8080");
}
