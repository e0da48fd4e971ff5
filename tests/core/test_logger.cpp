#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>
#include "trade_sim/core/logger.hpp"

using namespace trade_sim;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Reset logger first to close any existing file handles
        Logger::reset_for_tests();
        Logger::register_component("");

        original_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);

        // Reset logger BEFORE directory cleanup
        Logger::reset_for_tests();
        Logger::register_component("");

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    std::vector<std::filesystem::path> get_log_files(const std::string& dir) {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open())
            return "";
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LoggerConfig plain_file_config() const {
        LoggerConfig config;
        config.destination = LogDestination::FILE;
        config.log_directory = test_log_dir;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::streambuf* original_cout;
    std::stringstream cout_buffer;
    const std::string test_log_dir = "test_sim_logs";
};

TEST_F(LoggerTest, FileHandlesClosedAfterReset) {
    Logger::instance().initialize(plain_file_config());

    Logger::reset_for_tests();
    EXPECT_FALSE(Logger::instance().is_initialized());

    std::error_code ec;
    std::filesystem::remove_all(test_log_dir, ec);
    EXPECT_FALSE(ec) << "Failed to delete directory: " << ec.message();
}

TEST_F(LoggerTest, InitializationCreatesLogDirectory) {
    LoggerConfig config = plain_file_config();
    config.log_directory = test_log_dir + "/subdir";
    ASSERT_NO_THROW(Logger::instance().initialize(config));
    EXPECT_TRUE(std::filesystem::exists(config.log_directory));
}

TEST_F(LoggerTest, LogsToConsoleWhenConfigured) {
    LoggerConfig config;
    config.destination = LogDestination::CONSOLE;
    config.include_timestamp = false;
    config.include_level = false;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "Console message");

    EXPECT_EQ(cout_buffer.str(), "Console message\n");
}

TEST_F(LoggerTest, LogsToFileWithPrefixedName) {
    Logger::instance().initialize(plain_file_config());

    Logger::instance().log(LogLevel::INFO, "File message");

    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1u);
    std::string name = files[0].filename().string();
    EXPECT_EQ(name.rfind("trade_sim_", 0), 0u) << name;
    EXPECT_NE(name.find("_part1.log"), std::string::npos) << name;
    EXPECT_EQ(read_file(files[0]), "File message\n");
}

TEST_F(LoggerTest, LogLevelFiltering) {
    LoggerConfig config = plain_file_config();
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    DEBUG("Debug");
    INFO("Info");
    WARN("Warning");
    ERROR("Error");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content.find("Debug"), std::string::npos);
    EXPECT_EQ(content.find("Info"), std::string::npos);
    EXPECT_NE(content.find("Warning\nError\n"), std::string::npos);
}

TEST_F(LoggerTest, ComponentAndLevelTags) {
    LoggerConfig config = plain_file_config();
    config.include_level = true;
    Logger::instance().initialize(config);

    Logger::register_component("TradeSimulator");
    WARN("skipped " << 3 << " signals");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content, "[WARNING] [TradeSimulator] skipped 3 signals\n");
}

TEST_F(LoggerTest, SetLevelAtRuntime) {
    Logger::instance().initialize(plain_file_config());
    Logger::instance().set_level(LogLevel::ERR);
    EXPECT_EQ(Logger::instance().get_min_level(), LogLevel::ERR);

    WARN("hidden");
    ERROR("shown");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content, "shown\n");
}

TEST_F(LoggerTest, FileRotationKeepsBoundedFileCount) {
    LoggerConfig config = plain_file_config();
    config.max_file_size = 10;  // bytes
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 6; ++i) {
        Logger::instance().log(LogLevel::INFO, "rotation message " + std::to_string(i));
    }

    auto files = get_log_files(test_log_dir);
    EXPECT_GE(files.size(), 1u);
    EXPECT_LE(files.size(), 2u);
}

TEST_F(LoggerTest, RotationLeavesOtherLogFilesAlone) {
    const auto foreign = std::filesystem::path(test_log_dir) / "other_app_20240101.log";
    std::ofstream(foreign) << "not ours\n";

    LoggerConfig config = plain_file_config();
    config.max_file_size = 10;  // bytes
    config.max_files = 1;
    Logger::instance().initialize(config);

    for (int i = 0; i < 4; ++i) {
        Logger::instance().log(LogLevel::INFO, "rotation message " + std::to_string(i));
    }

    ASSERT_TRUE(std::filesystem::exists(foreign));
    EXPECT_EQ(read_file(foreign), "not ours\n");

    size_t own_files = 0;
    for (const auto& path : get_log_files(test_log_dir)) {
        if (path.filename().string().rfind("trade_sim_", 0) == 0) {
            ++own_files;
        }
    }
    EXPECT_EQ(own_files, 1u);
}

TEST_F(LoggerTest, UninitializedLoggerOnlyReportsWarnings) {
    std::stringstream cerr_buffer;
    std::streambuf* original_cerr = std::cerr.rdbuf(cerr_buffer.rdbuf());

    Logger::instance().log(LogLevel::INFO, "quiet");
    Logger::instance().log(LogLevel::WARNING, "loud");

    std::cerr.rdbuf(original_cerr);
    EXPECT_EQ(cerr_buffer.str(), "[WARNING] loud\n");
    EXPECT_TRUE(cout_buffer.str().empty());
}

TEST_F(LoggerTest, ConfigJsonRoundTrip) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "sweep";
    config.max_files = 9;

    LoggerConfig loaded;
    loaded.from_json(config.to_json());

    EXPECT_EQ(loaded.min_level, LogLevel::DEBUG);
    EXPECT_EQ(loaded.destination, LogDestination::BOTH);
    EXPECT_EQ(loaded.filename_prefix, "sweep");
    EXPECT_EQ(loaded.max_files, 9u);
    EXPECT_EQ(level_from_string("unknown"), LogLevel::INFO);
}
