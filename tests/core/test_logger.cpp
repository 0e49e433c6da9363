#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include "macross/core/logger.hpp"

using namespace macross;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Reset logger first to close any existing file handles
        Logger::reset_for_tests();

        saved_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());
        saved_cerr = std::cerr.rdbuf();
        std::cerr.rdbuf(cerr_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(saved_cout);
        std::cerr.rdbuf(saved_cerr);

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
        std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
            return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
        });
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

    LoggerConfig plain_config(LogDestination destination) {
        LoggerConfig config;
        config.destination = destination;
        config.log_directory = test_log_dir;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::streambuf* saved_cout;
    std::streambuf* saved_cerr;
    std::stringstream cout_buffer;
    std::stringstream cerr_buffer;
    const std::string test_log_dir = "test_logs";
};

TEST_F(LoggerTest, FileHandlesClosedAfterReset) {
    Logger::instance().initialize(plain_config(LogDestination::FILE));
    Logger::reset_for_tests();

    std::error_code ec;
    std::filesystem::remove_all(test_log_dir, ec);
    EXPECT_FALSE(ec) << "Failed to delete directory: " << ec.message();
}

TEST_F(LoggerTest, InitializationCreatesLogDirectory) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.log_directory = test_log_dir + "/subdir";
    ASSERT_NO_THROW(Logger::instance().initialize(config));
    EXPECT_TRUE(std::filesystem::exists(config.log_directory));
    EXPECT_TRUE(Logger::instance().is_initialized());
}

TEST_F(LoggerTest, LogsToConsoleWhenConfigured) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));

    Logger::instance().log(LogLevel::INFO, "Console message");

    EXPECT_EQ(cout_buffer.str(), "Console message\n");
}

TEST_F(LoggerTest, LogsToFileWhenConfigured) {
    Logger::instance().initialize(plain_config(LogDestination::FILE));

    Logger::instance().log(LogLevel::INFO, "File message");

    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1);
    EXPECT_EQ(read_file(files[0]), "File message\n");
}

TEST_F(LoggerTest, LogsToBothDestinations) {
    Logger::instance().initialize(plain_config(LogDestination::BOTH));

    Logger::instance().log(LogLevel::INFO, "Both message");

    EXPECT_EQ(cout_buffer.str(), "Both message\n");
    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1);
    EXPECT_EQ(read_file(files[0]), "Both message\n");
}

TEST_F(LoggerTest, LogLevelFiltering) {
    LoggerConfig config = plain_config(LogDestination::FILE);
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

TEST_F(LoggerTest, MessageFormatting) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.include_timestamp = true;
    config.include_level = true;
    Logger::instance().initialize(config);

    WARN("Formatted " << 42);

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_NE(content.find("[WARNING]"), std::string::npos);
    EXPECT_NE(content.find("Formatted 42"), std::string::npos);
    EXPECT_GE(content.size(), 20);  // Basic timestamp check
}

TEST_F(LoggerTest, ComponentTagIsPerThread) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));

    Logger::register_component("AAPL");
    INFO("main thread");

    std::thread worker([]() { INFO("worker thread"); });
    worker.join();

    std::string output = cout_buffer.str();
    EXPECT_NE(output.find("[AAPL] main thread"), std::string::npos);
    EXPECT_NE(output.find("worker thread"), std::string::npos);
    EXPECT_EQ(output.find("[AAPL] worker thread"), std::string::npos);
}

TEST_F(LoggerTest, FileRotation) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 10;  // 10 bytes
    config.max_files = 2;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "12345678");  // 9 bytes
    Logger::instance().log(LogLevel::INFO, "12345678");  // Triggers rotation

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2);
}

TEST_F(LoggerTest, MaxFilesEnforced) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 1;  // Rotate every message
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 3; ++i) {
        Logger::instance().log(LogLevel::INFO, std::to_string(i));
    }

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2);
}

TEST_F(LoggerTest, RetentionLeavesOtherFilesAlone) {
    const auto bars = std::filesystem::path(test_log_dir) / "bars.csv";
    const auto notes = std::filesystem::path(test_log_dir) / "notes.txt";
    const auto other_log = std::filesystem::path(test_log_dir) / "other_app.log";
    for (const auto& path : {bars, notes, other_log}) {
        std::ofstream file(path);
        file << "keep";
    }

    LoggerConfig config = plain_config(LogDestination::FILE);
    config.filename_prefix = "bt";
    config.max_file_size = 1;
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 4; ++i) {
        Logger::instance().log(LogLevel::INFO, std::to_string(i));
    }

    EXPECT_TRUE(std::filesystem::exists(bars));
    EXPECT_TRUE(std::filesystem::exists(notes));
    EXPECT_TRUE(std::filesystem::exists(other_log));
    EXPECT_EQ(read_file(bars), "keep");

    size_t own_files = 0;
    for (const auto& path : get_log_files(test_log_dir)) {
        if (path.filename().string().rfind("bt_", 0) == 0) {
            ++own_files;
        }
    }
    EXPECT_EQ(own_files, 2);
}

TEST_F(LoggerTest, LogBeforeInitializationGoesToStderr) {
    Logger::instance().log(LogLevel::INFO, "Early");

    EXPECT_TRUE(cout_buffer.str().empty());
    EXPECT_NE(cerr_buffer.str().find("Logger not initialized"), std::string::npos);
    EXPECT_TRUE(get_log_files(test_log_dir).empty());
}

TEST_F(LoggerTest, ConfigJsonRoundTrip) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "bt";
    config.max_files = 3;

    LoggerConfig loaded;
    loaded.from_json(config.to_json());

    EXPECT_EQ(loaded.min_level, LogLevel::DEBUG);
    EXPECT_EQ(loaded.destination, LogDestination::BOTH);
    EXPECT_EQ(loaded.filename_prefix, "bt");
    EXPECT_EQ(loaded.max_files, 3);
}
