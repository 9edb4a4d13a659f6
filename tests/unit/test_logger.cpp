#include <gtest/gtest.h>
#include "uplink/core/logger.hpp"
#include <filesystem>
#include <fstream>

using namespace uplink::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file = "test_uplink.log";
    }
    
    void TearDown() override {
        Logger::shutdown();
        if (std::filesystem::exists(log_file)) {
            std::filesystem::remove(log_file);
        }
    }
    
    std::string read_log() {
        Logger::get()->flush();
        std::ifstream file(log_file);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }
    
    std::string log_file;
};

TEST_F(LoggerTest, Initialize) {
    Logger::initialize(log_file, LogLevel::Debug);
    
    EXPECT_NE(Logger::get(), nullptr);
    EXPECT_EQ(Logger::get()->name(), "uplink");
    EXPECT_TRUE(std::filesystem::exists(log_file));
}

TEST_F(LoggerTest, UsableBeforeInitialize) {
    EXPECT_NE(Logger::get(), nullptr);
    LOG_INFO("Logged before initialize");
}

TEST_F(LoggerTest, LogMessages) {
    Logger::initialize(log_file, LogLevel::Debug);
    
    LOG_DEBUG("Chunk {} stored", 3);
    LOG_INFO("Session {} created", "abc123");
    LOG_WARN("Retry budget low");
    LOG_ERROR("Finalization failed");
    
    auto content = read_log();
    EXPECT_NE(content.find("Chunk 3 stored"), std::string::npos);
    EXPECT_NE(content.find("Session abc123 created"), std::string::npos);
    EXPECT_NE(content.find("Retry budget low"), std::string::npos);
    EXPECT_NE(content.find("Finalization failed"), std::string::npos);
}

TEST_F(LoggerTest, LogLevel) {
    Logger::initialize(log_file, LogLevel::Warn);
    
    LOG_DEBUG("Debug message");
    LOG_INFO("Info message");
    LOG_WARN("Warning message");
    
    auto content = read_log();
    EXPECT_EQ(content.find("Debug message"), std::string::npos);
    EXPECT_EQ(content.find("Info message"), std::string::npos);
    EXPECT_NE(content.find("Warning message"), std::string::npos);
}

TEST_F(LoggerTest, Reinitialize) {
    Logger::initialize(log_file, LogLevel::Warn);
    Logger::initialize(log_file, LogLevel::Debug);
    
    LOG_DEBUG("After reinitialize");
    
    EXPECT_NE(read_log().find("After reinitialize"), std::string::npos);
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(Logger::parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("Error"), LogLevel::Error);
    EXPECT_EQ(Logger::parse_level("off"), LogLevel::Off);
    EXPECT_EQ(Logger::parse_level("verbose"), LogLevel::Info);
    EXPECT_EQ(Logger::parse_level("bogus", LogLevel::Critical), LogLevel::Critical);
    EXPECT_EQ(Logger::parse_level("WARNING"), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level(""), LogLevel::Info);
    EXPECT_EQ(Logger::parse_level("d\xC3\xA9bug", LogLevel::Error), LogLevel::Error);
}
