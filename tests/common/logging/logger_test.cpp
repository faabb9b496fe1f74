// File: tests/common/logging/logger_test.cpp

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "common/logging/logger.hpp"

using common::logging::Logger;

namespace {
    std::string readAll(const std::filesystem::path &path) {
        std::ifstream in(path);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }
} // namespace

// configure() moves the file sink and applies the level
TEST(LoggerTest, ConfigureRedirectsFileSink) {
    const auto dir = std::filesystem::temp_directory_path() / "leafscan_logger_test";
    std::filesystem::remove_all(dir);
    const Logger::Settings previous = Logger::settings();

    Logger::Settings settings;
    settings.directory = dir.string();
    settings.filename = "first.log";
    settings.level = "info";
    Logger::configure(settings);
    LOG_DEBUG("below the configured level");
    LOG_INFO("indexed {} reference image(s)", 42);

    // Replacing the sinks closes first.log
    settings.filename = "second.log";
    Logger::configure(settings);

    const std::string content = readAll(dir / "first.log");
    EXPECT_NE(content.find("indexed 42 reference image(s)"), std::string::npos);
    EXPECT_EQ(content.find("below the configured level"), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(dir / "second.log"));
    EXPECT_EQ(Logger::settings().filename, "second.log");

    Logger::configure(previous);
    std::filesystem::remove_all(dir);
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(Logger::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(Logger::parseLevel("off"), spdlog::level::off);
    EXPECT_EQ(Logger::parseLevel("verbose"), spdlog::level::debug);
}
