#include "logger.hpp"
#include <gtest/gtest.h>
#include <cstdint>
#include <format>
#include <string>
#include <vector>

TEST(ByteVectorFormatter, WidthAndLimit) {
    std::vector<uint8_t> data = {0x41, 0x42, 0x00, 0xFF, 0x10};
    std::string expected = "0000: 41 42 00 FF " + std::string(12 * 3, ' ') +
                           " |AB..|\n(1 bytes left)";
    EXPECT_EQ(std::format("{:16xL4}", data), expected);
}

TEST(ByteVectorFormatter, WrapsLinesAndPadsTheLast) {
    std::vector<char> data = {'a', 'b', 'c', 'd', 'e', 'f'};
    std::string expected = "0000: 61 62 63 64  |abcd|\n"
                           "0004: 65 66 " + std::string(2 * 3, ' ') + " |ef|";
    EXPECT_EQ(std::format("{:4x}", data), expected);
}

TEST(ByteVectorFormatter, FullLineHasNoPadding) {
    std::vector<uint8_t> data = {0x01, 0x02};
    EXPECT_EQ(std::format("{:2X}", data), "0000: 01 02  |..|");
}

TEST(ByteVectorFormatter, EmptyVector) {
    EXPECT_EQ(std::format("{}", std::vector<uint8_t>{}), "[empty]");
}

TEST(ByteVectorFormatter, RejectsBadOptions) {
    std::vector<uint8_t> data = {0x01};
    EXPECT_THROW((void)std::vformat("{:16q}", std::make_format_args(data)), std::format_error);
    EXPECT_THROW((void)std::vformat("{:xL}", std::make_format_args(data)), std::format_error);
}

TEST(Logger, LevelFromDebug) {
    EXPECT_EQ(Logger::levelFromDebug(0), LogLevel::INFO);
    EXPECT_EQ(Logger::levelFromDebug(1), LogLevel::DEBUG);
    EXPECT_EQ(Logger::levelFromDebug(2), LogLevel::VERBOSE);
    EXPECT_EQ(Logger::levelFromDebug(7), LogLevel::VERBOSE);
}

TEST(Logger, WritesFormattedLineAtOrAboveLevel) {
    Logger::getInstance().setLevel(LogLevel::INFO);

    ::testing::internal::CaptureStdout();
    LOG_INFO("played {} ms of {}", 1500, "song.pcm");
    LOG_DEBUG("hidden {}", 1);
    std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("[INFO]"), std::string::npos);
    EXPECT_NE(output.find("played 1500 ms of song.pcm"), std::string::npos);
    EXPECT_EQ(output.find("hidden"), std::string::npos);
}

TEST(Logger, ByteDumpGoesOnItsOwnLines) {
    Logger::getInstance().setLevel(LogLevel::DEBUG);
    std::vector<uint8_t> payload(20, 0x2A);

    ::testing::internal::CaptureStdout();
    LOG_DEBUG("{:16xL16}", payload);
    std::string output = ::testing::internal::GetCapturedStdout();
    Logger::getInstance().setLevel(LogLevel::INFO);

    EXPECT_NE(output.find("[DEBUG]"), std::string::npos);
    EXPECT_NE(output.find("]\n0000: 2A 2A"), std::string::npos);
    EXPECT_NE(output.find("|****************|\n(4 bytes left)"), std::string::npos);
    EXPECT_EQ(output.find("0010:"), std::string::npos);
}
