/**
 * @file utils_tests.cpp
 * @brief Unit tests for string, time, hashing and id helpers
 */

#include <gtest/gtest.h>
#include <agentmem/core/utils.hpp>
#include <agentmem/core/logger.hpp>
#include <set>
#include <string>
#include <vector>

using namespace agentmem;

TEST(UtilsTest, Trim) {
    EXPECT_EQ(trim("  hello \t\n"), "hello");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(UtilsTest, CaseConversion) {
    EXPECT_EQ(to_lower("MiXeD"), "mixed");
    EXPECT_EQ(to_upper("sync.interval"), "SYNC.INTERVAL");
}

TEST(UtilsTest, Join) {
    std::vector<std::string> parts;
    EXPECT_EQ(join(parts, ", "), "");
    parts.push_back("a");
    parts.push_back("b");
    parts.push_back("c");
    EXPECT_EQ(join(parts, ", "), "a, b, c");
}

TEST(UtilsTest, Clamp) {
    EXPECT_EQ(clamp(15, 1, 10), 10);
    EXPECT_EQ(clamp(-2, 1, 10), 1);
    EXPECT_DOUBLE_EQ(clamp(0.5, 0.0, 1.0), 0.5);
}

TEST(UtilsTest, Sha256KnownVectors) {
    EXPECT_EQ(sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(UtilsTest, UuidFormatAndUniqueness) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string id = generate_uuid();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[14], '4');
        EXPECT_TRUE(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(UtilsTest, TimestampsAdvance) {
    int64_t before = current_timestamp_ms();
    sleep_ms(5);
    int64_t after = current_timestamp_ms();
    EXPECT_GE(after - before, 5);
}

TEST(UtilsTest, FormatTimestamp) {
    EXPECT_EQ(format_timestamp_ms(0), "never");
    EXPECT_EQ(format_timestamp_ms(1000123), "1970-01-01T00:16:40.123Z");
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level(" warning "), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("chatty", LogLevel::WARN), LogLevel::WARN);
}

TEST(LoggerTest, LevelIsAdjustable) {
    Logger& log = Logger::instance();
    LogLevel original = log.level();
    log.set_level(LogLevel::ERROR);
    EXPECT_EQ(log.level(), LogLevel::ERROR);
    LOG_INFO("suppressed %d", 1);
    log.set_level(original);
    EXPECT_STREQ(log_level_name(LogLevel::WARN), "WARN");
}
