#include <gtest/gtest.h>
#include "event_logger.hpp"

using namespace parley;

TEST(EventLoggerTest, Sanitization) {
    EXPECT_EQ(EventLogger::sanitize_log_message("plain text"), "plain text");
    EXPECT_EQ(EventLogger::sanitize_log_message("quote\" and \nnewline"), "quote  and  newline");
    EXPECT_EQ(EventLogger::sanitize_log_message(std::string("bell\x07") + "\\end"), "bell end");
}

TEST(EventLoggerTest, FormatLine) {
    std::string line = EventLogger::format_line(EventLogger::Level::WARNING,
                                                EventLogger::EventType::PROTOCOL_VIOLATION,
                                                "internal", "bad \"frame\"");
    EXPECT_NE(line.find("[WARN]"), std::string::npos);
    EXPECT_NE(line.find("[PROTOCOL]"), std::string::npos);
    EXPECT_NE(line.find("peer=internal"), std::string::npos);
    EXPECT_NE(line.find("msg=\"bad  frame \""), std::string::npos);
    EXPECT_EQ(line.find('\n'), std::string::npos);

    std::string bare = EventLogger::format_line(EventLogger::Level::INFO,
                                                EventLogger::EventType::LIFECYCLE, "store", "");
    EXPECT_EQ(bare.find("msg="), std::string::npos);
}

TEST(EventLoggerTest, ParseLevel) {
    EventLogger::Level level = EventLogger::Level::INFO;
    EXPECT_TRUE(EventLogger::parse_level("DEBUG", level));
    EXPECT_EQ(level, EventLogger::Level::TRACE);
    EXPECT_TRUE(EventLogger::parse_level("warn", level));
    EXPECT_EQ(level, EventLogger::Level::WARNING);
    EXPECT_TRUE(EventLogger::parse_level("Critical", level));
    EXPECT_EQ(level, EventLogger::Level::CRITICAL);
    EXPECT_FALSE(EventLogger::parse_level("verbose", level));
    EXPECT_EQ(level, EventLogger::Level::CRITICAL);
}

TEST(EventLoggerTest, Names) {
    EXPECT_EQ(EventLogger::level_to_string(EventLogger::Level::ERROR), "ERROR");
    EXPECT_EQ(EventLogger::event_to_string(EventLogger::EventType::CONNECTION_REJECTED), "CONN_REJECTED");
    EXPECT_EQ(EventLogger::event_to_string(EventLogger::EventType::AUTH_FAILURE), "AUTH_FAILURE");
}

TEST(EventLoggerTest, MinimumLevel) {
    auto previous = EventLogger::min_level();
    EventLogger::set_min_level(EventLogger::Level::ERROR);
    EXPECT_EQ(EventLogger::min_level(), EventLogger::Level::ERROR);

    // Below the threshold: dropped without output.
    testing::internal::CaptureStdout();
    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE, "internal", "hidden");
    EXPECT_TRUE(testing::internal::GetCapturedStdout().empty());

    testing::internal::CaptureStderr();
    EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORE_FAILURE, "10.0.0.1", "shown");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("shown"), std::string::npos);
    EXPECT_EQ(err.find("10.0.0.1"), std::string::npos);
    EXPECT_NE(err.find("peer=anon_"), std::string::npos);

    EventLogger::set_min_level(previous);
}
