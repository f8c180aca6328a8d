#include <gtest/gtest.h>
#include "event_logger.hpp"
#include <regex>
#include <string>

using namespace llmgate;

TEST(EventLoggerTest, LineFormat) {
    std::string line = EventLogger::format(EventLogger::Level::WARNING, EventLogger::EventType::RATE_LIMITED,
                                           "governor", "reason=requests retry_after_ms=100");
    std::regex pattern(R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} UTC\] \[WARN\] \[RATE_LIMIT\] ctx=governor msg="reason=requests retry_after_ms=100"$)");
    EXPECT_TRUE(std::regex_match(line, pattern)) << line;
}

TEST(EventLoggerTest, EmptyContextAndMessage) {
    std::string line = EventLogger::format(EventLogger::Level::INFO, EventLogger::EventType::SKIPPED, "");
    EXPECT_NE(line.find("[INFO] [SKIPPED] ctx=-"), std::string::npos) << line;
    EXPECT_EQ(line.find("msg="), std::string::npos);
}

TEST(EventLoggerTest, Sanitization) {
    EXPECT_EQ(EventLogger::sanitize_log_message("Malicious \" quote and \n newline"),
              "Malicious   quote and   newline");
    EXPECT_EQ(EventLogger::sanitize_log_message(std::string("bell\x07") + "\\"), "bell ");
}

TEST(EventLoggerTest, ContextIsSanitized) {
    std::string line = EventLogger::format(EventLogger::Level::ERROR, EventLogger::EventType::STORAGE_FAILURE,
                                           "http://example.org/e\n[INFO] forged", "boom");
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_NE(line.find("[ERROR] [STORAGE]"), std::string::npos);
}

TEST(EventLoggerTest, LogDoesNotThrow) {
    EXPECT_NO_THROW(EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::AUTO_LINKED,
                                     "http://example.org/e1", "best=Q42"));
    EXPECT_NO_THROW(EventLogger::log(EventLogger::Level::CRITICAL, EventLogger::EventType::CONFIG,
                                     "llmgate", "critical path"));
}
