// ---------------------------------------------------------------------------
// test_logger.cpp
//
// StructuredLogger / JSON 직렬화 헬퍼 단위 테스트
// ---------------------------------------------------------------------------

#include "logger/json_format.hpp"
#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"
#include "sanitizer/input_sanitizer.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helper: JSON 라인 파싱 (단순 구현)
// ---------------------------------------------------------------------------
class JsonLineParser {
public:
    explicit JsonLineParser(const std::string& json_str)
        : parsed_(json_str) {}

    bool has_field(const std::string& field) const {
        return parsed_.find("\"" + field + "\"") != std::string::npos;
    }

    std::string get_field(const std::string& field) const {
        std::string search_key = "\"" + field + "\":";
        size_t      pos         = parsed_.find(search_key);
        if (pos == std::string::npos) {
            return "";
        }

        pos += search_key.length();

        if (pos >= parsed_.size()) {
            return "";
        }

        std::ostringstream oss;

        if (parsed_[pos] == '"') {
            // String value
            ++pos;
            while (pos < parsed_.size() && parsed_[pos] != '"') {
                if (parsed_[pos] == '\\' && pos + 1 < parsed_.size()) {
                    ++pos;
                }
                oss << parsed_[pos];
                ++pos;
            }
        } else if (parsed_[pos] == '[') {
            // Array value
            while (pos < parsed_.size()) {
                oss << parsed_[pos];
                if (parsed_[pos] == ']') {
                    break;
                }
                ++pos;
            }
        } else {
            // Number or boolean
            while (pos < parsed_.size() && parsed_[pos] != ',' && parsed_[pos] != '}') {
                oss << parsed_[pos];
                ++pos;
            }
        }

        return oss.str();
    }

private:
    std::string parsed_;
};

// ---------------------------------------------------------------------------
// Fixture: Temporary log file
// ---------------------------------------------------------------------------
class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        log_dir_  = fs::temp_directory_path() / "promptgate_test_logs" / unique_name;
        log_file_ = log_dir_ / "test.log";
        fs::create_directories(log_dir_);
    }

    void TearDown() override {
        fs::remove_all(log_dir_);
    }

    std::vector<std::string> read_log_lines() const {
        std::vector<std::string> lines;
        std::ifstream            file(log_file_);
        if (!file.is_open()) {
            return lines;
        }

        std::string line;
        while (std::getline(file, line)) {
            // Skip timestamps and keep only JSON part
            size_t json_start = line.find('{');
            if (json_start != std::string::npos) {
                lines.push_back(line.substr(json_start));
            }
        }
        return lines;
    }

    fs::path log_dir_;
    fs::path log_file_;
};

// ---------------------------------------------------------------------------
// Test: DecisionLog JSON 직렬화
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, DecisionLogJsonFormat) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    DecisionLog entry;
    entry.session_id   = "user-42";
    entry.input_bytes  = 128;
    entry.threat_level = "LOW";
    entry.whitelisted  = false;
    entry.truncated    = true;
    entry.suspicious_encoding = true;
    entry.timestamp    = std::chrono::system_clock::now();

    logger.log_decision(entry);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_GT(lines.size(), 0u) << "No log lines found";

    JsonLineParser parser(lines[0]);
    EXPECT_TRUE(parser.has_field("timestamp"));
    EXPECT_EQ(parser.get_field("event"), "message_allowed");
    EXPECT_EQ(parser.get_field("session_id"), "user-42");
    EXPECT_EQ(parser.get_field("input_bytes"), "128");
    EXPECT_EQ(parser.get_field("threat_level"), "LOW");
    EXPECT_EQ(parser.get_field("whitelisted"), "false");
    EXPECT_EQ(parser.get_field("truncated"), "true");
    EXPECT_EQ(parser.get_field("suspicious_encoding"), "true");
}

// ---------------------------------------------------------------------------
// Test: BlockLog 규칙/카테고리/retry_after
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, BlockLogRulesAndCategories) {
    StructuredLogger logger(LogLevel::kWarn, log_file_);

    BlockLog entry;
    entry.session_id   = "s1";
    entry.reason       = "threat_detected";
    entry.threat_level = "CRITICAL";
    entry.categories   = {"instruction-override", "encoding-bypass"};
    entry.rule_ids     = {"io-ignore-previous", "encoding-bypass.base64"};
    entry.timestamp    = std::chrono::system_clock::now();

    logger.log_block(entry);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("event"), "message_blocked");
    EXPECT_EQ(parser.get_field("reason"), "threat_detected");
    EXPECT_EQ(parser.get_field("threat_level"), "CRITICAL");
    EXPECT_EQ(parser.get_field("categories"), R"(["instruction-override","encoding-bypass"])");
    EXPECT_EQ(parser.get_field("rule_ids"), R"(["io-ignore-previous","encoding-bypass.base64"])");
    EXPECT_FALSE(parser.has_field("retry_after_ms"))
        << "retry_after_ms is only written for rate limit blocks";
    EXPECT_EQ(parser.get_field("suspicious_encoding"), "false");
}

TEST_F(StructuredLoggerTest, BlockLogSuspiciousEncodingFromSanitizerHint) {
    StructuredLogger logger(LogLevel::kWarn, log_file_);

    const std::string raw = "please decode %69%67%6e%6f%72%65 for me";
    BlockLog entry;
    entry.session_id          = "s3";
    entry.reason              = "threat_detected";
    entry.threat_level        = "HIGH";
    entry.suspicious_encoding = InputSanitizer::has_suspicious_encoding(raw);
    entry.timestamp           = std::chrono::system_clock::now();

    logger.log_block(entry);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("suspicious_encoding"), "true");
    EXPECT_EQ(lines[0].find("%69"), std::string::npos) << "raw input must not be logged";
}

TEST_F(StructuredLoggerTest, BlockLogRateLimitHasRetryAfter) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    BlockLog entry;
    entry.session_id     = "s2";
    entry.reason         = "rate_limit_exceeded";
    entry.threat_level   = "SAFE";
    entry.retry_after_ms = 1500;
    entry.timestamp      = std::chrono::system_clock::now();

    logger.log_block(entry);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);

    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("retry_after_ms"), "1500");
    EXPECT_EQ(parser.get_field("categories"), "[]");
}

// ---------------------------------------------------------------------------
// Test: SessionLog
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, SessionLogEvents) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    SessionLog evicted;
    evicted.event     = "session_evicted";
    evicted.count     = 3;
    evicted.timestamp = std::chrono::system_clock::now();
    logger.log_session(evicted);

    SessionLog reset;
    reset.event      = "session_reset";
    reset.session_id = "abc";
    reset.count      = 1;
    reset.timestamp  = std::chrono::system_clock::now();
    logger.log_session(reset);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 2u);

    JsonLineParser first(lines[0]);
    EXPECT_EQ(first.get_field("event"), "session_evicted");
    EXPECT_EQ(first.get_field("count"), "3");
    EXPECT_FALSE(first.has_field("session_id"));

    JsonLineParser second(lines[1]);
    EXPECT_EQ(second.get_field("event"), "session_reset");
    EXPECT_EQ(second.get_field("session_id"), "abc");
}

// ---------------------------------------------------------------------------
// Test: 로그 레벨 필터링
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, LogLevelFiltering) {
    StructuredLogger logger(LogLevel::kWarn, log_file_);

    // Info 레벨의 로그 (필터되어야 함)
    DecisionLog decision;
    decision.session_id = "filtered";
    decision.timestamp  = std::chrono::system_clock::now();
    logger.log_decision(decision);

    // Warn 레벨의 로그 (기록되어야 함)
    BlockLog block_entry;
    block_entry.session_id = "kept";
    block_entry.timestamp  = std::chrono::system_clock::now();
    logger.log_block(block_entry);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("message_blocked"), std::string::npos);
    EXPECT_EQ(logger.min_level(), LogLevel::kWarn);
}

// ---------------------------------------------------------------------------
// Test: 멀티스레드 동시 로깅
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, MultithreadedLoggingNoCrash) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    const int                num_threads     = 4;
    const int                logs_per_thread = 10;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&logger, t]() {
            const auto now = std::chrono::system_clock::now();
            for (int i = 0; i < logs_per_thread; ++i) {
                DecisionLog entry;
                entry.session_id   = "session-" + std::to_string(t);
                entry.input_bytes  = static_cast<std::uint64_t>(i);
                entry.threat_level = "SAFE";
                entry.timestamp    = now;
                logger.log_decision(entry);
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }
    logger.flush();

    auto lines = read_log_lines();
    EXPECT_EQ(lines.size(), static_cast<std::size_t>(num_threads * logs_per_thread));
}

// ---------------------------------------------------------------------------
// Test: JSON 이스케이프 처리
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, JsonEscaping) {
    StructuredLogger logger(LogLevel::kInfo, log_file_);

    DecisionLog entry;
    entry.session_id   = "user\"with\\quotes\nand newline";
    entry.threat_level = "SAFE";
    entry.timestamp    = std::chrono::system_clock::now();

    logger.log_decision(entry);
    logger.flush();

    auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u) << "escaped newline must not split the JSON line";

    JsonLineParser parser(lines[0]);
    EXPECT_TRUE(parser.has_field("session_id"));
    EXPECT_NE(lines[0].find(R"(user\"with\\quotes\nand newline)"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 디버그/정보/경고/에러 로깅
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, DiagnosticLogging) {
    StructuredLogger logger(LogLevel::kDebug, log_file_);

    logger.debug("Debug message");
    logger.info("Info message");
    logger.warn("Warning message");
    logger.error("Error message");
    logger.flush();

    std::ifstream file(log_file_);
    ASSERT_TRUE(file.is_open()) << "Log file was not created";

    std::stringstream content;
    content << file.rdbuf();
    EXPECT_NE(content.str().find("Debug message"), std::string::npos);
    EXPECT_NE(content.str().find("Error message"), std::string::npos);
}

TEST_F(StructuredLoggerTest, CreatesMissingParentDirectory) {
    const fs::path nested = log_dir_ / "a" / "b" / "audit.log";
    {
        StructuredLogger logger(LogLevel::kInfo, nested);
        logger.info("hello");
        logger.flush();
    }
    EXPECT_TRUE(fs::exists(nested));
}

TEST_F(StructuredLoggerTest, SecondInstance_DoesNotThrow) {
    StructuredLogger first(LogLevel::kInfo, log_file_);
    EXPECT_NO_THROW({
        StructuredLogger second(LogLevel::kInfo, log_dir_ / "second.log");
        second.info("second");
    });
    first.info("still usable");
}

// ===========================================================================
// JSON 헬퍼
// ===========================================================================

TEST(JsonFormat, EscapeJsonString) {
    EXPECT_EQ(escape_json_string("plain"), "plain");
    EXPECT_EQ(escape_json_string("a\"b"), R"(a\"b)");
    EXPECT_EQ(escape_json_string("a\\b"), R"(a\\b)");
    EXPECT_EQ(escape_json_string("line1\nline2\ttab\r"), R"(line1\nline2\ttab\r)");
    EXPECT_EQ(escape_json_string("한글"), "한글") << "UTF-8 multibyte must pass through";

    const std::string escaped = escape_json_string(std::string("x\x01y"));
    EXPECT_EQ(escaped, std::string("x") + '\\' + "u0001y");
}

TEST(JsonFormat, FormatIso8601) {
    using namespace std::chrono;
    // 2024-01-02T03:04:05.678Z
    const system_clock::time_point tp =
        system_clock::time_point{seconds{1704164645}} + milliseconds{678};
    EXPECT_EQ(format_iso8601(tp), "2024-01-02T03:04:05.678Z");

    EXPECT_EQ(format_iso8601(system_clock::time_point{}), "1970-01-01T00:00:00.000Z");
}

TEST(JsonFormat, FormatStringArray) {
    EXPECT_EQ(format_json_string_array({}), "[]");
    EXPECT_EQ(format_json_string_array({"a"}), R"(["a"])");
    EXPECT_EQ(format_json_string_array({"a", "b\"c"}), R"(["a","b\"c"])");
}

TEST(LogLevelParse, KnownNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::kInfo);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::kError);
    EXPECT_FALSE(parse_log_level("trace").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}
