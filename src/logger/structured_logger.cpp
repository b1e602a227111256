// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
//
// stdout 은 CLI 판정 출력 전용이므로 콘솔 sink 는 stderr 로 보낸다.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include "logger/json_format.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kLoggerName = "promptgate";

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
spdlog::level::level_enum StructuredLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug:
            return spdlog::level::debug;
        case LogLevel::kInfo:
            return spdlog::level::info;
        case LogLevel::kWarn:
            return spdlog::level::warn;
        case LogLevel::kError:
            return spdlog::level::err;
        default:
            return spdlog::level::info;
    }
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 각 메서드에서 JSON으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::warn);

        if (!spdlog::get(kLoggerName)) {
            spdlog::register_logger(logger_);
        }

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
        if (spdlog::get(kLoggerName) == logger_) {
            spdlog::drop(kLoggerName);
        }
    }
}

// ---------------------------------------------------------------------------
// log_decision: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_decision(const DecisionLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kInfo) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"message_allowed","session_id":")" << escape_json_string(entry.session_id)
         << R"(","input_bytes":)" << entry.input_bytes
         << R"(,"threat_level":")" << escape_json_string(entry.threat_level)
         << R"(","whitelisted":)" << (entry.whitelisted ? "true" : "false")
         << R"(,"truncated":)" << (entry.truncated ? "true" : "false")
         << R"(,"suspicious_encoding":)" << (entry.suspicious_encoding ? "true" : "false")
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_block: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_block(const BlockLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kWarn) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"message_blocked","session_id":")" << escape_json_string(entry.session_id)
         << R"(","reason":")" << escape_json_string(entry.reason)
         << R"(","threat_level":")" << escape_json_string(entry.threat_level)
         << R"(","categories":)" << format_json_string_array(entry.categories)
         << R"(,"rule_ids":)" << format_json_string_array(entry.rule_ids);
    if (entry.retry_after_ms > 0) {
        json << R"(,"retry_after_ms":)" << entry.retry_after_ms;
    }
    json << R"(,"suspicious_encoding":)" << (entry.suspicious_encoding ? "true" : "false");
    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->warn(json.str());
}

// ---------------------------------------------------------------------------
// log_session: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_session(const SessionLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kInfo) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":")" << escape_json_string(entry.event) << '"';
    if (!entry.session_id.empty()) {
        json << R"(,"session_id":")" << escape_json_string(entry.session_id) << '"';
    }
    json << R"(,"count":)" << entry.count
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->info(json.str());
}

void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
