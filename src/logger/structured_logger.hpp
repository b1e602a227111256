#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 판정 로그는 한 줄 JSON 객체이며 필드명은 snake_case 로 통일한다.
// - 사용자 원문은 기록하지 않는다 (log_types.hpp 참조).
//
// [진단 로그와의 관계]
// 모듈 내부 진단 로그는 spdlog 기본 로거("component: msg")로 남긴다.
// 이 클래스는 판정/세션 이벤트 감사 로그 전용이다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/logger.h>

// 대소문자 무관. "debug" | "info" | "warn" | "warning" | "error"
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

// ---------------------------------------------------------------------------
// StructuredLogger
//   DecisionLog / BlockLog / SessionLog 를 JSON 포맷으로 기록한다.
//   sink: stderr + rotating file (100MB x 3)
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   실패 시 std::runtime_error (sink 생성 실패)
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // log_decision
    //   ALLOW 판정. info 레벨.
    void log_decision(const DecisionLog& entry);

    // log_block
    //   BLOCK 판정. warn 레벨.
    void log_block(const BlockLog& entry);

    // log_session
    //   세션 만료/리셋. info 레벨.
    void log_session(const SessionLog& entry);

    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    [[nodiscard]] LogLevel min_level() const noexcept { return min_level_; }

    void flush();

private:
    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
