#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - pipeline / detector 헤더를 include 하지 않는다.
// - 위협 레벨, 카테고리, 규칙 ID 는 호출자가 문자열로 변환해 채운다.
//
// [민감정보 취급 원칙]
// - 사용자 원문은 어떤 로그 타입에도 담지 않는다.
// - input_bytes 는 원문 길이(바이트)만 기록한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// DecisionLog
//   ALLOW 판정 로그.
//   threat_level       : 탐지 결과 레벨 ("SAFE" 포함). whitelisted 면 원래 레벨.
//   suspicious_encoding: 원문에 \xNN, %NN, &#NNN; 같은 인코딩 흔적이 있었는지
// ---------------------------------------------------------------------------
struct DecisionLog {
    std::string                           session_id{};
    std::uint64_t                         input_bytes{0};
    std::string                           threat_level{};
    bool                                  whitelisted{false};
    bool                                  truncated{false};
    bool                                  suspicious_encoding{false};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// BlockLog
//   BLOCK 판정 로그.
//   reason        : "rate_limit_exceeded" | "blacklist_match" | "threat_detected"
//   rule_ids      : 매칭된 규칙 ID (합성 encoding-bypass 매치 포함)
//   retry_after_ms: rate limit 차단일 때만 0 보다 크다
// ---------------------------------------------------------------------------
struct BlockLog {
    std::string                           session_id{};
    std::string                           reason{};
    std::string                           threat_level{};
    std::vector<std::string>              categories{};
    std::vector<std::string>              rule_ids{};
    std::int64_t                          retry_after_ms{0};
    bool                                  suspicious_encoding{false};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// SessionLog
//   세션 테이블 이벤트 로그.
//   event: "session_evicted" | "session_reset"
//   count: 이벤트로 영향받은 세션 수
// ---------------------------------------------------------------------------
struct SessionLog {
    std::string                           event{};
    std::string                           session_id{};  // session_reset 일 때만
    std::uint64_t                         count{0};
    std::chrono::system_clock::time_point timestamp{};
};
