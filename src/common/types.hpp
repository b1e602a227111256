#pragma once

// ---------------------------------------------------------------------------
// types.hpp
//
// promptgate 전 모듈이 공유하는 기본 타입 정의.
//
// [순환 의존성 방지]
// - 이 헤더는 프로젝트 내 다른 헤더를 include 하지 않는다.
// - sanitizer / detector / moderator / pipeline 모두 이 헤더만 공유한다.
//
// [오류 표현 원칙]
// - 예상 가능한 실패는 예외가 아닌 std::expected<T, XxxError> 로 반환한다.
// - 오류 구조체는 {code, message, context} 3필드로 통일한다.
//   context 에는 로그용 입력 단편만 담고, 사용자 원문 전체를 담지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// Clock
//   rate limit / idle TTL 계산용 단조 시계.
//   벽시계(system_clock) 변경에 영향받지 않도록 steady_clock 을 사용한다.
// ---------------------------------------------------------------------------
using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// ---------------------------------------------------------------------------
// ThreatLevel
//   탐지된 위협의 심각도. 숫자 값 순서가 곧 심각도 순서다.
//   SAFE < LOW < MEDIUM < HIGH < CRITICAL
//   scoped enum 의 내장 비교 연산자를 그대로 사용한다.
// ---------------------------------------------------------------------------
enum class ThreatLevel : std::uint8_t {
    kSafe     = 0,
    kLow      = 1,
    kMedium   = 2,
    kHigh     = 3,
    kCritical = 4,
};

// ---------------------------------------------------------------------------
// ThreatCategory
//   규칙이 탐지하는 공격 분류.
// ---------------------------------------------------------------------------
enum class ThreatCategory : std::uint8_t {
    kInstructionOverride = 0,  // 이전 지시 무시/덮어쓰기
    kRoleManipulation    = 1,  // 역할 변경, jailbreak
    kCommandInjection    = 2,  // 명령 실행 유도, 구분자 공격
    kPromptLeak          = 3,  // 시스템 프롬프트 추출
    kEncodingBypass      = 4,  // 인코딩으로 숨긴 페이로드
};

[[nodiscard]] std::string_view to_string(ThreatLevel level) noexcept;
[[nodiscard]] std::string_view to_string(ThreatCategory category) noexcept;

// 대소문자 무관. 알 수 없는 문자열이면 std::nullopt (호출자가 fail-close 처리).
[[nodiscard]] std::optional<ThreatLevel>    parse_threat_level(std::string_view text);
[[nodiscard]] std::optional<ThreatCategory> parse_threat_category(std::string_view text);

// ---------------------------------------------------------------------------
// ConfigErrorCode / ConfigError
//   설정 생성·검증·로드 단계의 오류. 생성 시점에만 발생하며
//   메시지 처리 경로에서는 절대 반환되지 않는다.
// ---------------------------------------------------------------------------
enum class ConfigErrorCode : std::uint8_t {
    kInvalidLevel       = 0,  // LOW/MEDIUM/HIGH 이외의 보안 레벨
    kNonPositiveLimit   = 1,  // 0 이하 한도 값
    kMalformedListEntry = 2,  // 빈 항목, 잘못된 re: 정규식
    kInvalidRule        = 3,  // 규칙 id/패턴/카테고리/레벨 오류
    kEmptyRuleSet       = 4,  // 규칙이 하나도 없음
    kFileNotFound       = 5,  // 설정 파일 없음
    kParseFailure       = 6,  // YAML 파싱 실패
};

struct ConfigError {
    ConfigErrorCode code{ConfigErrorCode::kParseFailure};
    std::string     message{};  // 사람이 읽을 수 있는 오류 설명
    std::string     context{};  // 문제가 된 필드명/값 (로깅용)
};

// ---------------------------------------------------------------------------
// ValidationErrorCode / ValidationError
//   메시지 단위 입력 검증 오류. 복구 가능하며 호출자는 사용자에게
//   재입력을 요청하면 된다. BLOCK 판정과는 구분된다.
// ---------------------------------------------------------------------------
enum class ValidationErrorCode : std::uint8_t {
    kEmptyInput      = 0,  // 빈 입력 또는 정제 후 빈 문자열
    kInputTooLarge   = 1,  // hard cap 초과 (정제 전 바이트 길이 기준)
    kInvalidEncoding = 2,  // UTF-8 형식 오류
    kEmptySessionId  = 3,  // 세션 ID 누락
};

struct ValidationError {
    ValidationErrorCode code{ValidationErrorCode::kEmptyInput};
    std::string         message{};
    std::string         context{};
};

[[nodiscard]] std::string_view to_string(ValidationErrorCode code) noexcept;
