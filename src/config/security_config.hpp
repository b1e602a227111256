#pragma once

// ---------------------------------------------------------------------------
// security_config.hpp
//
// 파이프라인 보안 설정과 정책 임계값 표.
//
// [정책 임계값 (inclusive)]
//   SecurityLevel | 차단 기준 (effective level >= threshold 이면 BLOCK)
//   LOW           | CRITICAL
//   MEDIUM        | MEDIUM
//   HIGH          | LOW
//
// [검증]
// validate_security_config() 는 SecurityPipeline::create/reload 에서 호출된다.
// 로더는 값을 읽기만 하고 검증하지 않는다 (모든 생성 경로가 동일한 검증을 거친다).
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class SecurityLevel : std::uint8_t {
    kLow    = 0,
    kMedium = 1,
    kHigh   = 2,
};

[[nodiscard]] std::string_view             to_string(SecurityLevel level) noexcept;
[[nodiscard]] std::optional<SecurityLevel> parse_security_level(std::string_view text);

// ---------------------------------------------------------------------------
// SecurityConfig
//   max_input_length : 정제 후 절단 기준 (코드포인트)
//   hard_input_cap   : 정제 전 원본 바이트 상한. 초과 시 ValidationError
//   정수 필드는 부호 있는 타입이다. 음수 설정값을 검증 단계에서 거부하기 위함.
// ---------------------------------------------------------------------------
struct SecurityConfig {
    SecurityLevel            level{SecurityLevel::kMedium};
    std::int64_t             max_input_length{2000};
    std::int64_t             hard_input_cap{65536};
    std::int64_t             rate_limit_per_minute{10};
    std::chrono::seconds     session_idle_ttl{600};
    bool                     enable_sanitization{true};
    bool                     enable_injection_detection{true};
    bool                     enable_content_moderation{true};
    std::vector<std::string> blacklist{};
    std::vector<std::string> whitelist{};
};

// ---------------------------------------------------------------------------
// validate_security_config
//   실패: ConfigError{kNonPositiveLimit | kMalformedListEntry}
//   목록 항목의 정규식 컴파일 검증은 ModerationPolicy::compile 이 수행한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<void, ConfigError>
validate_security_config(const SecurityConfig& config);

[[nodiscard]] constexpr ThreatLevel policy_threshold(SecurityLevel level) noexcept {
    switch (level) {
        case SecurityLevel::kLow:    return ThreatLevel::kCritical;
        case SecurityLevel::kMedium: return ThreatLevel::kMedium;
        case SecurityLevel::kHigh:   return ThreatLevel::kLow;
    }
    return ThreatLevel::kLow;  // 알 수 없는 값: 가장 엄격하게
}
