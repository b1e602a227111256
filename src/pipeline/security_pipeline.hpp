#pragma once

// ---------------------------------------------------------------------------
// security_pipeline.hpp
//
// 입력 보안 파이프라인: 검증 → rate limit → 정제 → blacklist → 탐지 →
// whitelist → 정책 판정.
//
// [fail-close 원칙]
// 1. 설정 검증 실패 → create()/reload() 가 ConfigError 반환 (파이프라인 미생성/기존 유지)
// 2. 알 수 없는 보안 레벨 → ConfigError. 기본값으로 대체하지 않는다.
// 3. 탐지 비활성화는 enable_injection_detection = false 명시 설정으로만 가능
// 4. 판정이 BLOCK 이면 sanitized_text 를 채우지 않는다
//
// [판정 순서]
//   0. 입력 검증 (ValidationError: 빈 입력, hard cap 초과, UTF-8 오류, 빈 세션 ID)
//   1. rate limit          (enable_content_moderation 일 때만)
//   2. 정제                (enable_sanitization == false 면 원문 통과)
//   3. blacklist           (항상)
//   4. 탐지 + whitelist    (enable_injection_detection 일 때만)
//   5. effective level >= policy_threshold(level) → BLOCK
//
// [Hot Reload]
// config 와 탐지기는 하나의 Snapshot 으로 묶어 atomic<shared_ptr> 로 교체한다.
// 진행 중인 process() 는 시작 시점의 Snapshot 으로 완료된다.
// moderator 정책은 Snapshot 교체 직후 별도로 교체되므로, 그 사이에 시작된
// process() 는 새 config 와 이전 blacklist/한도를 볼 수 있다.
// 세션 테이블(rate limit 기록)은 reload 에서 유지된다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "config/security_config.hpp"
#include "detector/injection_detector.hpp"
#include "detector/rule_set.hpp"
#include "moderator/content_moderator.hpp"
#include "stats/stats_collector.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

enum class PipelineAction : std::uint8_t {
    kAllow = 0,
    kBlock = 1,  // 기본값 (fail-close)
};

[[nodiscard]] std::string_view to_string(PipelineAction action) noexcept;

// 판정 사유 코드. 클라이언트에는 이 코드만 노출한다.
inline constexpr std::string_view kReasonAllowed           = "allowed";
inline constexpr std::string_view kReasonRateLimitExceeded = "rate_limit_exceeded";
inline constexpr std::string_view kReasonBlacklistMatch    = "blacklist_match";
inline constexpr std::string_view kReasonThreatDetected    = "threat_detected";

// ---------------------------------------------------------------------------
// PipelineResult
//   sanitized_text: ALLOW 일 때만 존재
//   detection     : 탐지를 수행했으면 존재 (whitelist 로 SAFE 처리된 경우도 원본 보존)
//   retry_after   : rate limit 차단일 때만 존재
// ---------------------------------------------------------------------------
struct PipelineResult {
    PipelineAction                           action{PipelineAction::kBlock};
    std::optional<std::string>               sanitized_text{};
    std::string                              reason{};
    std::optional<DetectionResult>           detection{};
    std::optional<std::chrono::milliseconds> retry_after{};
    bool                                     whitelisted{false};
    bool                                     truncated{false};

    [[nodiscard]] bool allowed() const noexcept { return action == PipelineAction::kAllow; }
};

class SecurityPipeline {
public:
    // create
    //   config 검증 + 정책 compile 후 파이프라인을 생성한다.
    //   rules 가 nullptr 이면 kEmptyRuleSet.
    [[nodiscard]] static std::expected<std::unique_ptr<SecurityPipeline>, ConfigError>
    create(SecurityConfig config, std::shared_ptr<const RuleSet> rules = RuleSet::defaults());

    ~SecurityPipeline();

    SecurityPipeline(const SecurityPipeline&)            = delete;
    SecurityPipeline& operator=(const SecurityPipeline&) = delete;

    // process
    //   BLOCK 은 오류가 아니라 정상 결과다. ValidationError 는 입력 자체가
    //   판정 대상이 될 수 없는 경우에만 반환된다.
    [[nodiscard]] std::expected<PipelineResult, ValidationError>
    process(std::string_view raw, std::string_view session_id);

    // 시각 주입 버전 (테스트/재생용)
    [[nodiscard]] std::expected<PipelineResult, ValidationError>
    process(std::string_view raw, std::string_view session_id, TimePoint now);

    // reload
    //   rules 가 std::nullopt 이면 현재 RuleSet 유지.
    //   실패 시 기존 설정/규칙/정책 유지.
    [[nodiscard]] std::expected<void, ConfigError>
    reload(SecurityConfig                                config,
           std::optional<std::shared_ptr<const RuleSet>> rules = std::nullopt);

    [[nodiscard]] StatsSnapshot                  stats() const;
    [[nodiscard]] SecurityConfig                 config() const;
    [[nodiscard]] std::shared_ptr<const RuleSet> rules() const;

    // SessionSweeper / 세션 조회용
    [[nodiscard]] const std::shared_ptr<ContentModerator>& moderator() const noexcept {
        return moderator_;
    }

private:
    struct Snapshot {
        SecurityConfig                                 config;
        std::shared_ptr<const PromptInjectionDetector> detector;
    };

    SecurityPipeline(std::shared_ptr<const Snapshot> snapshot,
                     std::shared_ptr<ContentModerator> moderator);

    [[nodiscard]] std::expected<PipelineResult, ValidationError>
    reject(ValidationErrorCode code, std::string message, std::string context);

    std::atomic<std::shared_ptr<const Snapshot>> snapshot_;
    std::shared_ptr<ContentModerator>            moderator_;
    StatsCollector                               stats_;
};
