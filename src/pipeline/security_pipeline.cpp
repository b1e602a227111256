// ---------------------------------------------------------------------------
// security_pipeline.cpp
//
// [로그 원칙]
// 사용자 원문은 로그에 남기지 않는다. 세션 ID, 바이트 길이, 위협 레벨,
// 규칙 ID 만 기록한다.
//
// [whitelist]
// whitelist 매칭은 탐지 결과를 SAFE 로 덮어쓸 뿐 blacklist 를 무시하지 않는다.
// blacklist 는 3단계에서 이미 판정을 끝낸다.
// ---------------------------------------------------------------------------

#include "pipeline/security_pipeline.hpp"

#include "common/text_utils.hpp"
#include "sanitizer/input_sanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] ModerationRules to_moderation_rules(const SecurityConfig& config) {
    ModerationRules rules{};
    rules.rate_limit_per_minute = static_cast<std::uint32_t>(config.rate_limit_per_minute);
    rules.window                = std::chrono::seconds{60};
    rules.session_idle_ttl      = config.session_idle_ttl;
    rules.blacklist             = config.blacklist;
    rules.whitelist             = config.whitelist;
    return rules;
}

[[nodiscard]] bool is_blank(std::string_view text) noexcept {
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

[[nodiscard]] std::string rule_ids(const DetectionResult& detection) {
    std::string ids;
    for (const auto& m : detection.matches) {
        if (!ids.empty()) {
            ids += ',';
        }
        ids += m.rule_id;
    }
    return ids;
}

void warn_if_insecure(const SecurityConfig& config) {
    if (!config.enable_sanitization) {
        spdlog::warn("security_pipeline: sanitization disabled, raw input is passed to the "
                     "detector and returned unchanged (insecure mode)");
    }
    if (!config.enable_content_moderation) {
        spdlog::warn("security_pipeline: rate limiting disabled by configuration");
    }
}

}  // namespace

std::string_view to_string(PipelineAction action) noexcept {
    switch (action) {
        case PipelineAction::kAllow: return "ALLOW";
        case PipelineAction::kBlock: return "BLOCK";
        default:                     return "BLOCK";
    }
}

// ---------------------------------------------------------------------------
// create
// ---------------------------------------------------------------------------
std::expected<std::unique_ptr<SecurityPipeline>, ConfigError>
SecurityPipeline::create(SecurityConfig config, std::shared_ptr<const RuleSet> rules) {
    if (auto valid = validate_security_config(config); !valid) {
        spdlog::error("security_pipeline: invalid config: {} ({})", valid.error().message,
                      valid.error().context);
        return std::unexpected(valid.error());
    }
    if (!rules) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kEmptyRuleSet, "rule set is required", "rules"});
    }

    auto policy = ModerationPolicy::compile(to_moderation_rules(config));
    if (!policy) {
        spdlog::error("security_pipeline: invalid moderation rules: {} ({})",
                      policy.error().message, policy.error().context);
        return std::unexpected(policy.error());
    }

    warn_if_insecure(config);
    spdlog::info("security_pipeline: created, level={} threshold={} rules={}",
                 to_string(config.level), to_string(policy_threshold(config.level)),
                 rules->size());

    auto detector  = std::make_shared<const PromptInjectionDetector>(std::move(rules));
    auto snapshot  = std::make_shared<const Snapshot>(Snapshot{std::move(config), std::move(detector)});
    auto moderator = std::make_shared<ContentModerator>(std::move(*policy));

    return std::unique_ptr<SecurityPipeline>(
        new SecurityPipeline(std::move(snapshot), std::move(moderator)));
}

SecurityPipeline::SecurityPipeline(std::shared_ptr<const Snapshot> snapshot,
                                   std::shared_ptr<ContentModerator> moderator)
    : snapshot_(std::move(snapshot))
    , moderator_(std::move(moderator))
{}

SecurityPipeline::~SecurityPipeline() = default;

// ---------------------------------------------------------------------------
// process
// ---------------------------------------------------------------------------
std::expected<PipelineResult, ValidationError>
SecurityPipeline::process(std::string_view raw, std::string_view session_id) {
    return process(raw, session_id, Clock::now());
}

std::expected<PipelineResult, ValidationError>
SecurityPipeline::process(std::string_view raw, std::string_view session_id, TimePoint now) {
    const auto            snap = snapshot_.load();
    const SecurityConfig& cfg  = snap->config;

    // ── 0. 입력 검증 ───────────────────────────────────────────────────
    if (raw.empty() || is_blank(raw)) {
        return reject(ValidationErrorCode::kEmptyInput, "input is empty", "");
    }
    if (raw.size() > static_cast<std::size_t>(cfg.hard_input_cap)) {
        return reject(ValidationErrorCode::kInputTooLarge, "input exceeds hard size cap",
                      std::to_string(raw.size()) + " > " + std::to_string(cfg.hard_input_cap));
    }
    if (!is_valid_utf8(raw)) {
        return reject(ValidationErrorCode::kInvalidEncoding, "input is not well-formed UTF-8", "");
    }
    if (session_id.empty()) {
        return reject(ValidationErrorCode::kEmptySessionId, "session id is required", "");
    }

    PipelineResult result{};

    // ── 1. rate limit ──────────────────────────────────────────────────
    if (cfg.enable_content_moderation) {
        const auto decision = moderator_->check_rate_limit(session_id, now);
        if (!decision.allowed) {
            result.reason      = std::string(kReasonRateLimitExceeded);
            result.retry_after = decision.retry_after;
            stats_.on_blocked(BlockKind::kRateLimited);
            return result;
        }
    }

    // ── 2. 정제 ────────────────────────────────────────────────────────
    std::string text;
    if (cfg.enable_sanitization) {
        auto sanitized = InputSanitizer::sanitize(raw, static_cast<std::size_t>(cfg.max_input_length));
        if (!sanitized) {
            spdlog::error("security_pipeline: sanitizer failed for session '{}': {}",
                          session_id, sanitized.error().message);
            return reject(ValidationErrorCode::kInvalidEncoding, sanitized.error().message,
                          sanitized.error().context);
        }
        text             = std::move(sanitized->cleaned_text);
        result.truncated = sanitized->truncated;
    } else {
        text = std::string(raw);
    }
    if (text.empty()) {
        return reject(ValidationErrorCode::kEmptyInput, "input is empty after sanitization", "");
    }

    // ── 3. blacklist ───────────────────────────────────────────────────
    if (moderator_->matches_blacklist(text)) {
        result.reason = std::string(kReasonBlacklistMatch);
        stats_.on_blocked(BlockKind::kBlacklisted);
        spdlog::warn("security_pipeline: session '{}' blocked by blacklist", session_id);
        return result;
    }

    // ── 4. 탐지 + whitelist ────────────────────────────────────────────
    ThreatLevel effective = ThreatLevel::kSafe;
    bool        overridden = false;
    if (cfg.enable_injection_detection) {
        DetectionResult detection = snap->detector->detect(text);
        effective                 = detection.level;

        if (moderator_->matches_whitelist(text)) {
            result.whitelisted = true;
            overridden         = detection.level != ThreatLevel::kSafe;
            if (overridden) {
                spdlog::info("security_pipeline: session '{}' whitelisted, {} detection "
                             "overridden (rules={})",
                             session_id, to_string(detection.level), rule_ids(detection));
            }
            effective = ThreatLevel::kSafe;
        }
        result.detection = std::move(detection);
    }

    // ── 5. 정책 판정 ───────────────────────────────────────────────────
    const ThreatLevel threshold = policy_threshold(cfg.level);
    if (effective >= threshold) {
        result.reason = std::string(kReasonThreatDetected);
        stats_.on_blocked(BlockKind::kThreatDetected);
        spdlog::warn("security_pipeline: session '{}' blocked, level={} threshold={} rules={}",
                     session_id, to_string(effective), to_string(threshold),
                     rule_ids(*result.detection));
        return result;
    }

    result.action         = PipelineAction::kAllow;
    result.reason         = std::string(kReasonAllowed);
    result.sanitized_text = std::move(text);
    stats_.on_allowed(overridden);
    return result;
}

std::expected<PipelineResult, ValidationError>
SecurityPipeline::reject(ValidationErrorCode code, std::string message, std::string context) {
    stats_.on_validation_failure();
    spdlog::debug("security_pipeline: validation failed: {} ({})", to_string(code), message);
    return std::unexpected(ValidationError{code, std::move(message), std::move(context)});
}

// ---------------------------------------------------------------------------
// reload
// ---------------------------------------------------------------------------
std::expected<void, ConfigError>
SecurityPipeline::reload(SecurityConfig                                config,
                         std::optional<std::shared_ptr<const RuleSet>> rules) {
    if (auto valid = validate_security_config(config); !valid) {
        spdlog::error("security_pipeline: reload rejected: {} ({})", valid.error().message,
                      valid.error().context);
        return std::unexpected(valid.error());
    }

    const auto current  = snapshot_.load();
    auto       rule_set = rules ? std::move(*rules) : current->detector->rules();
    if (!rule_set) {
        spdlog::error("security_pipeline: reload rejected: null rule set");
        return std::unexpected(ConfigError{
            ConfigErrorCode::kEmptyRuleSet, "rule set is required", "rules"});
    }

    auto policy = ModerationPolicy::compile(to_moderation_rules(config));
    if (!policy) {
        spdlog::error("security_pipeline: reload rejected: {} ({})", policy.error().message,
                      policy.error().context);
        return std::unexpected(policy.error());
    }

    warn_if_insecure(config);
    spdlog::info("security_pipeline: reloaded, level={} rules={}", to_string(config.level),
                 rule_set->size());

    auto detector = std::make_shared<const PromptInjectionDetector>(std::move(rule_set));
    snapshot_.store(std::make_shared<const Snapshot>(Snapshot{std::move(config), std::move(detector)}));
    moderator_->reload_policy(std::move(*policy));
    return {};
}

StatsSnapshot SecurityPipeline::stats() const {
    return stats_.snapshot(moderator_->session_count());
}

SecurityConfig SecurityPipeline::config() const {
    return snapshot_.load()->config;
}

std::shared_ptr<const RuleSet> SecurityPipeline::rules() const {
    return snapshot_.load()->detector->rules();
}
