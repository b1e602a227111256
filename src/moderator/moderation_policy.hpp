#pragma once

// ---------------------------------------------------------------------------
// moderation_policy.hpp
//
// ContentModerator 가 참조하는 불변 정책 (rate limit 한도 + blacklist/whitelist).
//
// [목록 항목 형식]
//   "text"      : 대소문자 무관 부분 문자열 (양쪽 모두 ICU case folding)
//   "re:<expr>" : ECMAScript icase 정규식. folding 된 텍스트에 대해 평가한다.
//
// [fail-fast]
// 빈 항목, 본문이 빈 "re:", 컴파일 불가 정규식은 ConfigError{kMalformedListEntry}.
// 0 이하 한도/윈도우/TTL 은 ConfigError{kNonPositiveLimit}.
//
// [Hot Reload]
// ModerationPolicy 는 compile() 로 생성된 뒤 수정되지 않는다.
// ContentModerator 는 std::atomic<std::shared_ptr<const ModerationPolicy>> 로
// 보관하며 교체 시 세션 테이블은 유지된다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// ModerationRules
//   compile 전 원본 값. SecurityConfig 에서 파생된다.
// ---------------------------------------------------------------------------
struct ModerationRules {
    std::uint32_t            rate_limit_per_minute{10};
    std::chrono::seconds     window{60};
    std::chrono::seconds     session_idle_ttl{600};
    std::vector<std::string> blacklist{};
    std::vector<std::string> whitelist{};
};

class ModerationPolicy {
public:
    // 정규식 항목 접두사
    static constexpr std::string_view kRegexPrefix = "re:";

    ~ModerationPolicy();

    ModerationPolicy(const ModerationPolicy&)            = delete;
    ModerationPolicy& operator=(const ModerationPolicy&) = delete;

    [[nodiscard]] static std::expected<std::shared_ptr<const ModerationPolicy>, ConfigError>
    compile(ModerationRules rules);

    [[nodiscard]] bool matches_blacklist(std::string_view text) const;
    [[nodiscard]] bool matches_whitelist(std::string_view text) const;

    [[nodiscard]] const ModerationRules& rules() const noexcept { return rules_; }

private:
    ModerationPolicy() = default;

    struct ListMatcher;

    [[nodiscard]] static std::expected<std::unique_ptr<ListMatcher>, ConfigError>
    compile_list(const std::vector<std::string>& entries, std::string_view list_name);

    ModerationRules              rules_{};
    std::unique_ptr<ListMatcher> blacklist_;
    std::unique_ptr<ListMatcher> whitelist_;
};
