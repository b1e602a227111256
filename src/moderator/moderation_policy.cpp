// ---------------------------------------------------------------------------
// moderation_policy.cpp
//
// [오탐/미탐 트레이드오프]
// - 부분 문자열 매칭이므로 blacklist "kill" 은 "skill" 에도 매칭된다.
//   단어 경계가 필요하면 "re:\bkill\b" 처럼 정규식 항목을 사용할 것.
// - whitelist 는 탐지 결과를 SAFE 로 덮어쓰므로 항목을 넓게 잡으면
//   인젝션이 통과한다. 운영자는 최소한의 구체적 문구만 등록해야 한다.
// ---------------------------------------------------------------------------

#include "moderator/moderation_policy.hpp"

#include "common/text_utils.hpp"

#include <regex>
#include <utility>

#include <spdlog/spdlog.h>

struct ModerationPolicy::ListMatcher {
    std::vector<std::string>                       substrings;  // case-folded
    std::vector<std::shared_ptr<const std::regex>> patterns;

    [[nodiscard]] bool empty() const noexcept { return substrings.empty() && patterns.empty(); }

    [[nodiscard]] bool matches(std::string_view text) const {
        if (empty()) {
            return false;
        }
        const std::string folded = fold_case(text);
        for (const auto& needle : substrings) {
            if (folded.find(needle) != std::string::npos) {
                return true;
            }
        }
        for (const auto& re : patterns) {
            if (std::regex_search(folded, *re)) {
                return true;
            }
        }
        return false;
    }
};

ModerationPolicy::~ModerationPolicy() = default;

// ---------------------------------------------------------------------------
// ModerationPolicy::compile
// ---------------------------------------------------------------------------
std::expected<std::shared_ptr<const ModerationPolicy>, ConfigError>
ModerationPolicy::compile(ModerationRules rules) {
    if (rules.rate_limit_per_minute == 0) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kNonPositiveLimit, "rate_limit_per_minute must be > 0",
            "rate_limit_per_minute"});
    }
    if (rules.window.count() <= 0) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kNonPositiveLimit, "rate limit window must be > 0", "window"});
    }
    if (rules.session_idle_ttl.count() <= 0) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kNonPositiveLimit, "session_idle_ttl must be > 0",
            "session_idle_ttl"});
    }

    auto black = compile_list(rules.blacklist, "blacklist");
    if (!black) {
        return std::unexpected(black.error());
    }
    auto white = compile_list(rules.whitelist, "whitelist");
    if (!white) {
        return std::unexpected(white.error());
    }

    std::shared_ptr<ModerationPolicy> policy(new ModerationPolicy());
    policy->rules_     = std::move(rules);
    policy->blacklist_ = std::move(*black);
    policy->whitelist_ = std::move(*white);

    spdlog::debug("moderation_policy: limit={}/{}s blacklist={} whitelist={}",
                  policy->rules_.rate_limit_per_minute, policy->rules_.window.count(),
                  policy->rules_.blacklist.size(), policy->rules_.whitelist.size());
    return std::shared_ptr<const ModerationPolicy>(std::move(policy));
}

bool ModerationPolicy::matches_blacklist(std::string_view text) const {
    return blacklist_->matches(text);
}

bool ModerationPolicy::matches_whitelist(std::string_view text) const {
    return whitelist_->matches(text);
}

// ---------------------------------------------------------------------------
// ModerationPolicy::compile_list
// ---------------------------------------------------------------------------
std::expected<std::unique_ptr<ModerationPolicy::ListMatcher>, ConfigError>
ModerationPolicy::compile_list(const std::vector<std::string>& entries,
                               std::string_view                list_name) {
    auto matcher = std::make_unique<ListMatcher>();

    for (const auto& entry : entries) {
        if (entry.empty()) {
            return std::unexpected(ConfigError{
                ConfigErrorCode::kMalformedListEntry,
                std::string(list_name) + " entry must not be empty",
                std::string(list_name),
            });
        }

        if (entry.starts_with(kRegexPrefix)) {
            const std::string body = entry.substr(kRegexPrefix.size());
            if (body.empty()) {
                return std::unexpected(ConfigError{
                    ConfigErrorCode::kMalformedListEntry,
                    std::string(list_name) + " regex entry has empty body",
                    entry,
                });
            }
            try {
                matcher->patterns.push_back(std::make_shared<const std::regex>(
                    body, std::regex_constants::ECMAScript | std::regex_constants::icase));
            } catch (const std::regex_error& e) {
                spdlog::error("moderation_policy: invalid {} regex '{}': {}", list_name, body,
                              e.what());
                return std::unexpected(ConfigError{
                    ConfigErrorCode::kMalformedListEntry,
                    std::string("invalid regex: ") + e.what(),
                    entry,
                });
            }
            continue;
        }

        matcher->substrings.push_back(fold_case(entry));
    }
    return matcher;
}
