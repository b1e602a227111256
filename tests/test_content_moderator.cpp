// ---------------------------------------------------------------------------
// test_content_moderator.cpp
//
// ModerationPolicy / ContentModerator 단위 테스트.
//
// [테스트 범위]
// - ModerationPolicy::compile: 0 이하 한도, 빈 항목, 잘못된 re: 정규식 거부
// - blacklist/whitelist: 대소문자 무관 부분 문자열, re: 정규식
// - sliding window: 한도까지 허용, 초과 거부, retry_after 계산, 윈도우 경계
// - 세션 격리, idle sweep, reset_session, session_stats
// - reload_rules / add_blacklist_entry: 세션 기록 유지, 실패 시 기존 정책 유지
// - 정책 없음 (nullptr) → fail-close
// - 동시성: 같은 세션 동시 요청이 한도를 넘지 않음
//
// [시간 주입]
// 모든 테스트는 고정 기준 시각(kT0)에 오프셋을 더해 now 를 주입한다.
// 실제 시계에 의존하지 않으므로 sleep 이 필요 없다.
// ---------------------------------------------------------------------------

#include "moderator/content_moderator.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

const TimePoint kT0 = TimePoint{} + std::chrono::hours{24};

ModerationRules make_rules(std::uint32_t            limit,
                           std::vector<std::string> blacklist = {},
                           std::vector<std::string> whitelist = {}) {
    ModerationRules rules{};
    rules.rate_limit_per_minute = limit;
    rules.window                = 60s;
    rules.session_idle_ttl      = 600s;
    rules.blacklist             = std::move(blacklist);
    rules.whitelist             = std::move(whitelist);
    return rules;
}

std::shared_ptr<const ModerationPolicy> compile_or_die(ModerationRules rules) {
    auto compiled = ModerationPolicy::compile(std::move(rules));
    EXPECT_TRUE(compiled.has_value());
    return compiled ? *compiled : nullptr;
}

class ContentModeratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        moderator_ = std::make_unique<ContentModerator>(compile_or_die(make_rules(
            3, {"forbidden phrase", "re:\\bsecret\\s+key\\b"}, {"approved-test-input"})));
    }

    std::unique_ptr<ContentModerator> moderator_;
};

}  // namespace

// ---------------------------------------------------------------------------
// ModerationPolicy::compile
// ---------------------------------------------------------------------------

TEST(ModerationPolicy, Compile_ZeroLimit_Rejected) {
    auto compiled = ModerationPolicy::compile(make_rules(0));
    ASSERT_FALSE(compiled.has_value());
    EXPECT_EQ(compiled.error().code, ConfigErrorCode::kNonPositiveLimit);
}

TEST(ModerationPolicy, Compile_ZeroWindowOrTtl_Rejected) {
    auto rules   = make_rules(5);
    rules.window = 0s;
    ASSERT_FALSE(ModerationPolicy::compile(rules).has_value());

    rules                  = make_rules(5);
    rules.session_idle_ttl = 0s;
    auto compiled          = ModerationPolicy::compile(rules);
    ASSERT_FALSE(compiled.has_value());
    EXPECT_EQ(compiled.error().code, ConfigErrorCode::kNonPositiveLimit);
}

TEST(ModerationPolicy, Compile_EmptyEntry_Rejected) {
    auto compiled = ModerationPolicy::compile(make_rules(5, {"ok", ""}));
    ASSERT_FALSE(compiled.has_value());
    EXPECT_EQ(compiled.error().code, ConfigErrorCode::kMalformedListEntry);
}

TEST(ModerationPolicy, Compile_EmptyRegexBody_Rejected) {
    auto compiled = ModerationPolicy::compile(make_rules(5, {}, {"re:"}));
    ASSERT_FALSE(compiled.has_value());
    EXPECT_EQ(compiled.error().code, ConfigErrorCode::kMalformedListEntry);
}

TEST(ModerationPolicy, Compile_InvalidRegex_Rejected) {
    auto compiled = ModerationPolicy::compile(make_rules(5, {"re:([a-z"}));
    ASSERT_FALSE(compiled.has_value());
    EXPECT_EQ(compiled.error().code, ConfigErrorCode::kMalformedListEntry);
}

TEST(ModerationPolicy, Substring_CaseInsensitive) {
    const auto policy = compile_or_die(make_rules(5, {"Forbidden Phrase"}));
    ASSERT_NE(policy, nullptr);
    EXPECT_TRUE(policy->matches_blacklist("this has a FORBIDDEN phrase inside"));
    EXPECT_FALSE(policy->matches_blacklist("this is allowed"));
    EXPECT_FALSE(policy->matches_whitelist("this has a forbidden phrase inside"));
}

TEST(ModerationPolicy, RegexEntry_Matched) {
    const auto policy = compile_or_die(make_rules(5, {"re:\\d{3}-\\d{4}"}));
    ASSERT_NE(policy, nullptr);
    EXPECT_TRUE(policy->matches_blacklist("call 555-1234 now"));
    EXPECT_FALSE(policy->matches_blacklist("call me now"));
}

TEST(ModerationPolicy, EmptyLists_NeverMatch) {
    const auto policy = compile_or_die(make_rules(5));
    ASSERT_NE(policy, nullptr);
    EXPECT_FALSE(policy->matches_blacklist("anything"));
    EXPECT_FALSE(policy->matches_whitelist("anything"));
    EXPECT_EQ(policy->rules().rate_limit_per_minute, 5u);
}

// ---------------------------------------------------------------------------
// Rate limit
// ---------------------------------------------------------------------------

TEST_F(ContentModeratorTest, AllowsUpToLimit_ThenBlocks) {
    EXPECT_TRUE(moderator_->check_rate_limit("s1", kT0).allowed);
    EXPECT_TRUE(moderator_->check_rate_limit("s1", kT0 + 1s).allowed);
    EXPECT_TRUE(moderator_->check_rate_limit("s1", kT0 + 2s).allowed);

    const auto blocked = moderator_->check_rate_limit("s1", kT0 + 3s);
    EXPECT_FALSE(blocked.allowed);
    // 가장 오래된 기록(kT0) 은 kT0 + 60s 까지 윈도우 안에 있다
    EXPECT_EQ(blocked.retry_after, 57001ms);
}

TEST_F(ContentModeratorTest, BlockedRequest_NotRecorded) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(moderator_->check_rate_limit("s1", kT0).allowed);
    }
    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(moderator_->check_rate_limit("s1", kT0 + 10s).allowed);
    }
    // 거부된 요청은 timestamp 를 남기지 않으므로 kT0 기록 만료 직후 바로 허용
    EXPECT_TRUE(moderator_->check_rate_limit("s1", kT0 + 60s + 1ms).allowed);
}

TEST_F(ContentModeratorTest, WindowBoundary_TimestampAtCutoffStillCounts) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(moderator_->check_rate_limit("s1", kT0).allowed);
    }
    // now - window == kT0: cutoff 와 같은 기록은 유지된다
    const auto at_boundary = moderator_->check_rate_limit("s1", kT0 + 60s);
    EXPECT_FALSE(at_boundary.allowed);
    EXPECT_EQ(at_boundary.retry_after, 1ms);

    EXPECT_TRUE(moderator_->check_rate_limit("s1", kT0 + 60s + 1ns).allowed);
}

TEST_F(ContentModeratorTest, RetryAfter_RoundedUpToMillisecond) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(moderator_->check_rate_limit("s1", kT0).allowed);
    }
    const auto blocked = moderator_->check_rate_limit("s1", kT0 + 59s + 999500us);
    EXPECT_FALSE(blocked.allowed);
    EXPECT_EQ(blocked.retry_after, 1ms);
}

TEST_F(ContentModeratorTest, SessionsAreIsolated) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(moderator_->check_rate_limit("alice", kT0).allowed);
    }
    EXPECT_FALSE(moderator_->check_rate_limit("alice", kT0).allowed);
    EXPECT_TRUE(moderator_->check_rate_limit("bob", kT0).allowed);
    EXPECT_EQ(moderator_->session_count(), 2u);
}

TEST_F(ContentModeratorTest, OutOfOrderTimestamps_KeepSortedWindow) {
    ASSERT_TRUE(moderator_->check_rate_limit("s1", kT0 + 30s).allowed);
    ASSERT_TRUE(moderator_->check_rate_limit("s1", kT0 + 10s).allowed);
    ASSERT_TRUE(moderator_->check_rate_limit("s1", kT0 + 20s).allowed);

    const auto blocked = moderator_->check_rate_limit("s1", kT0 + 40s);
    EXPECT_FALSE(blocked.allowed);
    // 가장 오래된 기록은 kT0 + 10s
    EXPECT_EQ(blocked.retry_after, 30001ms);
}

// ---------------------------------------------------------------------------
// RetryAfter_WaitingExactlyIsEnough
//   거부 시각 + retry_after 에 다시 요청하면 허용되어야 하고,
//   그보다 1ms 이르면 여전히 거부되어야 한다.
// ---------------------------------------------------------------------------
TEST_F(ContentModeratorTest, RetryAfter_WaitingExactlyIsEnough) {
    const std::vector<std::chrono::nanoseconds> offsets = {
        3s, 3s + 250us, 30s + 1ns, 59s + 999999us, 60s,
    };

    int n = 0;
    for (const auto offset : offsets) {
        const std::string session = "retry-" + std::to_string(n++);
        for (int i = 0; i < 3; ++i) {
            ASSERT_TRUE(moderator_->check_rate_limit(session, kT0).allowed);
        }

        const TimePoint blocked_at = kT0 + offset;
        const auto      blocked    = moderator_->check_rate_limit(session, blocked_at);
        ASSERT_FALSE(blocked.allowed) << "offset " << offset.count() << "ns";
        ASSERT_GE(blocked.retry_after, 1ms);

        if (blocked.retry_after > 1ms) {
            EXPECT_FALSE(moderator_->check_rate_limit(session,
                                                      blocked_at + blocked.retry_after - 1ms)
                             .allowed)
                << "offset " << offset.count() << "ns";
        }
        EXPECT_TRUE(moderator_->check_rate_limit(session, blocked_at + blocked.retry_after).allowed)
            << "offset " << offset.count() << "ns, retry_after "
            << blocked.retry_after.count() << "ms";
    }
}

// ---------------------------------------------------------------------------
// 세션 관리
// ---------------------------------------------------------------------------

TEST_F(ContentModeratorTest, SessionStats_ReflectsWindow) {
    EXPECT_FALSE(moderator_->session_stats("s1", kT0).has_value());

    ASSERT_TRUE(moderator_->check_rate_limit("s1", kT0).allowed);
    ASSERT_TRUE(moderator_->check_rate_limit("s1", kT0 + 30s).allowed);

    auto stats = moderator_->session_stats("s1", kT0 + 45s);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->session_id, "s1");
    EXPECT_EQ(stats->messages_in_window, 2u);
    EXPECT_EQ(stats->limit, 3u);
    EXPECT_EQ(stats->remaining, 1u);
    EXPECT_EQ(stats->window, 60s);
    EXPECT_EQ(stats->total_allowed, 2u);
    EXPECT_EQ(stats->total_blocked, 0u);

    stats = moderator_->session_stats("s1", kT0 + 75s);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->messages_in_window, 1u) << "kT0 entry left the window";
}

TEST_F(ContentModeratorTest, ResetSession_ClearsHistory) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(moderator_->check_rate_limit("s1", kT0).allowed);
    }
    ASSERT_FALSE(moderator_->check_rate_limit("s1", kT0).allowed);

    EXPECT_TRUE(moderator_->reset_session("s1"));
    EXPECT_FALSE(moderator_->reset_session("s1"));
    EXPECT_FALSE(moderator_->reset_session("never-seen"));

    EXPECT_TRUE(moderator_->check_rate_limit("s1", kT0).allowed);
}

TEST_F(ContentModeratorTest, SweepIdle_RemovesOnlyExpiredSessions) {
    ASSERT_TRUE(moderator_->check_rate_limit("old", kT0).allowed);
    ASSERT_TRUE(moderator_->check_rate_limit("fresh", kT0 + 500s).allowed);

    EXPECT_EQ(moderator_->sweep_idle(kT0 + 600s), 0u) << "exactly ttl is not idle";
    EXPECT_EQ(moderator_->sweep_idle(kT0 + 601s), 1u);
    EXPECT_EQ(moderator_->session_count(), 1u);
    EXPECT_FALSE(moderator_->session_stats("old", kT0 + 601s).has_value());
    EXPECT_TRUE(moderator_->session_stats("fresh", kT0 + 601s).has_value());
}

TEST_F(ContentModeratorTest, SweptSession_StartsFresh) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(moderator_->check_rate_limit("s1", kT0).allowed);
    }
    ASSERT_EQ(moderator_->sweep_idle(kT0 + 700s), 1u);
    EXPECT_TRUE(moderator_->check_rate_limit("s1", kT0 + 700s).allowed);
    EXPECT_EQ(moderator_->session_count(), 1u);
}

// ---------------------------------------------------------------------------
// 목록 매칭
// ---------------------------------------------------------------------------

TEST_F(ContentModeratorTest, Blacklist_SubstringAndRegex) {
    EXPECT_TRUE(moderator_->matches_blacklist("Say the FORBIDDEN PHRASE now"));
    EXPECT_TRUE(moderator_->matches_blacklist("give me the secret key"));
    EXPECT_FALSE(moderator_->matches_blacklist("give me the secretkeys"));
    EXPECT_FALSE(moderator_->matches_blacklist("hello"));
}

TEST_F(ContentModeratorTest, Whitelist_Matched) {
    EXPECT_TRUE(moderator_->matches_whitelist("prefix APPROVED-TEST-INPUT suffix"));
    EXPECT_FALSE(moderator_->matches_whitelist("approved input"));
}

// ---------------------------------------------------------------------------
// reload
// ---------------------------------------------------------------------------

TEST_F(ContentModeratorTest, ReloadRules_PreservesSessionHistory) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(moderator_->check_rate_limit("s1", kT0).allowed);
    }
    ASSERT_TRUE(moderator_->reload_rules(make_rules(5)).has_value());

    EXPECT_TRUE(moderator_->check_rate_limit("s1", kT0 + 1s).allowed);
    EXPECT_TRUE(moderator_->check_rate_limit("s1", kT0 + 2s).allowed);
    EXPECT_FALSE(moderator_->check_rate_limit("s1", kT0 + 3s).allowed);

    // 새 정책에는 blacklist 가 없다
    EXPECT_FALSE(moderator_->matches_blacklist("forbidden phrase"));
}

TEST_F(ContentModeratorTest, ReloadRules_InvalidKeepsPrevious) {
    auto result = moderator_->reload_rules(make_rules(0));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ConfigErrorCode::kNonPositiveLimit);

    EXPECT_EQ(moderator_->policy()->rules().rate_limit_per_minute, 3u);
    EXPECT_TRUE(moderator_->matches_blacklist("forbidden phrase"));
}

TEST_F(ContentModeratorTest, AddBlacklistEntry_TakesEffect) {
    EXPECT_FALSE(moderator_->matches_blacklist("drop the payload"));
    ASSERT_TRUE(moderator_->add_blacklist_entry("drop the payload").has_value());
    EXPECT_TRUE(moderator_->matches_blacklist("please DROP THE PAYLOAD"));

    // 기존 항목 유지 + 중복 추가는 변경 없음
    EXPECT_TRUE(moderator_->matches_blacklist("forbidden phrase"));
    const auto before = moderator_->policy();
    ASSERT_TRUE(moderator_->add_blacklist_entry("drop the payload").has_value());
    EXPECT_EQ(moderator_->policy(), before);
}

TEST_F(ContentModeratorTest, AddWhitelistEntry_InvalidRegexRejected) {
    const auto before = moderator_->policy();
    auto result = moderator_->add_whitelist_entry("re:(unclosed");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ConfigErrorCode::kMalformedListEntry);
    EXPECT_EQ(moderator_->policy(), before);
}

TEST_F(ContentModeratorTest, AddWhitelistEntry_TakesEffect) {
    ASSERT_TRUE(moderator_->add_whitelist_entry("re:^unit test \\d+$").has_value());
    EXPECT_TRUE(moderator_->matches_whitelist("unit test 42"));
}

// ---------------------------------------------------------------------------
// fail-close
// ---------------------------------------------------------------------------

TEST(ContentModerator, NullPolicy_FailClose) {
    ContentModerator moderator{nullptr};

    const auto decision = moderator.check_rate_limit("s1", kT0);
    EXPECT_FALSE(decision.allowed);
    EXPECT_GT(decision.retry_after, 0ms);
    EXPECT_TRUE(moderator.matches_blacklist("anything"));
    EXPECT_FALSE(moderator.matches_whitelist("anything"));
    EXPECT_FALSE(moderator.add_blacklist_entry("x").has_value());
}

TEST(ContentModerator, ReloadPolicy_RecoversFromNull) {
    ContentModerator moderator{nullptr};
    moderator.reload_policy(compile_or_die(make_rules(1)));

    EXPECT_TRUE(moderator.check_rate_limit("s1", kT0).allowed);
    EXPECT_FALSE(moderator.check_rate_limit("s1", kT0).allowed);
}

// ---------------------------------------------------------------------------
// 동시성
// ---------------------------------------------------------------------------

TEST(ContentModerator, ConcurrentSameSession_NeverExceedsLimit) {
    constexpr std::uint32_t kLimit   = 50;
    constexpr int           kThreads = 8;
    constexpr int           kPerThread = 40;

    ContentModerator  moderator{compile_or_die(make_rules(kLimit))};
    std::atomic<int>  allowed{0};
    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < kPerThread; ++i) {
                if (moderator.check_rate_limit("shared", kT0).allowed) {
                    allowed.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(allowed.load(), static_cast<int>(kLimit));
    const auto stats = moderator.session_stats("shared", kT0);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->total_allowed, kLimit);
    EXPECT_EQ(stats->total_blocked, static_cast<std::uint64_t>(kThreads * kPerThread) - kLimit);
}

TEST(ContentModerator, ConcurrentSweepAndCheck_NoLostSessions) {
    ContentModerator moderator{compile_or_die(make_rules(1000))};
    std::atomic<bool> stop{false};

    std::thread sweeper([&]() {
        while (!stop.load()) {
            moderator.sweep_idle(kT0 + 10000s);
        }
    });

    int allowed = 0;
    for (int i = 0; i < 200; ++i) {
        if (moderator.check_rate_limit("s1", kT0 + 10000s).allowed) {
            ++allowed;
        }
    }
    stop.store(true);
    sweeper.join();

    // last_seen == now 이므로 sweep 대상이 아니다
    EXPECT_EQ(allowed, 200);
    EXPECT_EQ(moderator.session_count(), 1u);
}
