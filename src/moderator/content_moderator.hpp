#pragma once

// ---------------------------------------------------------------------------
// content_moderator.hpp
//
// 세션별 sliding-window rate limit 과 blacklist/whitelist 매칭.
//
// [동시성 모델]
// - 세션 테이블: std::shared_mutex 로 보호되는 id → shared_ptr<SessionRecord> 맵.
//   테이블 락은 조회/삽입/삭제 동안에만 잡는다.
// - 레코드마다 std::mutex 를 두고, prune → count → append 전체를 레코드 락
//   안에서 수행한다. 같은 세션의 동시 요청이 한도를 함께 넘지 못한다.
// - 락 순서: 레코드 락을 잡은 상태에서 테이블 락을 잡지 않는다.
//
// [idle 세션 제거]
// sweep_idle() 은 레코드 락 안에서 evicted 플래그를 세운 뒤 테이블에서 지운다.
// 플래그가 선 레코드를 잡은 check_rate_limit() 는 새 레코드로 재시도한다.
// 제거된 세션의 timestamp 는 사라지므로 TTL 은 반드시 윈도우보다 길어야 한다.
//
// [fail-close]
// 정책이 없으면 (nullptr) 모든 요청을 거부하고 blacklist 매칭으로 간주한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "moderator/moderation_policy.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

// ---------------------------------------------------------------------------
// RateLimitDecision
//   allowed == false 이면 retry_after >= 1ms. 거부 시각에 retry_after 를
//   더한 시각에는 가장 오래된 timestamp 가 윈도우를 벗어나 있다.
// ---------------------------------------------------------------------------
struct RateLimitDecision {
    bool                      allowed{false};
    std::chrono::milliseconds retry_after{0};
};

// ---------------------------------------------------------------------------
// SessionState
//   timestamps: 오름차순 유지, check 직전에 윈도우 밖 항목을 제거한다.
// ---------------------------------------------------------------------------
struct SessionState {
    std::string           session_id{};
    std::deque<TimePoint> timestamps{};
    std::uint64_t         total_blocked{0};
    std::uint64_t         total_allowed{0};
    TimePoint             last_seen{};
};

// ---------------------------------------------------------------------------
// SessionStats
//   session_stats() 의 조회 결과 (복사본).
// ---------------------------------------------------------------------------
struct SessionStats {
    std::string          session_id{};
    std::size_t          messages_in_window{0};
    std::uint32_t        limit{0};
    std::chrono::seconds window{0};
    std::uint32_t        remaining{0};
    std::uint64_t        total_allowed{0};
    std::uint64_t        total_blocked{0};
};

class ContentModerator {
public:
    // policy 가 nullptr 이면 fail-close.
    explicit ContentModerator(std::shared_ptr<const ModerationPolicy> policy);
    ~ContentModerator();

    ContentModerator(const ContentModerator&)            = delete;
    ContentModerator& operator=(const ContentModerator&) = delete;

    // check_rate_limit
    //   세션이 없으면 생성한다. 허용 시 now 를 기록하고 total_allowed 증가,
    //   거부 시 total_blocked 증가.
    [[nodiscard]] RateLimitDecision check_rate_limit(std::string_view session_id,
                                                     TimePoint        now);

    [[nodiscard]] bool matches_blacklist(std::string_view text) const;
    [[nodiscard]] bool matches_whitelist(std::string_view text) const;

    // sweep_idle
    //   last_seen 이후 session_idle_ttl 을 넘긴 세션을 제거한다. 반환: 제거 수
    std::size_t sweep_idle(TimePoint now);

    // reset_session
    //   세션의 rate limit 기록을 삭제한다. 세션이 있었으면 true.
    bool reset_session(std::string_view session_id);

    [[nodiscard]] std::optional<SessionStats> session_stats(std::string_view session_id,
                                                            TimePoint        now) const;

    [[nodiscard]] std::size_t session_count() const;

    // reload_rules
    //   한도와 목록을 원자적으로 교체한다. 세션 테이블은 유지된다.
    //   실패 시 기존 정책 유지.
    [[nodiscard]] std::expected<void, ConfigError> reload_rules(ModerationRules rules);

    // 이미 compile 된 정책으로 교체 (파이프라인 reload 용). nullptr 이면 fail-close.
    void reload_policy(std::shared_ptr<const ModerationPolicy> policy);

    // add_blacklist_entry / add_whitelist_entry
    //   현재 정책에 항목 하나를 추가한 새 정책으로 교체한다.
    //   이미 있는 항목이면 변경 없이 성공.
    [[nodiscard]] std::expected<void, ConfigError> add_blacklist_entry(std::string entry);
    [[nodiscard]] std::expected<void, ConfigError> add_whitelist_entry(std::string entry);

    [[nodiscard]] std::shared_ptr<const ModerationPolicy> policy() const { return policy_.load(); }

private:
    struct SessionRecord;

    [[nodiscard]] std::shared_ptr<SessionRecord> acquire_record(const std::string& key,
                                                                TimePoint          now);
    void erase_if_same(const std::string& key, const std::shared_ptr<SessionRecord>& record);

    [[nodiscard]] std::expected<void, ConfigError>
    add_list_entry(std::string entry, bool to_blacklist);

    std::atomic<std::shared_ptr<const ModerationPolicy>> policy_;

    mutable std::shared_mutex                                       sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionRecord>> sessions_;
};
