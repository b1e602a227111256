// ---------------------------------------------------------------------------
// content_moderator.cpp
//
// [sliding window]
//   cutoff = now - window
//   timestamps 중 cutoff 보다 이른 항목 제거 (cutoff 와 같은 항목은 유지)
//   count >= limit → 거부, retry_after = floor(oldest + window - now) + 1ms
//   count <  limit → now 기록 후 허용
//
// 주입된 now 가 마지막 timestamp 보다 이르면 정렬 위치에 삽입하여
// 오름차순 불변식을 유지한다.
// ---------------------------------------------------------------------------

#include "moderator/content_moderator.hpp"

#include <algorithm>
#include <mutex>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

struct ContentModerator::SessionRecord {
    std::mutex   mutex;
    SessionState state;
    bool         evicted{false};  // sweep/reset 으로 테이블에서 분리됨
};

ContentModerator::ContentModerator(std::shared_ptr<const ModerationPolicy> policy)
    : policy_(std::move(policy)) {
    const auto current = policy_.load();
    if (!current) {
        spdlog::error("content_moderator: no moderation policy, "
                      "all messages will be rejected (fail-close)");
        return;
    }
    spdlog::info("content_moderator: initialized, rate_limit={}/{}s, blacklist={}, whitelist={}",
                 current->rules().rate_limit_per_minute, current->rules().window.count(),
                 current->rules().blacklist.size(), current->rules().whitelist.size());
}

ContentModerator::~ContentModerator() = default;

// ---------------------------------------------------------------------------
// acquire_record
//   공유 락으로 먼저 조회하고, 없을 때만 배타 락으로 삽입한다.
// ---------------------------------------------------------------------------
std::shared_ptr<ContentModerator::SessionRecord>
ContentModerator::acquire_record(const std::string& key, TimePoint now) {
    {
        std::shared_lock lock(sessions_mutex_);
        if (const auto it = sessions_.find(key); it != sessions_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(sessions_mutex_);
    auto& slot = sessions_[key];
    if (!slot) {
        slot                   = std::make_shared<SessionRecord>();
        slot->state.session_id = key;
        slot->state.last_seen  = now;
        spdlog::debug("content_moderator: new session '{}'", key);
    }
    return slot;
}

void ContentModerator::erase_if_same(const std::string&                    key,
                                     const std::shared_ptr<SessionRecord>& record) {
    std::unique_lock lock(sessions_mutex_);
    if (const auto it = sessions_.find(key); it != sessions_.end() && it->second == record) {
        sessions_.erase(it);
    }
}

// ---------------------------------------------------------------------------
// check_rate_limit
// ---------------------------------------------------------------------------
RateLimitDecision ContentModerator::check_rate_limit(std::string_view session_id,
                                                     TimePoint        now) {
    const auto policy = policy_.load();
    if (!policy) {
        spdlog::warn("content_moderator: rate limit check without policy (fail-close)");
        return RateLimitDecision{false, ModerationRules{}.window};
    }
    const ModerationRules& rules = policy->rules();
    const std::string      key(session_id);

    for (;;) {
        auto record = acquire_record(key, now);

        std::unique_lock lock(record->mutex);
        if (record->evicted) {
            // sweep/reset 과 경합: 분리된 레코드는 버리고 새 레코드로 재시도
            lock.unlock();
            erase_if_same(key, record);
            continue;
        }

        SessionState& state = record->state;
        state.last_seen     = std::max(state.last_seen, now);

        auto&           ts     = state.timestamps;
        const TimePoint cutoff = now - rules.window;
        while (!ts.empty() && ts.front() < cutoff) {
            ts.pop_front();
        }

        if (ts.size() >= rules.rate_limit_per_minute) {
            ++state.total_blocked;
            // cutoff 과 같은 기록은 유지되므로 슬롯은 front + window 를 지나야 빈다.
            // now + wait > front + window 를 만족하는 가장 작은 ms 단위 값.
            const auto wait =
                std::chrono::floor<std::chrono::milliseconds>(ts.front() + rules.window - now) +
                std::chrono::milliseconds{1};
            spdlog::warn("content_moderator: rate limit exceeded for session '{}': "
                         "{} messages in {}s, retry after {}ms",
                         key, ts.size(), rules.window.count(), wait.count());
            return RateLimitDecision{false, wait};
        }

        if (ts.empty() || ts.back() <= now) {
            ts.push_back(now);
        } else {
            ts.insert(std::upper_bound(ts.begin(), ts.end(), now), now);
        }
        ++state.total_allowed;
        return RateLimitDecision{true, std::chrono::milliseconds{0}};
    }
}

bool ContentModerator::matches_blacklist(std::string_view text) const {
    const auto policy = policy_.load();
    if (!policy) {
        return true;  // fail-close
    }
    const bool hit = policy->matches_blacklist(text);
    if (hit) {
        spdlog::warn("content_moderator: blacklist match ({} bytes)", text.size());
    }
    return hit;
}

bool ContentModerator::matches_whitelist(std::string_view text) const {
    const auto policy = policy_.load();
    return policy && policy->matches_whitelist(text);
}

// ---------------------------------------------------------------------------
// sweep_idle
//   1. 공유 락으로 테이블 스냅샷
//   2. 레코드 락 안에서 idle 판정 + evicted 표시
//   3. 배타 락으로 포인터가 그대로인 항목만 제거
// ---------------------------------------------------------------------------
std::size_t ContentModerator::sweep_idle(TimePoint now) {
    const auto policy = policy_.load();
    const auto ttl    = policy ? policy->rules().session_idle_ttl
                               : ModerationRules{}.session_idle_ttl;

    std::vector<std::pair<std::string, std::shared_ptr<SessionRecord>>> snapshot;
    {
        std::shared_lock lock(sessions_mutex_);
        snapshot.reserve(sessions_.size());
        for (const auto& [id, record] : sessions_) {
            snapshot.emplace_back(id, record);
        }
    }

    std::vector<std::pair<std::string, std::shared_ptr<SessionRecord>>> victims;
    for (auto& [id, record] : snapshot) {
        std::lock_guard lock(record->mutex);
        if (!record->evicted && now - record->state.last_seen > ttl) {
            record->evicted = true;
            victims.emplace_back(std::move(id), std::move(record));
        }
    }

    if (victims.empty()) {
        return 0;
    }

    {
        std::unique_lock lock(sessions_mutex_);
        for (const auto& [id, record] : victims) {
            if (const auto it = sessions_.find(id); it != sessions_.end() && it->second == record) {
                sessions_.erase(it);
            }
        }
    }

    spdlog::info("content_moderator: evicted {} idle sessions", victims.size());
    return victims.size();
}

// ---------------------------------------------------------------------------
// reset_session
// ---------------------------------------------------------------------------
bool ContentModerator::reset_session(std::string_view session_id) {
    std::shared_ptr<SessionRecord> record;
    {
        std::unique_lock lock(sessions_mutex_);
        const auto it = sessions_.find(std::string(session_id));
        if (it == sessions_.end()) {
            return false;
        }
        record = std::move(it->second);
        sessions_.erase(it);
    }

    if (record) {
        std::lock_guard lock(record->mutex);
        record->evicted = true;
    }
    spdlog::info("content_moderator: reset rate limiting for session '{}'", session_id);
    return true;
}

// ---------------------------------------------------------------------------
// session_stats
//   세션 상태를 수정하지 않는다 (prune 없이 윈도우 안의 항목만 센다).
// ---------------------------------------------------------------------------
std::optional<SessionStats> ContentModerator::session_stats(std::string_view session_id,
                                                            TimePoint        now) const {
    std::shared_ptr<SessionRecord> record;
    {
        std::shared_lock lock(sessions_mutex_);
        const auto it = sessions_.find(std::string(session_id));
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        record = it->second;
    }

    const auto            policy = policy_.load();
    const ModerationRules rules  = policy ? policy->rules() : ModerationRules{};

    std::lock_guard lock(record->mutex);
    if (record->evicted) {
        return std::nullopt;
    }

    const TimePoint cutoff    = now - rules.window;
    const auto      in_window = static_cast<std::size_t>(std::count_if(
        record->state.timestamps.begin(), record->state.timestamps.end(),
        [cutoff, now](TimePoint t) { return t >= cutoff && t <= now; }));

    SessionStats stats{};
    stats.session_id         = record->state.session_id;
    stats.messages_in_window = in_window;
    stats.limit              = rules.rate_limit_per_minute;
    stats.window             = rules.window;
    stats.remaining          = in_window >= rules.rate_limit_per_minute
                                   ? 0
                                   : rules.rate_limit_per_minute - static_cast<std::uint32_t>(in_window);
    stats.total_allowed      = record->state.total_allowed;
    stats.total_blocked      = record->state.total_blocked;
    return stats;
}

std::size_t ContentModerator::session_count() const {
    std::shared_lock lock(sessions_mutex_);
    return sessions_.size();
}

// ---------------------------------------------------------------------------
// reload
// ---------------------------------------------------------------------------
std::expected<void, ConfigError> ContentModerator::reload_rules(ModerationRules rules) {
    auto compiled = ModerationPolicy::compile(std::move(rules));
    if (!compiled) {
        spdlog::error("content_moderator: reload rejected: {} ({})", compiled.error().message,
                      compiled.error().context);
        return std::unexpected(compiled.error());
    }
    reload_policy(std::move(*compiled));
    return {};
}

void ContentModerator::reload_policy(std::shared_ptr<const ModerationPolicy> policy) {
    if (!policy) {
        spdlog::warn("content_moderator: reload with null policy, "
                     "all messages will be rejected (fail-close)");
    } else {
        spdlog::info("content_moderator: policy reloaded, rate_limit={}/{}s",
                     policy->rules().rate_limit_per_minute, policy->rules().window.count());
    }
    policy_.store(std::move(policy));
}

std::expected<void, ConfigError> ContentModerator::add_blacklist_entry(std::string entry) {
    return add_list_entry(std::move(entry), true);
}

std::expected<void, ConfigError> ContentModerator::add_whitelist_entry(std::string entry) {
    return add_list_entry(std::move(entry), false);
}

// ---------------------------------------------------------------------------
// add_list_entry
//   동시 reload 와 경합하면 최신 정책을 기준으로 다시 만든다 (CAS 루프).
// ---------------------------------------------------------------------------
std::expected<void, ConfigError> ContentModerator::add_list_entry(std::string entry,
                                                                  bool        to_blacklist) {
    const char* list_name = to_blacklist ? "blacklist" : "whitelist";

    auto current = policy_.load();
    for (;;) {
        if (!current) {
            return std::unexpected(ConfigError{
                ConfigErrorCode::kMalformedListEntry,
                "no active moderation policy",
                list_name,
            });
        }

        ModerationRules rules = current->rules();
        auto&           list  = to_blacklist ? rules.blacklist : rules.whitelist;
        if (std::find(list.begin(), list.end(), entry) != list.end()) {
            return {};
        }
        list.push_back(entry);

        auto compiled = ModerationPolicy::compile(std::move(rules));
        if (!compiled) {
            return std::unexpected(compiled.error());
        }
        if (policy_.compare_exchange_weak(current, *compiled)) {
            spdlog::info("content_moderator: added {} entry", list_name);
            return {};
        }
    }
}
