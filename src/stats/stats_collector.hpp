#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 파이프라인 메시지 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_allowed / on_blocked / on_validation_failure:
//   process() 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 조회 경로. 갱신 경로와 mutex 없이 분리된다.
//
// [격리 원칙]
// 통계 갱신 실패가 판정 경로로 전파되지 않도록 모든 갱신 메서드는 noexcept.
//
// [집계 기준]
// total_messages = allowed_messages + blocked_messages.
// validation_failures 는 판정 이전에 거부된 입력이므로 total 에 포함하지 않는다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// BlockKind
//   BLOCK 판정 사유. PipelineResult::reason 과 1:1 대응.
// ---------------------------------------------------------------------------
enum class BlockKind : std::uint8_t {
    kRateLimited    = 0,
    kBlacklisted    = 1,
    kThreatDetected = 2,
};

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   mps       : 생성 이후 경과 시간 기준 초당 메시지 수
//   block_rate: blocked_messages / total_messages (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                         total_messages{0};
    std::uint64_t                         allowed_messages{0};
    std::uint64_t                         blocked_messages{0};
    std::uint64_t                         rate_limited{0};
    std::uint64_t                         blacklisted{0};
    std::uint64_t                         threat_blocked{0};
    std::uint64_t                         validation_failures{0};
    std::uint64_t                         whitelist_overrides{0};
    std::uint64_t                         active_sessions{0};
    double                                mps{0.0};
    double                                block_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class StatsCollector {
public:
    StatsCollector() noexcept
        : started_at_(std::chrono::steady_clock::now())
    {}

    ~StatsCollector() = default;

    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    // on_allowed
    //   whitelisted: 탐지 결과가 whitelist 로 SAFE 처리된 경우 true
    void on_allowed(bool whitelisted) noexcept {
        total_messages_.fetch_add(1, std::memory_order_relaxed);
        allowed_messages_.fetch_add(1, std::memory_order_relaxed);
        if (whitelisted) {
            whitelist_overrides_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void on_blocked(BlockKind kind) noexcept {
        total_messages_.fetch_add(1, std::memory_order_relaxed);
        blocked_messages_.fetch_add(1, std::memory_order_relaxed);
        switch (kind) {
            case BlockKind::kRateLimited:
                rate_limited_.fetch_add(1, std::memory_order_relaxed);
                break;
            case BlockKind::kBlacklisted:
                blacklisted_.fetch_add(1, std::memory_order_relaxed);
                break;
            case BlockKind::kThreatDetected:
                threat_blocked_.fetch_add(1, std::memory_order_relaxed);
                break;
        }
    }

    void on_validation_failure() noexcept {
        validation_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    // snapshot
    //   active_sessions 는 호출자(ContentModerator::session_count) 가 채운다.
    [[nodiscard]] StatsSnapshot snapshot(std::uint64_t active_sessions = 0) const noexcept {
        const auto total   = total_messages_.load(std::memory_order_relaxed);
        const auto blocked = blocked_messages_.load(std::memory_order_relaxed);

        const double elapsed_sec = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - started_at_).count();

        double mps = 0.0;
        if (elapsed_sec > 0.0) {
            mps = static_cast<double>(total) / elapsed_sec;
        }

        double block_rate = 0.0;
        if (total > 0) {
            block_rate = static_cast<double>(blocked) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .total_messages      = total,
            .allowed_messages    = allowed_messages_.load(std::memory_order_relaxed),
            .blocked_messages    = blocked,
            .rate_limited        = rate_limited_.load(std::memory_order_relaxed),
            .blacklisted         = blacklisted_.load(std::memory_order_relaxed),
            .threat_blocked      = threat_blocked_.load(std::memory_order_relaxed),
            .validation_failures = validation_failures_.load(std::memory_order_relaxed),
            .whitelist_overrides = whitelist_overrides_.load(std::memory_order_relaxed),
            .active_sessions     = active_sessions,
            .mps                 = mps,
            .block_rate          = block_rate,
            .captured_at         = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_messages_{0};
    std::atomic<std::uint64_t> allowed_messages_{0};
    std::atomic<std::uint64_t> blocked_messages_{0};
    std::atomic<std::uint64_t> rate_limited_{0};
    std::atomic<std::uint64_t> blacklisted_{0};
    std::atomic<std::uint64_t> threat_blocked_{0};
    std::atomic<std::uint64_t> validation_failures_{0};
    std::atomic<std::uint64_t> whitelist_overrides_{0};

    const std::chrono::steady_clock::time_point started_at_;
};
