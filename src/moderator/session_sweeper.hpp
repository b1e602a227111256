#pragma once

// ---------------------------------------------------------------------------
// session_sweeper.hpp
//
// 주기적으로 ContentModerator::sweep_idle() 을 호출하는 타이머 코루틴.
// 호출자가 제공한 io_context 에서 co_spawn 하여 실행한다.
//
// [종료]
// stop() 은 어느 스레드에서 호출해도 된다. 타이머 취소는 io_context 로
// post 하여 타이머 소유 스레드에서 수행한다.
// ---------------------------------------------------------------------------

#include "moderator/content_moderator.hpp"

#include <utility>  // boost/asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

class SessionSweeper {
public:
    // 한 번의 sweep 에서 세션이 제거되면 호출된다 (io_context 스레드).
    using EvictionCallback = std::function<void(std::size_t evicted)>;

    SessionSweeper(std::shared_ptr<ContentModerator> moderator,
                   std::chrono::milliseconds         interval,
                   boost::asio::io_context&          io_context,
                   EvictionCallback                  on_evict = {});

    ~SessionSweeper();

    SessionSweeper(const SessionSweeper&)            = delete;
    SessionSweeper& operator=(const SessionSweeper&) = delete;

    // run
    //   interval 마다 sweep_idle(Clock::now()) 호출. stop() 또는 타이머 취소 시 종료.
    auto run() -> boost::asio::awaitable<void>;

    void stop();

    [[nodiscard]] std::uint64_t total_evicted() const noexcept {
        return total_evicted_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] std::uint64_t sweep_count() const noexcept {
        return sweeps_.load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<ContentModerator> moderator_;
    std::chrono::milliseconds         interval_;
    boost::asio::io_context&          ioc_;
    boost::asio::steady_timer         timer_;
    EvictionCallback                  on_evict_;

    std::atomic<bool>          stop_requested_{false};
    std::atomic<std::uint64_t> total_evicted_{0};
    std::atomic<std::uint64_t> sweeps_{0};
};
