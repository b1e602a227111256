#include "moderator/session_sweeper.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <utility>

#include <spdlog/spdlog.h>

namespace asio = boost::asio;

SessionSweeper::SessionSweeper(std::shared_ptr<ContentModerator> moderator,
                               std::chrono::milliseconds         interval,
                               asio::io_context&                 io_context,
                               EvictionCallback                  on_evict)
    : moderator_(std::move(moderator))
    , interval_(interval)
    , ioc_(io_context)
    , timer_(io_context)
    , on_evict_(std::move(on_evict)) {
    if (interval_ <= std::chrono::milliseconds::zero()) {
        spdlog::warn("session_sweeper: non-positive interval {}ms, using 1000ms",
                     interval_.count());
        interval_ = std::chrono::milliseconds{1000};
    }
}

SessionSweeper::~SessionSweeper() {
    stop();
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------
void SessionSweeper::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    if (ioc_.stopped()) {
        timer_.cancel();
        return;
    }
    asio::post(ioc_, [this]() { timer_.cancel(); });
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
auto SessionSweeper::run() -> asio::awaitable<void> {
    if (!moderator_) {
        spdlog::error("session_sweeper: no moderator, sweeper not started");
        co_return;
    }

    spdlog::info("session_sweeper: started, interval={}ms", interval_.count());

    for (;;) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            break;
        }

        boost::system::error_code ec;
        timer_.expires_after(interval_);
        co_await timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::error("session_sweeper: timer error: {}", ec.message());
            }
            break;
        }
        if (stop_requested_.load(std::memory_order_acquire)) {
            break;
        }

        const std::size_t evicted = moderator_->sweep_idle(Clock::now());
        sweeps_.fetch_add(1, std::memory_order_relaxed);
        if (evicted > 0) {
            total_evicted_.fetch_add(evicted, std::memory_order_relaxed);
            if (on_evict_) {
                on_evict_(evicted);
            }
        }
    }

    spdlog::info("session_sweeper: stopped after {} sweeps, {} sessions evicted",
                 sweeps_.load(std::memory_order_relaxed),
                 total_evicted_.load(std::memory_order_relaxed));
}
