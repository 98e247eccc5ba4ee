#include "console_progress/progress/render_scheduler.hpp"
#include "console_progress/common/error_codes.hpp"
#include "console_progress/common/logger.hpp"
#include <utility>

namespace console_progress {
namespace progress {

namespace {

// Scheduler whose tick loop runs on the current thread, if any.
thread_local const RenderScheduler* ticking_scheduler = nullptr;

}

const char* toString(RenderScheduler::State state) {
    switch (state) {
        case RenderScheduler::State::IDLE: return "idle";
        case RenderScheduler::State::ACTIVE: return "active";
        case RenderScheduler::State::DISPOSED: return "disposed";
    }
    return "unknown";
}

RenderScheduler::RenderScheduler(std::chrono::milliseconds interval, TickHandler handler)
    : interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1)),
      handler_(std::move(handler)) {}

RenderScheduler::~RenderScheduler() {
    dispose();
}

void RenderScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::IDLE) {
        return;
    }

    state_ = State::ACTIVE;
    thread_ = std::thread(&RenderScheduler::threadMain, this);

    common::Logger::instance().debug("[Scheduler] Started | interval_ms={}", interval_.count());
}

void RenderScheduler::dispose() {
    if (ticking_scheduler == this) {
        // Called from the tick handler: the mutex is already held by this
        // thread, and the loop exits once the handler returns.
        state_ = State::DISPOSED;
        if (thread_.joinable()) {
            thread_.detach();
        }
        return;
    }

    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::DISPOSED) {
            return;
        }
        state_ = State::DISPOSED;
        worker = std::move(thread_);
    }
    cv_.notify_all();

    if (worker.joinable()) {
        worker.join();
    }

    common::Logger::instance().debug("[Scheduler] Disposed | ticks={}", tickCount());
}

RenderScheduler::State RenderScheduler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint64_t RenderScheduler::tickCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tick_count_;
}

void RenderScheduler::threadMain() {
    ticking_scheduler = this;
    std::unique_lock<std::mutex> lock(mutex_);
    auto next_tick = std::chrono::steady_clock::now() + interval_;

    while (state_ == State::ACTIVE) {
        if (cv_.wait_until(lock, next_tick, [this] { return state_ != State::ACTIVE; })) {
            break;
        }

        runTick();

        // One-shot re-arm measured from the end of this tick.
        next_tick = std::chrono::steady_clock::now() + interval_;
    }
}

void RenderScheduler::runTick() {
    try {
        handler_();
        ++tick_count_;
        if (consecutive_failures_ > 0) {
            common::Logger::instance().info("[Scheduler] Render recovered | failed_ticks={}",
                                            consecutive_failures_);
            consecutive_failures_ = 0;
        }
    } catch (const common::TerminalError& e) {
        ++tick_count_;
        if (consecutive_failures_++ == 0) {
            common::Logger::instance().warn("[Scheduler] Render failed, retrying next tick | code={} | error={}",
                                            e.codeString(), e.what());
        } else {
            common::Logger::instance().debug("[Scheduler] Render still failing | code={} | failed_ticks={}",
                                             e.codeString(), consecutive_failures_);
        }
    } catch (const std::exception& e) {
        ++tick_count_;
        if (consecutive_failures_++ == 0) {
            common::Logger::instance().warn("[Scheduler] Tick failed, retrying next tick | error={}", e.what());
        } else {
            common::Logger::instance().debug("[Scheduler] Tick still failing | failed_ticks={} | error={}",
                                             consecutive_failures_, e.what());
        }
    }
}

}}
