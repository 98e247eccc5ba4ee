#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <cstdint>

namespace console_progress {
namespace progress {

// Runs a tick handler on a dedicated thread, one period after the previous
// tick finished. Ticks never overlap each other or disposal: both run under
// the same mutex.
class RenderScheduler {
public:
    enum class State {
        IDLE,
        ACTIVE,
        DISPOSED
    };

    using TickHandler = std::function<void()>;

    RenderScheduler(std::chrono::milliseconds interval, TickHandler handler);
    ~RenderScheduler();

    RenderScheduler(const RenderScheduler&) = delete;
    RenderScheduler& operator=(const RenderScheduler&) = delete;

    // IDLE -> ACTIVE. Ignored in any other state.
    void start();

    // Any state -> DISPOSED. Waits for an in-flight tick, then joins the
    // thread. Safe to call repeatedly and from inside the tick handler.
    void dispose();

    State state() const;
    std::chrono::milliseconds interval() const { return interval_; }
    uint64_t tickCount() const;

private:
    const std::chrono::milliseconds interval_;
    TickHandler handler_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    State state_ = State::IDLE;
    uint64_t tick_count_ = 0;
    uint64_t consecutive_failures_ = 0;
    std::thread thread_;

    void threadMain();
    void runTick();
};

const char* toString(RenderScheduler::State state);

}}
