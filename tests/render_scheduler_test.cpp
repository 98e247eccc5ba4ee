#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "console_progress/common/error_codes.hpp"
#include "console_progress/progress/render_scheduler.hpp"
#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>

using namespace console_progress;
using progress::RenderScheduler;
using namespace std::chrono_literals;

TEST(RenderScheduler, idle_until_started) {
    std::atomic<int> ticks{0};
    RenderScheduler scheduler(5ms, [&ticks]() { ++ticks; });

    std::this_thread::sleep_for(30ms);

    EXPECT_EQ(scheduler.state(), RenderScheduler::State::IDLE);
    EXPECT_EQ(ticks, 0);
    EXPECT_EQ(scheduler.tickCount(), 0u);
}

TEST(RenderScheduler, ticks_repeatedly_after_start) {
    std::atomic<int> ticks{0};
    RenderScheduler scheduler(5ms, [&ticks]() { ++ticks; });

    scheduler.start();

    EXPECT_EQ(scheduler.state(), RenderScheduler::State::ACTIVE);
    EXPECT_TRUE(wait_for([&ticks]() { return ticks >= 3; }));
    scheduler.dispose();
    EXPECT_EQ(scheduler.tickCount(), static_cast<uint64_t>(ticks.load()));
}

TEST(RenderScheduler, first_tick_waits_one_interval) {
    std::atomic<int> ticks{0};
    RenderScheduler scheduler(500ms, [&ticks]() { ++ticks; });

    scheduler.start();
    std::this_thread::sleep_for(50ms);

    EXPECT_EQ(ticks, 0);
}

TEST(RenderScheduler, interval_has_lower_bound) {
    RenderScheduler scheduler(0ms, []() {});
    EXPECT_EQ(scheduler.interval(), 1ms);
}

TEST(RenderScheduler, no_ticks_after_dispose) {
    std::atomic<int> ticks{0};
    RenderScheduler scheduler(2ms, [&ticks]() { ++ticks; });

    scheduler.start();
    ASSERT_TRUE(wait_for([&ticks]() { return ticks >= 2; }));
    scheduler.dispose();
    int after_dispose = ticks;

    std::this_thread::sleep_for(30ms);

    EXPECT_EQ(ticks, after_dispose);
    EXPECT_EQ(scheduler.state(), RenderScheduler::State::DISPOSED);
}

TEST(RenderScheduler, dispose_is_idempotent) {
    RenderScheduler scheduler(5ms, []() {});
    scheduler.start();

    scheduler.dispose();
    scheduler.dispose();

    EXPECT_EQ(scheduler.state(), RenderScheduler::State::DISPOSED);
}

TEST(RenderScheduler, dispose_while_idle_prevents_start) {
    std::atomic<int> ticks{0};
    RenderScheduler scheduler(2ms, [&ticks]() { ++ticks; });

    scheduler.dispose();
    scheduler.start();
    std::this_thread::sleep_for(20ms);

    EXPECT_EQ(scheduler.state(), RenderScheduler::State::DISPOSED);
    EXPECT_EQ(ticks, 0);
}

TEST(RenderScheduler, dispose_waits_for_tick_in_flight) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> release_future = release.get_future().share();
    std::atomic<bool> tick_finished{false};
    std::atomic<int> ticks{0};

    RenderScheduler scheduler(50ms, [&]() {
        if (ticks++ == 0) {
            entered.set_value();
            release_future.wait();
            tick_finished = true;
        }
    });
    scheduler.start();
    entered.get_future().wait();

    std::atomic<bool> dispose_returned{false};
    std::thread disposer([&]() {
        scheduler.dispose();
        dispose_returned = true;
    });

    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(dispose_returned);

    release.set_value();
    disposer.join();

    EXPECT_TRUE(tick_finished);
    EXPECT_EQ(scheduler.state(), RenderScheduler::State::DISPOSED);

    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(ticks, 1);
    EXPECT_EQ(scheduler.tickCount(), 1u);
}

TEST(RenderScheduler, dispose_from_inside_tick) {
    std::atomic<int> ticks{0};
    RenderScheduler* self = nullptr;

    RenderScheduler scheduler(2ms, [&]() {
        ++ticks;
        self->dispose();
    });
    self = &scheduler;
    scheduler.start();

    ASSERT_TRUE(wait_for([&scheduler]() {
        return scheduler.state() == RenderScheduler::State::DISPOSED;
    }));
    std::this_thread::sleep_for(30ms);

    EXPECT_EQ(ticks, 1);
}

TEST(RenderScheduler, dispose_from_inside_tick_while_host_disposes) {
    std::promise<void> entered;
    std::atomic<int> ticks{0};
    RenderScheduler* self = nullptr;

    RenderScheduler scheduler(2ms, [&]() {
        if (ticks++ == 0) {
            entered.set_value();
            // Give the host thread time to block on the scheduler.
            std::this_thread::sleep_for(20ms);
        }
        self->dispose();
    });
    self = &scheduler;
    scheduler.start();
    entered.get_future().wait();

    std::thread host([&scheduler]() { scheduler.dispose(); });
    host.join();

    EXPECT_EQ(scheduler.state(), RenderScheduler::State::DISPOSED);
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(ticks, 1);
}

TEST(RenderScheduler, host_and_handler_dispose_race) {
    for (int round = 0; round < 50; ++round) {
        std::atomic<int> ticks{0};
        RenderScheduler* self = nullptr;

        RenderScheduler scheduler(1ms, [&]() {
            if (++ticks == 2) {
                self->dispose();
            }
        });
        self = &scheduler;
        scheduler.start();

        std::thread host([&scheduler, round]() {
            std::this_thread::sleep_for(std::chrono::microseconds(round * 40));
            scheduler.dispose();
        });
        host.join();

        EXPECT_EQ(scheduler.state(), RenderScheduler::State::DISPOSED);
        EXPECT_LE(ticks, 2);
    }
}

TEST(RenderScheduler, keeps_ticking_after_handler_failure) {
    std::atomic<int> ticks{0};
    RenderScheduler scheduler(2ms, [&ticks]() {
        int tick = ++ticks;
        if (tick == 1) {
            throw common::TerminalError(common::RenderErrorCode::TERMINAL_WRITE_FAILED,
                                        {"Test", {{"tick", "1"}}});
        }
        if (tick == 2) {
            throw std::runtime_error("formatter failed");
        }
    });

    scheduler.start();

    EXPECT_TRUE(wait_for([&ticks]() { return ticks >= 4; }));
    scheduler.dispose();
}

TEST(RenderScheduler, state_names) {
    EXPECT_STREQ(progress::toString(RenderScheduler::State::IDLE), "idle");
    EXPECT_STREQ(progress::toString(RenderScheduler::State::ACTIVE), "active");
    EXPECT_STREQ(progress::toString(RenderScheduler::State::DISPOSED), "disposed");
}
