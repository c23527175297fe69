#include <urlbridge/executor.hpp>
#include <gtest/gtest.h>
#include <future>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace URLBRIDGE_NAMESPACE;
using namespace std::literals;

TEST(Executor, Execute) {
    ThreadExecutor executor;
    std::vector<int> order;
    std::promise<void> done;
    for (int i = 0; i < 5; ++i) {
        executor.execute([&order, i]() { order.push_back(i); });
    }
    executor.execute([&]() { done.set_value(); });
    done.get_future().wait();
    ASSERT_EQ(order, (std::vector<int> {0, 1, 2, 3, 4}));
}

TEST(Executor, CurrentThread) {
    ThreadExecutor executor;
    ASSERT_FALSE(executor.isCurrentThread());
    std::promise<bool> inside;
    executor.execute([&]() { inside.set_value(executor.isCurrentThread()); });
    ASSERT_TRUE(inside.get_future().get());
}

TEST(Executor, Timer) {
    ThreadExecutor executor;
    std::promise<std::chrono::steady_clock::time_point> fired;
    auto begin = std::chrono::steady_clock::now();
    auto id = executor.executeAfter(50ms, [&]() { fired.set_value(std::chrono::steady_clock::now()); });
    ASSERT_NE(id, 0);
    auto at = fired.get_future().get();
    ASSERT_GE(at - begin, 50ms);
    ASSERT_FALSE(executor.cancelTimer(id)); // Already fired
}

TEST(Executor, CancelTimer) {
    ThreadExecutor executor;
    std::atomic<bool> fired {false};
    auto id = executor.executeAfter(100ms, [&]() { fired = true; });
    ASSERT_TRUE(executor.cancelTimer(id));
    ASSERT_FALSE(executor.cancelTimer(id));
    std::this_thread::sleep_for(200ms);
    ASSERT_FALSE(fired);
}

TEST(Executor, Shutdown) {
    ThreadExecutor executor;
    std::atomic<int> ran {0};
    std::atomic<bool> timerFired {false};
    executor.executeAfter(10s, [&]() { timerFired = true; });
    for (int i = 0; i < 10; ++i) {
        executor.execute([&]() { ++ran; });
    }
    executor.shutdown();
    ASSERT_TRUE(executor.isShutdown());
    ASSERT_EQ(ran, 10); // Queued work is drained
    ASSERT_FALSE(timerFired);

    // Dropped after shutdown
    executor.execute([&]() { ++ran; });
    ASSERT_EQ(executor.executeAfter(1ms, [&]() { ++ran; }), 0);
    ASSERT_EQ(ran, 10);
    executor.shutdown(); // Twice is fine
}

TEST(Executor, DestroyOnOwnThread) {
    auto executor = std::make_unique<ThreadExecutor>().release();
    std::promise<void> queued;
    std::promise<void> destroyed;
    std::promise<bool> drained;
    executor->execute([executor, ready = queued.get_future().share(), &destroyed]() {
        ready.wait();
        delete executor; // Last owner dropped from a callback
        destroyed.set_value();
    });
    executor->execute([&drained]() { drained.set_value(true); });
    queued.set_value();

    auto done = destroyed.get_future();
    ASSERT_EQ(done.wait_for(5s), std::future_status::ready);
    // Work queued before the destruction still runs on the detached thread
    auto rest = drained.get_future();
    ASSERT_EQ(rest.wait_for(5s), std::future_status::ready);
    ASSERT_TRUE(rest.get());
}

auto main(int argc, char **argv) -> int {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
