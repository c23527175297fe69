/**
 * @file executor.hpp
 * @brief Provides the single thread executor each client owns
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#pragma once

#include <urlbridge/engine.hpp>
#include <condition_variable>
#include <chrono>
#include <thread>
#include <memory>
#include <mutex>
#include <deque>
#include <map>

URLBRIDGE_NS_BEGIN

/**
 * @brief The executor running everything on one background thread, with timers
 * 
 */
class URLBRIDGE_API ThreadExecutor final : public Executor {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using TimerId = uint64_t;

    ThreadExecutor();
    ThreadExecutor(const ThreadExecutor &) = delete;
    ~ThreadExecutor();

    /**
     * @brief Queue the function, dropped with a warning after shutdown
     * 
     * @param fn 
     */
    auto execute(detail::MoveOnlyFunction<void()> fn) -> void override;

    /**
     * @brief Run the function after the delay
     * 
     * @param delay 
     * @param fn 
     * @return TimerId (0 if the executor is shutdown)
     */
    auto executeAfter(std::chrono::milliseconds delay, detail::MoveOnlyFunction<void()> fn) -> TimerId;

    /**
     * @brief Cancel a pending timer
     * 
     * @param id 
     * @return true The timer was pending and is removed
     * @return false The timer already fired or does not exist
     */
    auto cancelTimer(TimerId id) -> bool;

    /**
     * @brief Run the queued work, drop pending timers and join the thread
     *
     * Called on the executor thread (a callback dropping the last owner), the thread is detached
     * instead and finishes the queued work on its own.
     */
    auto shutdown() -> void;

    auto isShutdown() const -> bool;

    /**
     * @brief Check the caller is running on the executor thread
     * 
     */
    auto isCurrentThread() const -> bool;
private:
    struct Timer {
        TimerId id;
        detail::MoveOnlyFunction<void()> fn;
    };

    // Owned together by the executor and its thread, so a thread detached by a shutdown
    // from inside a callback never reads a destroyed executor
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cond;
        std::deque<detail::MoveOnlyFunction<void()> > queue;
        std::multimap<TimePoint, Timer> timers;
        TimerId nextTimerId = 1;
        bool stopping = false;
    };

    static auto run(std::shared_ptr<State> state) -> void;

    std::shared_ptr<State> mState;
    std::thread::id mThreadId;
    std::thread mThread;
};

URLBRIDGE_NS_END
