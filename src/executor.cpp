#include <urlbridge/executor.hpp>
#include <urlbridge/log.hpp>
#include <algorithm>

URLBRIDGE_NS_BEGIN

ThreadExecutor::ThreadExecutor() : mState(std::make_shared<State>()) {
    mThread = std::thread(&ThreadExecutor::run, mState);
    mThreadId = mThread.get_id();
}

ThreadExecutor::~ThreadExecutor() {
    shutdown();
}

auto ThreadExecutor::execute(detail::MoveOnlyFunction<void()> fn) -> void {
    std::lock_guard locker(mState->mutex);
    if (mState->stopping) {
        URLBRIDGE_WARN("Executor", "Executor is shutdown, work dropped");
        return;
    }
    mState->queue.emplace_back(std::move(fn));
    mState->cond.notify_one();
}

auto ThreadExecutor::executeAfter(std::chrono::milliseconds delay, detail::MoveOnlyFunction<void()> fn) -> TimerId {
    std::lock_guard locker(mState->mutex);
    if (mState->stopping) {
        URLBRIDGE_WARN("Executor", "Executor is shutdown, timer dropped");
        return 0;
    }
    auto id = mState->nextTimerId++;
    URLBRIDGE_TRACE("Executor", "Submit timer {} after {}", id, delay);
    mState->timers.emplace(std::chrono::steady_clock::now() + delay, Timer {id, std::move(fn)});
    mState->cond.notify_one();
    return id;
}

auto ThreadExecutor::cancelTimer(TimerId id) -> bool {
    std::lock_guard locker(mState->mutex);
    auto &timers = mState->timers;
    auto iter = std::find_if(timers.begin(), timers.end(), [id](const auto &item) { return item.second.id == id; });
    if (iter == timers.end()) {
        return false;
    }
    URLBRIDGE_TRACE("Executor", "Cancel timer {}", id);
    timers.erase(iter);
    return true;
}

auto ThreadExecutor::shutdown() -> void {
    {
        std::lock_guard locker(mState->mutex);
        mState->stopping = true;
        mState->cond.notify_one();
    }
    if (!mThread.joinable()) {
        return;
    }
    if (isCurrentThread()) { // Can not join ourself, the thread keeps the state alive until it returns
        URLBRIDGE_DEBUG("Executor", "shutdown() on the executor thread, detaching");
        mThread.detach();
        return;
    }
    mThread.join();
}

auto ThreadExecutor::isShutdown() const -> bool {
    std::lock_guard locker(mState->mutex);
    return mState->stopping;
}

auto ThreadExecutor::isCurrentThread() const -> bool {
    return mThreadId == std::this_thread::get_id();
}

// Only touches the shared state, never the executor, which may be gone after any fn()
auto ThreadExecutor::run(std::shared_ptr<State> state) -> void {
    std::unique_lock locker(state->mutex);
    while (true) {
        if (state->stopping && !state->timers.empty()) {
            URLBRIDGE_DEBUG("Executor", "Drop {} pending timers", state->timers.size());
            state->timers.clear();
        }
        auto now = std::chrono::steady_clock::now();
        while (!state->timers.empty() && state->timers.begin()->first <= now) {
            state->queue.emplace_back(std::move(state->timers.begin()->second.fn));
            state->timers.erase(state->timers.begin());
        }
        if (!state->queue.empty()) {
            {
                auto fn = std::move(state->queue.front());
                state->queue.pop_front();
                locker.unlock();
                fn();
            } // The captures are released without the lock held
            locker.lock();
            continue;
        }
        if (state->stopping) {
            return;
        }
        if (state->timers.empty()) {
            state->cond.wait(locker);
        }
        else {
            state->cond.wait_until(locker, state->timers.begin()->first);
        }
    }
}

URLBRIDGE_NS_END
