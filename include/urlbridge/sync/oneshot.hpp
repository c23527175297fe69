/**
 * @file oneshot.hpp
 * @brief Oneshot result cell, the first writer wins and later writers are dropped
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#pragma once

#include <urlbridge/detail/functional.hpp>
#include <condition_variable>
#include <optional>
#include <concepts>
#include <atomic>
#include <chrono>
#include <mutex>
#include <vector>

URLBRIDGE_NS_BEGIN

namespace oneshot {

template <typename T>
concept Sendable = std::movable<T> && (!std::is_reference_v<T>);

/**
 * @brief The thread safe cell for sending one value, resolved at most once
 * 
 * @tparam T 
 */
template <Sendable T>
class Cell {
public:
    Cell() = default;
    Cell(const Cell &) = delete;

    /**
     * @brief Try to resolve the cell
     * 
     * @param value 
     * @return true The cell is resolved by this call
     * @return false The cell was already resolved, the value is dropped
     */
    auto trySet(T value) -> bool {
        std::vector<detail::MoveOnlyFunction<void()> > callbacks;
        {
            std::lock_guard locker(mMutex);
            if (mValue) {
                return false;
            }
            mValue.emplace(std::move(value));
            mResolved.store(true, std::memory_order_release);
            callbacks.swap(mCallbacks);
        }
        mCond.notify_all();
        for (auto &callback : callbacks) {
            callback();
        }
        return true;
    }

    [[nodiscard]]
    auto isResolved() const noexcept -> bool {
        return mResolved.load(std::memory_order_acquire);
    }

    /**
     * @brief Block until resolved
     * 
     * @return T& The stored value, valid as long as the cell
     */
    auto wait() -> T & {
        std::unique_lock locker(mMutex);
        mCond.wait(locker, [this]() { return mValue.has_value(); });
        return *mValue;
    }

    /**
     * @brief Block until resolved or the timeout expired
     * 
     * @return true Resolved
     */
    template <typename Rep, typename Period>
    auto waitFor(std::chrono::duration<Rep, Period> timeout) -> bool {
        std::unique_lock locker(mMutex);
        return mCond.wait_for(locker, timeout, [this]() { return mValue.has_value(); });
    }

    /**
     * @brief Move the value out, only once
     * 
     * @return std::optional<T> (nullopt if not resolved yet or already taken)
     */
    auto take() -> std::optional<T> {
        std::lock_guard locker(mMutex);
        if (!mValue || mTaken) {
            return std::nullopt;
        }
        mTaken = true;
        return std::move(*mValue);
    }

    /**
     * @brief Register a callback called once resolved, immediately if it already is
     * 
     * The callback runs on the thread resolving the cell.
     * 
     * @param fn 
     */
    auto onResolved(detail::MoveOnlyFunction<void()> fn) -> void {
        {
            std::lock_guard locker(mMutex);
            if (!mValue) {
                mCallbacks.emplace_back(std::move(fn));
                return;
            }
        }
        fn();
    }
private:
    mutable std::mutex mMutex;
    std::condition_variable mCond;
    std::optional<T> mValue;
    std::atomic<bool> mResolved {false};
    bool mTaken = false;
    std::vector<detail::MoveOnlyFunction<void()> > mCallbacks;
};

} // namespace oneshot

URLBRIDGE_NS_END
