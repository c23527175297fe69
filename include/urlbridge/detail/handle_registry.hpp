/**
 * @file handle_registry.hpp
 * @brief Map opaque integer handles to owned objects for the C interface
 * @version 0.1
 * @date 2026-03-02
 * 
 * @copyright Copyright (c) 2026
 * 
 */
#pragma once

#include <urlbridge/defines.hpp>
#include <unordered_map>
#include <cstdint>
#include <memory>
#include <mutex>

URLBRIDGE_NS_BEGIN

namespace detail {

/**
 * @brief The thread safe arena of objects addressed by non zero handles, handles are never reused
 * 
 * @tparam T 
 */
template <typename T>
class HandleRegistry {
public:
    using Handle = uint64_t;

    HandleRegistry() = default;
    HandleRegistry(const HandleRegistry &) = delete;

    /**
     * @brief Take the ownership of the object
     * 
     * @param object 
     * @return Handle (0 if the object is null)
     */
    auto insert(std::shared_ptr<T> object) -> Handle {
        if (!object) {
            return 0;
        }
        std::lock_guard locker(mMutex);
        auto handle = ++mLast;
        mObjects.emplace(handle, std::move(object));
        return handle;
    }

    /**
     * @brief Get the object, it stays alive while the caller holds it even if removed meanwhile
     * 
     * @param handle 
     * @return std::shared_ptr<T> (nullptr if unknown)
     */
    auto get(Handle handle) const -> std::shared_ptr<T> {
        std::lock_guard locker(mMutex);
        auto it = mObjects.find(handle);
        if (it == mObjects.end()) {
            return nullptr;
        }
        return it->second;
    }

    /**
     * @brief Remove the object from the registry
     * 
     * @param handle 
     * @return std::shared_ptr<T> The removed object (nullptr if unknown)
     */
    auto remove(Handle handle) -> std::shared_ptr<T> {
        std::lock_guard locker(mMutex);
        auto it = mObjects.find(handle);
        if (it == mObjects.end()) {
            return nullptr;
        }
        auto object = std::move(it->second);
        mObjects.erase(it);
        return object;
    }

    auto size() const -> size_t {
        std::lock_guard locker(mMutex);
        return mObjects.size();
    }
private:
    mutable std::mutex mMutex;
    Handle mLast = 0;
    std::unordered_map<Handle, std::shared_ptr<T> > mObjects;
};

} // namespace detail

URLBRIDGE_NS_END
