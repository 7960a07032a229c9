/**
 * @file image_cache.hpp
 * @brief Thread-safe set of images known to be ready
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace codebox {
namespace core {

/**
 * @class ImageCache
 * @brief Image readiness map with one lock per image name
 *
 * The map mutex guards only the containers; the per-key mutex returned by
 * LockKey() serializes the check-build-mark sequence for one image while
 * leaving other images free to proceed.
 *
 * One key mutex exists per image name that has been locked and not erased
 * since. Erase() drops both the readiness flag and the key mutex; a holder
 * of the old mutex keeps it alive until its KeyLock goes away.
 *
 * **Usage Example**:
 * @code
 * if (!cache.Contains(name)) {
 *     auto guard = cache.LockKey(name);
 *     if (!cache.Contains(name)) {
 *         // ... build ...
 *         cache.MarkReady(name);
 *     }
 * }
 * @endcode
 */
class ImageCache {
public:
    /**
     * @class KeyLock
     * @brief Held per-image lock that shares ownership of its mutex
     */
    class KeyLock {
    public:
        explicit KeyLock(std::shared_ptr<std::mutex> mutex)
            : mutex_(std::move(mutex)), lock_(*mutex_) {}

        bool OwnsLock() const { return lock_.owns_lock(); }

    private:
        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    bool Contains(const std::string& image) const;
    void MarkReady(const std::string& image);
    void Erase(const std::string& image);
    std::size_t Size() const;

    /// Number of per-image mutexes currently tracked
    std::size_t KeyCount() const;

    /**
     * @brief Acquire the lock for one image name
     * @return Held lock; released when it goes out of scope
     */
    KeyLock LockKey(const std::string& image);

private:
    mutable std::mutex map_mutex_;
    std::unordered_set<std::string> ready_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> key_locks_;
};

} // namespace core
} // namespace codebox
