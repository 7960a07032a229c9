/**
 * @file image_cache.cpp
 * @brief ImageCache implementation
 *
 * @date 2025
 */

#include "codebox/core/image_cache.hpp"

namespace codebox {
namespace core {

bool ImageCache::Contains(const std::string& image) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return ready_.count(image) > 0;
}

void ImageCache::MarkReady(const std::string& image) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    ready_.insert(image);
}

void ImageCache::Erase(const std::string& image) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    ready_.erase(image);
    key_locks_.erase(image);
}

std::size_t ImageCache::Size() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return ready_.size();
}

std::size_t ImageCache::KeyCount() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return key_locks_.size();
}

ImageCache::KeyLock ImageCache::LockKey(const std::string& image) {
    std::shared_ptr<std::mutex> key_mutex;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        auto& slot = key_locks_[image];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        key_mutex = slot;
    }
    return KeyLock(std::move(key_mutex));
}

} // namespace core
} // namespace codebox
