/**
 * @file memory_tier.cpp
 * @brief LRU memory tier
 */

#include "cache/memory_tier.h"

namespace cache {

MemoryTier::MemoryTier(size_t capacity) : capacity_(capacity) {}

std::optional<CacheEntry> MemoryTier::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;

    // Lazy expiry
    if (it->second->second.expired(Clock::now())) {
        lru_.erase(it->second);
        index_.erase(it);
        return std::nullopt;
    }

    lru_.splice(lru_.begin(), lru_, it->second);
    return it->second->second;
}

void MemoryTier::set(const std::string& key, const CacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) return;

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = entry;
        lru_.splice(lru_.begin(), lru_, it->second);
        return;
    }

    lru_.emplace_front(key, entry);
    index_[key] = lru_.begin();

    while (lru_.size() > capacity_) {
        index_.erase(lru_.back().first);
        lru_.pop_back();
        evictions_++;
    }
}

void MemoryTier::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return;
    lru_.erase(it->second);
    index_.erase(it);
}

void MemoryTier::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    index_.clear();
}

size_t MemoryTier::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

uint64_t MemoryTier::evictions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evictions_;
}

} // namespace cache
