#pragma once
#include "cache/cache_store.h"
#include <list>
#include <mutex>
#include <unordered_map>

namespace cache {

// Bounded in-process tier with least-recently-used eviction.
// The list keeps recency order (front = most recent); the map points into it.

class MemoryTier : public CacheBackend {
public:
    explicit MemoryTier(size_t capacity);

    const char* name() const override { return "memory"; }
    std::optional<CacheEntry> get(const std::string& key) override;
    void set(const std::string& key, const CacheEntry& entry) override;
    void remove(const std::string& key) override;
    void clear() override;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t evictions() const;

private:
    using Item = std::pair<std::string, CacheEntry>;

    size_t capacity_;
    std::list<Item> lru_;
    std::unordered_map<std::string, std::list<Item>::iterator> index_;
    uint64_t evictions_ = 0;
    mutable std::mutex mutex_;
};

} // namespace cache
