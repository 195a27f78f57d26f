#pragma once
#include "cache/cache_store.h"
#include <filesystem>
#include <mutex>

namespace cache {

// One file per key under a private directory. File names are the SHA-256
// of the key; contents use the encode_entry() envelope. Writes go to a
// temporary file that is renamed into place, so readers never see a
// partially written entry.

class DiskTier : public CacheBackend {
public:
    /**
     * @brief Open (and create if needed) the cache directory
     * @throws CacheError if the directory cannot be created
     */
    explicit DiskTier(const std::string& dir);

    const char* name() const override { return "disk"; }
    std::optional<CacheEntry> get(const std::string& key) override;
    void set(const std::string& key, const CacheEntry& entry) override;
    void remove(const std::string& key) override;
    void clear() override;

private:
    std::filesystem::path dir_;
    std::mutex mutex_;

    std::filesystem::path path_for(const std::string& key) const;
};

} // namespace cache
