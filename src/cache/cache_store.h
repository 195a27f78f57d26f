#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class HttpTransport;

namespace cache {

// Tiered key/value cache for fetched responses.
// Lookup walks the tiers in order (memory, disk, remote); a hit in a lower
// tier is copied into the tiers above it with its remaining lifetime.
// Values are opaque byte strings. Every entry carries an absolute expiry,
// and a lookup past that expiry is a miss even if the bytes still exist.

using Clock = std::chrono::system_clock;

struct CacheEntry {
    std::string value;
    Clock::time_point expires_at;

    bool expired(Clock::time_point now) const { return now >= expires_at; }
};

/**
 * One storage tier. Implementations synchronize internally and report
 * storage failures by throwing CacheError.
 */
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    virtual const char* name() const = 0;

    /// Entry for key, or nullopt if absent or expired
    virtual std::optional<CacheEntry> get(const std::string& key) = 0;

    /// Insert or overwrite (value and expiry together)
    virtual void set(const std::string& key, const CacheEntry& entry) = 0;

    virtual void remove(const std::string& key) = 0;
    virtual void clear() = 0;
};

struct Options {
    bool enabled;
    std::chrono::seconds default_ttl;
    size_t memory_capacity;
    std::string disk_dir;      // empty = no disk tier
    std::string remote_url;    // empty = no remote tier
    long remote_timeout_ms;

    Options()
        : enabled(true),
          default_ttl(3600),
          memory_capacity(1000),
          remote_timeout_ms(2000)
    {}
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t sets = 0;
    uint64_t errors = 0;
    std::vector<uint64_t> tier_hits;    // same order as tier_names
    std::vector<std::string> tier_names;

    double hit_rate() const {
        uint64_t total = hits + misses;
        return total ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

class CacheStore {
public:
    /**
     * @brief Build a store over the given tiers, fastest first
     * @param tiers Storage tiers; an empty list makes every get a miss
     * @param default_ttl TTL used by set() when none is given
     */
    explicit CacheStore(std::vector<std::unique_ptr<CacheBackend>> tiers,
                        std::chrono::seconds default_ttl = std::chrono::seconds(3600));

    /**
     * @brief Build the memory/disk/remote stack described by opts
     *
     * A tier that cannot be set up (unwritable disk directory, ...) is left
     * out with a warning.
     */
    static std::shared_ptr<CacheStore> from_options(const Options& opts,
                                                    std::shared_ptr<const HttpTransport> transport);

    /**
     * @brief Look up a key
     * @return Value, or nullopt on miss, expiry or backend failure
     */
    std::optional<std::string> get(const std::string& key);

    void set(const std::string& key, const std::string& value, std::chrono::seconds ttl);
    void set(const std::string& key, const std::string& value) { set(key, value, default_ttl_); }

    void remove(const std::string& key);

    /// true if get() would hit; does not count towards hit/miss stats
    bool exists(const std::string& key);

    void clear();

    CacheStats stats() const;

    std::chrono::seconds default_ttl() const { return default_ttl_; }

private:
    std::vector<std::unique_ptr<CacheBackend>> tiers_;
    std::chrono::seconds default_ttl_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> sets_{0};
    std::atomic<uint64_t> errors_{0};
    std::unique_ptr<std::atomic<uint64_t>[]> tier_hits_;

    std::optional<std::string> lookup(const std::string& key, bool count);
    void report(const CacheBackend& tier, const char* op, const std::exception& e);
};

/**
 * @brief Serialize an entry for byte-oriented tiers ("<expiry ms>\n<value>")
 */
std::string encode_entry(const CacheEntry& entry);

/**
 * @brief Parse encode_entry() output
 * @return false if the bytes are not a valid envelope
 */
bool decode_entry(const std::string& bytes, CacheEntry& out);

} // namespace cache
