/**
 * @file cache_store.cpp
 * @brief Tier walking, promotion and failure degradation for the cache
 */

#include "cache/cache_store.h"
#include "cache/memory_tier.h"
#include "cache/disk_tier.h"
#include "cache/remote_tier.h"
#include "core/errors.h"
#include "logging/console.h"

namespace cache {

CacheStore::CacheStore(std::vector<std::unique_ptr<CacheBackend>> tiers,
                       std::chrono::seconds default_ttl)
    : tiers_(std::move(tiers)),
      default_ttl_(default_ttl),
      tier_hits_(std::make_unique<std::atomic<uint64_t>[]>(tiers_.size() ? tiers_.size() : 1)) {
    for (size_t i = 0; i < tiers_.size(); i++) tier_hits_[i] = 0;
}

std::shared_ptr<CacheStore> CacheStore::from_options(const Options& opts,
                                                     std::shared_ptr<const HttpTransport> transport) {
    std::vector<std::unique_ptr<CacheBackend>> tiers;
    if (opts.enabled) {
        tiers.push_back(std::make_unique<MemoryTier>(opts.memory_capacity));
        if (!opts.disk_dir.empty()) {
            try {
                tiers.push_back(std::make_unique<DiskTier>(opts.disk_dir));
            } catch (const CacheError& e) {
                logging::warn(std::string("cache: disk tier disabled: ") + e.what());
            }
        }
        if (!opts.remote_url.empty()) {
            if (transport) {
                tiers.push_back(std::make_unique<RemoteTier>(transport, opts.remote_url, opts.remote_timeout_ms));
            } else {
                logging::warn("cache: remote tier disabled: no transport");
            }
        }
    }
    return std::make_shared<CacheStore>(std::move(tiers), opts.default_ttl);
}

void CacheStore::report(const CacheBackend& tier, const char* op, const std::exception& e) {
    errors_++;
    logging::warn(std::string("cache: ") + tier.name() + " " + op + " failed: " + e.what());
}

std::optional<std::string> CacheStore::lookup(const std::string& key, bool count) {
    auto now = Clock::now();
    for (size_t i = 0; i < tiers_.size(); i++) {
        std::optional<CacheEntry> entry;
        try {
            entry = tiers_[i]->get(key);
        } catch (const CacheError& e) {
            report(*tiers_[i], "get", e);
            continue;
        }
        if (!entry || entry->expired(now)) continue;

        // Promote into the faster tiers, keeping the remaining lifetime
        for (size_t j = 0; j < i; j++) {
            try {
                tiers_[j]->set(key, *entry);
            } catch (const CacheError& e) {
                report(*tiers_[j], "promote", e);
            }
        }
        if (count) {
            hits_++;
            tier_hits_[i]++;
        }
        return std::move(entry->value);
    }
    if (count) misses_++;
    return std::nullopt;
}

std::optional<std::string> CacheStore::get(const std::string& key) {
    return lookup(key, true);
}

bool CacheStore::exists(const std::string& key) {
    return lookup(key, false).has_value();
}

void CacheStore::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    CacheEntry entry{value, Clock::now() + ttl};
    sets_++;
    for (auto& tier : tiers_) {
        try {
            tier->set(key, entry);
        } catch (const CacheError& e) {
            report(*tier, "set", e);
        }
    }
}

void CacheStore::remove(const std::string& key) {
    for (auto& tier : tiers_) {
        try {
            tier->remove(key);
        } catch (const CacheError& e) {
            report(*tier, "delete", e);
        }
    }
}

void CacheStore::clear() {
    for (auto& tier : tiers_) {
        try {
            tier->clear();
        } catch (const CacheError& e) {
            report(*tier, "clear", e);
        }
    }
}

CacheStats CacheStore::stats() const {
    CacheStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.sets = sets_.load();
    s.errors = errors_.load();
    for (size_t i = 0; i < tiers_.size(); i++) {
        s.tier_names.push_back(tiers_[i]->name());
        s.tier_hits.push_back(tier_hits_[i].load());
    }
    return s;
}

std::string encode_entry(const CacheEntry& entry) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.expires_at.time_since_epoch()).count();
    std::string out = std::to_string(ms);
    out += '\n';
    out += entry.value;
    return out;
}

bool decode_entry(const std::string& bytes, CacheEntry& out) {
    size_t nl = bytes.find('\n');
    if (nl == std::string::npos || nl == 0 || nl > 18) return false;
    long long ms = 0;
    for (size_t i = 0; i < nl; i++) {
        char c = bytes[i];
        if (c < '0' || c > '9') return false;
        ms = ms * 10 + (c - '0');
    }
    out.expires_at = Clock::time_point(std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds(ms)));
    out.value = bytes.substr(nl + 1);
    return true;
}

} // namespace cache
