/**
 * @file test_cache.cpp
 * @brief Unit tests for the tiered response cache
 */

#include <catch2/catch.hpp>
#include "cache/cache_store.h"
#include "cache/disk_tier.h"
#include "cache/memory_tier.h"
#include "cache/remote_tier.h"
#include "core/errors.h"
#include "helpers/fake_transport.h"
#include <atomic>
#include <filesystem>
#include <thread>

using namespace cache;
namespace fs = std::filesystem;

namespace {

/// Every operation fails
class BrokenTier : public CacheBackend {
public:
    const char* name() const override { return "broken"; }
    std::optional<CacheEntry> get(const std::string&) override { throw CacheError("backend down"); }
    void set(const std::string&, const CacheEntry&) override { throw CacheError("backend down"); }
    void remove(const std::string&) override { throw CacheError("backend down"); }
    void clear() override { throw CacheError("backend down"); }
};

fs::path fresh_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    return dir;
}

std::vector<std::unique_ptr<CacheBackend>> tiers_of(std::unique_ptr<CacheBackend> a,
                                                    std::unique_ptr<CacheBackend> b = nullptr) {
    std::vector<std::unique_ptr<CacheBackend>> tiers;
    tiers.push_back(std::move(a));
    if (b) tiers.push_back(std::move(b));
    return tiers;
}

} // namespace

TEST_CASE("Cache round trip and expiry", "[cache]") {
    CacheStore store(tiers_of(std::make_unique<MemoryTier>(16)));

    SECTION("a stored value comes back before its TTL") {
        store.set("k", "value", std::chrono::seconds(60));
        auto v = store.get("k");
        REQUIRE(v);
        REQUIRE(*v == "value");
        REQUIRE(store.exists("k"));
    }

    SECTION("an expired value is a miss") {
        store.set("k", "value", std::chrono::seconds(0));
        REQUIRE_FALSE(store.get("k"));
        REQUIRE_FALSE(store.exists("k"));
    }

    SECTION("remove and clear") {
        store.set("a", "1");
        store.set("b", "2");
        store.remove("a");
        REQUIRE_FALSE(store.get("a"));
        REQUIRE(store.get("b"));
        store.clear();
        REQUIRE_FALSE(store.get("b"));
    }

    SECTION("stats count hits, misses and sets") {
        store.set("k", "v");
        store.get("k");
        store.get("missing");
        store.exists("k");     // not counted
        CacheStats s = store.stats();
        REQUIRE(s.hits == 1);
        REQUIRE(s.misses == 1);
        REQUIRE(s.sets == 1);
        REQUIRE(s.hit_rate() == Approx(0.5));
        REQUIRE(s.tier_names == std::vector<std::string>{"memory"});
    }
}

TEST_CASE("Memory tier evicts the least recently used entry", "[cache][memory]") {
    MemoryTier tier(2);
    CacheEntry e{"x", Clock::now() + std::chrono::hours(1)};

    tier.set("a", e);
    tier.set("b", e);
    REQUIRE(tier.get("a"));      // a is now most recent
    tier.set("c", e);

    REQUIRE(tier.size() == 2);
    REQUIRE(tier.evictions() == 1);
    REQUIRE(tier.get("a"));
    REQUIRE_FALSE(tier.get("b"));
    REQUIRE(tier.get("c"));
}

TEST_CASE("Disk tier persists entries across instances", "[cache][disk]") {
    fs::path dir = fresh_dir("sitecheck_disk_tier_test");
    CacheEntry e{std::string("bin\0ary\nbody", 12), Clock::now() + std::chrono::hours(1)};

    {
        DiskTier tier(dir.string());
        tier.set("key one", e);
    }
    {
        DiskTier tier(dir.string());
        auto got = tier.get("key one");
        REQUIRE(got);
        REQUIRE(got->value == e.value);
        tier.clear();
        REQUIRE_FALSE(tier.get("key one"));
    }

    fs::remove_all(dir);
}

TEST_CASE("Lower-tier hits are promoted", "[cache][tiers]") {
    fs::path dir = fresh_dir("sitecheck_promotion_test");
    auto disk = std::make_unique<DiskTier>(dir.string());
    disk->set("k", CacheEntry{"from disk", Clock::now() + std::chrono::hours(1)});

    CacheStore store(tiers_of(std::make_unique<MemoryTier>(8), std::move(disk)));

    REQUIRE(store.get("k") == std::optional<std::string>("from disk"));
    REQUIRE(store.get("k") == std::optional<std::string>("from disk"));

    CacheStats s = store.stats();
    REQUIRE(s.tier_hits.size() == 2);
    REQUIRE(s.tier_hits[1] == 1);    // first lookup
    REQUIRE(s.tier_hits[0] == 1);    // second lookup, after promotion

    fs::remove_all(dir);
}

TEST_CASE("Backend failures degrade to misses", "[cache][tiers]") {
    CacheStore store(tiers_of(std::make_unique<BrokenTier>(), std::make_unique<MemoryTier>(8)));

    store.set("k", "v");
    // The broken tier is skipped, the memory tier still answers
    REQUIRE(store.get("k") == std::optional<std::string>("v"));
    REQUIRE_NOTHROW(store.remove("k"));
    REQUIRE_NOTHROW(store.clear());
    REQUIRE(store.stats().errors >= 4);

    CacheStore only_broken(tiers_of(std::make_unique<BrokenTier>()));
    REQUIRE_FALSE(only_broken.get("k"));
}

TEST_CASE("Remote tier speaks the HTTP key/value protocol", "[cache][remote]") {
    auto fake = std::make_shared<test_helpers::FakeTransport>();
    auto stored = std::make_shared<std::map<std::string, std::string>>();
    auto mu = std::make_shared<std::mutex>();

    fake->on_request([stored, mu](const HttpRequest& req) -> std::optional<test_helpers::FakeRoute> {
        std::lock_guard<std::mutex> lock(*mu);
        test_helpers::FakeRoute route;
        if (req.method == "PUT") {
            (*stored)[req.url] = req.body;
            route.status = 204;
        } else if (req.method == "GET") {
            auto it = stored->find(req.url);
            if (it == stored->end()) {
                route.status = 404;
            } else {
                route.body = it->second;
            }
        } else if (req.method == "DELETE") {
            stored->erase(req.url);
            route.status = 204;
        }
        return route;
    });

    RemoteTier tier(fake, "http://cache.test/ns/");
    CacheEntry e{"payload", Clock::now() + std::chrono::hours(1)};

    REQUIRE_FALSE(tier.get("a key"));
    tier.set("a key", e);
    REQUIRE(stored->count("http://cache.test/ns/a%20key") == 1);

    auto got = tier.get("a key");
    REQUIRE(got);
    REQUIRE(got->value == "payload");

    tier.remove("a key");
    REQUIRE_FALSE(tier.get("a key"));

    SECTION("unexpected statuses raise CacheError") {
        fake->on_request([](const HttpRequest&) -> std::optional<test_helpers::FakeRoute> {
            test_helpers::FakeRoute route;
            route.status = 500;
            return route;
        });
        REQUIRE_THROWS_AS(tier.get("a key"), CacheError);
        REQUIRE_THROWS_AS(tier.set("a key", e), CacheError);
    }
}

TEST_CASE("Concurrent readers and writers on shared keys", "[cache][concurrency]") {
    const int threads = 8;
    const int rounds = 500;
    CacheStore store(tiers_of(std::make_unique<MemoryTier>(8), std::make_unique<MemoryTier>(64)));

    std::atomic<int> foreign{0};
    std::atomic<int> lookups{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; t++) {
        workers.emplace_back([&, t]() {
            for (int i = 0; i < rounds; i++) {
                std::string key = "k" + std::to_string((t * 7 + i) % 16);
                store.set(key, "v:" + key + ":" + std::to_string(t) + ":" + std::to_string(i));

                std::string other = "k" + std::to_string((t + i * 3) % 16);
                auto value = store.get(other);
                lookups++;
                // Either a miss or something some writer stored under that key
                if (value && value->rfind("v:" + other + ":", 0) != 0) foreign++;
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(foreign == 0);
    CacheStats stats = store.stats();
    REQUIRE(stats.sets == static_cast<uint64_t>(threads * rounds));
    REQUIRE(stats.hits + stats.misses == static_cast<uint64_t>(lookups.load()));
    REQUIRE(stats.errors == 0);

    for (int k = 0; k < 16; k++) {
        std::string key = "k" + std::to_string(k);
        auto value = store.get(key);
        REQUIRE(value);
        REQUIRE(value->rfind("v:" + key + ":", 0) == 0);
    }
}

TEST_CASE("Entry envelope", "[cache]") {
    CacheEntry e{"line1\nline2", Clock::now() + std::chrono::minutes(5)};
    CacheEntry back;
    REQUIRE(decode_entry(encode_entry(e), back));
    REQUIRE(back.value == e.value);

    REQUIRE_FALSE(decode_entry("no newline", back));
    REQUIRE_FALSE(decode_entry("12a\nvalue", back));
    REQUIRE_FALSE(decode_entry("\nvalue", back));
}

TEST_CASE("from_options builds the configured tiers", "[cache]") {
    fs::path dir = fresh_dir("sitecheck_from_options_test");
    Options opts;
    opts.memory_capacity = 4;
    opts.disk_dir = dir.string();

    auto store = CacheStore::from_options(opts, nullptr);
    REQUIRE(store->stats().tier_names == std::vector<std::string>{"memory", "disk"});

    opts.enabled = false;
    auto disabled = CacheStore::from_options(opts, nullptr);
    REQUIRE(disabled->stats().tier_names.empty());

    fs::remove_all(dir);
}
