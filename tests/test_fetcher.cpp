/**
 * @file test_fetcher.cpp
 * @brief Unit tests for caching, retries and admission in the Fetcher
 */

#include <catch2/catch.hpp>
#include "cache/cache_store.h"
#include "cache/memory_tier.h"
#include "core/fetcher.h"
#include "helpers/fake_transport.h"
#include "ratelimit/strategies.h"
#include <atomic>

using test_helpers::FakeRoute;
using test_helpers::FakeTransport;

namespace {

std::shared_ptr<cache::CacheStore> memory_cache() {
    std::vector<std::unique_ptr<cache::CacheBackend>> tiers;
    tiers.push_back(std::make_unique<cache::MemoryTier>(64));
    return std::make_shared<cache::CacheStore>(std::move(tiers));
}

Fetcher::Options fast_retries() {
    Fetcher::Options opts;
    opts.backoff_initial_ms = 1;
    opts.backoff_max_ms = 5;
    return opts;
}

HttpRequest get(const std::string& url) {
    HttpRequest req;
    req.url = url;
    return req;
}

} // namespace

TEST_CASE("Successful GET responses are cached", "[fetcher][cache]") {
    auto fake = std::make_shared<FakeTransport>();
    fake->page("http://site.test/", "<p>home</p>", {{"x-custom", "1"}});
    Fetcher fetcher(fake, memory_cache(), nullptr, fast_retries());

    FetchResult first = fetcher.fetch(get("http://site.test/"));
    REQUIRE(first.ok());
    REQUIRE_FALSE(first.from_cache);
    REQUIRE(first.response.status == 200);

    FetchResult second = fetcher.fetch(get("HTTP://SITE.test:80/#x"));
    REQUIRE(second.ok());
    REQUIRE(second.from_cache);
    REQUIRE(second.response.body == "<p>home</p>");
    REQUIRE(second.response.header("x-custom") == "1");
    REQUIRE(fake->total() == 1);

    SECTION("bypassing the cache goes to the network") {
        FetchOptions fopts;
        fopts.use_cache = false;
        FetchResult probe = fetcher.fetch(get("http://site.test/"), fopts);
        REQUIRE_FALSE(probe.from_cache);
        REQUIRE(fake->total() == 2);
    }

    SECTION("POST is never cached") {
        HttpRequest post = get("http://site.test/");
        post.method = "POST";
        fetcher.fetch(post);
        fetcher.fetch(post);
        REQUIRE(fake->total() == 3);
    }
}

TEST_CASE("Fingerprint depends on response-varying headers only", "[fetcher][cache]") {
    HttpRequest a = get("http://site.test/p?b=2&a=1");
    HttpRequest b = get("http://site.test/p?a=1&b=2");
    b.headers["X-Trace"] = "123";
    REQUIRE(Fetcher::fingerprint(a) == Fetcher::fingerprint(b));

    b.headers["Cookie"] = "sid=1";
    REQUIRE(Fetcher::fingerprint(a) != Fetcher::fingerprint(b));

    HttpRequest head = a;
    head.method = "HEAD";
    REQUIRE(Fetcher::fingerprint(a) != Fetcher::fingerprint(head));
}

TEST_CASE("Server errors are retried and then reported", "[fetcher][retry]") {
    auto fake = std::make_shared<FakeTransport>();
    FakeRoute broken;
    broken.status = 502;
    broken.body = "bad gateway";
    fake->add("http://site.test/down", broken);
    auto cache = memory_cache();
    Fetcher fetcher(fake, cache, nullptr, fast_retries());

    FetchResult r = fetcher.fetch(get("http://site.test/down"));
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error->kind == FetchErrorKind::HttpStatus);
    REQUIRE(r.error->status == 502);
    REQUIRE(r.response.body == "bad gateway");
    REQUIRE(r.attempts == 3);
    REQUIRE(fake->count("http://site.test/down") == 3);
    REQUIRE(cache->stats().sets == 0);
}

TEST_CASE("A transient failure followed by success", "[fetcher][retry]") {
    auto fake = std::make_shared<FakeTransport>();
    auto calls = std::make_shared<std::atomic<int>>(0);
    fake->on_request([calls](const HttpRequest&) -> std::optional<FakeRoute> {
        FakeRoute route;
        if ((*calls)++ == 0) {
            route.failure = NetError::Timeout;
        } else {
            route.body = "ok";
        }
        return route;
    });
    Fetcher fetcher(fake, nullptr, nullptr, fast_retries());

    FetchResult r = fetcher.fetch(get("http://site.test/flaky"));
    REQUIRE(r.ok());
    REQUIRE(r.attempts == 2);
    REQUIRE(r.response.body == "ok");
}

TEST_CASE("Failure kinds", "[fetcher]") {
    auto fake = std::make_shared<FakeTransport>();
    fake->fail("http://site.test/tls", NetError::Tls);
    fake->fail("http://site.test/refused", NetError::Connect);
    FakeRoute missing;
    missing.status = 404;
    fake->add("http://site.test/missing", missing);
    Fetcher fetcher(fake, nullptr, nullptr, fast_retries());

    SECTION("4xx is an ordinary response") {
        FetchResult r = fetcher.fetch(get("http://site.test/missing"));
        REQUIRE(r.ok());
        REQUIRE(r.response.status == 404);
        REQUIRE(r.attempts == 1);
    }

    SECTION("TLS failures are not retried") {
        FetchResult r = fetcher.fetch(get("http://site.test/tls"));
        REQUIRE(r.error->kind == FetchErrorKind::Tls);
        REQUIRE(r.attempts == 1);
    }

    SECTION("connection failures are retried") {
        FetchResult r = fetcher.fetch(get("http://site.test/refused"));
        REQUIRE(r.error->kind == FetchErrorKind::Connection);
        REQUIRE(r.attempts == 3);
    }

    SECTION("per-call retry override") {
        FetchOptions fopts;
        fopts.max_retries = 0;
        FetchResult r = fetcher.fetch(get("http://site.test/refused"), fopts);
        REQUIRE(r.attempts == 1);
    }

    SECTION("malformed URLs never reach the transport") {
        FetchResult r = fetcher.fetch(get("not a url"));
        REQUIRE(r.error->kind == FetchErrorKind::InvalidRequest);
        REQUIRE(fake->total() == 0);
    }
}

TEST_CASE("Deadline and admission", "[fetcher][ratelimit]") {
    auto fake = std::make_shared<FakeTransport>();
    fake->page("http://site.test/", "home");

    SECTION("a passed deadline cancels the fetch") {
        Fetcher::Options opts = fast_retries();
        opts.deadline = Fetcher::SteadyClock::now() - std::chrono::seconds(1);
        Fetcher fetcher(fake, nullptr, nullptr, opts);
        FetchResult r = fetcher.fetch(get("http://site.test/"));
        REQUIRE(r.error->kind == FetchErrorKind::Cancelled);
        REQUIRE(fake->total() == 0);
    }

    SECTION("no slot within the queue bound is RateLimited") {
        auto limiter = std::make_shared<ratelimit::TokenBucket>(1, 0.001);
        Fetcher::Options opts = fast_retries();
        opts.max_queue_ms = 20;
        Fetcher fetcher(fake, nullptr, limiter, opts);

        REQUIRE(fetcher.fetch(get("http://site.test/")).ok());
        FetchResult r = fetcher.fetch(get("http://site.test/"));
        REQUIRE(r.error->kind == FetchErrorKind::RateLimited);
        REQUIRE(fake->total() == 1);
    }

    SECTION("rate limiting can be bypassed per call") {
        auto limiter = std::make_shared<ratelimit::TokenBucket>(1, 0.001);
        Fetcher::Options opts = fast_retries();
        opts.max_queue_ms = 20;
        Fetcher fetcher(fake, nullptr, limiter, opts);

        FetchOptions fopts;
        fopts.rate_limit = false;
        REQUIRE(fetcher.fetch(get("http://site.test/"), fopts).ok());
        REQUIRE(fetcher.fetch(get("http://site.test/"), fopts).ok());
    }
}
