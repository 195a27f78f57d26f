#pragma once
#include "http_client.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace cache { class CacheStore; }
namespace ratelimit { class RateLimiter; }

// Single entry point for outbound HTTP during a scan.
// Order of operations for one fetch: cache lookup (GET/HEAD), rate limiter
// admission keyed by host, transport call with a timeout clipped to the scan
// deadline, cache write for 2xx/3xx, retries with exponential backoff for
// timeouts, connection failures and 5xx. Other 4xx responses come back as
// ordinary responses.

enum class FetchErrorKind {
    Timeout,
    Connection,
    Tls,
    HttpStatus,
    RateLimited,
    InvalidRequest,
    Cancelled
};

const char* fetch_error_name(FetchErrorKind kind);

struct FetchError {
    FetchErrorKind kind;
    std::string message;
    long status = 0;   // set for HttpStatus
};

struct FetchResult {
    HttpResponse response;
    bool from_cache = false;
    int attempts = 0;
    double duration_ms = 0.0;      // wall time of the final transport call
    std::optional<FetchError> error;

    bool ok() const { return !error.has_value(); }
};

/// Per-call overrides
struct FetchOptions {
    bool use_cache = true;         // probes with payloads turn this off
    bool rate_limit = true;
    long timeout_ms = 0;           // 0 = fetcher default
    int max_retries = -1;          // -1 = fetcher default
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

class Fetcher {
public:
    using SteadyClock = std::chrono::steady_clock;

    struct Options {
        int max_retries;
        long backoff_initial_ms;
        long backoff_max_ms;
        long max_queue_ms;
        long request_timeout_ms;
        std::chrono::seconds cache_ttl;
        std::optional<SteadyClock::time_point> deadline;   // scan deadline

        Options()
            : max_retries(2),
              backoff_initial_ms(250),
              backoff_max_ms(4000),
              max_queue_ms(30000),
              request_timeout_ms(30000),
              cache_ttl(3600)
        {}
    };

    /**
     * @brief Create a fetcher over a transport
     * @param transport Network capability (libcurl client or a test fake)
     * @param cache Response cache; may be null
     * @param limiter Admission control; may be null
     * @param opts Retry, timeout and cache settings
     */
    Fetcher(std::shared_ptr<const HttpTransport> transport,
            std::shared_ptr<cache::CacheStore> cache,
            std::shared_ptr<ratelimit::RateLimiter> limiter,
            const Options& opts = Options());

    /**
     * @brief Fetch a request through cache, limiter and transport
     * @param req Request to issue
     * @param fopts Per-call overrides
     * @return Response, or a FetchError describing the terminal failure
     */
    FetchResult fetch(const HttpRequest& req, const FetchOptions& fopts = FetchOptions()) const;

    /**
     * @brief Cache key for a request
     *
     * SHA-256 over method, normalized URL and the request headers that
     * change the response (Accept, Accept-Language, Authorization, Cookie).
     */
    static std::string fingerprint(const HttpRequest& req);

    const Options& options() const { return opts_; }
    std::shared_ptr<cache::CacheStore> cache() const { return cache_; }
    std::shared_ptr<ratelimit::RateLimiter> limiter() const { return limiter_; }

private:
    std::shared_ptr<const HttpTransport> transport_;
    std::shared_ptr<cache::CacheStore> cache_;
    std::shared_ptr<ratelimit::RateLimiter> limiter_;
    Options opts_;

    std::optional<FetchResult> from_cache(const std::string& key) const;
    void store(const std::string& key, const HttpResponse& resp) const;
};
