#pragma once
#include <chrono>
#include <memory>
#include <string>

namespace ratelimit {

// Request admission control, keyed by host.
// allow() decides immediately; acquire() waits (polling retry_after hints)
// until a slot frees up or the wait bound passes. Implementations are
// internally synchronized and shared by every fetch of a scan.

using Clock = std::chrono::steady_clock;

/// Feedback from a completed request
enum class Outcome {
    Success,
    Throttled,   // 429 / 503
    Error        // 5xx, timeout, connection failure
};

enum class Strategy {
    TokenBucket,
    FixedWindow,
    SlidingWindow,
    Adaptive
};

bool parse_strategy(const std::string& name, Strategy& out);
const char* strategy_name(Strategy s);

class RateLimiter {
public:
    virtual ~RateLimiter() = default;

    virtual const char* name() const = 0;

    /**
     * @brief Try to take a slot for key without waiting
     * @return true if the request may proceed now
     */
    virtual bool allow(const std::string& key) = 0;

    /**
     * @brief Hint for how long until allow(key) could succeed
     * @return Zero if a slot is available now
     */
    virtual std::chrono::milliseconds retry_after(const std::string& key) = 0;

    /// Report how a request admitted for key turned out
    virtual void record_outcome(const std::string& key, Outcome outcome) {
        (void)key;
        (void)outcome;
    }

    /**
     * @brief Block until a slot is available or max_wait elapses
     * @return true if a slot was taken, false if the wait bound was hit
     */
    bool acquire(const std::string& key, std::chrono::milliseconds max_wait);
};

struct Options {
    bool enabled;
    Strategy strategy;
    Strategy adaptive_base;       // strategy wrapped by Adaptive
    int max_requests;             // per window (bucket capacity for TokenBucket)
    std::chrono::milliseconds window;
    double min_factor;            // Adaptive floor as a fraction of max_requests
    int recovery_successes;       // successes before Adaptive raises its limit
    double recovery_step;

    Options()
        : enabled(true),
          strategy(Strategy::TokenBucket),
          adaptive_base(Strategy::SlidingWindow),
          max_requests(10),
          window(1000),
          min_factor(0.1),
          recovery_successes(20),
          recovery_step(0.05)
    {}
};

/**
 * @brief Build the limiter for a scan
 * @param opts Configured strategy
 * @param politeness_delay Minimum spacing between requests to one host;
 *        zero disables the politeness bucket
 *
 * The result admits a request only when both the configured strategy and
 * the politeness bucket do.
 */
std::shared_ptr<RateLimiter> build_limiter(const Options& opts,
                                           std::chrono::milliseconds politeness_delay);

} // namespace ratelimit
