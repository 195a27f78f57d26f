#pragma once
#include "ratelimit/rate_limiter.h"
#include <deque>
#include <map>
#include <mutex>
#include <vector>

namespace ratelimit {

/**
 * Bucket of `capacity` tokens per key, refilled continuously at
 * `refill_per_second`. Buckets start full.
 */
class TokenBucket : public RateLimiter {
public:
    TokenBucket(double capacity, double refill_per_second);

    const char* name() const override { return "token_bucket"; }
    bool allow(const std::string& key) override;
    std::chrono::milliseconds retry_after(const std::string& key) override;

    double tokens(const std::string& key);

private:
    struct Bucket {
        double tokens;
        Clock::time_point last;
    };

    double capacity_;
    double refill_per_second_;
    std::map<std::string, Bucket> buckets_;
    std::mutex mutex_;

    Bucket& refill(const std::string& key, Clock::time_point now);
};

/**
 * At most max_requests per aligned window; the count resets when the
 * clock crosses a window boundary.
 */
class FixedWindow : public RateLimiter {
public:
    FixedWindow(int max_requests, std::chrono::milliseconds window);

    const char* name() const override { return "fixed_window"; }
    bool allow(const std::string& key) override;
    std::chrono::milliseconds retry_after(const std::string& key) override;

private:
    struct Counter {
        long long index = -1;
        int count = 0;
    };

    int max_requests_;
    std::chrono::milliseconds window_;
    std::map<std::string, Counter> counters_;
    std::mutex mutex_;

    long long window_index(Clock::time_point now) const;
};

/**
 * At most max_requests within any trailing window, tracked with a
 * per-key timestamp log.
 */
class SlidingWindow : public RateLimiter {
public:
    SlidingWindow(int max_requests, std::chrono::milliseconds window);

    const char* name() const override { return "sliding_window"; }
    bool allow(const std::string& key) override;
    std::chrono::milliseconds retry_after(const std::string& key) override;

    int remaining(const std::string& key);

private:
    int max_requests_;
    std::chrono::milliseconds window_;
    std::map<std::string, std::deque<Clock::time_point>> logs_;
    std::mutex mutex_;

    std::deque<Clock::time_point>& prune(const std::string& key, Clock::time_point now);
};

/**
 * Wraps another strategy and lowers the per-window limit for a key when
 * the target pushes back. A Throttled outcome halves the load factor (not
 * below min_factor); every recovery_successes consecutive successes raise
 * it by recovery_step, up to 1.0.
 */
class Adaptive : public RateLimiter {
public:
    Adaptive(std::unique_ptr<RateLimiter> inner,
             int base_limit,
             std::chrono::milliseconds window,
             double min_factor = 0.1,
             int recovery_successes = 20,
             double recovery_step = 0.05);

    const char* name() const override { return "adaptive"; }
    bool allow(const std::string& key) override;
    std::chrono::milliseconds retry_after(const std::string& key) override;
    void record_outcome(const std::string& key, Outcome outcome) override;

    double load_factor(const std::string& key);
    int effective_limit(const std::string& key);

private:
    struct KeyState {
        double factor = 1.0;
        int successes = 0;
        std::deque<Clock::time_point> log;
    };

    std::unique_ptr<RateLimiter> inner_;
    int base_limit_;
    std::chrono::milliseconds window_;
    double min_factor_;
    int recovery_successes_;
    double recovery_step_;
    std::map<std::string, KeyState> states_;
    std::mutex mutex_;

    KeyState& state(const std::string& key, Clock::time_point now);
    int limit_for(const KeyState& s) const;
};

/**
 * Admits a request only if every child does. Children are checked with
 * retry_after() first so none of them spends a slot on a rejected request.
 */
class Composite : public RateLimiter {
public:
    explicit Composite(std::vector<std::unique_ptr<RateLimiter>> children);

    const char* name() const override { return "composite"; }
    bool allow(const std::string& key) override;
    std::chrono::milliseconds retry_after(const std::string& key) override;
    void record_outcome(const std::string& key, Outcome outcome) override;

    size_t size() const { return children_.size(); }

private:
    std::vector<std::unique_ptr<RateLimiter>> children_;
    std::mutex mutex_;
};

} // namespace ratelimit
