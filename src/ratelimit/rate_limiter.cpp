/**
 * @file rate_limiter.cpp
 * @brief Blocking acquire and limiter construction from options
 */

#include "ratelimit/rate_limiter.h"
#include "ratelimit/strategies.h"
#include <algorithm>
#include <thread>
#include <vector>

namespace ratelimit {

bool parse_strategy(const std::string& name, Strategy& out) {
    if (name == "token_bucket") out = Strategy::TokenBucket;
    else if (name == "fixed_window") out = Strategy::FixedWindow;
    else if (name == "sliding_window") out = Strategy::SlidingWindow;
    else if (name == "adaptive") out = Strategy::Adaptive;
    else return false;
    return true;
}

const char* strategy_name(Strategy s) {
    switch (s) {
        case Strategy::TokenBucket:   return "token_bucket";
        case Strategy::FixedWindow:   return "fixed_window";
        case Strategy::SlidingWindow: return "sliding_window";
        case Strategy::Adaptive:      return "adaptive";
    }
    return "token_bucket";
}

bool RateLimiter::acquire(const std::string& key, std::chrono::milliseconds max_wait) {
    const auto deadline = Clock::now() + max_wait;
    const auto max_nap = std::chrono::milliseconds(250);
    while (true) {
        if (allow(key)) return true;
        auto now = Clock::now();
        if (now >= deadline) return false;

        auto hint = retry_after(key);
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto nap = std::clamp(hint, std::chrono::milliseconds(1), max_nap);
        // A hint past the deadline means waiting cannot help
        if (hint > left + max_nap) return false;
        std::this_thread::sleep_for(std::min(nap, std::max(left, std::chrono::milliseconds(1))));
    }
}

static std::unique_ptr<RateLimiter> make_strategy(Strategy s, const Options& opts) {
    double window_s = std::chrono::duration<double>(opts.window).count();
    switch (s) {
        case Strategy::TokenBucket:
            return std::make_unique<TokenBucket>(opts.max_requests,
                                                 window_s > 0 ? opts.max_requests / window_s : opts.max_requests);
        case Strategy::FixedWindow:
            return std::make_unique<FixedWindow>(opts.max_requests, opts.window);
        case Strategy::SlidingWindow:
            return std::make_unique<SlidingWindow>(opts.max_requests, opts.window);
        case Strategy::Adaptive: {
            Strategy base = opts.adaptive_base == Strategy::Adaptive ? Strategy::SlidingWindow : opts.adaptive_base;
            return std::make_unique<Adaptive>(make_strategy(base, opts), opts.max_requests, opts.window,
                                              opts.min_factor, opts.recovery_successes, opts.recovery_step);
        }
    }
    return std::make_unique<TokenBucket>(opts.max_requests, opts.max_requests);
}

std::shared_ptr<RateLimiter> build_limiter(const Options& opts,
                                           std::chrono::milliseconds politeness_delay) {
    std::vector<std::unique_ptr<RateLimiter>> children;
    if (opts.enabled) {
        children.push_back(make_strategy(opts.strategy, opts));
    }
    if (politeness_delay.count() > 0) {
        // One request, then one more per delay
        children.push_back(std::make_unique<TokenBucket>(1.0, 1000.0 / politeness_delay.count()));
    }
    return std::make_shared<Composite>(std::move(children));
}

} // namespace ratelimit
