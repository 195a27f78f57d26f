/**
 * @file strategies.cpp
 * @brief Token bucket, fixed window, sliding window, adaptive and composite limiters
 */

#include "ratelimit/strategies.h"
#include <algorithm>
#include <cmath>

namespace ratelimit {

namespace {

/// Round a positive wait up to whole milliseconds.
std::chrono::milliseconds ceil_ms(Clock::duration d) {
    if (d <= Clock::duration::zero()) return std::chrono::milliseconds(0);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d);
    if (ms < d) ms += std::chrono::milliseconds(1);
    return ms;
}

} // namespace

// ---- TokenBucket ----

TokenBucket::TokenBucket(double capacity, double refill_per_second)
    : capacity_(std::max(1.0, capacity)), refill_per_second_(std::max(0.0, refill_per_second)) {}

TokenBucket::Bucket& TokenBucket::refill(const std::string& key, Clock::time_point now) {
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        it = buckets_.emplace(key, Bucket{capacity_, now}).first;
        return it->second;
    }
    Bucket& b = it->second;
    double elapsed = std::chrono::duration<double>(now - b.last).count();
    b.tokens = std::min(capacity_, b.tokens + elapsed * refill_per_second_);
    b.last = now;
    return b;
}

bool TokenBucket::allow(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Bucket& b = refill(key, Clock::now());
    if (b.tokens >= 1.0) {
        b.tokens -= 1.0;
        return true;
    }
    return false;
}

std::chrono::milliseconds TokenBucket::retry_after(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Bucket& b = refill(key, Clock::now());
    if (b.tokens >= 1.0) return std::chrono::milliseconds(0);
    if (refill_per_second_ <= 0.0) return std::chrono::milliseconds::max();
    double seconds = (1.0 - b.tokens) / refill_per_second_;
    return ceil_ms(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds)));
}

double TokenBucket::tokens(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return refill(key, Clock::now()).tokens;
}

// ---- FixedWindow ----

FixedWindow::FixedWindow(int max_requests, std::chrono::milliseconds window)
    : max_requests_(std::max(1, max_requests)),
      window_(std::max(window, std::chrono::milliseconds(1))) {}

long long FixedWindow::window_index(Clock::time_point now) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() /
           window_.count();
}

bool FixedWindow::allow(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    long long idx = window_index(Clock::now());
    Counter& c = counters_[key];
    if (c.index != idx) {
        c.index = idx;
        c.count = 0;
    }
    if (c.count < max_requests_) {
        c.count++;
        return true;
    }
    return false;
}

std::chrono::milliseconds FixedWindow::retry_after(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    long long idx = window_index(now);
    auto it = counters_.find(key);
    if (it == counters_.end() || it->second.index != idx || it->second.count < max_requests_) {
        return std::chrono::milliseconds(0);
    }
    auto boundary = Clock::time_point(std::chrono::duration_cast<Clock::duration>(window_ * (idx + 1)));
    return ceil_ms(boundary - now);
}

// ---- SlidingWindow ----

SlidingWindow::SlidingWindow(int max_requests, std::chrono::milliseconds window)
    : max_requests_(std::max(1, max_requests)),
      window_(std::max(window, std::chrono::milliseconds(1))) {}

std::deque<Clock::time_point>& SlidingWindow::prune(const std::string& key, Clock::time_point now) {
    auto& log = logs_[key];
    while (!log.empty() && log.front() <= now - window_) {
        log.pop_front();
    }
    return log;
}

bool SlidingWindow::allow(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    auto& log = prune(key, now);
    if (static_cast<int>(log.size()) < max_requests_) {
        log.push_back(now);
        return true;
    }
    return false;
}

std::chrono::milliseconds SlidingWindow::retry_after(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    auto& log = prune(key, now);
    if (static_cast<int>(log.size()) < max_requests_) return std::chrono::milliseconds(0);
    return ceil_ms(log.front() + window_ - now);
}

int SlidingWindow::remaining(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& log = prune(key, Clock::now());
    return std::max(0, max_requests_ - static_cast<int>(log.size()));
}

// ---- Adaptive ----

Adaptive::Adaptive(std::unique_ptr<RateLimiter> inner,
                   int base_limit,
                   std::chrono::milliseconds window,
                   double min_factor,
                   int recovery_successes,
                   double recovery_step)
    : inner_(std::move(inner)),
      base_limit_(std::max(1, base_limit)),
      window_(std::max(window, std::chrono::milliseconds(1))),
      min_factor_(std::clamp(min_factor, 0.01, 1.0)),
      recovery_successes_(std::max(1, recovery_successes)),
      recovery_step_(std::max(0.0, recovery_step)) {}

Adaptive::KeyState& Adaptive::state(const std::string& key, Clock::time_point now) {
    KeyState& s = states_[key];
    while (!s.log.empty() && s.log.front() <= now - window_) {
        s.log.pop_front();
    }
    return s;
}

int Adaptive::limit_for(const KeyState& s) const {
    return std::max(1, static_cast<int>(std::floor(base_limit_ * s.factor)));
}

bool Adaptive::allow(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    KeyState& s = state(key, now);
    if (static_cast<int>(s.log.size()) >= limit_for(s)) return false;
    if (inner_ && !inner_->allow(key)) return false;
    s.log.push_back(now);
    return true;
}

std::chrono::milliseconds Adaptive::retry_after(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    KeyState& s = state(key, now);
    std::chrono::milliseconds own(0);
    if (static_cast<int>(s.log.size()) >= limit_for(s)) {
        own = ceil_ms(s.log.front() + window_ - now);
    }
    std::chrono::milliseconds inner = inner_ ? inner_->retry_after(key) : std::chrono::milliseconds(0);
    return std::max(own, inner);
}

void Adaptive::record_outcome(const std::string& key, Outcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        KeyState& s = states_[key];
        switch (outcome) {
            case Outcome::Throttled:
                s.factor = std::max(min_factor_, s.factor * 0.5);
                s.successes = 0;
                break;
            case Outcome::Success:
                if (++s.successes >= recovery_successes_) {
                    s.factor = std::min(1.0, s.factor + recovery_step_);
                    s.successes = 0;
                }
                break;
            case Outcome::Error:
                s.successes = 0;
                break;
        }
    }
    if (inner_) inner_->record_outcome(key, outcome);
}

double Adaptive::load_factor(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(key);
    return it == states_.end() ? 1.0 : it->second.factor;
}

int Adaptive::effective_limit(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(key);
    return it == states_.end() ? base_limit_ : limit_for(it->second);
}

// ---- Composite ----

Composite::Composite(std::vector<std::unique_ptr<RateLimiter>> children)
    : children_(std::move(children)) {}

bool Composite::allow(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& child : children_) {
        if (child->retry_after(key).count() > 0) return false;
    }
    bool ok = true;
    for (auto& child : children_) {
        ok = child->allow(key) && ok;
    }
    return ok;
}

std::chrono::milliseconds Composite::retry_after(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::chrono::milliseconds wait(0);
    for (auto& child : children_) {
        wait = std::max(wait, child->retry_after(key));
    }
    return wait;
}

void Composite::record_outcome(const std::string& key, Outcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& child : children_) {
        child->record_outcome(key, outcome);
    }
}

} // namespace ratelimit
