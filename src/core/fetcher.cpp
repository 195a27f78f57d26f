/**
 * @file fetcher.cpp
 * @brief Cache, rate limiting, timeouts and retries around an HttpTransport
 */

#include "fetcher.h"
#include "cache/cache_store.h"
#include "core/digest.h"
#include "core/url.h"
#include "logging/console.h"
#include "ratelimit/rate_limiter.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <thread>
#include <vector>

using json = nlohmann::json;

const char* fetch_error_name(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::Timeout:        return "timeout";
        case FetchErrorKind::Connection:     return "connection";
        case FetchErrorKind::Tls:            return "tls";
        case FetchErrorKind::HttpStatus:     return "http_status";
        case FetchErrorKind::RateLimited:    return "rate_limited";
        case FetchErrorKind::InvalidRequest: return "invalid_request";
        case FetchErrorKind::Cancelled:      return "cancelled";
    }
    return "connection";
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

static bool cacheable_method(const std::string& method) {
    return method == "GET" || method == "HEAD";
}

static long ms_until(Fetcher::SteadyClock::time_point t) {
    auto left = t - Fetcher::SteadyClock::now();
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(left).count());
}

Fetcher::Fetcher(std::shared_ptr<const HttpTransport> transport,
                 std::shared_ptr<cache::CacheStore> cache,
                 std::shared_ptr<ratelimit::RateLimiter> limiter,
                 const Options& opts)
    : transport_(std::move(transport)),
      cache_(std::move(cache)),
      limiter_(std::move(limiter)),
      opts_(opts) {}

std::string Fetcher::fingerprint(const HttpRequest& req) {
    std::string canonical = req.method;
    canonical += '\n';
    auto norm = urls::normalize(req.url);
    canonical += norm ? *norm : req.url;
    canonical += '\n';

    std::vector<std::pair<std::string, std::string>> relevant;
    for (const auto& [name, value] : req.headers) {
        std::string lower = to_lower(name);
        if (lower == "accept" || lower == "accept-language" ||
            lower == "authorization" || lower == "cookie") {
            relevant.emplace_back(lower, value);
        }
    }
    std::sort(relevant.begin(), relevant.end());
    for (const auto& [name, value] : relevant) {
        canonical += name + ":" + value + "\n";
    }
    return sha256_hex(canonical);
}

// Cached responses are CBOR documents: status, headers, effective URL, body.
std::optional<FetchResult> Fetcher::from_cache(const std::string& key) const {
    auto bytes = cache_->get(key);
    if (!bytes) return std::nullopt;
    try {
        json j = json::from_cbor(*bytes);
        FetchResult r;
        r.from_cache = true;
        r.response.status = j.at("status").get<long>();
        r.response.effective_url = j.value("effective_url", "");
        for (const auto& h : j.at("headers")) {
            r.response.headers.emplace_back(h.at(0).get<std::string>(), h.at(1).get<std::string>());
        }
        const auto& body = j.at("body").get_binary();
        r.response.body.assign(body.begin(), body.end());
        r.response.body_bytes = r.response.body.size();
        return r;
    } catch (const json::exception& e) {
        logging::warn(std::string("cache: dropping unreadable entry: ") + e.what());
        cache_->remove(key);
        return std::nullopt;
    }
}

void Fetcher::store(const std::string& key, const HttpResponse& resp) const {
    json j;
    j["status"] = resp.status;
    j["effective_url"] = resp.effective_url;
    j["headers"] = json::array();
    for (const auto& [name, value] : resp.headers) {
        j["headers"].push_back({name, value});
    }
    j["body"] = json::binary(std::vector<std::uint8_t>(resp.body.begin(), resp.body.end()));
    std::vector<std::uint8_t> cbor = json::to_cbor(j);
    cache_->set(key, std::string(cbor.begin(), cbor.end()), opts_.cache_ttl);
}

FetchResult Fetcher::fetch(const HttpRequest& req, const FetchOptions& fopts) const {
    FetchResult result;

    auto norm = urls::normalize(req.url);
    std::string host = norm ? urls::host_of(*norm) : std::string();
    if (!norm || host.empty()) {
        result.error = FetchError{FetchErrorKind::InvalidRequest, "malformed URL: " + req.url};
        return result;
    }

    // Effective deadline: the earlier of the scan deadline and the caller's
    std::optional<SteadyClock::time_point> deadline = opts_.deadline;
    if (fopts.deadline && (!deadline || *fopts.deadline < *deadline)) {
        deadline = fopts.deadline;
    }

    const bool use_cache = fopts.use_cache && cache_ && cacheable_method(req.method);
    std::string key;
    if (use_cache) {
        key = fingerprint(req);
        if (auto hit = from_cache(key)) {
            return std::move(*hit);
        }
    }

    const int max_retries = fopts.max_retries >= 0 ? fopts.max_retries : opts_.max_retries;
    const long base_timeout = fopts.timeout_ms > 0 ? fopts.timeout_ms : opts_.request_timeout_ms;
    long backoff = opts_.backoff_initial_ms;

    while (true) {
        result.attempts++;

        long timeout = base_timeout;
        if (deadline) {
            long left = ms_until(*deadline);
            if (left <= 0) {
                result.error = FetchError{FetchErrorKind::Cancelled, "scan deadline reached"};
                return result;
            }
            timeout = std::min(timeout, left);
        }

        if (fopts.rate_limit && limiter_) {
            long wait = opts_.max_queue_ms;
            bool deadline_bound = false;
            if (deadline && ms_until(*deadline) < wait) {
                wait = std::max(0L, ms_until(*deadline));
                deadline_bound = true;
            }
            if (!limiter_->acquire(host, std::chrono::milliseconds(wait))) {
                if (deadline_bound) {
                    result.error = FetchError{FetchErrorKind::Cancelled, "scan deadline reached while rate limited"};
                } else {
                    result.error = FetchError{FetchErrorKind::RateLimited,
                                              "no request slot for " + host + " within " +
                                              std::to_string(opts_.max_queue_ms) + " ms"};
                }
                return result;
            }
            if (deadline) {
                timeout = std::min(timeout, std::max(1L, ms_until(*deadline)));
            }
        }

        HttpRequest attempt = req;
        attempt.timeout_ms = timeout;
        HttpResponse resp;
        auto started = SteadyClock::now();
        bool ok = transport_->perform(attempt, resp);
        result.duration_ms = std::chrono::duration<double, std::milli>(SteadyClock::now() - started).count();

        bool retryable = false;
        if (!ok) {
            FetchErrorKind kind = FetchErrorKind::Connection;
            switch (resp.net_error) {
                case NetError::Timeout:    kind = FetchErrorKind::Timeout; retryable = true; break;
                case NetError::Tls:        kind = FetchErrorKind::Tls; break;
                case NetError::InvalidUrl: kind = FetchErrorKind::InvalidRequest; break;
                default:                   kind = FetchErrorKind::Connection; retryable = true; break;
            }
            if (limiter_) limiter_->record_outcome(host, ratelimit::Outcome::Error);
            result.response = std::move(resp);
            result.error = FetchError{kind, result.response.error};
        } else if (resp.status >= 500) {
            if (limiter_) {
                limiter_->record_outcome(host, resp.status == 503 ? ratelimit::Outcome::Throttled
                                                                  : ratelimit::Outcome::Error);
            }
            retryable = true;
            result.error = FetchError{FetchErrorKind::HttpStatus,
                                      "HTTP " + std::to_string(resp.status), resp.status};
            result.response = std::move(resp);
        } else {
            if (limiter_) {
                limiter_->record_outcome(host, resp.status == 429 ? ratelimit::Outcome::Throttled
                                                                  : ratelimit::Outcome::Success);
            }
            result.error.reset();
            result.response = std::move(resp);
            if (use_cache && result.response.status >= 200 && result.response.status < 400) {
                store(key, result.response);
            }
            return result;
        }

        if (!retryable || result.attempts > max_retries) {
            return result;
        }

        // Exponential backoff, never sleeping past the deadline
        long nap = std::min(backoff, opts_.backoff_max_ms);
        if (deadline) {
            long left = ms_until(*deadline);
            if (left <= nap) return result;
        }
        logging::debug("retrying " + req.method + " " + req.url + " after " +
                       result.error->message + " (attempt " + std::to_string(result.attempts) + ")");
        std::this_thread::sleep_for(std::chrono::milliseconds(nap));
        backoff = std::min(backoff * 2, opts_.backoff_max_ms);
    }
}
