#pragma once
#include "crawler.h"
#include "fetcher.h"
#include "session.h"
#include "cache/cache_store.h"
#include "ratelimit/rate_limiter.h"
#include <chrono>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Settings for one scan. Loaded from a JSON file, validated once and then
// treated as read-only by every component.
//
// File layout (every key optional except target.url):
//   target:     url, base_url, cookies{}, headers{}, auth{type, token, ...}
//   crawler:    max_depth, max_pages, respect_robots_txt, crawl_delay (s),
//               concurrent_requests, timeout (s), allowed_domains[],
//               include_patterns[], exclude_patterns[], openapi, user_agent,
//               max_body_bytes, verify_tls
//   cache:      enabled, ttl (s), memory_capacity, disk_dir, remote_url
//   rate_limit: enabled, strategy, max_requests, window_ms, max_queue_ms,
//               min_factor, adaptive_base
//   retry:      max_retries, backoff_initial_ms, backoff_max_ms
//   modules:    enabled[] or profile, options{name: {...}}, parallel,
//               concurrency, timeout (s)
//   scan:       timeout (s, 0 = unbounded)
//   logging:    level, audit_log
//   plugins:    [shared library paths]

struct ScanConfig {
    std::string target;
    std::string base_url;       // defaults to the origin of target

    Crawler::Options crawl;
    std::chrono::milliseconds delay;
    std::string openapi_path;
    bool verify_tls;

    cache::Options cache;
    ratelimit::Options rate_limit;
    Fetcher::Options fetch;     // retries, backoff, request timeout, queue bound

    std::vector<std::string> modules;   // explicit selection; wins over profile
    std::string profile;
    nlohmann::json module_options;      // name -> option object
    bool parallel;
    int module_concurrency;
    std::chrono::milliseconds module_timeout;
    std::chrono::milliseconds scan_timeout;   // zero = unbounded

    std::map<std::string, std::string> cookies;
    std::map<std::string, std::string> headers;
    AuthOptions auth;

    std::string audit_log;               // empty = no audit log
    std::vector<std::string> plugins;
    std::string log_level;

    ScanConfig()
        : delay(500),
          verify_tls(true),
          profile("full"),
          module_options(nlohmann::json::object()),
          parallel(true),
          module_concurrency(10),
          module_timeout(300000),
          scan_timeout(0),
          log_level("info")
    {}

    /// Options object for one module ({} if none configured)
    nlohmann::json options_for(const std::string& module) const;
};

namespace config {

/**
 * @brief Load and validate a JSON configuration file
 * @param path Path to the configuration file
 * @return Validated configuration
 * @throws SetupError if the file cannot be read, parsed or validated
 */
ScanConfig load_file(const std::string& path);

/**
 * @brief Build and validate a configuration from parsed JSON
 * @throws SetupError on wrongly typed or invalid values
 */
ScanConfig from_json(const nlohmann::json& j);

/**
 * @brief Check a configuration and fill derived defaults
 *
 * Normalizes target and base_url and defaults allowed_domains to the
 * target host.
 * @throws SetupError describing the first invalid setting
 */
void validate(ScanConfig& cfg);

} // namespace config
