#pragma once
#include "fetcher.h"
#include "robots.h"
#include <schema/crawled_page.h>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Breadth-first crawler that maps the reachable surface of a site.
// Worker threads share one queue of (url, depth, parent) tasks. A URL is
// reserved in the visited set before it is queued, so no page is fetched
// twice and the number of pages never exceeds max_pages. Out-of-scope
// links are recorded but never fetched; robots.txt is honoured when enabled.

struct CrawlSurface {
    std::vector<CrawledPage> pages;           // sorted by (depth, url)
    std::vector<ApiEndpoint> endpoints;       // sorted by (url, method)
    std::vector<std::string> out_of_scope_links;
    bool partial = false;                     // deadline cut the crawl short
    bool truncated = false;                   // max_pages stopped enqueuing
    size_t robots_blocked = 0;
    size_t cache_hits = 0;
};

class Crawler {
public:
    struct Options {
        int max_depth;
        size_t max_pages;
        bool respect_robots;
        int concurrency;
        std::vector<std::string> allowed_domains;    // empty = hosts of the seeds
        std::vector<std::string> include_patterns;   // regex; empty = everything
        std::vector<std::string> exclude_patterns;   // regex
        size_t max_body_bytes;
        std::string user_agent;
        std::map<std::string, std::string> headers;  // sent with every page request

        Options()
            : max_depth(5),
              max_pages(1000),
              respect_robots(true),
              concurrency(10),
              max_body_bytes(5 * 1024 * 1024),
              user_agent("sitecheck/1.0")
        {}
    };

    /**
     * @brief Create a new crawler over a fetcher
     * @param fetcher Fetcher used for pages and robots.txt
     * @param opts Crawl options (limits, scope, robots.txt handling, etc.)
     * @throws SetupError if an include/exclude pattern is not a valid regex
     */
    Crawler(const Fetcher& fetcher, const Options& opts = Options());

    /**
     * @brief Add a starting URL for the crawl
     * @param url URL to start from
     */
    void add_seed(const std::string& url);

    /**
     * @brief Load an OpenAPI document to discover API endpoints
     * @param path Path to the OpenAPI JSON file
     * @return true if loaded successfully, false otherwise
     */
    bool load_openapi_file(const std::string& path);

    /**
     * @brief Use an already parsed OpenAPI document
     * @return false if the document has no "paths" object
     */
    bool load_openapi(const nlohmann::json& doc);

    /**
     * @brief Crawl from all seed URLs
     * @param deadline Stop dequeuing once this time passes
     * @return Pages, endpoints and out-of-scope links found
     */
    CrawlSurface run(std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

private:
    struct Task {
        std::string url;
        int depth;
        std::string parent;
    };

    const Fetcher& fetcher_;
    Options opts_;
    std::vector<std::string> seeds_;
    std::vector<std::regex> include_;
    std::vector<std::regex> exclude_;
    nlohmann::json openapi_;

    bool in_scope(const std::string& url) const;
    bool passes_patterns(const std::string& url) const;
    std::vector<ApiEndpoint> openapi_endpoints(const std::string& origin) const;
};
