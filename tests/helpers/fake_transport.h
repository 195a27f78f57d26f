/**
 * @file fake_transport.h
 * @brief In-process HttpTransport serving canned responses
 *
 * Routes are matched on the exact request URL first, then on the URL
 * without its query string. Unknown URLs get a 404. A handler installed
 * with on_request() sees every request before the routes and can answer
 * it itself, which is how tests simulate delays tied to payloads.
 *
 * Example usage:
 * @code
 *   auto fake = std::make_shared<test_helpers::FakeTransport>();
 *   fake->page("http://site.test/", "<a href='/a'>a</a>");
 *   fake->robots("http://site.test", "User-agent: *\nDisallow: /private\n");
 *   Fetcher fetcher(fake, nullptr, nullptr);
 * @endcode
 */

#pragma once

#include "core/http_client.h"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace test_helpers {

struct FakeRoute {
    long status = 200;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;   // lower-cased names
    std::chrono::milliseconds latency{0};
    NetError failure = NetError::None;    // perform() returns false when set
};

class FakeTransport : public HttpTransport {
public:
    using Handler = std::function<std::optional<FakeRoute>(const HttpRequest&)>;

    /// Serve a route for url (replaces any earlier one)
    void add(const std::string& url, FakeRoute route);

    /// 200 text/html page
    void page(const std::string& url, const std::string& html,
              std::vector<std::pair<std::string, std::string>> extra_headers = {});

    /// 200 text/plain robots.txt at origin + "/robots.txt"
    void robots(const std::string& origin, const std::string& body);

    /// Transport failure for url
    void fail(const std::string& url, NetError error);

    /// Delay added to every response
    void set_latency(std::chrono::milliseconds latency);

    /// Handler consulted before the routes; returning nullopt falls through
    void on_request(Handler handler);

    bool perform(const HttpRequest& req, HttpResponse& resp) const override;

    /// Requests seen so far, in arrival order
    std::vector<HttpRequest> requests() const;

    /// Number of requests whose URL equals url
    size_t count(const std::string& url) const;

    size_t total() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, FakeRoute> routes_;
    std::chrono::milliseconds latency_{0};
    Handler handler_;
    mutable std::vector<HttpRequest> seen_;
};

/// Header list with a content type
std::vector<std::pair<std::string, std::string>> with_content_type(
    const std::string& content_type,
    std::vector<std::pair<std::string, std::string>> headers = {});

} // namespace test_helpers
