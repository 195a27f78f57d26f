/**
 * @file fake_transport.cpp
 * @brief Canned-response transport for tests
 */

#include "helpers/fake_transport.h"
#include <thread>

namespace test_helpers {

std::vector<std::pair<std::string, std::string>> with_content_type(
    const std::string& content_type,
    std::vector<std::pair<std::string, std::string>> headers) {
    headers.insert(headers.begin(), {"content-type", content_type});
    return headers;
}

void FakeTransport::add(const std::string& url, FakeRoute route) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[url] = std::move(route);
}

void FakeTransport::page(const std::string& url, const std::string& html,
                         std::vector<std::pair<std::string, std::string>> extra_headers) {
    FakeRoute route;
    route.body = html;
    route.headers = with_content_type("text/html; charset=utf-8", std::move(extra_headers));
    add(url, std::move(route));
}

void FakeTransport::robots(const std::string& origin, const std::string& body) {
    FakeRoute route;
    route.body = body;
    route.headers = with_content_type("text/plain");
    add(origin + "/robots.txt", std::move(route));
}

void FakeTransport::fail(const std::string& url, NetError error) {
    FakeRoute route;
    route.status = 0;
    route.failure = error;
    add(url, std::move(route));
}

void FakeTransport::set_latency(std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    latency_ = latency;
}

void FakeTransport::on_request(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

bool FakeTransport::perform(const HttpRequest& req, HttpResponse& resp) const {
    Handler handler;
    std::optional<FakeRoute> route;
    std::chrono::milliseconds latency;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seen_.push_back(req);
        handler = handler_;
        latency = latency_;

        auto it = routes_.find(req.url);
        if (it == routes_.end()) {
            it = routes_.find(req.url.substr(0, req.url.find('?')));
        }
        if (it != routes_.end()) route = it->second;
    }

    // The handler runs outside the lock so slow handlers do not serialize requests
    if (handler) {
        if (auto answer = handler(req)) route = std::move(answer);
    }
    if (!route) {
        route = FakeRoute();
        route->status = 404;
        route->body = "not found";
        route->headers = with_content_type("text/html");
    }

    auto wait = latency + route->latency;
    if (wait.count() > 0) std::this_thread::sleep_for(wait);

    resp = HttpResponse();
    resp.effective_url = req.url;
    if (route->failure != NetError::None) {
        resp.net_error = route->failure;
        resp.error = "simulated transport failure";
        return false;
    }
    resp.status = route->status;
    resp.headers = route->headers;
    resp.body = route->body;
    resp.body_bytes = resp.body.size();
    return true;
}

std::vector<HttpRequest> FakeTransport::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_;
}

size_t FakeTransport::count(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& r : seen_) {
        if (r.url == url) n++;
    }
    return n;
}

size_t FakeTransport::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

} // namespace test_helpers
