/**
 * @file crawler.cpp
 * @brief Multi-threaded web crawler using gumbo and the fetcher
 */

#include "crawler.h"
#include "core/errors.h"
#include "core/html_extractor.h"
#include "core/url.h"
#include "logging/console.h"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <thread>

namespace {

using SteadyClock = std::chrono::steady_clock;

/// Convert string copy to lowercase using lambda on each character.
std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

bool is_structured(const std::string& content_type) {
    std::string ct = to_lower(content_type);
    return ct.find("json") != std::string::npos ||
           (ct.find("xml") != std::string::npos && ct.find("html") == std::string::npos);
}

bool is_javascript(const std::string& content_type) {
    return to_lower(content_type).find("javascript") != std::string::npos;
}

} // namespace

/// Init Crawler with a Fetcher reference and config options.
Crawler::Crawler(const Fetcher& fetcher, const Options& opts)
    : fetcher_(fetcher), opts_(opts) {
    if (opts_.concurrency < 1) opts_.concurrency = 1;
    try {
        for (const auto& p : opts_.include_patterns) include_.emplace_back(p);
        for (const auto& p : opts_.exclude_patterns) exclude_.emplace_back(p);
    } catch (const std::regex_error& e) {
        throw SetupError(std::string("invalid crawl pattern: ") + e.what());
    }
}

/// Add a new starting URL to seed list.
void Crawler::add_seed(const std::string& url) {
    seeds_.push_back(url);
}

/// Read an OpenAPI definition.
bool Crawler::load_openapi_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    try {
        return load_openapi(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        logging::warn("openapi: cannot parse " + path + ": " + e.what());
        return false;
    }
}

bool Crawler::load_openapi(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("paths") || !doc["paths"].is_object()) {
        return false;
    }
    openapi_ = doc;
    return true;
}

std::vector<ApiEndpoint> Crawler::openapi_endpoints(const std::string& origin) const {
    std::vector<ApiEndpoint> out;
    if (openapi_.is_null()) return out;

    // servers[0].url may be absolute or a path prefix
    std::string base = origin;
    if (openapi_.contains("servers") && openapi_["servers"].is_array() && !openapi_["servers"].empty()) {
        std::string server = openapi_["servers"][0].value("url", "");
        if (!server.empty() && server[0] == '/') {
            base = origin + server;
        } else if (urls::normalize(server)) {
            base = server;
        }
    }
    while (!base.empty() && base.back() == '/') base.pop_back();

    static const char* const kMethods[] = {"get", "post", "put", "patch", "delete", "head", "options"};
    for (const auto& el : openapi_["paths"].items()) {
        const std::string& path = el.key();
        const nlohmann::json& item = el.value();
        if (!item.is_object()) continue;
        for (const char* m : kMethods) {
            if (!item.contains(m)) continue;
            ApiEndpoint ep;
            ep.method = m;
            std::transform(ep.method.begin(), ep.method.end(), ep.method.begin(),
                           [](unsigned char c){ return std::toupper(c); });
            ep.url = base + (path.empty() || path[0] != '/' ? "/" : "") + path;
            ep.source = "openapi";
            const auto& op = item[m];
            if (op.is_object() && op.contains("requestBody")) {
                const auto& content = op["requestBody"].value("content", nlohmann::json::object());
                if (content.is_object() && !content.empty()) ep.content_type = content.begin().key();
            }
            out.push_back(std::move(ep));
        }
    }
    return out;
}

bool Crawler::in_scope(const std::string& url) const {
    return urls::in_scope(urls::host_of(url), opts_.allowed_domains);
}

bool Crawler::passes_patterns(const std::string& url) const {
    for (const auto& re : exclude_) {
        if (std::regex_search(url, re)) return false;
    }
    if (include_.empty()) return true;
    for (const auto& re : include_) {
        if (std::regex_search(url, re)) return true;
    }
    return false;
}

/// Perform web crawl process starting from seeds_.
CrawlSurface Crawler::run(std::optional<SteadyClock::time_point> deadline) {
    CrawlSurface surface;

    std::vector<std::string> seeds;
    for (const auto& s : seeds_) {
        if (auto norm = urls::normalize(s)) {
            seeds.push_back(*norm);
        } else {
            logging::warn("crawler: ignoring malformed seed " + s);
        }
    }
    if (seeds.empty()) return surface;

    if (opts_.allowed_domains.empty()) {
        for (const auto& s : seeds) opts_.allowed_domains.push_back(urls::host_of(s));
    }

    // Shared crawl state, guarded by mu
    std::mutex mu;
    std::condition_variable cv;
    std::deque<Task> queue;
    std::set<std::string> visited;          // reserved URLs, size <= max_pages
    std::set<std::string> blocked;          // robots-disallowed URLs
    std::set<std::string> outside;          // out-of-scope links
    std::map<std::pair<std::string, std::string>, ApiEndpoint> endpoints;
    std::map<std::string, RobotsRules> robots;
    std::mutex robots_mu;
    size_t in_flight = 0;
    bool stop = false;

    auto robots_for = [&](const std::string& url) -> const RobotsRules& {
        std::string origin = urls::origin_of(url);
        std::lock_guard<std::mutex> lock(robots_mu);
        auto it = robots.find(origin);
        if (it != robots.end()) return it->second;

        // Fetched once per origin; anything but a 2xx means no restrictions
        HttpRequest req;
        req.url = origin + "/robots.txt";
        req.headers["Accept"] = "text/plain,*/*;q=0.5";
        FetchOptions fo;
        fo.deadline = deadline;
        FetchResult r = fetcher_.fetch(req, fo);
        RobotsRules rules = RobotsRules::allow_all();
        if (r.ok() && r.response.status >= 200 && r.response.status < 300) {
            rules = RobotsRules::parse(r.response.body, opts_.user_agent);
        } else if (!r.ok()) {
            logging::debug("crawler: robots.txt unavailable for " + origin + ": " + r.error->message);
        }
        return robots.emplace(origin, std::move(rules)).first->second;
    };

    auto robots_allow = [&](const std::string& url) {
        if (!opts_.respect_robots) return true;
        if (robots_for(url).allows(urls::path_of(url))) return true;
        std::lock_guard<std::mutex> lock(mu);
        if (blocked.insert(url).second) surface.robots_blocked++;
        return false;
    };

    // Reserve and queue a URL; caller holds no lock
    auto enqueue = [&](const std::string& url, int depth, const std::string& parent) {
        {
            std::lock_guard<std::mutex> lock(mu);
            if (visited.count(url) || blocked.count(url)) return;
            if (visited.size() >= opts_.max_pages) {
                surface.truncated = true;
                return;
            }
        }
        if (!robots_allow(url)) return;

        std::lock_guard<std::mutex> lock(mu);
        if (visited.count(url)) return;
        if (visited.size() >= opts_.max_pages) {
            surface.truncated = true;
            return;
        }
        visited.insert(url);
        queue.push_back(Task{url, depth, parent});
        cv.notify_one();
    };

    auto add_endpoint = [&](ApiEndpoint ep) {
        std::lock_guard<std::mutex> lock(mu);
        auto key = std::make_pair(ep.url, ep.method);
        endpoints.emplace(std::move(key), std::move(ep));
    };

    auto process = [&](const Task& task) {
        HttpRequest req;
        req.method = "GET";
        req.url = task.url;
        req.headers = opts_.headers;
        req.headers["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
        FetchOptions fo;
        fo.deadline = deadline;
        FetchResult r = fetcher_.fetch(req, fo);

        CrawledPage page;
        page.url = task.url;
        page.depth = task.depth;
        page.parent_url = task.parent;
        page.fetch_duration_ms = r.duration_ms;
        page.from_cache = r.from_cache;
        page.status = r.response.status;
        page.headers = r.response.headers;
        page.content_type = r.response.header("content-type").value_or("");

        std::string body = std::move(r.response.body);
        if (body.size() > opts_.max_body_bytes) body.resize(opts_.max_body_bytes);
        page.body = std::make_shared<const std::string>(std::move(body));

        std::vector<std::string> found;
        if (!r.ok()) {
            page.fetch_error = std::string(fetch_error_name(r.error->kind)) + ": " + r.error->message;
            if (r.error->kind == FetchErrorKind::Cancelled) {
                std::lock_guard<std::mutex> lock(mu);
                surface.partial = true;
            }
        } else if (page.status >= 200 && page.status < 400) {
            // Links resolve against the final URL after redirects
            std::string base = task.url;
            if (!r.response.effective_url.empty()) {
                if (auto eff = urls::normalize(r.response.effective_url)) base = *eff;
            }
            if (base != task.url) found.push_back(base);
            if (page.status >= 300) {
                if (auto loc = r.response.header("location")) {
                    if (auto target = urls::resolve(base, *loc)) found.push_back(*target);
                }
            }

            if (page.is_html()) {
                HtmlFacts facts = extract_html(base, *page.body);
                apply_facts(facts, page);
                found.insert(found.end(), facts.links.begin(), facts.links.end());
                for (const auto& code : facts.inline_scripts) {
                    for (const auto& call : find_script_calls(code)) {
                        auto abs = urls::resolve(base, call.url);
                        if (abs && in_scope(*abs)) {
                            add_endpoint(ApiEndpoint{call.method, *abs, "", task.url, "javascript"});
                        }
                    }
                }
            } else if (is_javascript(page.content_type)) {
                for (const auto& call : find_script_calls(*page.body)) {
                    auto abs = urls::resolve(base, call.url);
                    if (abs && in_scope(*abs)) {
                        add_endpoint(ApiEndpoint{call.method, *abs, "", task.url, "javascript"});
                    }
                }
            } else if (is_structured(page.content_type)) {
                add_endpoint(ApiEndpoint{"GET", task.url, page.content_type, task.parent, "response"});
            }
        }

        for (const auto& link : found) {
            if (!in_scope(link)) {
                std::lock_guard<std::mutex> lock(mu);
                outside.insert(link);
                continue;
            }
            if (task.depth + 1 > opts_.max_depth) continue;
            if (!passes_patterns(link)) continue;
            enqueue(link, task.depth + 1, task.url);
        }

        std::lock_guard<std::mutex> lock(mu);
        if (page.from_cache) surface.cache_hits++;
        surface.pages.push_back(std::move(page));
    };

    // Seeds, then OpenAPI-described endpoints one level below the target
    for (const auto& s : seeds) {
        if (in_scope(s)) enqueue(s, 0, "");
    }
    if (!openapi_.is_null()) {
        for (auto& ep : openapi_endpoints(urls::origin_of(seeds.front()))) {
            auto norm = urls::normalize(ep.url);
            if (!norm) continue;
            ep.url = *norm;
            bool crawlable = ep.method == "GET" && ep.url.find('{') == std::string::npos &&
                             ep.url.find("%7B") == std::string::npos;
            if (crawlable && opts_.max_depth >= 1 && in_scope(ep.url) && passes_patterns(ep.url)) {
                enqueue(ep.url, 1, seeds.front());
            }
            add_endpoint(std::move(ep));
        }
    }

    auto worker = [&]() {
        std::unique_lock<std::mutex> lock(mu);
        while (true) {
            auto ready = [&] { return stop || !queue.empty() || in_flight == 0; };
            if (deadline) {
                if (!cv.wait_until(lock, *deadline, ready)) {
                    stop = true;
                    surface.partial = true;
                    cv.notify_all();
                    return;
                }
            } else {
                cv.wait(lock, ready);
            }
            if (stop) return;
            if (queue.empty()) {
                // Nothing queued and nothing in flight: the crawl is done
                cv.notify_all();
                return;
            }
            if (deadline && SteadyClock::now() >= *deadline) {
                stop = true;
                surface.partial = true;
                cv.notify_all();
                return;
            }

            Task task = std::move(queue.front());
            queue.pop_front();
            in_flight++;
            lock.unlock();

            process(task);

            lock.lock();
            in_flight--;
            if (queue.empty() && in_flight == 0) cv.notify_all();
        }
    };

    std::vector<std::thread> workers;
    for (int i = 0; i < opts_.concurrency; i++) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) t.join();

    std::sort(surface.pages.begin(), surface.pages.end(), [](const CrawledPage& a, const CrawledPage& b) {
        return a.depth != b.depth ? a.depth < b.depth : a.url < b.url;
    });
    for (auto& [key, ep] : endpoints) surface.endpoints.push_back(std::move(ep));
    surface.out_of_scope_links.assign(outside.begin(), outside.end());

    logging::info("crawl finished: " + std::to_string(surface.pages.size()) + " pages, " +
                  std::to_string(surface.endpoints.size()) + " endpoints, " +
                  std::to_string(surface.out_of_scope_links.size()) + " out-of-scope links" +
                  (surface.partial ? " (partial)" : ""));
    return surface;
}
