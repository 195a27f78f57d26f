/**
 * @file remote_tier.cpp
 * @brief HTTP key/value cache tier
 */

#include "cache/remote_tier.h"
#include "core/errors.h"
#include "core/http_client.h"
#include "core/url.h"

namespace cache {

RemoteTier::RemoteTier(std::shared_ptr<const HttpTransport> transport,
                       const std::string& base_url,
                       long timeout_ms)
    : transport_(std::move(transport)), base_url_(base_url), timeout_ms_(timeout_ms) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string RemoteTier::url_for(const std::string& key) const {
    return base_url_ + "/" + urls::url_encode(key);
}

std::optional<CacheEntry> RemoteTier::get(const std::string& key) {
    HttpRequest req;
    req.method = "GET";
    req.url = url_for(key);
    req.timeout_ms = timeout_ms_;
    HttpResponse resp;
    if (!transport_->perform(req, resp)) {
        throw CacheError("GET " + req.url + ": " + resp.error);
    }
    if (resp.status == 404) return std::nullopt;
    if (resp.status != 200) {
        throw CacheError("GET " + req.url + ": HTTP " + std::to_string(resp.status));
    }

    CacheEntry entry;
    if (!decode_entry(resp.body, entry)) {
        throw CacheError("GET " + req.url + ": malformed entry");
    }
    if (entry.expired(Clock::now())) return std::nullopt;
    return entry;
}

void RemoteTier::set(const std::string& key, const CacheEntry& entry) {
    HttpRequest req;
    req.method = "PUT";
    req.url = url_for(key);
    req.timeout_ms = timeout_ms_;
    req.headers["Content-Type"] = "application/octet-stream";
    req.body = encode_entry(entry);
    HttpResponse resp;
    if (!transport_->perform(req, resp)) {
        throw CacheError("PUT " + req.url + ": " + resp.error);
    }
    if (resp.status < 200 || resp.status >= 300) {
        throw CacheError("PUT " + req.url + ": HTTP " + std::to_string(resp.status));
    }
}

void RemoteTier::remove(const std::string& key) {
    HttpRequest req;
    req.method = "DELETE";
    req.url = url_for(key);
    req.timeout_ms = timeout_ms_;
    HttpResponse resp;
    if (!transport_->perform(req, resp)) {
        throw CacheError("DELETE " + req.url + ": " + resp.error);
    }
    if (resp.status != 404 && (resp.status < 200 || resp.status >= 300)) {
        throw CacheError("DELETE " + req.url + ": HTTP " + std::to_string(resp.status));
    }
}

void RemoteTier::clear() {
    HttpRequest req;
    req.method = "DELETE";
    req.url = base_url_ + "/";
    req.timeout_ms = timeout_ms_;
    HttpResponse resp;
    if (!transport_->perform(req, resp)) {
        throw CacheError("DELETE " + req.url + ": " + resp.error);
    }
    if (resp.status < 200 || resp.status >= 300) {
        throw CacheError("DELETE " + req.url + ": HTTP " + std::to_string(resp.status));
    }
}

} // namespace cache
