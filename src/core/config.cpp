/**
 * @file config.cpp
 * @brief JSON configuration loading and validation
 */

#include "config.h"
#include "core/errors.h"
#include "core/url.h"
#include "logging/console.h"
#include <fstream>
#include <iterator>

using json = nlohmann::json;

json ScanConfig::options_for(const std::string& module) const {
    if (module_options.is_object() && module_options.contains(module) &&
        module_options[module].is_object()) {
        return module_options[module];
    }
    return json::object();
}

namespace config {

namespace {

std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;
    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw SetupError(std::string("config: '") + key + "' must be a list");
    }
    for (const auto& v : arr) {
        out.push_back(v.get<std::string>());
    }
    return out;
}

std::map<std::string, std::string> string_map(const json& j, const char* key) {
    std::map<std::string, std::string> out;
    if (!j.contains(key)) return out;
    const json& obj = j.at(key);
    if (!obj.is_object()) {
        throw SetupError(std::string("config: '") + key + "' must be an object");
    }
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        out[it.key()] = it.value().get<std::string>();
    }
    return out;
}

const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    if (!j.contains(key)) return empty;
    const json& s = j.at(key);
    if (!s.is_object()) {
        throw SetupError(std::string("config: section '") + key + "' must be an object");
    }
    return s;
}

std::chrono::milliseconds seconds_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

void read_target(const json& j, ScanConfig& cfg) {
    if (!j.contains("target")) {
        throw SetupError("config: missing 'target'");
    }
    // "target": "https://..." is accepted as shorthand
    if (j.at("target").is_string()) {
        cfg.target = j.at("target").get<std::string>();
        return;
    }
    const json& t = section(j, "target");
    cfg.target = t.value("url", "");
    cfg.base_url = t.value("base_url", "");
    cfg.cookies = string_map(t, "cookies");
    cfg.headers = string_map(t, "headers");

    const json& a = section(t, "auth");
    if (!a.empty()) {
        std::string type = a.value("type", "none");
        if (!parse_auth_type(type, cfg.auth.type)) {
            throw SetupError("config: unknown auth type '" + type + "'");
        }
        cfg.auth.token = a.value("token", "");
        cfg.auth.header_name = a.value("header_name", cfg.auth.header_name);
        cfg.auth.login_url = a.value("login_url", "");
        cfg.auth.username = a.value("username", "");
        cfg.auth.password = a.value("password", "");
        cfg.auth.username_field = a.value("username_field", cfg.auth.username_field);
        cfg.auth.password_field = a.value("password_field", cfg.auth.password_field);
    }
}

void read_crawler(const json& j, ScanConfig& cfg) {
    const json& c = section(j, "crawler");
    cfg.crawl.max_depth = c.value("max_depth", cfg.crawl.max_depth);
    int max_pages = c.value("max_pages", static_cast<int>(cfg.crawl.max_pages));
    if (max_pages < 1) {
        throw SetupError("config: crawler.max_pages must be at least 1");
    }
    cfg.crawl.max_pages = static_cast<size_t>(max_pages);
    cfg.crawl.respect_robots = c.value("respect_robots_txt", cfg.crawl.respect_robots);
    cfg.crawl.concurrency = c.value("concurrent_requests", cfg.crawl.concurrency);
    cfg.crawl.allowed_domains = string_list(c, "allowed_domains");
    cfg.crawl.include_patterns = string_list(c, "include_patterns");
    cfg.crawl.exclude_patterns = string_list(c, "exclude_patterns");
    cfg.crawl.user_agent = c.value("user_agent", cfg.crawl.user_agent);
    cfg.crawl.max_body_bytes = c.value("max_body_bytes", cfg.crawl.max_body_bytes);
    cfg.delay = seconds_ms(c.value("crawl_delay", 0.5));
    cfg.openapi_path = c.value("openapi", "");
    cfg.verify_tls = c.value("verify_tls", cfg.verify_tls);
    cfg.fetch.request_timeout_ms =
        static_cast<long>(c.value("timeout", cfg.fetch.request_timeout_ms / 1000.0) * 1000.0);
}

void read_cache(const json& j, ScanConfig& cfg) {
    const json& c = section(j, "cache");
    cfg.cache.enabled = c.value("enabled", cfg.cache.enabled);
    cfg.cache.default_ttl = std::chrono::seconds(c.value("ttl", static_cast<long>(cfg.cache.default_ttl.count())));
    cfg.cache.memory_capacity = c.value("memory_capacity", cfg.cache.memory_capacity);
    cfg.cache.disk_dir = c.value("disk_dir", "");
    cfg.cache.remote_url = c.value("remote_url", "");
    cfg.cache.remote_timeout_ms = c.value("remote_timeout_ms", cfg.cache.remote_timeout_ms);
    cfg.fetch.cache_ttl = cfg.cache.default_ttl;
}

void read_rate_limit(const json& j, ScanConfig& cfg) {
    const json& r = section(j, "rate_limit");
    cfg.rate_limit.enabled = r.value("enabled", cfg.rate_limit.enabled);
    std::string strategy = r.value("strategy", std::string(ratelimit::strategy_name(cfg.rate_limit.strategy)));
    if (!ratelimit::parse_strategy(strategy, cfg.rate_limit.strategy)) {
        throw SetupError("config: unknown rate limit strategy '" + strategy + "'");
    }
    std::string base = r.value("adaptive_base", std::string(ratelimit::strategy_name(cfg.rate_limit.adaptive_base)));
    if (!ratelimit::parse_strategy(base, cfg.rate_limit.adaptive_base) ||
        cfg.rate_limit.adaptive_base == ratelimit::Strategy::Adaptive) {
        throw SetupError("config: invalid adaptive_base '" + base + "'");
    }
    cfg.rate_limit.max_requests = r.value("max_requests", cfg.rate_limit.max_requests);
    cfg.rate_limit.window = std::chrono::milliseconds(r.value("window_ms", static_cast<long>(cfg.rate_limit.window.count())));
    cfg.rate_limit.min_factor = r.value("min_factor", cfg.rate_limit.min_factor);
    cfg.fetch.max_queue_ms = r.value("max_queue_ms", cfg.fetch.max_queue_ms);
}

void read_retry(const json& j, ScanConfig& cfg) {
    const json& r = section(j, "retry");
    cfg.fetch.max_retries = r.value("max_retries", cfg.fetch.max_retries);
    cfg.fetch.backoff_initial_ms = r.value("backoff_initial_ms", cfg.fetch.backoff_initial_ms);
    cfg.fetch.backoff_max_ms = r.value("backoff_max_ms", cfg.fetch.backoff_max_ms);
}

void read_modules(const json& j, ScanConfig& cfg) {
    const json& m = section(j, "modules");
    cfg.modules = string_list(m, "enabled");
    cfg.profile = m.value("profile", cfg.profile);
    if (m.contains("options")) {
        if (!m.at("options").is_object()) {
            throw SetupError("config: modules.options must be an object");
        }
        cfg.module_options = m.at("options");
    }
    cfg.parallel = m.value("parallel", cfg.parallel);
    cfg.module_concurrency = m.value("concurrency", cfg.module_concurrency);
    cfg.module_timeout = seconds_ms(m.value("timeout", cfg.module_timeout.count() / 1000.0));
}

} // namespace

ScanConfig from_json(const json& j) {
    if (!j.is_object()) {
        throw SetupError("config: top level must be an object");
    }

    ScanConfig cfg;
    try {
        read_target(j, cfg);
        read_crawler(j, cfg);
        read_cache(j, cfg);
        read_rate_limit(j, cfg);
        read_retry(j, cfg);
        read_modules(j, cfg);

        const json& scan = section(j, "scan");
        cfg.scan_timeout = seconds_ms(scan.value("timeout", 0.0));

        const json& log = section(j, "logging");
        cfg.log_level = log.value("level", cfg.log_level);
        cfg.audit_log = log.value("audit_log", "");

        cfg.plugins = string_list(j, "plugins");
    } catch (const json::exception& e) {
        throw SetupError(std::string("config: ") + e.what());
    }

    validate(cfg);
    return cfg;
}

ScanConfig load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw SetupError("config: cannot open " + path);
    }
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());

    json j = json::parse(content, nullptr, false);
    if (j.is_discarded()) {
        throw SetupError("config: " + path + " is not valid JSON");
    }
    return from_json(j);
}

void validate(ScanConfig& cfg) {
    if (cfg.target.empty()) {
        throw SetupError("config: target url is required");
    }
    auto target = urls::normalize(cfg.target);
    if (!target) {
        throw SetupError("config: invalid target url '" + cfg.target + "'");
    }
    cfg.target = *target;

    if (cfg.base_url.empty()) {
        cfg.base_url = urls::origin_of(cfg.target);
    } else {
        auto base = urls::normalize(cfg.base_url);
        if (!base) {
            throw SetupError("config: invalid base_url '" + cfg.base_url + "'");
        }
        cfg.base_url = *base;
    }

    if (cfg.crawl.allowed_domains.empty()) {
        cfg.crawl.allowed_domains.push_back(urls::host_of(cfg.target));
    }

    if (cfg.crawl.max_depth < 0) {
        throw SetupError("config: crawler.max_depth must not be negative");
    }
    if (cfg.crawl.max_pages < 1) {
        throw SetupError("config: crawler.max_pages must be at least 1");
    }
    if (cfg.crawl.concurrency < 1) {
        throw SetupError("config: crawler.concurrent_requests must be at least 1");
    }
    if (cfg.delay.count() < 0) {
        throw SetupError("config: crawler.crawl_delay must not be negative");
    }
    if (cfg.fetch.request_timeout_ms <= 0) {
        throw SetupError("config: crawler.timeout must be positive");
    }
    if (cfg.fetch.max_retries < 0) {
        throw SetupError("config: retry.max_retries must not be negative");
    }
    if (cfg.rate_limit.max_requests < 1 || cfg.rate_limit.window.count() <= 0) {
        throw SetupError("config: rate_limit needs max_requests >= 1 and a positive window");
    }
    if (cfg.rate_limit.min_factor <= 0.0 || cfg.rate_limit.min_factor > 1.0) {
        throw SetupError("config: rate_limit.min_factor must be in (0, 1]");
    }
    if (cfg.cache.default_ttl.count() <= 0) {
        throw SetupError("config: cache.ttl must be positive");
    }
    if (cfg.module_concurrency < 1) {
        throw SetupError("config: modules.concurrency must be at least 1");
    }
    if (cfg.module_timeout.count() <= 0) {
        throw SetupError("config: modules.timeout must be positive");
    }
    if (cfg.scan_timeout.count() < 0) {
        throw SetupError("config: scan.timeout must not be negative");
    }
    if (cfg.modules.empty() && cfg.profile.empty()) {
        throw SetupError("config: select modules with modules.enabled or modules.profile");
    }
    if (!cfg.module_options.is_object()) {
        throw SetupError("config: modules.options must be an object");
    }

    logging::Level level;
    if (!logging::parse_level(cfg.log_level, level)) {
        throw SetupError("config: unknown log level '" + cfg.log_level + "'");
    }

    if (cfg.auth.type == AuthType::FORM && (cfg.auth.login_url.empty() || cfg.auth.username.empty())) {
        throw SetupError("config: form auth needs login_url and username");
    }
    if ((cfg.auth.type == AuthType::BEARER || cfg.auth.type == AuthType::API_KEY) && cfg.auth.token.empty()) {
        throw SetupError("config: token auth needs a token");
    }
}

} // namespace config
