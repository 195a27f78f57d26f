/**
 * @file result_json.cpp
 * @brief Serialization of scan results
 */

#include "result_json.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace engine {

using json = nlohmann::json;

std::string format_time(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm tm;
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

json to_json(const Finding& finding) {
    json j;
    j["title"] = finding.title;
    j["severity"] = severity_to_string(finding.severity);
    j["description"] = finding.description;
    j["evidence"] = finding.evidence;
    j["module"] = finding.module;
    j["url"] = finding.url;
    j["confidence"] = finding.confidence;
    if (!finding.classification.empty()) {
        j["classification"] = finding.classification;
    }
    return j;
}

json to_json(const CrawledPage& page) {
    json j;
    j["url"] = page.url;
    j["status"] = page.status;
    j["content_type"] = page.content_type;
    j["depth"] = page.depth;
    j["parent_url"] = page.parent_url;
    j["fetch_duration_ms"] = page.fetch_duration_ms;
    j["from_cache"] = page.from_cache;
    j["fetch_error"] = page.fetch_error ? json(*page.fetch_error) : json(nullptr);
    j["body_bytes"] = page.body ? page.body->size() : 0;
    j["links"] = page.links;
    if (page.has_title) {
        j["title"] = page.title;
    }

    j["headers"] = json::object();
    for (const auto& h : page.headers) {
        j["headers"][h.first] = h.second;
    }

    j["forms"] = json::array();
    for (const auto& form : page.forms) {
        json f;
        f["action"] = form.action;
        f["method"] = form.method;
        f["fields"] = json::array();
        for (const auto& field : form.fields) {
            f["fields"].push_back({{"name", field.name}, {"type", field.type}});
        }
        j["forms"].push_back(f);
    }
    return j;
}

json to_json(const ApiEndpoint& endpoint) {
    return {
        {"method", endpoint.method},
        {"url", endpoint.url},
        {"content_type", endpoint.content_type},
        {"parent_url", endpoint.parent_url},
        {"source", endpoint.source}
    };
}

json to_json(const ModuleResult& result) {
    json j;
    j["name"] = result.name;
    j["category"] = category_to_string(result.category);
    j["status"] = module_status_to_string(result.status);
    j["start_time"] = format_time(result.start_time);
    j["end_time"] = format_time(result.end_time);
    j["duration_ms"] = result.duration_ms();
    j["error"] = result.status == ModuleStatus::ERROR ? json(result.error) : json(nullptr);
    j["findings"] = json::array();
    for (const auto& f : result.findings) {
        j["findings"].push_back(to_json(f));
    }
    return j;
}

json to_json(const ScanSummary& summary) {
    return {
        {"critical", summary.critical},
        {"high", summary.high},
        {"medium", summary.medium},
        {"low", summary.low},
        {"info", summary.info},
        {"total", summary.total()},
        {"modules_passed", summary.modules_passed},
        {"modules_failed", summary.modules_failed},
        {"modules_errored", summary.modules_errored}
    };
}

json to_json(const ScanResult& result) {
    json j;
    j["target_url"] = result.target_url;
    j["state"] = scan_state_to_string(result.state);
    j["start_time"] = format_time(result.start_time);
    j["end_time"] = format_time(result.end_time);
    j["partial"] = result.partial;
    j["summary"] = to_json(result.summary());
    j["crawl"] = {
        {"pages", result.pages.size()},
        {"endpoints", result.endpoints.size()},
        {"robots_blocked", result.robots_blocked},
        {"cache_hits", result.cache_hits}
    };

    j["pages"] = json::array();
    for (const auto& p : result.pages) {
        j["pages"].push_back(to_json(p));
    }
    j["endpoints"] = json::array();
    for (const auto& e : result.endpoints) {
        j["endpoints"].push_back(to_json(e));
    }
    j["out_of_scope_links"] = result.out_of_scope_links;
    j["modules"] = json::array();
    for (const auto& m : result.module_results) {
        j["modules"].push_back(to_json(m));
    }
    return j;
}

} // namespace engine
