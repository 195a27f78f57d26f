#pragma once
#include "core/config.h"
#include "core/fetcher.h"
#include "core/session.h"
#include <schema/crawled_page.h>
#include <schema/finding.h>
#include <schema/scan_result.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace engine {

/**
 * Everything a module may look at. Built once per scan after crawling and
 * shared read-only by every module.
 */
struct TestContext {
    std::string target_url;
    std::string base_url;
    std::vector<CrawledPage> pages;
    std::vector<ApiEndpoint> endpoints;
    std::shared_ptr<const ScanConfig> config;
    AuthSession session;
    nlohmann::json additions = nlohmann::json::object();   // from pre-scan hooks
    std::shared_ptr<const Fetcher> fetcher;                 // for active probes
    std::optional<std::chrono::steady_clock::time_point> deadline;

    /// true once the scan deadline has passed
    bool expired() const {
        return deadline && std::chrono::steady_clock::now() >= *deadline;
    }

    /// Request for url carrying the session cookies and headers
    HttpRequest request(const std::string& url, const std::string& method = "GET") const {
        HttpRequest req;
        req.method = method;
        req.url = url;
        session.apply(req);
        return req;
    }
};

/**
 * What a module hands back: its findings, or an error message.
 * A module that fails part way may still return the findings it has.
 */
struct ModuleOutcome {
    std::vector<Finding> findings;
    std::optional<std::string> error;

    static ModuleOutcome failure(const std::string& message) {
        ModuleOutcome o;
        o.error = message;
        return o;
    }
};

/**
 * A test module. Instances are created fresh for every scan by the
 * registry; run() is called at most once, on its own thread.
 */
class TestModule {
public:
    virtual ~TestModule() = default;

    virtual std::string name() const = 0;
    virtual Category category() const = 0;
    virtual std::string description() const = 0;

    /**
     * @brief Modules sharing a non-empty group never run at the same time
     */
    virtual std::string exclusive_group() const { return ""; }

    /**
     * @brief Prepare the module for a scan
     * @param config Scan configuration (module options via options_for(name()))
     * @param error Set when the module cannot run
     * @return false to exclude the module; it is reported with status error
     */
    virtual bool initialize(const ScanConfig& config, std::string& error) {
        (void)config;
        (void)error;
        return true;
    }

    /**
     * @brief Test the crawled surface
     * @param ctx Shared scan context
     * @return Findings, or an error
     */
    virtual ModuleOutcome run(const TestContext& ctx) = 0;
};

} // namespace engine
