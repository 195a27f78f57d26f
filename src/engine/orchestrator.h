#pragma once
#include "module.h"
#include "plugins.h"
#include "registry.h"
#include "core/crawler.h"
#include "logging/chain.h"
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace engine {

/**
 * Shared infrastructure for a scan. Tests swap the transport for a fake;
 * everything else is normally built from the configuration.
 */
struct Services {
    std::shared_ptr<const HttpTransport> transport;
    std::shared_ptr<cache::CacheStore> cache;
    std::shared_ptr<ratelimit::RateLimiter> limiter;

    /**
     * @brief Build transport, cache and limiter for a configuration
     * @param transport Use this transport instead of a libcurl client
     */
    static Services from_config(const ScanConfig& config,
                                std::shared_ptr<const HttpTransport> transport = nullptr);
};

/// "run_YYYYmmdd_HHMMSS" in UTC
std::string generate_run_id();

/**
 * Runs one scan: crawl, then every selected module, then aggregation.
 *
 * Setup problems (invalid target, unknown modules or profile, bad
 * patterns) move the scan to FAILED and throw SetupError before anything
 * is crawled. Everything after that is isolated: fetch failures are
 * recorded per page and module failures per module.
 */
class Orchestrator {
public:
    /**
     * @brief Prepare a scan
     * @param config Scan configuration (validated again by run())
     * @param registry Module table; hooks may add to this copy
     * @param services Transport, cache and limiter
     */
    Orchestrator(ScanConfig config, Registry registry, Services services);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Hooks invoked around this scan
    PluginHost& plugins() { return plugins_; }

    /**
     * @brief Crawl the target and run the selected modules
     * @throws SetupError for configuration problems
     */
    ScanResult run();

    /**
     * @brief Run the selected modules over an already crawled surface
     * @throws SetupError for configuration problems
     */
    ScanResult run(const CrawlSurface& surface);

    ScanState state() const { return state_.load(); }
    const std::string& run_id() const { return run_id_; }

private:
    ScanConfig config_;
    // Declared before registry_: factories registered by a plugin library
    // must be destroyed before the library is closed
    PluginHost plugins_;
    Registry registry_;
    Services services_;
    std::string run_id_;
    std::atomic<ScanState> state_;
    std::atomic<bool> deadline_hit_;
    bool plugins_loaded_;
    std::unique_ptr<logging::ChainLogger> audit_;

    /// execute() that leaves the scan FAILED on any escaping exception
    ScanResult guarded_execute(const CrawlSurface* precrawled);
    ScanResult execute(const CrawlSurface* precrawled);

    ModuleResult run_module(const std::shared_ptr<TestModule>& module,
                            const std::shared_ptr<const TestContext>& ctx,
                            ModuleResult result);

    void run_modules(const std::vector<std::shared_ptr<TestModule>>& modules,
                     const std::vector<size_t>& runnable,
                     const std::shared_ptr<const TestContext>& ctx,
                     std::vector<ModuleResult>& results);

    void audit(const std::string& event, const nlohmann::json& payload);
    void report_hook_errors(const std::vector<HookError>& errors);
    void open_audit_log();
};

} // namespace engine
