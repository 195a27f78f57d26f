/**
 * @file orchestrator.cpp
 * @brief Scan pipeline: setup, crawl, module scheduling, aggregation
 */

#include "orchestrator.h"
#include "core/errors.h"
#include "core/url.h"
#include "logging/console.h"
#include "ratelimit/rate_limiter.h"
#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>

namespace engine {

using json = nlohmann::json;
using SteadyClock = std::chrono::steady_clock;

Services Services::from_config(const ScanConfig& config,
                               std::shared_ptr<const HttpTransport> transport) {
    Services s;
    if (transport) {
        s.transport = std::move(transport);
    } else {
        HttpClient::Options opts;
        opts.timeout_seconds = std::max(1L, config.fetch.request_timeout_ms / 1000);
        opts.user_agent = config.crawl.user_agent;
        opts.verify_tls = config.verify_tls;
        // The crawler follows Location itself so redirects pass scope and robots checks
        opts.follow_redirects = false;
        s.transport = std::make_shared<HttpClient>(opts);
    }
    if (config.cache.enabled) {
        s.cache = cache::CacheStore::from_options(config.cache, s.transport);
    }
    s.limiter = ratelimit::build_limiter(config.rate_limit, config.delay);
    return s;
}

std::string generate_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << "run_" << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

namespace {

/// Completion slot shared between the scheduler and one module thread.
/// Lives as long as either side holds it, so a detached thread that
/// finishes late still has somewhere to write.
struct ModuleRun {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    ModuleOutcome outcome;
};

json surface_stats(const ScanResult& r) {
    return {
        {"pages", r.pages.size()},
        {"endpoints", r.endpoints.size()},
        {"out_of_scope_links", r.out_of_scope_links.size()},
        {"robots_blocked", r.robots_blocked},
        {"cache_hits", r.cache_hits},
        {"partial", r.partial}
    };
}

} // namespace

Orchestrator::Orchestrator(ScanConfig config, Registry registry, Services services)
    : config_(std::move(config)),
      registry_(std::move(registry)),
      services_(std::move(services)),
      run_id_(generate_run_id()),
      state_(ScanState::CREATED),
      deadline_hit_(false),
      plugins_loaded_(false)
{}

ScanResult Orchestrator::run() {
    return guarded_execute(nullptr);
}

ScanResult Orchestrator::run(const CrawlSurface& surface) {
    return guarded_execute(&surface);
}

ScanResult Orchestrator::guarded_execute(const CrawlSurface* precrawled) {
    try {
        return execute(precrawled);
    } catch (const std::exception& e) {
        if (state_ != ScanState::FAILED) {
            state_ = ScanState::FAILED;
            logging::error(std::string("scan aborted: ") + e.what());
            audit("scan_failed", {{"target", config_.target}, {"error", e.what()}});
        }
        throw;
    }
}

void Orchestrator::open_audit_log() {
    if (config_.audit_log.empty()) return;
    std::filesystem::path parent = std::filesystem::path(config_.audit_log).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            logging::warn("audit log directory " + parent.string() + ": " + ec.message());
        }
    }
    audit_ = std::make_unique<logging::ChainLogger>(config_.audit_log, run_id_);
}

void Orchestrator::audit(const std::string& event, const json& payload) {
    if (audit_ && !audit_->append(event, payload)) {
        logging::warn("audit log: failed to record " + event);
    }
}

void Orchestrator::report_hook_errors(const std::vector<HookError>& errors) {
    for (const auto& e : errors) {
        logging::warn("hook " + e.hook + " failed in " + e.stage + ": " + e.message);
        audit("hook_error", {{"hook", e.hook}, {"stage", e.stage}, {"message", e.message}});
    }
}

ScanResult Orchestrator::execute(const CrawlSurface* precrawled) {
    ScanResult result;
    result.start_time = ScanResult::Clock::now();
    deadline_hit_ = false;

    std::optional<SteadyClock::time_point> deadline;
    if (config_.scan_timeout.count() > 0) {
        deadline = SteadyClock::now() + config_.scan_timeout;
    }

    std::vector<std::string> selected;
    std::shared_ptr<Fetcher> fetcher;
    std::unique_ptr<Crawler> crawler;
    try {
        config::validate(config_);
        result.target_url = config_.target;

        logging::Level level;
        if (logging::parse_level(config_.log_level, level)) {
            logging::set_level(level);
        }

        if (!plugins_loaded_) {
            for (const auto& path : config_.plugins) {
                std::string error;
                if (!plugins_.load_library(path, error)) {
                    throw SetupError("plugin " + error);
                }
            }
            plugins_loaded_ = true;
        }

        if (!services_.transport) {
            throw SetupError("no HTTP transport configured");
        }

        Fetcher::Options fopts = config_.fetch;
        fopts.deadline = deadline;
        fetcher = std::make_shared<Fetcher>(services_.transport, services_.cache, services_.limiter, fopts);

        // Rejects bad include/exclude patterns before anything is fetched
        if (!precrawled) {
            crawler = std::make_unique<Crawler>(*fetcher, config_.crawl);
        }
    } catch (const SetupError& e) {
        state_ = ScanState::FAILED;
        logging::error(std::string("scan setup failed: ") + e.what());
        throw;
    }

    open_audit_log();

    std::vector<HookError> hook_errors;
    json additions = plugins_.pre_scan(config_, hook_errors);
    plugins_.register_modules(registry_, hook_errors);
    report_hook_errors(hook_errors);

    try {
        selected = registry_.resolve(config_.modules, config_.profile);
    } catch (const SetupError& e) {
        state_ = ScanState::FAILED;
        logging::error(std::string("scan setup failed: ") + e.what());
        audit("scan_failed", {{"target", config_.target}, {"error", e.what()}});
        throw;
    }

    logging::info("scan " + run_id_ + " started: " + config_.target + " (" +
                  std::to_string(selected.size()) + " modules)");
    audit("scan_start", {{"target", config_.target},
                         {"modules", selected},
                         {"profile", config_.modules.empty() ? config_.profile : ""},
                         {"parallel", config_.parallel}});

    // Authentication failures leave the scan unauthenticated
    AuthSession session;
    std::string auth_error;
    if (!establish_session(*fetcher, config_.auth, config_.cookies, config_.headers, session, auth_error)) {
        logging::warn("authentication failed, continuing without it: " + auth_error);
    }

    state_ = ScanState::CRAWLING;
    CrawlSurface surface;
    if (precrawled) {
        surface = *precrawled;
    } else {
        // Rebuilt so page requests carry the session
        Crawler::Options copts = config_.crawl;
        for (const auto& h : session.request_headers()) {
            copts.headers[h.first] = h.second;
        }
        crawler = std::make_unique<Crawler>(*fetcher, copts);
        crawler->add_seed(config_.target);
        if (!config_.openapi_path.empty() && !crawler->load_openapi_file(config_.openapi_path)) {
            logging::warn("openapi document " + config_.openapi_path + " not used");
        }
        surface = crawler->run(deadline);
    }

    result.pages = std::move(surface.pages);
    result.endpoints = std::move(surface.endpoints);
    result.out_of_scope_links = std::move(surface.out_of_scope_links);
    result.partial = surface.partial;
    result.robots_blocked = surface.robots_blocked;
    result.cache_hits = surface.cache_hits;
    audit("crawl_complete", surface_stats(result));

    state_ = ScanState::TESTING;

    auto ctx = std::make_shared<TestContext>();
    ctx->target_url = config_.target;
    ctx->base_url = config_.base_url;
    ctx->pages = result.pages;
    ctx->endpoints = result.endpoints;
    ctx->config = std::make_shared<const ScanConfig>(config_);
    ctx->session = session;
    ctx->additions = additions;
    ctx->fetcher = fetcher;
    ctx->deadline = deadline;
    std::shared_ptr<const TestContext> shared_ctx = ctx;

    // Initialize every selected module; failures are final results
    std::vector<std::shared_ptr<TestModule>> modules(selected.size());
    std::vector<ModuleResult> results(selected.size());
    std::vector<size_t> runnable;
    auto exclude = [&](size_t i, const std::string& error) {
        results[i].status = ModuleStatus::ERROR;
        results[i].error = error;
        results[i].start_time = results[i].end_time = ModuleResult::Clock::now();
        logging::warn("module " + selected[i] + " excluded: " + error);
    };
    for (size_t i = 0; i < selected.size(); ++i) {
        results[i].name = selected[i];

        // Factories may come from plugins
        std::shared_ptr<TestModule> module;
        std::string error;
        try {
            module = registry_.create(selected[i]);
            if (module) results[i].category = module->category();
        } catch (const std::exception& e) {
            module.reset();
            error = e.what();
        }
        if (!module) {
            exclude(i, "could not be created: " + (error.empty() ? std::string("factory returned no module") : error));
            continue;
        }

        bool ok = false;
        try {
            ok = module->initialize(config_, error);
        } catch (const std::exception& e) {
            error = e.what();
        }
        if (!ok) {
            exclude(i, "initialization failed: " + (error.empty() ? std::string("unknown reason") : error));
            continue;
        }
        modules[i] = std::move(module);
        runnable.push_back(i);
    }

    run_modules(modules, runnable, shared_ctx, results);

    state_ = ScanState::AGGREGATING;
    result.module_results = std::move(results);
    if (deadline_hit_) {
        result.partial = true;
    }

    for (const auto& m : result.module_results) {
        audit("module_result", {{"module", m.name},
                                {"category", category_to_string(m.category)},
                                {"status", module_status_to_string(m.status)},
                                {"findings", m.findings.size()},
                                {"error", m.error},
                                {"duration_ms", m.duration_ms()}});
    }

    ScanSummary summary = result.summary();
    result.end_time = ScanResult::Clock::now();
    state_ = ScanState::COMPLETED;
    result.state = ScanState::COMPLETED;

    audit("scan_complete", {{"state", scan_state_to_string(result.state)},
                            {"partial", result.partial},
                            {"findings", {{"critical", summary.critical},
                                          {"high", summary.high},
                                          {"medium", summary.medium},
                                          {"low", summary.low},
                                          {"info", summary.info}}},
                            {"modules_passed", summary.modules_passed},
                            {"modules_failed", summary.modules_failed},
                            {"modules_errored", summary.modules_errored}});

    logging::info("scan " + run_id_ + " completed: " + std::to_string(summary.total()) + " findings, " +
                  std::to_string(summary.modules_errored) + " module errors" +
                  (result.partial ? " (partial)" : ""));

    hook_errors.clear();
    plugins_.post_scan(result, hook_errors);
    report_hook_errors(hook_errors);

    return result;
}

void Orchestrator::run_modules(const std::vector<std::shared_ptr<TestModule>>& modules,
                               const std::vector<size_t>& runnable,
                               const std::shared_ptr<const TestContext>& ctx,
                               std::vector<ModuleResult>& results) {
    if (runnable.empty()) return;

    if (!config_.parallel || config_.module_concurrency <= 1 || runnable.size() == 1) {
        for (size_t i : runnable) {
            results[i] = run_module(modules[i], ctx, results[i]);
        }
        return;
    }

    // Bounded pool. A worker takes the first unstarted module in resolved
    // order whose exclusive group is not already running.
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<bool> started(runnable.size(), false);
    size_t remaining = runnable.size();
    std::set<std::string> busy_groups;

    auto worker = [&]() {
        for (;;) {
            size_t slot = runnable.size();
            std::string group;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [&]() {
                    if (remaining == 0) return true;
                    for (size_t k = 0; k < runnable.size(); ++k) {
                        if (started[k]) continue;
                        std::string g = modules[runnable[k]]->exclusive_group();
                        if (g.empty() || busy_groups.count(g) == 0) {
                            slot = k;
                            group = g;
                            return true;
                        }
                    }
                    return false;
                });
                if (slot == runnable.size()) return;
                started[slot] = true;
                --remaining;
                if (!group.empty()) busy_groups.insert(group);
            }

            size_t index = runnable[slot];
            ModuleResult done = run_module(modules[index], ctx, results[index]);

            {
                std::lock_guard<std::mutex> lock(mutex);
                results[index] = std::move(done);
                if (!group.empty()) busy_groups.erase(group);
            }
            cv.notify_all();
        }
    };

    size_t pool = std::min(runnable.size(), static_cast<size_t>(config_.module_concurrency));
    std::vector<std::thread> workers;
    workers.reserve(pool);
    for (size_t i = 0; i < pool; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }
}

ModuleResult Orchestrator::run_module(const std::shared_ptr<TestModule>& module,
                                      const std::shared_ptr<const TestContext>& ctx,
                                      ModuleResult result) {
    result.status = ModuleStatus::RUNNING;
    result.start_time = ModuleResult::Clock::now();

    auto now = SteadyClock::now();
    auto limit = now + config_.module_timeout;
    bool deadline_bound = false;
    if (ctx->deadline && *ctx->deadline < limit) {
        limit = *ctx->deadline;
        deadline_bound = true;
    }

    if (limit <= now) {
        deadline_hit_ = true;
        result.status = ModuleStatus::ERROR;
        result.error = "scan deadline reached before the module started";
        result.end_time = ModuleResult::Clock::now();
        return result;
    }

    logging::debug("module " + result.name + " running");

    auto run = std::make_shared<ModuleRun>();
    std::thread worker([module, ctx, run]() {
        ModuleOutcome outcome;
        try {
            outcome = module->run(*ctx);
        } catch (const std::exception& e) {
            outcome = ModuleOutcome::failure(std::string("unhandled exception: ") + e.what());
        } catch (...) {
            outcome = ModuleOutcome::failure("unhandled exception of unknown type");
        }
        std::lock_guard<std::mutex> lock(run->mutex);
        run->outcome = std::move(outcome);
        run->done = true;
        run->cv.notify_all();
    });

    bool finished;
    {
        std::unique_lock<std::mutex> lock(run->mutex);
        finished = run->cv.wait_until(lock, limit, [&]() { return run->done; });
    }

    if (!finished) {
        // The thread keeps the module and context alive until it returns
        worker.detach();
        if (deadline_bound) deadline_hit_ = true;
        auto allowed = std::chrono::duration_cast<std::chrono::milliseconds>(limit - now);
        result.status = ModuleStatus::ERROR;
        result.error = "timed out after " + std::to_string(allowed.count()) + " ms";
        result.end_time = ModuleResult::Clock::now();
        logging::warn("module " + result.name + " " + result.error);
        return result;
    }
    worker.join();

    ModuleOutcome outcome = std::move(run->outcome);
    result.end_time = ModuleResult::Clock::now();
    for (auto& f : outcome.findings) {
        if (f.module.empty()) f.module = result.name;
    }
    result.findings = std::move(outcome.findings);

    if (outcome.error) {
        result.status = ModuleStatus::ERROR;
        result.error = *outcome.error;
        logging::warn("module " + result.name + " failed: " + result.error);
        return result;
    }

    bool significant = std::any_of(result.findings.begin(), result.findings.end(),
                                   [](const Finding& f) { return f.severity != Severity::INFO; });
    result.status = significant ? ModuleStatus::FAILED : ModuleStatus::PASSED;
    logging::debug("module " + result.name + " " + module_status_to_string(result.status) + " with " +
                   std::to_string(result.findings.size()) + " findings");
    return result;
}

} // namespace engine
