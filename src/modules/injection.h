#pragma once
#include "engine/module.h"
#include <vector>

// Active modules: they send payloads through the fetcher (cache bypassed)
// and compare what comes back with a clean request.

namespace modules {

class ReflectedXssModule : public engine::TestModule {
public:
    std::string name() const override { return "reflected_xss"; }
    Category category() const override { return Category::SECURITY; }
    std::string description() const override {
        return "Query and form parameters echoed into HTML without encoding";
    }
    std::string exclusive_group() const override { return "active_probes"; }
    bool initialize(const ScanConfig& config, std::string& error) override;
    engine::ModuleOutcome run(const engine::TestContext& ctx) override;

private:
    size_t max_requests_ = 50;
};

/**
 * Error-based and time-based SQL injection.
 *
 * Error-based: a quote-breaking payload produces a database error message
 * that the clean request does not. Time-based: a sleep payload delays the
 * response by at least the threshold on every validation sample, measured
 * against a baseline of clean requests.
 */
class SqlInjectionModule : public engine::TestModule {
public:
    std::string name() const override { return "sql_injection"; }
    Category category() const override { return Category::SECURITY; }
    std::string description() const override {
        return "Error-based and time-based SQL injection in request parameters";
    }
    std::string exclusive_group() const override { return "active_probes"; }
    bool initialize(const ScanConfig& config, std::string& error) override;
    engine::ModuleOutcome run(const engine::TestContext& ctx) override;

    /// Sleep payloads for a delay in whole seconds
    static std::vector<std::string> time_payloads(int delay_seconds);

    static const std::vector<std::string>& error_payloads();

private:
    int delay_seconds_ = 5;
    double time_threshold_ms_ = 0.0;   // 0 = 80% of the delay
    size_t baseline_samples_ = 3;
    size_t validation_samples_ = 2;
    size_t max_targets_ = 20;
    bool error_based_ = true;
    bool time_based_ = true;
};

/**
 * OS command injection in request parameters, POST forms included.
 *
 * Output-based: an appended `id` prints a uid/gid line the clean response
 * lacks. Time-based: an appended `sleep n` delays the response by at
 * least the threshold on every validation sample.
 */
class CommandInjectionModule : public engine::TestModule {
public:
    std::string name() const override { return "command_injection"; }
    Category category() const override { return Category::SECURITY; }
    std::string description() const override {
        return "Output-based and time-based OS command injection in request parameters";
    }
    std::string exclusive_group() const override { return "active_probes"; }
    bool initialize(const ScanConfig& config, std::string& error) override;
    engine::ModuleOutcome run(const engine::TestContext& ctx) override;

    static const std::vector<std::string>& output_payloads();

    /// Shell sleeps for a delay in whole seconds
    static std::vector<std::string> time_payloads(int delay_seconds);

private:
    int delay_seconds_ = 5;
    double time_threshold_ms_ = 0.0;
    size_t baseline_samples_ = 3;
    size_t validation_samples_ = 2;
    size_t max_targets_ = 20;
    bool output_based_ = true;
    bool time_based_ = true;
};

} // namespace modules
