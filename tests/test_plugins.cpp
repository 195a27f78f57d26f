/**
 * @file test_plugins.cpp
 * @brief Scan hooks: shared-library loading, module registration, failure isolation
 */

#include <catch2/catch.hpp>
#include "core/errors.h"
#include "engine/orchestrator.h"
#include "engine/plugins.h"
#include "helpers/fake_transport.h"
#include <stdexcept>

using namespace engine;
using json = nlohmann::json;

namespace {

/// Reports whatever the hooks added to the context
class AdditionsEcho : public TestModule {
public:
    std::string name() const override { return "additions_echo"; }
    Category category() const override { return Category::OTHER; }
    std::string description() const override { return "echoes hook additions"; }
    ModuleOutcome run(const TestContext& ctx) override {
        ModuleOutcome out;
        Finding f;
        f.title = "Additions";
        f.url = ctx.target_url;
        f.evidence = ctx.additions;
        out.findings.push_back(f);
        return out;
    }
};

class RecordingHook : public ScanHook {
public:
    std::string name() const override { return "recording"; }

    json pre_scan(const ScanConfig& config) override {
        return {{"environment", "staging"}, {"target", config.target}};
    }

    void register_modules(Registry& registry) override {
        registry.register_module("additions_echo", []() { return std::make_unique<AdditionsEcho>(); });
    }

    void post_scan(const ScanResult& result) override {
        post_scan_modules = result.module_results.size();
    }

    size_t post_scan_modules = 0;
};

class ThrowingHook : public ScanHook {
public:
    std::string name() const override { return "throwing"; }
    json pre_scan(const ScanConfig&) override { throw std::runtime_error("hook exploded"); }
    void post_scan(const ScanResult&) override { throw std::runtime_error("post hook exploded"); }
};

class BadAdditionsHook : public ScanHook {
public:
    std::string name() const override { return "bad_additions"; }
    json pre_scan(const ScanConfig&) override { return json::array({1, 2}); }
};

ScanConfig config_for(const std::vector<std::string>& modules) {
    json j;
    j["target"] = "http://site.test/";
    j["modules"]["enabled"] = modules;
    j["logging"]["level"] = "error";
    return config::from_json(j);
}

} // namespace

TEST_CASE("Shared-library hooks are loaded", "[plugins]") {
    PluginHost host;
    std::string error;
    REQUIRE(host.load_library(SITECHECK_SAMPLE_HOOK_PATH, error));
    REQUIRE(host.size() == 1);

    std::vector<HookError> errors;
    json additions = host.pre_scan(config_for({}), errors);
    REQUIRE(errors.empty());
    REQUIRE(additions["sample"] == true);
    REQUIRE(additions["seen_target"] == "http://site.test/");
}

TEST_CASE("A plugin library registers a module that runs in a full scan", "[plugins]") {
    auto fake = std::make_shared<test_helpers::FakeTransport>();
    fake->page("http://site.test/", "<html><body><a href='/about'>about</a></body></html>");
    fake->page("http://site.test/about", "<html><body>about</body></html>");
    Services services;
    services.transport = fake;

    ScanConfig cfg = config_for({"page_inventory"});
    cfg.plugins = {SITECHECK_MODULE_HOOK_PATH};

    ScanResult result;
    {
        Orchestrator orch(cfg, Registry(), services);
        result = orch.run();
        REQUIRE(orch.state() == ScanState::COMPLETED);
        REQUIRE(orch.plugins().size() == 1);
    }
    // The orchestrator, its registry and the library are gone by now

    REQUIRE(result.module_results.size() == 1);
    const ModuleResult* inventory = result.module("page_inventory");
    REQUIRE(inventory);
    REQUIRE(inventory->status == ModuleStatus::PASSED);
    REQUIRE(inventory->category == Category::FUNCTIONAL);
    REQUIRE(inventory->findings.size() == 2);
    REQUIRE(inventory->findings[0].module == "page_inventory");
    REQUIRE(inventory->findings[0].evidence["status"] == 200);
}

TEST_CASE("Loading a missing library fails cleanly", "[plugins]") {
    PluginHost host;
    std::string error;
    REQUIRE_FALSE(host.load_library("/nonexistent/libnothing.so", error));
    REQUIRE(error.find("cannot load") != std::string::npos);
    REQUIRE(host.size() == 0);
}

TEST_CASE("A missing configured plugin is a setup error", "[plugins][setup]") {
    ScanConfig cfg = config_for({});
    cfg.plugins = {"/nonexistent/libnothing.so"};
    Services services;
    services.transport = std::make_shared<test_helpers::FakeTransport>();

    Orchestrator orch(cfg, Registry(), services);
    REQUIRE_THROWS_AS(orch.run(), SetupError);
    REQUIRE(orch.state() == ScanState::FAILED);
}

TEST_CASE("Hooks add modules and context", "[plugins]") {
    auto fake = std::make_shared<test_helpers::FakeTransport>();
    fake->page("http://site.test/", "<html><head><title>Home</title></head></html>");
    Services services;
    services.transport = fake;

    auto hook = std::make_shared<RecordingHook>();
    Orchestrator orch(config_for({"additions_echo"}), Registry(), services);
    orch.plugins().add(hook);
    orch.plugins().add(std::make_shared<ThrowingHook>());
    orch.plugins().add(std::make_shared<BadAdditionsHook>());

    ScanResult result = orch.run();

    // The throwing and malformed hooks are reported and otherwise ignored
    const ModuleResult* echo = result.module("additions_echo");
    REQUIRE(echo);
    REQUIRE(echo->status == ModuleStatus::PASSED);
    REQUIRE(echo->findings.size() == 1);
    REQUIRE(echo->findings[0].evidence["environment"] == "staging");
    REQUIRE(echo->findings[0].evidence["target"] == "http://site.test/");
    REQUIRE(hook->post_scan_modules == 1);
}

TEST_CASE("Hook failures are collected per stage", "[plugins]") {
    PluginHost host;
    host.add(std::make_shared<ThrowingHook>());
    host.add(std::make_shared<BadAdditionsHook>());
    host.add(nullptr);
    REQUIRE(host.size() == 2);

    std::vector<HookError> errors;
    json additions = host.pre_scan(config_for({}), errors);
    REQUIRE(additions.empty());
    REQUIRE(errors.size() == 2);
    REQUIRE(errors[0].hook == "throwing");
    REQUIRE(errors[0].stage == "pre_scan");
    REQUIRE(errors[0].message == "hook exploded");
    REQUIRE(errors[1].hook == "bad_additions");

    errors.clear();
    host.post_scan(ScanResult(), errors);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].stage == "post_scan");

    errors.clear();
    Registry registry;
    host.register_modules(registry, errors);
    REQUIRE(errors.empty());
}
