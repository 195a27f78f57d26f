/**
 * @file test_sql_injection.cpp
 * @brief Error-based and time-based SQL injection detection
 *
 * The fake site answers quote-breaking payloads with a MySQL error and
 * delays any request carrying SLEEP by one second.
 */

#include <catch2/catch.hpp>
#include "core/config.h"
#include "core/timing_analyzer.h"
#include "core/url.h"
#include "helpers/fake_transport.h"
#include "modules/injection.h"
#include "modules/module_util.h"
#include <chrono>
#include <stdexcept>

using test_helpers::FakeRoute;
using test_helpers::FakeTransport;
using json = nlohmann::json;

namespace {

const char* kItemPage = "<html><body>item 1</body></html>";

ScanConfig config_with(const json& options) {
    json j;
    j["target"] = "http://site.test/";
    j["modules"]["options"]["sql_injection"] = options;
    return config::from_json(j);
}

CrawledPage item_page() {
    CrawledPage page;
    page.url = "http://site.test/item?id=1";
    page.status = 200;
    page.content_type = "text/html";
    page.body = std::make_shared<const std::string>(kItemPage);
    return page;
}

engine::TestContext context_for(const std::shared_ptr<FakeTransport>& fake, std::vector<CrawledPage> pages) {
    Fetcher::Options fopts;
    fopts.max_retries = 0;
    engine::TestContext ctx;
    ctx.target_url = "http://site.test/";
    ctx.base_url = "http://site.test";
    ctx.pages = std::move(pages);
    ctx.fetcher = std::make_shared<Fetcher>(fake, nullptr, nullptr, fopts);
    return ctx;
}

/// Quote payloads break the query; sleep payloads stall it
std::shared_ptr<FakeTransport> vulnerable_site(bool errors, bool sleeps) {
    auto fake = std::make_shared<FakeTransport>();
    fake->page("http://site.test/item", kItemPage);
    fake->on_request([errors, sleeps](const HttpRequest& req) -> std::optional<FakeRoute> {
        std::string seen = urls::url_decode(req.url) + " " + urls::url_decode(req.body);
        FakeRoute route;
        route.headers = test_helpers::with_content_type("text/html");
        if (sleeps && seen.find("SLEEP") != std::string::npos) {
            route.body = kItemPage;
            route.latency = std::chrono::milliseconds(1000);
            return route;
        }
        if (errors && seen.find('\'') != std::string::npos) {
            route.status = 500;
            route.body = "<b>You have an error in your SQL syntax; check the manual that corresponds "
                         "to your MySQL server version for the right syntax to use near ''1''' at line 1</b>";
            return route;
        }
        return std::nullopt;
    });
    return fake;
}

/// Every request takes base; SLEEP payloads take extra on top
std::shared_ptr<FakeTransport> slow_site(std::chrono::milliseconds base, std::chrono::milliseconds extra) {
    auto fake = std::make_shared<FakeTransport>();
    fake->page("http://site.test/item", kItemPage);
    fake->set_latency(base);
    fake->on_request([extra](const HttpRequest& req) -> std::optional<FakeRoute> {
        if (urls::url_decode(req.url).find("SLEEP") == std::string::npos) return std::nullopt;
        FakeRoute route;
        route.body = kItemPage;
        route.headers = test_helpers::with_content_type("text/html");
        route.latency = extra;
        return route;
    });
    return fake;
}

} // namespace

TEST_CASE("Error-based injection in a query parameter", "[sql_injection]") {
    auto fake = vulnerable_site(true, false);
    modules::SqlInjectionModule module;
    std::string error;
    REQUIRE(module.initialize(config_with({{"time_based", false}}), error));

    engine::ModuleOutcome out = module.run(context_for(fake, {item_page()}));
    REQUIRE_FALSE(out.error);
    REQUIRE(out.findings.size() == 1);

    const Finding& f = out.findings[0];
    REQUIRE(f.title == "SQL injection (error-based)");
    REQUIRE(f.severity == Severity::CRITICAL);
    REQUIRE(f.classification == "CWE-89");
    REQUIRE(f.url == "http://site.test/item?id=1");
    REQUIRE(f.evidence["parameter"] == "id");
    REQUIRE(f.evidence["payload"] == "1'");
    REQUIRE(f.evidence["database"] == "mysql");
    REQUIRE(f.evidence["status"] == 500);
}

TEST_CASE("Error-based injection in a POST form", "[sql_injection]") {
    auto fake = vulnerable_site(true, false);

    CrawledPage page;
    page.url = "http://site.test/search";
    page.status = 200;
    page.content_type = "text/html";
    Form form;
    form.action = "http://site.test/search";
    form.method = "POST";
    FormField q;
    q.name = "q";
    q.type = "text";
    form.fields.push_back(q);
    page.forms.push_back(form);

    modules::SqlInjectionModule module;
    std::string error;
    REQUIRE(module.initialize(config_with({{"time_based", false}}), error));

    engine::ModuleOutcome out = module.run(context_for(fake, {page}));
    REQUIRE(out.findings.size() == 1);
    REQUIRE(out.findings[0].evidence["method"] == "POST");
    REQUIRE(out.findings[0].evidence["source"] == "form");
    REQUIRE(out.findings[0].evidence["parameter"] == "q");
}

TEST_CASE("An error already present on the clean page is not reported", "[sql_injection]") {
    auto fake = std::make_shared<FakeTransport>();
    FakeRoute broken;
    broken.body = "You have an error in your SQL syntax near 'x'";
    broken.headers = test_helpers::with_content_type("text/html");
    fake->add("http://site.test/item", broken);

    modules::SqlInjectionModule module;
    std::string error;
    REQUIRE(module.initialize(config_with({{"time_based", false}}), error));

    engine::ModuleOutcome out = module.run(context_for(fake, {item_page()}));
    REQUIRE(out.findings.empty());
}

TEST_CASE("Time-based injection", "[sql_injection][timing]") {
    modules::SqlInjectionModule module;
    std::string error;
    REQUIRE(module.initialize(config_with({{"error_based", false},
                                           {"delay_seconds", 1},
                                           {"validation_samples", 1},
                                           {"time_threshold_ms", 600}}), error));

    SECTION("a delayed response is reported") {
        auto fake = vulnerable_site(false, true);
        engine::ModuleOutcome out = module.run(context_for(fake, {item_page()}));
        REQUIRE(out.findings.size() == 1);

        const Finding& f = out.findings[0];
        REQUIRE(f.title == "SQL injection (time-based)");
        REQUIRE(f.severity == Severity::HIGH);
        REQUIRE(f.evidence["parameter"] == "id");
        REQUIRE(f.evidence["payload"].get<std::string>().find("SLEEP(1)") != std::string::npos);
        REQUIRE(f.evidence["latency_delta_ms"].get<double>() >= 600.0);
        REQUIRE(f.confidence >= 0.5);
    }

    SECTION("a site without delays is clean") {
        auto fake = vulnerable_site(false, false);
        engine::ModuleOutcome out = module.run(context_for(fake, {item_page()}));
        REQUIRE(out.findings.empty());
    }
}

TEST_CASE("The configured threshold alone decides a time-based finding", "[sql_injection][timing]") {
    using std::chrono::milliseconds;
    modules::SqlInjectionModule module;
    std::string error;

    SECTION("requested sleep longer than the observed delay") {
        REQUIRE(module.initialize(config_with({{"error_based", false},
                                               {"delay_seconds", 3},
                                               {"validation_samples", 1},
                                               {"time_threshold_ms", 600}}), error));
        auto fake = slow_site(milliseconds(0), milliseconds(1000));
        engine::ModuleOutcome out = module.run(context_for(fake, {item_page()}));
        REQUIRE(out.findings.size() == 1);
        REQUIRE(out.findings[0].severity == Severity::HIGH);
        REQUIRE(out.findings[0].evidence["latency_delta_ms"].get<double>() >= 600.0);
        REQUIRE(out.findings[0].evidence["threshold_ms"].get<double>() == Approx(600.0));
    }

    SECTION("slow baseline with a delay above the threshold") {
        REQUIRE(module.initialize(config_with({{"error_based", false},
                                               {"delay_seconds", 1},
                                               {"validation_samples", 2},
                                               {"time_threshold_ms", 600}}), error));
        auto fake = slow_site(milliseconds(300), milliseconds(700));
        engine::ModuleOutcome out = module.run(context_for(fake, {item_page()}));
        REQUIRE(out.findings.size() == 1);

        const Finding& f = out.findings[0];
        REQUIRE(f.evidence["baseline_time_ms"].get<double>() >= 300.0);
        REQUIRE(f.evidence["measurements"].size() == 2);
        REQUIRE(f.evidence["latency_delta_ms"].get<double>() >= 600.0);
    }

    SECTION("slow baseline with a delay below the threshold") {
        REQUIRE(module.initialize(config_with({{"error_based", false},
                                               {"delay_seconds", 1},
                                               {"validation_samples", 1},
                                               {"time_threshold_ms", 600}}), error));
        auto fake = slow_site(milliseconds(300), milliseconds(350));
        engine::ModuleOutcome out = module.run(context_for(fake, {item_page()}));
        REQUIRE(out.findings.empty());
    }
}

TEST_CASE("Payload sets", "[sql_injection]") {
    auto payloads = modules::SqlInjectionModule::time_payloads(3);
    REQUIRE(payloads.size() == 5);
    for (const auto& p : payloads) {
        REQUIRE(TimingAnalyzer::expected_delay_ms(p, "sql") == Approx(3000.0));
    }
    REQUIRE_FALSE(modules::SqlInjectionModule::error_payloads().empty());
}

TEST_CASE("SQL error recognition", "[sql_injection]") {
    auto mysql = modules::find_sql_error("You have an error in your SQL syntax; check the manual near 'x'");
    REQUIRE(mysql);
    REQUIRE(mysql->database == "mysql");

    auto pg = modules::find_sql_error("ERROR:  syntax error at or near \"'\"");
    REQUIRE(pg);
    REQUIRE(pg->database == "postgresql");

    REQUIRE_FALSE(modules::find_sql_error("<html>Welcome back</html>"));
    REQUIRE_FALSE(modules::find_sql_error("<!-- You have an error in your SQL syntax near 'x' -->"));
}

TEST_CASE("Invalid sql_injection options", "[sql_injection][setup]") {
    modules::SqlInjectionModule module;
    std::string error;

    REQUIRE_FALSE(module.initialize(config_with({{"delay_seconds", 0}}), error));
    REQUIRE(error.find("delay_seconds") != std::string::npos);
    REQUIRE_FALSE(module.initialize(config_with({{"baseline_samples", 2}}), error));
    REQUIRE_FALSE(module.initialize(config_with({{"time_threshold_ms", -1}}), error));
    REQUIRE_THROWS_AS(module.initialize(config_with({{"delay_seconds", "five"}}), error),
                      std::invalid_argument);
}
