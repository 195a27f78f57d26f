/**
 * @file test_site_security.cpp
 * @brief csrf, open_redirect and info_disclosure modules
 */

#include <catch2/catch.hpp>
#include "core/config.h"
#include "core/url.h"
#include "helpers/fake_transport.h"
#include "modules/site_security.h"
#include <stdexcept>

using test_helpers::FakeRoute;
using test_helpers::FakeTransport;
using json = nlohmann::json;

namespace {

CrawledPage html_page(const std::string& url, const std::string& body = "<html></html>",
                      std::vector<std::pair<std::string, std::string>> headers = {}) {
    CrawledPage page;
    page.url = url;
    page.status = 200;
    page.content_type = "text/html; charset=utf-8";
    page.headers = std::move(headers);
    page.body = std::make_shared<const std::string>(body);
    return page;
}

CrawledPage page_with_form(const std::string& method, std::vector<std::string> field_names) {
    CrawledPage page = html_page("http://site.test/profile");
    Form form;
    form.action = "http://site.test/account";
    form.method = method;
    for (const auto& n : field_names) {
        FormField field;
        field.name = n;
        field.type = "text";
        form.fields.push_back(field);
    }
    page.forms.push_back(form);
    return page;
}

engine::TestContext context_with(std::vector<CrawledPage> pages,
                                 std::shared_ptr<FakeTransport> fake = nullptr) {
    engine::TestContext ctx;
    ctx.target_url = "http://site.test/";
    ctx.base_url = "http://site.test";
    ctx.pages = std::move(pages);
    if (fake) {
        Fetcher::Options fopts;
        fopts.max_retries = 0;
        ctx.fetcher = std::make_shared<Fetcher>(fake, nullptr, nullptr, fopts);
    }
    return ctx;
}

ScanConfig config_with(const std::string& module, const json& options) {
    json j;
    j["target"] = "http://site.test/";
    j["modules"]["options"][module] = options;
    return config::from_json(j);
}

/// Redirects to whatever the next parameter holds
std::shared_ptr<FakeTransport> redirecting_site(bool any_host) {
    auto fake = std::make_shared<FakeTransport>();
    fake->on_request([any_host](const HttpRequest& req) -> std::optional<FakeRoute> {
        for (const auto& q : urls::parse_query(req.url)) {
            if (q.first != "next") continue;
            FakeRoute route;
            route.status = 302;
            route.headers = {{"location", any_host ? q.second : "/home"}};
            return route;
        }
        return std::nullopt;
    });
    return fake;
}

} // namespace

TEST_CASE("csrf", "[modules][csrf]") {
    modules::CsrfModule module;
    std::string error;

    SECTION("accepted submission without a token") {
        auto fake = std::make_shared<FakeTransport>();
        fake->page("http://site.test/account", "<html>saved</html>");
        REQUIRE(module.initialize(config_with("csrf", json::object()), error));

        auto out = module.run(context_with({page_with_form("POST", {"email"})}, fake));
        REQUIRE(out.findings.size() == 1);

        const Finding& f = out.findings[0];
        REQUIRE(f.title == "Missing CSRF protection");
        REQUIRE(f.severity == Severity::HIGH);
        REQUIRE(f.classification == "CWE-352");
        REQUIRE(f.url == "http://site.test/profile");
        REQUIRE(f.evidence["action"] == "http://site.test/account");
        REQUIRE(f.evidence["fields"] == json::array({"email"}));
        REQUIRE(f.evidence["status"] == 200);

        auto requests = fake->requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].method == "POST");
        REQUIRE(requests[0].body == "email=test");
    }

    SECTION("a form with a token field is not submitted") {
        auto fake = std::make_shared<FakeTransport>();
        REQUIRE(module.initialize(config_with("csrf", json::object()), error));

        auto out = module.run(context_with({page_with_form("POST", {"email", "csrf_token"}),
                                            page_with_form("POST", {"authenticity_token"})}, fake));
        REQUIRE(out.findings.empty());
        REQUIRE(fake->total() == 0);
    }

    SECTION("rejected submission") {
        auto fake = std::make_shared<FakeTransport>();
        FakeRoute forbidden;
        forbidden.status = 403;
        fake->add("http://site.test/account", forbidden);
        REQUIRE(module.initialize(config_with("csrf", json::object()), error));

        auto out = module.run(context_with({page_with_form("POST", {"email"})}, fake));
        REQUIRE(out.findings.empty());
    }

    SECTION("passive mode and GET forms") {
        auto fake = std::make_shared<FakeTransport>();
        REQUIRE(module.initialize(config_with("csrf", {{"submit", false}}), error));

        auto out = module.run(context_with({page_with_form("POST", {"email"}),
                                            page_with_form("POST", {"email"}),
                                            page_with_form("GET", {"q"})}, fake));
        REQUIRE(out.findings.size() == 1);
        REQUIRE(out.findings[0].severity == Severity::MEDIUM);
        REQUIRE(out.findings[0].evidence["submitted"] == false);
        REQUIRE(out.findings[0].evidence["status"].is_null());
        REQUIRE(fake->total() == 0);
    }

    SECTION("token field names") {
        REQUIRE(modules::CsrfModule::is_token_field("_csrf"));
        REQUIRE(modules::CsrfModule::is_token_field("X-XSRF-TOKEN"));
        REQUIRE(modules::CsrfModule::is_token_field("form_nonce"));
        REQUIRE_FALSE(modules::CsrfModule::is_token_field("email"));
    }

    SECTION("invalid options") {
        REQUIRE_FALSE(module.initialize(config_with("csrf", {{"max_forms", 0}}), error));
        REQUIRE_THROWS_AS(module.initialize(config_with("csrf", {{"submit", "yes"}}), error),
                          std::invalid_argument);
    }
}

TEST_CASE("open_redirect", "[modules][open_redirect]") {
    modules::OpenRedirectModule module;
    std::string error;
    REQUIRE(module.initialize(config_with("open_redirect", json::object()), error));

    SECTION("redirect to an arbitrary host") {
        auto fake = redirecting_site(true);
        auto out = module.run(context_with({html_page("http://site.test/login?next=%2Fhome")}, fake));
        REQUIRE(out.findings.size() == 1);

        const Finding& f = out.findings[0];
        REQUIRE(f.title == "Open redirect");
        REQUIRE(f.severity == Severity::MEDIUM);
        REQUIRE(f.classification == "CWE-601");
        REQUIRE(f.evidence["parameter"] == "next");
        REQUIRE(f.evidence["status"] == 302);
        REQUIRE(f.evidence["location"] == "https://sitecheck-redirect.invalid/");
        REQUIRE(fake->total() == 1);
    }

    SECTION("redirects that stay on the site") {
        auto fake = redirecting_site(false);
        auto out = module.run(context_with({html_page("http://site.test/login?next=%2Fhome")}, fake));
        REQUIRE(out.findings.empty());
        REQUIRE(fake->total() == 2);
    }

    SECTION("only redirect-like parameters are tried") {
        auto fake = redirecting_site(true);
        auto out = module.run(context_with({html_page("http://site.test/item?id=1")}, fake));
        REQUIRE(out.findings.empty());
        REQUIRE(fake->total() == 0);

        REQUIRE(modules::OpenRedirectModule::is_redirect_parameter("returnUrl"));
        REQUIRE(modules::OpenRedirectModule::is_redirect_parameter("redirect_to"));
        REQUIRE_FALSE(modules::OpenRedirectModule::is_redirect_parameter("page"));
    }

    SECTION("a redirect host that is not a bare name") {
        REQUIRE_FALSE(module.initialize(config_with("open_redirect", {{"probe_host", "http://evil"}}), error));
        REQUIRE(error.find("probe_host") != std::string::npos);
    }
}

TEST_CASE("info_disclosure", "[modules][info_disclosure]") {
    modules::InfoDisclosureModule module;
    std::string error;

    SECTION("version banners and comments") {
        REQUIRE(module.initialize(config_with("info_disclosure", {{"probe_error_page", false}}), error));

        std::vector<std::pair<std::string, std::string>> banners = {
            {"server", "Apache/2.4.41 (Ubuntu)"}, {"x-powered-by", "PHP/7.4.3"}};
        auto out = module.run(context_with({
            html_page("http://site.test/", "<html><!-- TODO: rotate the admin password --></html>", banners),
            html_page("http://site.test/about", "<html><!-- layout v2 --></html>", banners),
            html_page("http://site.test/plain", "<html></html>", {{"server", "nginx"}})}));

        REQUIRE(out.findings.size() == 3);
        REQUIRE(out.findings[0].title == "Version disclosed in server header");
        REQUIRE(out.findings[0].evidence["observed_value"] == "Apache/2.4.41 (Ubuntu)");
        REQUIRE(out.findings[1].title == "Version disclosed in x-powered-by header");

        const Finding& comment = out.findings[2];
        REQUIRE(comment.title == "Sensitive information in HTML comment");
        REQUIRE(comment.url == "http://site.test/");
        REQUIRE(comment.evidence["keyword"] == "password");
        REQUIRE(comment.classification == "CWE-615");
    }

    SECTION("error page with a stack trace") {
        auto fake = std::make_shared<FakeTransport>();
        fake->on_request([](const HttpRequest& req) -> std::optional<FakeRoute> {
            if (req.url.find("/sitecheck-missing-") == std::string::npos) return std::nullopt;
            FakeRoute route;
            route.status = 404;
            route.body = "<pre>Traceback (most recent call last):\n  File \"app.py\", line 12</pre>";
            return route;
        });
        REQUIRE(module.initialize(config_with("info_disclosure", json::object()), error));

        auto out = module.run(context_with({html_page("http://site.test/")}, fake));
        REQUIRE(out.findings.size() == 1);
        REQUIRE(out.findings[0].title == "Stack trace on error page");
        REQUIRE(out.findings[0].severity == Severity::LOW);
        REQUIRE(out.findings[0].evidence["status"] == 404);
        REQUIRE(out.findings[0].url.rfind("http://site.test/sitecheck-missing-", 0) == 0);
    }

    SECTION("error page naming the server") {
        auto fake = std::make_shared<FakeTransport>();
        fake->on_request([](const HttpRequest& req) -> std::optional<FakeRoute> {
            if (req.url.find("/sitecheck-missing-") == std::string::npos) return std::nullopt;
            FakeRoute route;
            route.status = 404;
            route.body = "<h1>Not Found</h1><address>Apache/2.4.41 Server at site.test</address>";
            return route;
        });
        REQUIRE(module.initialize(config_with("info_disclosure", json::object()), error));

        auto out = module.run(context_with({html_page("http://site.test/")}, fake));
        REQUIRE(out.findings.size() == 1);
        REQUIRE(out.findings[0].title == "Technology version on error page");
        REQUIRE(out.findings[0].severity == Severity::INFO);
    }

    SECTION("plain error page") {
        auto fake = std::make_shared<FakeTransport>();
        REQUIRE(module.initialize(config_with("info_disclosure", json::object()), error));
        auto out = module.run(context_with({html_page("http://site.test/")}, fake));
        REQUIRE(out.findings.empty());
        REQUIRE(fake->total() == 1);
    }
}
