/**
 * @file test_session.cpp
 * @brief Authentication: static credentials, form login, cookie handling
 */

#include <catch2/catch.hpp>
#include "core/fetcher.h"
#include "core/session.h"
#include "helpers/fake_transport.h"
#include <mutex>

using test_helpers::FakeRoute;
using test_helpers::FakeTransport;

namespace {

const char* kLoginPage = R"(<html><body>
<form method="post" action="/login">
  <input type="hidden" name="csrf_token" value="tok123">
  <input name="username"><input type="password" name="password">
</form></body></html>)";

} // namespace

TEST_CASE("Set-Cookie parsing", "[session][cookies]") {
    auto c = parse_set_cookie("sid=abc123; Path=/; HttpOnly; Secure");
    REQUIRE(c.size() == 1);
    REQUIRE(c.at("sid") == "abc123");

    REQUIRE(parse_set_cookie(" lang = en ").at("lang") == "en");
    REQUIRE(parse_set_cookie("=novalue").empty());
    REQUIRE(parse_set_cookie("Secure; sid=1").empty());
    REQUIRE(parse_set_cookie("garbage").empty());
}

TEST_CASE("CSRF token extraction", "[session]") {
    REQUIRE(extract_csrf_token(kLoginPage) == "tok123");
    REQUIRE(extract_csrf_token(R"(<head><meta name="csrf-token" content="m3ta"></head>)") == "m3ta");
    REQUIRE(extract_csrf_token("<form><input type='hidden' name='other' value='x'></form>").empty());
}

TEST_CASE("Session headers and cookies", "[session]") {
    AuthSession session;
    session.cookies = {{"b", "2"}, {"a", "1"}};
    session.headers = {{"X-Env", "test"}};

    HttpRequest req;
    req.url = "http://site.test/";
    session.apply(req);
    REQUIRE(req.headers.at("Cookie") == "a=1; b=2");
    REQUIRE(req.headers.at("X-Env") == "test");

    HttpResponse resp;
    resp.headers = {{"set-cookie", "a=updated; Path=/"}, {"set-cookie", "c=3"}};
    session.absorb(resp);
    REQUIRE(session.cookies.at("a") == "updated");
    REQUIRE(session.cookies.at("c") == "3");
}

TEST_CASE("Static authentication", "[session][auth]") {
    auto fake = std::make_shared<FakeTransport>();
    Fetcher fetcher(fake, nullptr, nullptr);
    AuthSession session;
    std::string error;

    SECTION("none keeps configured cookies and headers") {
        AuthOptions auth;
        REQUIRE(establish_session(fetcher, auth, {{"sid", "x"}}, {{"X-A", "1"}}, session, error));
        REQUIRE_FALSE(session.authenticated);
        REQUIRE(session.cookies.at("sid") == "x");
        REQUIRE(session.headers.at("X-A") == "1");
    }

    SECTION("bearer") {
        AuthOptions auth;
        auth.type = AuthType::BEARER;
        auth.token = "t0k";
        REQUIRE(establish_session(fetcher, auth, {}, {}, session, error));
        REQUIRE(session.authenticated);
        REQUIRE(session.headers.at("Authorization") == "Bearer t0k");
    }

    SECTION("api key") {
        AuthOptions auth;
        auth.type = AuthType::API_KEY;
        auth.token = "k3y";
        auth.header_name = "X-Api-Token";
        REQUIRE(establish_session(fetcher, auth, {}, {}, session, error));
        REQUIRE(session.headers.at("X-Api-Token") == "k3y");
    }

    SECTION("bearer without a token") {
        AuthOptions auth;
        auth.type = AuthType::BEARER;
        REQUIRE_FALSE(establish_session(fetcher, auth, {}, {}, session, error));
        REQUIRE_FALSE(error.empty());
    }

    REQUIRE(fake->total() == 0);
}

TEST_CASE("Form login", "[session][auth]") {
    auto fake = std::make_shared<FakeTransport>();
    std::string posted;
    std::mutex posted_mu;
    fake->on_request([&](const HttpRequest& req) -> std::optional<FakeRoute> {
        if (req.url != "http://site.test/login") return std::nullopt;
        FakeRoute route;
        if (req.method == "GET") {
            route.body = kLoginPage;
            route.headers = {{"content-type", "text/html"}, {"set-cookie", "pre=1; Path=/"}};
        } else {
            std::lock_guard<std::mutex> lock(posted_mu);
            posted = req.body;
            route.status = 302;
            route.headers = {{"location", "/home"}, {"set-cookie", "sid=logged-in; HttpOnly"}};
        }
        return route;
    });
    Fetcher::Options fopts;
    fopts.max_retries = 0;
    Fetcher fetcher(fake, nullptr, nullptr, fopts);

    AuthOptions auth;
    auth.type = AuthType::FORM;
    auth.login_url = "http://site.test/login";
    auth.username = "alice";
    auth.password = "p@ss word";

    AuthSession session;
    std::string error;

    SECTION("credentials and CSRF token are posted") {
        REQUIRE(establish_session(fetcher, auth, {}, {}, session, error));
        REQUIRE(session.authenticated);
        REQUIRE(session.cookies.at("sid") == "logged-in");
        REQUIRE(session.cookies.at("pre") == "1");
        REQUIRE(posted.find("username=alice") != std::string::npos);
        REQUIRE(posted.find("password=p%40ss%20word") != std::string::npos);
        REQUIRE(posted.find("csrf_token=tok123") != std::string::npos);

        // The POST carried the cookie from the login page
        auto reqs = fake->requests();
        REQUIRE(reqs.size() == 2);
        REQUIRE(reqs[1].headers.at("Cookie") == "pre=1");
    }

    SECTION("an unavailable login page fails") {
        auth.login_url = "http://site.test/missing";
        REQUIRE_FALSE(establish_session(fetcher, auth, {}, {}, session, error));
        REQUIRE(error.find("HTTP 404") != std::string::npos);
        REQUIRE_FALSE(session.authenticated);
    }
}
