/**
 * @file test_url.cpp
 * @brief Unit tests for URL normalization, resolution and scope checks
 */

#include <catch2/catch.hpp>
#include "core/url.h"

TEST_CASE("normalize produces the page identity", "[url]") {
    SECTION("scheme and host are lower-cased, default port and fragment dropped") {
        auto n = urls::normalize("HTTP://Example.COM:80/a?b=2&a=1#frag");
        REQUIRE(n);
        REQUIRE(*n == "http://example.com/a?a=1&b=2");
    }

    SECTION("empty path becomes /") {
        REQUIRE(urls::normalize("https://example.com") == std::optional<std::string>("https://example.com/"));
    }

    SECTION("non-default port is kept") {
        REQUIRE(urls::normalize("https://example.com:8443/x") ==
                std::optional<std::string>("https://example.com:8443/x"));
    }

    SECTION("non-http schemes and garbage are rejected") {
        REQUIRE_FALSE(urls::normalize("ftp://example.com/file"));
        REQUIRE_FALSE(urls::normalize("not a url"));
        REQUIRE_FALSE(urls::normalize(""));
    }
}

TEST_CASE("resolve handles relative and non-navigable links", "[url]") {
    const std::string base = "http://example.com/dir/page";

    REQUIRE(urls::resolve(base, "../other?x=1") == std::optional<std::string>("http://example.com/other?x=1"));
    REQUIRE(urls::resolve(base, "next") == std::optional<std::string>("http://example.com/dir/next"));
    REQUIRE(urls::resolve(base, "https://other.com/x") == std::optional<std::string>("https://other.com/x"));

    REQUIRE_FALSE(urls::resolve(base, "#top"));
    REQUIRE_FALSE(urls::resolve(base, "javascript:void(0)"));
    REQUIRE_FALSE(urls::resolve(base, "mailto:someone@example.com"));
    REQUIRE_FALSE(urls::resolve(base, "   "));
}

TEST_CASE("origin, host and path extraction", "[url]") {
    REQUIRE(urls::origin_of("https://Example.com:8443/a/b?c=1") == "https://example.com:8443");
    REQUIRE(urls::origin_of("http://example.com/") == "http://example.com");
    REQUIRE(urls::host_of("http://API.example.com/x") == "api.example.com");
    REQUIRE(urls::path_of("http://example.com/a/b?c=1") == "/a/b?c=1");
    REQUIRE(urls::path_of("http://example.com") == "/");
}

TEST_CASE("in_scope matches exact hosts and wildcard entries", "[url][scope]") {
    std::vector<std::string> allowed{"*.example.com", "Partner.org"};

    REQUIRE(urls::in_scope("example.com", allowed));
    REQUIRE(urls::in_scope("api.example.com", allowed));
    REQUIRE(urls::in_scope("a.b.example.com", allowed));
    REQUIRE(urls::in_scope("partner.org", allowed));

    REQUIRE_FALSE(urls::in_scope("badexample.com", allowed));
    REQUIRE_FALSE(urls::in_scope("sub.partner.org", allowed));
    REQUIRE_FALSE(urls::in_scope("", allowed));
    REQUIRE_FALSE(urls::in_scope("example.com", {}));
}

TEST_CASE("query helpers", "[url]") {
    SECTION("parse_query decodes names and values in order") {
        auto q = urls::parse_query("http://x.test/?a=1&b=hello%20world&c#frag");
        REQUIRE(q.size() == 3);
        REQUIRE(q[0] == std::make_pair(std::string("a"), std::string("1")));
        REQUIRE(q[1] == std::make_pair(std::string("b"), std::string("hello world")));
        REQUIRE(q[2] == std::make_pair(std::string("c"), std::string("")));
    }

    SECTION("with_query_param replaces in place") {
        REQUIRE(urls::with_query_param("http://x.test/p?a=1&b=2", "a", "x y") ==
                "http://x.test/p?a=x%20y&b=2");
    }

    SECTION("with_query_param appends a missing parameter") {
        REQUIRE(urls::with_query_param("http://x.test/p", "q", "1'") == "http://x.test/p?q=1%27");
        REQUIRE(urls::with_query_param("http://x.test/p?a=1", "q", "v") == "http://x.test/p?a=1&q=v");
    }

    SECTION("encode and decode") {
        REQUIRE(urls::url_encode("a b&c") == "a%20b%26c");
        REQUIRE(urls::url_decode("a%20b+c%2") == "a b c%2");
    }
}
