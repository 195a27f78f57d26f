/**
 * @file test_html_extractor.cpp
 * @brief Unit tests for link, form and page-fact extraction
 */

#include <catch2/catch.hpp>
#include "core/html_extractor.h"

namespace {

const char* kPage = R"(<!doctype html>
<html lang="en">
<head>
  <title>  Product   catalogue </title>
  <meta name="Description" content="All products">
  <meta name="viewport" content="width=device-width">
  <link rel="canonical" href="/catalogue">
  <link rel="stylesheet" href="/css/site.css">
  <script src="/js/app.js"></script>
  <script>fetch('/api/items'); axios.post("/api/cart", {});</script>
</head>
<body>
  <h1>Catalogue</h1>
  <a href="/item?id=2&sort=asc">two</a>
  <a href="/item?sort=asc&id=2">two again</a>
  <a href="#top">top</a>
  <a href="mailto:shop@example.com">mail</a>
  <a href="https://cdn.example.net/x">cdn</a>
  <img src="/a.png" alt="A">
  <img src="/b.png">
  <form action="/search" method="get">
    <label for="q">Search</label>
    <input id="q" name="q" type="text">
    <label>Size <select name="size"><option>1</option></select></label>
    <input name="color">
    <input type="hidden" name="token" value="abc">
    <input type="submit" name="go" value="Go">
  </form>
  <form method="POST">
    <textarea name="comment" aria-label="Comment"></textarea>
  </form>
</body>
</html>)";

} // namespace

TEST_CASE("extract_html collects links", "[html]") {
    HtmlFacts facts = extract_html("http://shop.test/catalogue/index", kPage);

    // Duplicate (normalized) links, fragments and mailto: are dropped
    REQUIRE(facts.links.size() == 2);
    REQUIRE(facts.links[0] == "http://shop.test/item?id=2&sort=asc");
    REQUIRE(facts.links[1] == "https://cdn.example.net/x");
}

TEST_CASE("extract_html collects page facts", "[html]") {
    HtmlFacts facts = extract_html("http://shop.test/catalogue/index", kPage);

    REQUIRE(facts.has_title);
    REQUIRE(facts.title == "Product catalogue");
    REQUIRE(facts.html_lang == "en");
    REQUIRE(facts.meta_tags.at("description") == "All products");
    REQUIRE(facts.meta_tags.count("viewport") == 1);
    REQUIRE(facts.canonical_url == "http://shop.test/catalogue");
    REQUIRE(facts.h1_count == 1);
    REQUIRE(facts.stylesheets == std::vector<std::string>{"http://shop.test/css/site.css"});
    REQUIRE(facts.scripts == std::vector<std::string>{"http://shop.test/js/app.js"});
    REQUIRE(facts.inline_scripts.size() == 1);

    REQUIRE(facts.images.size() == 2);
    REQUIRE(facts.images[0].has_alt);
    REQUIRE_FALSE(facts.images[1].has_alt);
}

TEST_CASE("extract_html collects forms and labels", "[html]") {
    HtmlFacts facts = extract_html("http://shop.test/catalogue/index", kPage);
    REQUIRE(facts.forms.size() == 2);

    const Form& search = facts.forms[0];
    REQUIRE(search.action == "http://shop.test/search");
    REQUIRE(search.method == "GET");
    REQUIRE(search.fields.size() == 5);

    REQUIRE(search.fields[0].name == "q");
    REQUIRE(search.fields[0].type == "text");
    REQUIRE(search.fields[0].labelled);          // <label for>

    REQUIRE(search.fields[1].name == "size");
    REQUIRE(search.fields[1].type == "select");
    REQUIRE(search.fields[1].labelled);          // wrapping <label>

    REQUIRE(search.fields[2].name == "color");
    REQUIRE_FALSE(search.fields[2].labelled);

    REQUIRE(search.fields[3].type == "hidden");
    REQUIRE(search.fields[3].value == "abc");

    const Form& comment = facts.forms[1];
    REQUIRE(comment.method == "POST");
    REQUIRE(comment.action == "http://shop.test/catalogue/index");   // no action: the page itself
    REQUIRE(comment.fields.size() == 1);
    REQUIRE(comment.fields[0].type == "textarea");
    REQUIRE(comment.fields[0].labelled);         // aria-label
}

TEST_CASE("apply_facts copies facts onto a page", "[html]") {
    HtmlFacts facts = extract_html("http://shop.test/catalogue/index", kPage);
    CrawledPage page;
    apply_facts(facts, page);

    REQUIRE(page.links == facts.links);
    REQUIRE(page.forms.size() == 2);
    REQUIRE(page.title == "Product catalogue");
    REQUIRE(page.h1_count == 1);
    REQUIRE(page.images.size() == 2);
}

TEST_CASE("find_script_calls recognizes common request patterns", "[html][javascript]") {
    std::string code = R"(
        fetch("/api/users");
        axios.delete('/api/users/1');
        $.ajax({type: "POST", url: "/rest/orders"});
        xhr.open("PUT", "/v2/profile");
        const endpoint = "/graphql/query";
        fetch("/api/users");
    )";

    auto calls = find_script_calls(code);
    REQUIRE(calls.size() == 5);
    REQUIRE(calls[0].method == "UNKNOWN");
    REQUIRE(calls[0].url == "/api/users");
    REQUIRE(calls[1].method == "DELETE");
    REQUIRE(calls[1].url == "/api/users/1");
    REQUIRE(calls[2].url == "/rest/orders");
    REQUIRE(calls[3].method == "PUT");
    REQUIRE(calls[3].url == "/v2/profile");
    REQUIRE(calls[4].url == "/graphql/query");
}
