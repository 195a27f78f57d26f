#pragma once
#include <schema/crawled_page.h>
#include <string>
#include <vector>

// Pulls links, forms and page facts out of an HTML document with gumbo.
// All URLs in the result are resolved against the page URL and normalized;
// links that cannot be resolved (fragments, javascript:, mailto:) are dropped.

struct HtmlFacts {
    std::vector<std::string> links;      // unique, in document order
    std::vector<Form> forms;
    std::string title;
    bool has_title = false;
    std::map<std::string, std::string> meta_tags;   // lower-cased name/property -> content
    std::string canonical_url;
    std::string html_lang;
    int h1_count = 0;
    std::vector<std::string> scripts;
    std::vector<std::string> stylesheets;
    std::vector<ImageRef> images;
    std::vector<std::string> inline_scripts;
};

/**
 * @brief Parse an HTML document
 * @param page_url Absolute URL the document was fetched from
 * @param body Raw HTML
 * @return Extracted facts
 */
HtmlFacts extract_html(const std::string& page_url, const std::string& body);

/**
 * @brief Copy the extracted facts onto a crawled page
 */
void apply_facts(const HtmlFacts& facts, CrawledPage& page);

struct ScriptCall {
    std::string method;   // upper case, "UNKNOWN" when the call does not say
    std::string url;      // as written in the script
};

/**
 * @brief Find HTTP calls in JavaScript source
 *
 * Recognizes fetch("..."), axios.get/post/...("..."), $.ajax({url: "..."}),
 * xhr.open("METHOD", "...") and quoted /api/, /graphql/, /rest/, /vN/ paths.
 */
std::vector<ScriptCall> find_script_calls(const std::string& code);
