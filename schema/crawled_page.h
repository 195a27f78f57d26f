#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @file crawled_page.h
 * @brief Data structures describing the crawl surface
 *
 * A CrawledPage is created exactly once per normalized URL and is shared
 * read-only by every module once the crawl finishes. APIEndpoints are
 * produced alongside pages while responses are being parsed.
 */

struct FormField {
    std::string name;
    std::string type;      // "text" when the element carries no type attribute
    std::string value;
    std::string id;
    bool labelled = false; // <label for>, wrapping <label>, aria-label or aria-labelledby
};

struct Form {
    std::string action;    // absolute URL
    std::string method;    // upper case, "GET" when absent
    std::vector<FormField> fields;
};

struct ImageRef {
    std::string src;
    bool has_alt = false;
};

// Body is held by handle; pages can be copied without duplicating content.
using BodyRef = std::shared_ptr<const std::string>;

struct CrawledPage {
    std::string url;                   // normalized, unique per scan
    long status = 0;
    std::vector<std::pair<std::string, std::string>> headers;  // lower-cased names
    std::string content_type;
    BodyRef body;
    std::vector<Form> forms;
    std::vector<std::string> links;
    int depth = 0;
    std::string parent_url;
    double fetch_duration_ms = 0.0;
    std::optional<std::string> fetch_error;
    bool from_cache = false;

    // Facts pulled out of HTML responses
    std::string title;
    bool has_title = false;
    std::map<std::string, std::string> meta_tags;
    std::string canonical_url;
    std::string html_lang;
    int h1_count = 0;
    std::vector<std::string> scripts;
    std::vector<std::string> stylesheets;
    std::vector<ImageRef> images;

    /**
     * @brief First value of a response header (name compared lower-case)
     */
    std::optional<std::string> header(const std::string& lower_name) const {
        for (const auto& h : headers) {
            if (h.first == lower_name) return h.second;
        }
        return std::nullopt;
    }

    bool is_html() const {
        return content_type.find("html") != std::string::npos;
    }
};

struct ApiEndpoint {
    std::string method;        // "GET", "POST", ... or "UNKNOWN"
    std::string url;
    std::string content_type;
    std::string parent_url;
    std::string source;        // "response", "javascript" or "openapi"
};
