/**
 * @file site_quality.cpp
 * @brief seo, performance and accessibility modules
 */

#include "site_quality.h"
#include "module_util.h"
#include <map>

namespace modules {

using json = nlohmann::json;

// --- seo ---

bool SeoModule::initialize(const ScanConfig& config, std::string& error) {
    json opts = config.options_for(name());
    long min_len = option_or(opts, "min_title_length", static_cast<long>(min_title_length_));
    long max_len = option_or(opts, "max_title_length", static_cast<long>(max_title_length_));
    if (min_len < 0 || max_len < 1 || min_len > max_len) {
        error = "title length bounds must satisfy 0 <= min_title_length <= max_title_length";
        return false;
    }
    min_title_length_ = static_cast<size_t>(min_len);
    max_title_length_ = static_cast<size_t>(max_len);
    return true;
}

engine::ModuleOutcome SeoModule::run(const engine::TestContext& ctx) {
    engine::ModuleOutcome out;
    auto add = [&](const CrawledPage& page, const std::string& title, Severity severity,
                   const std::string& description, json evidence) {
        out.findings.push_back(make_finding(name(), title, severity, page.url, description, std::move(evidence)));
    };

    std::map<std::string, std::vector<std::string>> by_title;

    for (const CrawledPage* page : html_pages(ctx)) {
        std::string title = trim(page->title);
        if (!page->has_title || title.empty()) {
            add(*page, "Missing page title", Severity::HIGH,
                "The page has no <title> or it is empty.", json::object());
        } else {
            by_title[title].push_back(page->url);
            if (title.size() > max_title_length_) {
                add(*page, "Page title too long", Severity::LOW,
                    "Titles over " + std::to_string(max_title_length_) + " characters are truncated in search results.",
                    {{"title", title}, {"length", title.size()}});
            } else if (title.size() < min_title_length_) {
                add(*page, "Page title too short", Severity::LOW,
                    "The title has fewer than " + std::to_string(min_title_length_) + " characters.",
                    {{"title", title}, {"length", title.size()}});
            }
        }

        auto desc = page->meta_tags.find("description");
        if (desc == page->meta_tags.end() || trim(desc->second).empty()) {
            add(*page, "Missing meta description", Severity::MEDIUM,
                "The page has no <meta name=\"description\">.", json::object());
        }
        if (page->meta_tags.find("viewport") == page->meta_tags.end()) {
            add(*page, "Missing viewport meta tag", Severity::MEDIUM,
                "The page has no <meta name=\"viewport\"> and will not scale on mobile devices.", json::object());
        }

        if (page->h1_count == 0) {
            add(*page, "Missing h1 heading", Severity::MEDIUM,
                "The page has no <h1> element.", {{"h1_count", 0}});
        } else if (page->h1_count > 1) {
            add(*page, "Multiple h1 headings", Severity::LOW,
                "The page has more than one <h1> element.", {{"h1_count", page->h1_count}});
        }

        if (page->canonical_url.empty()) {
            add(*page, "Missing canonical link", Severity::LOW,
                "The page has no <link rel=\"canonical\">.", json::object());
        }

        auto robots = page->meta_tags.find("robots");
        auto robots_header = page->header("x-robots-tag");
        bool meta_noindex = robots != page->meta_tags.end() &&
                            to_lower(robots->second).find("noindex") != std::string::npos;
        bool header_noindex = robots_header && to_lower(*robots_header).find("noindex") != std::string::npos;
        if (meta_noindex || header_noindex) {
            add(*page, "Page excluded from indexing", Severity::INFO,
                "A noindex directive keeps this page out of search results.",
                {{"source", meta_noindex ? "meta" : "x-robots-tag"}});
        }
    }

    for (const auto& entry : by_title) {
        if (entry.second.size() < 2) continue;
        out.findings.push_back(make_finding(name(), "Duplicate page title", Severity::LOW, entry.second.front(),
                                            "The same title is used by " + std::to_string(entry.second.size()) + " pages.",
                                            {{"title", entry.first}, {"urls", entry.second}}));
    }
    return out;
}

// --- performance ---

bool PerformanceModule::initialize(const ScanConfig& config, std::string& error) {
    json opts = config.options_for(name());
    opts_.slow_ms = option_or(opts, "slow_ms", opts_.slow_ms);
    opts_.very_slow_ms = option_or(opts, "very_slow_ms", opts_.very_slow_ms);
    long max_bytes = option_or(opts, "max_page_bytes", static_cast<long>(opts_.max_page_bytes));
    long min_compress = option_or(opts, "min_compress_bytes", static_cast<long>(opts_.min_compress_bytes));

    if (opts_.slow_ms <= 0.0 || opts_.very_slow_ms < opts_.slow_ms) {
        error = "slow_ms must be positive and no larger than very_slow_ms";
        return false;
    }
    if (max_bytes < 1 || min_compress < 0) {
        error = "max_page_bytes must be positive and min_compress_bytes not negative";
        return false;
    }
    opts_.max_page_bytes = static_cast<size_t>(max_bytes);
    opts_.min_compress_bytes = static_cast<size_t>(min_compress);
    return true;
}

namespace {

bool textual(const std::string& content_type) {
    std::string ct = to_lower(content_type);
    return ct.rfind("text/", 0) == 0 ||
           ct.find("javascript") != std::string::npos ||
           ct.find("json") != std::string::npos ||
           ct.find("xml") != std::string::npos;
}

bool compressed(const std::optional<std::string>& encoding) {
    if (!encoding) return false;
    std::string e = to_lower(*encoding);
    return e.find("gzip") != std::string::npos || e.find("br") != std::string::npos ||
           e.find("deflate") != std::string::npos || e.find("zstd") != std::string::npos;
}

} // namespace

engine::ModuleOutcome PerformanceModule::run(const engine::TestContext& ctx) {
    engine::ModuleOutcome out;

    for (const auto& page : ctx.pages) {
        if (page.fetch_error) continue;
        size_t bytes = page.body ? page.body->size() : 0;

        // Cached pages carry no fresh timing
        if (!page.from_cache && page.fetch_duration_ms > opts_.slow_ms) {
            bool very = page.fetch_duration_ms > opts_.very_slow_ms;
            out.findings.push_back(make_finding(name(), very ? "Very slow response" : "Slow response",
                                                very ? Severity::HIGH : Severity::MEDIUM, page.url,
                                                "The response took longer than " +
                                                std::to_string(static_cast<long>(very ? opts_.very_slow_ms : opts_.slow_ms)) + " ms.",
                                                {{"duration_ms", page.fetch_duration_ms},
                                                 {"threshold_ms", very ? opts_.very_slow_ms : opts_.slow_ms}}));
        }

        if (bytes > opts_.max_page_bytes) {
            out.findings.push_back(make_finding(name(), "Large response body", Severity::MEDIUM, page.url,
                                                "The response body exceeds the size limit.",
                                                {{"bytes", bytes}, {"limit_bytes", opts_.max_page_bytes}}));
        }

        if (textual(page.content_type) && bytes >= opts_.min_compress_bytes &&
            !compressed(page.header("content-encoding"))) {
            out.findings.push_back(make_finding(name(), "Response not compressed", Severity::LOW, page.url,
                                                "A text response was served without gzip, brotli or deflate.",
                                                {{"content_type", page.content_type}, {"bytes", bytes}}));
        }

        if (page.status >= 200 && page.status < 300 &&
            !page.header("cache-control") && !page.header("expires")) {
            out.findings.push_back(make_finding(name(), "Missing caching headers", Severity::LOW, page.url,
                                                "The response sets neither Cache-Control nor Expires.",
                                                json::object()));
        }
    }
    return out;
}

// --- accessibility ---

engine::ModuleOutcome AccessibilityModule::run(const engine::TestContext& ctx) {
    engine::ModuleOutcome out;

    for (const CrawledPage* page : html_pages(ctx)) {
        if (trim(page->html_lang).empty()) {
            Finding f = make_finding(name(), "Missing document language", Severity::MEDIUM, page->url,
                                     "The <html> element has no lang attribute.");
            f.classification = "WCAG 3.1.1";
            out.findings.push_back(std::move(f));
        }

        if (!page->has_title || trim(page->title).empty()) {
            Finding f = make_finding(name(), "Page has no title", Severity::MEDIUM, page->url,
                                     "Screen readers announce the <title> when a page loads.");
            f.classification = "WCAG 2.4.2";
            out.findings.push_back(std::move(f));
        }

        json missing_alt = json::array();
        for (const auto& img : page->images) {
            if (!img.has_alt) missing_alt.push_back(img.src);
        }
        if (!missing_alt.empty()) {
            Finding f = make_finding(name(), "Images without alt text", Severity::HIGH, page->url,
                                     std::to_string(missing_alt.size()) + " image(s) have no alt attribute.",
                                     {{"count", missing_alt.size()}, {"images", missing_alt}});
            f.classification = "WCAG 1.1.1";
            out.findings.push_back(std::move(f));
        }

        json unlabelled = json::array();
        for (const auto& form : page->forms) {
            for (const auto& field : form.fields) {
                const std::string& t = field.type;
                if (t == "hidden" || t == "submit" || t == "button" || t == "image" || t == "reset") continue;
                if (!field.labelled) unlabelled.push_back(field.name.empty() ? "#" + field.id : field.name);
            }
        }
        if (!unlabelled.empty()) {
            Finding f = make_finding(name(), "Form fields without labels", Severity::HIGH, page->url,
                                     std::to_string(unlabelled.size()) + " form field(s) have no associated label.",
                                     {{"count", unlabelled.size()}, {"fields", unlabelled}});
            f.classification = "WCAG 1.3.1";
            out.findings.push_back(std::move(f));
        }
    }
    return out;
}

} // namespace modules
