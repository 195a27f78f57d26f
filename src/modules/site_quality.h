#pragma once
#include "engine/module.h"

// Passive checks over the crawled pages: no requests are sent.

namespace modules {

class SeoModule : public engine::TestModule {
public:
    std::string name() const override { return "seo"; }
    Category category() const override { return Category::SEO; }
    std::string description() const override {
        return "Title, meta description, headings, canonical links and indexing directives";
    }
    bool initialize(const ScanConfig& config, std::string& error) override;
    engine::ModuleOutcome run(const engine::TestContext& ctx) override;

private:
    size_t min_title_length_ = 10;
    size_t max_title_length_ = 60;
};

class PerformanceModule : public engine::TestModule {
public:
    struct Options {
        double slow_ms;
        double very_slow_ms;
        size_t max_page_bytes;
        size_t min_compress_bytes;   // smaller bodies are not worth compressing

        Options()
            : slow_ms(1000.0),
              very_slow_ms(3000.0),
              max_page_bytes(5 * 1024 * 1024),
              min_compress_bytes(1024)
        {}
    };

    std::string name() const override { return "performance"; }
    Category category() const override { return Category::PERFORMANCE; }
    std::string description() const override {
        return "Slow and oversized responses, missing compression and caching headers";
    }
    bool initialize(const ScanConfig& config, std::string& error) override;
    engine::ModuleOutcome run(const engine::TestContext& ctx) override;

private:
    Options opts_;
};

class AccessibilityModule : public engine::TestModule {
public:
    std::string name() const override { return "accessibility"; }
    Category category() const override { return Category::ACCESSIBILITY; }
    std::string description() const override {
        return "Document language, image alt text, form labels and page titles";
    }
    engine::ModuleOutcome run(const engine::TestContext& ctx) override;
};

} // namespace modules
