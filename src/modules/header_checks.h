#pragma once
#include "engine/module.h"

// Checks driven by response headers of crawled pages. cors additionally
// sends one probe per origin to see whether arbitrary origins are echoed.

namespace modules {

class SecurityHeadersModule : public engine::TestModule {
public:
    std::string name() const override { return "security_headers"; }
    Category category() const override { return Category::SECURITY; }
    std::string description() const override {
        return "Missing X-Frame-Options, Content-Security-Policy, X-Content-Type-Options and HSTS";
    }
    engine::ModuleOutcome run(const engine::TestContext& ctx) override;
};

class CookieSecurityModule : public engine::TestModule {
public:
    std::string name() const override { return "cookie_security"; }
    Category category() const override { return Category::SECURITY; }
    std::string description() const override {
        return "Set-Cookie without Secure, HttpOnly or SameSite";
    }
    engine::ModuleOutcome run(const engine::TestContext& ctx) override;
};

class CorsModule : public engine::TestModule {
public:
    std::string name() const override { return "cors"; }
    Category category() const override { return Category::SECURITY; }
    std::string description() const override {
        return "Wildcard or reflected Access-Control-Allow-Origin";
    }
    bool initialize(const ScanConfig& config, std::string& error) override;
    engine::ModuleOutcome run(const engine::TestContext& ctx) override;

private:
    bool probe_ = true;
    std::string probe_origin_ = "https://sitecheck-probe.invalid";
};

} // namespace modules
