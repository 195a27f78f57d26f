#pragma once
#include "engine/module.h"
#include <string>

// Security checks on forms, redirects and what the site reveals about
// itself. Each may send a handful of requests of its own.

namespace modules {

/**
 * State-changing forms (POST, PUT, DELETE) without an anti-CSRF token
 * field. With submit enabled the form is sent once without a token and
 * only reported when the server does not answer 401 or 403.
 */
class CsrfModule : public engine::TestModule {
public:
    std::string name() const override { return "csrf"; }
    Category category() const override { return Category::SECURITY; }
    std::string description() const override {
        return "State-changing forms accepted without an anti-CSRF token";
    }
    std::string exclusive_group() const override { return "active_probes"; }
    bool initialize(const ScanConfig& config, std::string& error) override;
    engine::ModuleOutcome run(const engine::TestContext& ctx) override;

    /// Field names that carry a token (csrf, xsrf, token, ...)
    static bool is_token_field(const std::string& field_name);

private:
    bool submit_ = true;
    size_t max_forms_ = 20;
};

class OpenRedirectModule : public engine::TestModule {
public:
    std::string name() const override { return "open_redirect"; }
    Category category() const override { return Category::SECURITY; }
    std::string description() const override {
        return "Redirect parameters that send the browser to any host";
    }
    std::string exclusive_group() const override { return "active_probes"; }
    bool initialize(const ScanConfig& config, std::string& error) override;
    engine::ModuleOutcome run(const engine::TestContext& ctx) override;

    /// Parameter names that usually hold a redirect target
    static bool is_redirect_parameter(const std::string& name);

private:
    std::string probe_host_ = "sitecheck-redirect.invalid";
    size_t max_targets_ = 20;
};

/**
 * Version banners in response headers, sensitive HTML comments, and
 * stack traces or technology banners on the error page.
 */
class InfoDisclosureModule : public engine::TestModule {
public:
    std::string name() const override { return "info_disclosure"; }
    Category category() const override { return Category::SECURITY; }
    std::string description() const override {
        return "Version banners, sensitive HTML comments and verbose error pages";
    }
    bool initialize(const ScanConfig& config, std::string& error) override;
    engine::ModuleOutcome run(const engine::TestContext& ctx) override;

private:
    bool probe_error_page_ = true;
};

} // namespace modules
