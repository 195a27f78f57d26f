/**
 * @file header_checks.cpp
 * @brief security_headers, cookie_security and cors modules
 */

#include "header_checks.h"
#include "module_util.h"
#include "core/url.h"
#include <set>

namespace modules {

using json = nlohmann::json;

// --- security_headers ---

engine::ModuleOutcome SecurityHeadersModule::run(const engine::TestContext& ctx) {
    struct Check {
        const char* header;
        const char* title;
        const char* classification;
    };
    static const Check checks[] = {
        {"x-frame-options", "Missing X-Frame-Options header", "CWE-1021"},
        {"content-security-policy", "Missing Content-Security-Policy header", "CWE-693"},
        {"x-content-type-options", "Missing X-Content-Type-Options header", "CWE-693"},
        {"strict-transport-security", "Missing Strict-Transport-Security header", "CWE-319"}
    };

    engine::ModuleOutcome out;
    for (const CrawledPage* page : html_pages(ctx)) {
        bool https = page->url.rfind("https://", 0) == 0;
        auto csp = page->header("content-security-policy");

        for (const auto& check : checks) {
            std::string header = check.header;
            if (header == "strict-transport-security" && !https) continue;
            if (page->header(header)) continue;
            // frame-ancestors covers clickjacking as well
            if (header == "x-frame-options" && csp && to_lower(*csp).find("frame-ancestors") != std::string::npos) {
                continue;
            }

            Finding f = make_finding(name(), check.title, Severity::MEDIUM, page->url,
                                     "The response does not set " + header + ".",
                                     {{"header", header}, {"observed_value", "[]"}});
            f.classification = check.classification;
            f.confidence = 0.95;
            out.findings.push_back(std::move(f));
        }
    }
    return out;
}

// --- cookie_security ---

engine::ModuleOutcome CookieSecurityModule::run(const engine::TestContext& ctx) {
    engine::ModuleOutcome out;
    std::set<std::string> reported;   // cookie name + problem

    auto report = [&](const CrawledPage& page, const std::string& cookie, const std::string& problem,
                      Severity severity, const std::string& title, const std::string& observed) {
        if (!reported.insert(cookie + "|" + problem).second) return;
        Finding f = make_finding(name(), title, severity, page.url,
                                 "Cookie '" + cookie + "': " + problem + ".",
                                 {{"cookie", cookie}, {"problem", problem}, {"observed_value", "[" + observed + "]"}});
        f.classification = "CWE-614";
        f.confidence = 0.95;
        out.findings.push_back(std::move(f));
    };

    for (const auto& page : ctx.pages) {
        if (page.fetch_error) continue;
        for (const auto& header : page.headers) {
            if (header.first != "set-cookie") continue;

            auto tokens = parse_cookie_attributes(header.second);
            if (tokens.empty() || tokens[0].empty()) continue;
            // Names are case-sensitive; take the original spelling
            std::string raw = trim(header.second.substr(0, header.second.find(';')));
            std::string cookie = raw.substr(0, raw.find('='));

            bool has_secure = false, has_httponly = false, has_samesite = false;
            std::string samesite_val;
            for (size_t i = 1; i < tokens.size(); i++) {
                if (tokens[i].rfind("samesite", 0) == 0) {
                    has_samesite = true;
                    size_t eq = tokens[i].find('=');
                    if (eq != std::string::npos) samesite_val = trim(tokens[i].substr(eq + 1));
                } else if (tokens[i] == "httponly") {
                    has_httponly = true;
                } else if (tokens[i] == "secure") {
                    has_secure = true;
                }
            }

            if (!has_secure) {
                report(page, cookie, "Secure attribute not set", Severity::MEDIUM,
                       "Cookie without Secure flag", "");
            }
            if (!has_httponly) {
                report(page, cookie, "HttpOnly attribute not set", Severity::MEDIUM,
                       "Cookie without HttpOnly flag", "");
            }
            if (!has_samesite) {
                report(page, cookie, "SameSite attribute not set", Severity::LOW,
                       "Cookie without SameSite attribute", "");
            } else if (samesite_val != "strict" && samesite_val != "lax" && samesite_val != "none") {
                report(page, cookie, "SameSite value is not Strict, Lax or None", Severity::LOW,
                       "Cookie with invalid SameSite value", samesite_val);
            } else if (samesite_val == "none" && !has_secure) {
                report(page, cookie, "SameSite=None without Secure", Severity::MEDIUM,
                       "Cookie with SameSite=None but no Secure flag", samesite_val);
            }
        }
    }
    return out;
}

// --- cors ---

bool CorsModule::initialize(const ScanConfig& config, std::string& error) {
    json opts = config.options_for(name());
    probe_ = option_or(opts, "probe", probe_);
    probe_origin_ = option_or(opts, "probe_origin", probe_origin_);
    if (probe_ && !urls::normalize(probe_origin_)) {
        error = "probe_origin must be an absolute http(s) URL";
        return false;
    }
    return true;
}

engine::ModuleOutcome CorsModule::run(const engine::TestContext& ctx) {
    engine::ModuleOutcome out;

    for (const auto& page : ctx.pages) {
        if (page.fetch_error) continue;
        auto origin = page.header("access-control-allow-origin");
        auto creds = page.header("access-control-allow-credentials");
        bool wildcard = origin && trim(*origin) == "*";
        bool with_creds = creds && to_lower(trim(*creds)) == "true";

        std::string title;
        Severity severity = Severity::MEDIUM;
        double confidence = 0.0;
        if (wildcard && with_creds) {
            title = "CORS wildcard origin with credentials";
            severity = Severity::HIGH;
            confidence = 0.95;
        } else if (wildcard) {
            title = "CORS wildcard Access-Control-Allow-Origin";
            confidence = 0.90;
        } else if (with_creds && !origin) {
            title = "CORS credentials allowed without an explicit origin";
            confidence = 0.85;
        }
        if (title.empty()) continue;

        Finding f = make_finding(name(), title, severity, page.url,
                                 "Cross-origin reads are allowed more broadly than needed.",
                                 {{"allow_origin", origin ? "[" + *origin + "]" : "[]"},
                                  {"allow_credentials", creds ? "[" + *creds + "]" : "[]"}});
        f.classification = "CWE-942";
        f.confidence = confidence;
        out.findings.push_back(std::move(f));
    }

    if (!probe_ || !ctx.fetcher) return out;

    // One probe per origin: the target, then API endpoints on other origins
    std::vector<std::string> targets{ctx.target_url};
    std::set<std::string> origins{urls::origin_of(ctx.target_url)};
    for (const auto& ep : ctx.endpoints) {
        std::string o = urls::origin_of(ep.url);
        if (!o.empty() && origins.insert(o).second) targets.push_back(ep.url);
    }

    FetchOptions fo;
    fo.use_cache = false;
    for (const auto& url : targets) {
        if (ctx.expired()) break;
        HttpRequest req = ctx.request(url);
        req.headers["Origin"] = probe_origin_;
        FetchResult r = ctx.fetcher->fetch(req, fo);
        if (!r.ok()) continue;

        auto acao = r.response.header("access-control-allow-origin");
        if (!acao || trim(*acao) != probe_origin_) continue;
        auto creds = r.response.header("access-control-allow-credentials");
        bool with_creds = creds && to_lower(trim(*creds)) == "true";

        Finding f = make_finding(name(),
                                 with_creds ? "CORS reflects arbitrary origins with credentials"
                                            : "CORS reflects arbitrary origins",
                                 with_creds ? Severity::HIGH : Severity::MEDIUM, url,
                                 "The server echoed an unrelated Origin header in Access-Control-Allow-Origin.",
                                 {{"probe_origin", probe_origin_},
                                  {"allow_origin", *acao},
                                  {"allow_credentials", with_creds},
                                  {"status", r.response.status}});
        f.classification = "CWE-942";
        f.confidence = 0.95;
        out.findings.push_back(std::move(f));
    }
    return out;
}

} // namespace modules
