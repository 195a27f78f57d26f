/**
 * @file site_security.cpp
 * @brief csrf, open_redirect and info_disclosure modules
 */

#include "site_security.h"
#include "module_util.h"
#include "core/timing_analyzer.h"
#include "core/url.h"
#include "logging/console.h"
#include <algorithm>
#include <initializer_list>
#include <limits>
#include <regex>
#include <set>

namespace modules {

using json = nlohmann::json;

namespace {

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&](const char* n) { return haystack.find(n) != std::string::npos; });
}

// Probes are sent once; a retry would only repeat the side effect
FetchOptions single_shot() {
    FetchOptions fo;
    fo.use_cache = false;
    fo.max_retries = 0;
    return fo;
}

} // namespace

// --- csrf ---

bool CsrfModule::is_token_field(const std::string& field_name) {
    return contains_any(to_lower(field_name), {"csrf", "xsrf", "token", "nonce", "authenticity"});
}

bool CsrfModule::initialize(const ScanConfig& config, std::string& error) {
    json opts = config.options_for(name());
    submit_ = option_or(opts, "submit", submit_);
    long max_forms = option_or(opts, "max_forms", static_cast<long>(max_forms_));
    if (max_forms < 1) {
        error = "max_forms must be at least 1";
        return false;
    }
    max_forms_ = static_cast<size_t>(max_forms);
    return true;
}

engine::ModuleOutcome CsrfModule::run(const engine::TestContext& ctx) {
    engine::ModuleOutcome out;
    std::set<std::string> seen;    // method + action
    size_t checked = 0;

    for (const auto& page : ctx.pages) {
        if (page.fetch_error) continue;
        for (const auto& form : page.forms) {
            if (form.method != "POST" && form.method != "PUT" && form.method != "DELETE") continue;
            std::string action = form.action.empty() ? page.url : form.action;
            if (!seen.insert(form.method + " " + action).second) continue;

            bool has_token = std::any_of(form.fields.begin(), form.fields.end(),
                                         [](const FormField& f) { return is_token_field(f.name); });
            if (has_token) continue;
            if (checked++ >= max_forms_ || ctx.expired()) return out;

            json fields = json::array();
            std::string encoded = "?";
            for (const auto& field : form.fields) {
                if (field.name.empty()) continue;
                fields.push_back(field.name);
                encoded = urls::with_query_param(encoded, field.name, field.value.empty() ? "test" : field.value);
            }

            Severity severity = Severity::MEDIUM;
            double confidence = 0.6;
            json status = nullptr;
            bool submitted = submit_ && ctx.fetcher;

            if (submitted) {
                HttpRequest req = ctx.request(action, form.method);
                req.body = encoded.substr(1);
                req.headers["Content-Type"] = "application/x-www-form-urlencoded";

                FetchResult r = ctx.fetcher->fetch(req, single_shot());
                if (!has_response(r)) {
                    logging::debug("csrf: " + action + ": " + r.error->message);
                    continue;
                }
                long code = r.response.status;
                if (code == 401 || code == 403) continue;
                status = code;
                if (code < 400) {
                    severity = Severity::HIGH;
                    confidence = 0.85;
                }
            }

            Finding f = make_finding(name(), "Missing CSRF protection", severity, page.url,
                                     "The " + form.method + " form submitting to " + action +
                                     " carries no anti-CSRF token.",
                                     {{"action", action},
                                      {"method", form.method},
                                      {"fields", fields},
                                      {"submitted", submitted},
                                      {"status", status}});
            f.classification = "CWE-352";
            f.confidence = confidence;
            out.findings.push_back(std::move(f));
        }
    }
    return out;
}

// --- open_redirect ---

bool OpenRedirectModule::is_redirect_parameter(const std::string& name) {
    return contains_any(to_lower(name), {"url", "uri", "redirect", "redir", "return", "next",
                                         "goto", "dest", "continue"});
}

bool OpenRedirectModule::initialize(const ScanConfig& config, std::string& error) {
    json opts = config.options_for(name());
    std::string host = option_or(opts, "probe_host", probe_host_);
    long targets = option_or(opts, "max_targets", static_cast<long>(max_targets_));
    if (host.empty() || host.find_first_of("/?#@: ") != std::string::npos) {
        error = "probe_host must be a bare host name";
        return false;
    }
    if (targets < 1) {
        error = "max_targets must be at least 1";
        return false;
    }
    probe_host_ = to_lower(host);
    max_targets_ = static_cast<size_t>(targets);
    return true;
}

engine::ModuleOutcome OpenRedirectModule::run(const engine::TestContext& ctx) {
    engine::ModuleOutcome out;
    if (!ctx.fetcher) return out;

    const std::string payloads[] = {"https://" + probe_host_ + "/", "//" + probe_host_ + "/"};

    size_t tested = 0;
    for (const auto& point : injection_points(ctx, false, std::numeric_limits<size_t>::max())) {
        if (!is_redirect_parameter(point.parameter)) continue;
        if (tested++ >= max_targets_ || ctx.expired()) break;

        for (const auto& payload : payloads) {
            HttpRequest req = TimingAnalyzer::inject(point.request, point.parameter, payload);
            FetchResult r = ctx.fetcher->fetch(req, single_shot());
            if (!has_response(r)) {
                logging::debug("open_redirect: " + req.url + ": " + r.error->message);
                continue;
            }

            long code = r.response.status;
            auto location = r.response.header("location");
            if (code < 300 || code >= 400 || !location) continue;

            auto target = urls::resolve(req.url, *location);
            if (!target || urls::host_of(*target) != probe_host_) continue;

            Finding f = make_finding(name(), "Open redirect", Severity::MEDIUM, point.request.url,
                                     "Parameter '" + point.parameter + "' redirects to any host it is given.",
                                     {{"parameter", point.parameter},
                                      {"payload", payload},
                                      {"source", point.source},
                                      {"status", code},
                                      {"location", *location}});
            f.classification = "CWE-601";
            f.confidence = 0.9;
            out.findings.push_back(std::move(f));
            break;
        }
    }
    return out;
}

// --- info_disclosure ---

bool InfoDisclosureModule::initialize(const ScanConfig& config, std::string& error) {
    (void)error;
    probe_error_page_ = option_or(config.options_for(name()), "probe_error_page", probe_error_page_);
    return true;
}

engine::ModuleOutcome InfoDisclosureModule::run(const engine::TestContext& ctx) {
    static const char* banner_headers[] = {"server", "x-powered-by", "x-aspnet-version", "x-aspnetmvc-version"};
    static const std::regex version(R"(\d+(?:\.\d+)+)");
    static const std::regex comment(R"(<!--([\s\S]*?)-->)");
    static const std::regex stack_trace(
        R"(Traceback \(most recent call last\)|Exception in thread "|Stack trace:|)"
        R"(at [\w$.]+\([\w$]+\.java:\d+\)|Fatal error: .{0,200} on line \d+|System\.[\w.]*Exception)",
        std::regex::icase);
    static const std::regex tech_banner(
        R"((?:apache|nginx|microsoft-iis|php|tomcat|jetty|express|werkzeug|python)[/ ]v?\d+(?:\.\d+)+)",
        std::regex::icase);
    static const char* comment_keywords[] = {"password", "passwd", "api key", "apikey", "secret", "todo", "fixme"};

    engine::ModuleOutcome out;
    std::set<std::string> reported;

    for (const auto& page : ctx.pages) {
        if (page.fetch_error) continue;
        for (const char* header : banner_headers) {
            auto value = page.header(header);
            if (!value || !std::regex_search(*value, version)) continue;
            if (!reported.insert(std::string(header) + "|" + *value).second) continue;

            Finding f = make_finding(name(), std::string("Version disclosed in ") + header + " header",
                                     Severity::LOW, page.url,
                                     "The " + std::string(header) + " header reveals software versions.",
                                     {{"header", header}, {"observed_value", *value}});
            f.classification = "CWE-200";
            f.confidence = 0.9;
            out.findings.push_back(std::move(f));
        }
    }

    for (const CrawledPage* page : html_pages(ctx)) {
        if (!page->body) continue;
        const std::string& body = *page->body;
        for (auto it = std::sregex_iterator(body.begin(), body.end(), comment); it != std::sregex_iterator(); ++it) {
            std::string text = (*it)[1].str();
            std::string lower = to_lower(text);
            auto keyword = std::find_if(std::begin(comment_keywords), std::end(comment_keywords),
                                        [&](const char* k) { return lower.find(k) != std::string::npos; });
            if (keyword == std::end(comment_keywords)) continue;

            Finding f = make_finding(name(), "Sensitive information in HTML comment", Severity::LOW, page->url,
                                     "An HTML comment mentions '" + std::string(*keyword) + "'.",
                                     {{"keyword", *keyword}, {"comment", trim(text).substr(0, 200)}});
            f.classification = "CWE-615";
            f.confidence = 0.6;
            out.findings.push_back(std::move(f));
            break;
        }
    }

    if (!probe_error_page_ || !ctx.fetcher || ctx.expired()) return out;

    std::string missing = urls::origin_of(ctx.target_url) + "/sitecheck-missing-" +
                          make_marker(ctx.target_url, "error_page");
    FetchResult r = ctx.fetcher->fetch(ctx.request(missing), single_shot());
    if (!has_response(r)) {
        logging::debug("info_disclosure: " + missing + ": " + r.error->message);
        return out;
    }

    const std::string& body = r.response.body;
    std::smatch m;
    if (std::regex_search(body, m, stack_trace)) {
        Finding f = make_finding(name(), "Stack trace on error page", Severity::LOW, missing,
                                 "The error page shows a stack trace.",
                                 {{"status", r.response.status},
                                  {"match", m[0].str()},
                                  {"snippet", snippet(body, static_cast<size_t>(m.position(0)),
                                                      static_cast<size_t>(m.length(0)))}});
        f.classification = "CWE-209";
        f.confidence = 0.85;
        out.findings.push_back(std::move(f));
    } else if (std::regex_search(body, m, tech_banner)) {
        Finding f = make_finding(name(), "Technology version on error page", Severity::INFO, missing,
                                 "The error page names the software stack.",
                                 {{"status", r.response.status}, {"match", m[0].str()}});
        f.classification = "CWE-209";
        f.confidence = 0.7;
        out.findings.push_back(std::move(f));
    }
    return out;
}

} // namespace modules
