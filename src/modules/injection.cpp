/**
 * @file injection.cpp
 * @brief reflected_xss, sql_injection and command_injection modules
 */

#include "injection.h"
#include "module_util.h"
#include "core/timing_analyzer.h"
#include "logging/console.h"
#include <cmath>
#include <regex>

namespace modules {

using json = nlohmann::json;

namespace {

double round_ms(double v) {
    return std::round(v * 10.0) / 10.0;
}

/// Options shared by the time-based probes; false with error set on bad values
bool read_timing_options(const nlohmann::json& opts, int& delay_seconds, double& threshold_ms,
                         size_t& baseline_samples, size_t& validation_samples, size_t& max_targets,
                         std::string& error) {
    long delay = option_or(opts, "delay_seconds", static_cast<long>(delay_seconds));
    double threshold = option_or(opts, "time_threshold_ms", 0.0);
    long baseline = option_or(opts, "baseline_samples", static_cast<long>(baseline_samples));
    long validation = option_or(opts, "validation_samples", static_cast<long>(validation_samples));
    long targets = option_or(opts, "max_targets", static_cast<long>(max_targets));

    if (delay < 1 || delay > 60) {
        error = "delay_seconds must be between 1 and 60";
        return false;
    }
    if (threshold < 0.0) {
        error = "time_threshold_ms must not be negative";
        return false;
    }
    if (baseline < 3 || validation < 1 || targets < 1) {
        error = "baseline_samples must be at least 3, validation_samples and max_targets at least 1";
        return false;
    }

    delay_seconds = static_cast<int>(delay);
    // Unset threshold: 80% of the requested delay
    threshold_ms = threshold > 0.0 ? threshold : delay * 1000.0 * 0.8;
    baseline_samples = static_cast<size_t>(baseline);
    validation_samples = static_cast<size_t>(validation);
    max_targets = static_cast<size_t>(targets);
    return true;
}

TimingAnalyzer::Options timing_options(int delay_seconds, double threshold_ms,
                                       size_t baseline_samples, size_t validation_samples) {
    TimingAnalyzer::Options topts;
    topts.baseline_samples = baseline_samples;
    topts.validation_samples = validation_samples;
    topts.threshold_ms = threshold_ms;
    topts.probe_timeout_ms = delay_seconds * 1000L + 10000L;
    return topts;
}

/**
 * First payload that delays every validation probe past the threshold.
 * Returns a result with is_anomaly false when none does or no baseline
 * could be measured.
 */
std::pair<std::string, TimingResult> first_delayed(TimingAnalyzer& analyzer,
                                                   const engine::TestContext& ctx,
                                                   const InjectionPoint& point,
                                                   const std::vector<std::string>& payloads,
                                                   const std::string& injection_type) {
    TimingBaseline baseline = analyzer.establish_baseline(point.request);
    if (baseline.sample_count == 0) return {};

    for (const auto& payload : payloads) {
        if (ctx.expired()) break;
        TimingResult t = analyzer.test_payload_validated(point.request, point.parameter, payload,
                                                         baseline, injection_type);
        if (t.is_anomaly) return {payload, t};
    }
    return {};
}

Finding timing_finding(const std::string& module, const std::string& title, const std::string& classification,
                       const InjectionPoint& point, const std::string& payload, const TimingResult& t,
                       double threshold_ms) {
    Finding f = make_finding(module, title, Severity::HIGH, point.request.url,
                             "A sleep payload in parameter '" + point.parameter +
                             "' delayed the response on every attempt.",
                             {{"parameter", point.parameter},
                              {"payload", payload},
                              {"method", point.request.method},
                              {"source", point.source},
                              {"baseline_time_ms", round_ms(t.baseline_time_ms)},
                              {"measured_time_ms", round_ms(t.measured_time_ms)},
                              {"latency_delta_ms", round_ms(t.deviation_ms)},
                              {"threshold_ms", threshold_ms},
                              {"measurements", t.measurements}});
    f.classification = classification;
    f.confidence = t.confidence;
    return f;
}

} // namespace

// --- reflected_xss ---

bool ReflectedXssModule::initialize(const ScanConfig& config, std::string& error) {
    json opts = config.options_for(name());
    long max_requests = option_or(opts, "max_requests", static_cast<long>(max_requests_));
    if (max_requests < 1) {
        error = "max_requests must be at least 1";
        return false;
    }
    max_requests_ = static_cast<size_t>(max_requests);
    return true;
}

engine::ModuleOutcome ReflectedXssModule::run(const engine::TestContext& ctx) {
    engine::ModuleOutcome out;
    if (!ctx.fetcher) return out;

    FetchOptions fo;
    fo.use_cache = false;

    for (const auto& point : injection_points(ctx, false, max_requests_)) {
        if (ctx.expired()) break;

        std::string marker = make_marker(point.request.url, point.parameter);
        std::string probe = marker + "<x>\"'";
        HttpRequest req = TimingAnalyzer::inject(point.request, point.parameter, probe);
        FetchResult r = ctx.fetcher->fetch(req, fo);
        if (!has_response(r)) {
            logging::debug("reflected_xss: " + req.url + ": " + r.error->message);
            continue;
        }

        const std::string& body = r.response.body;
        size_t raw = body.find(probe);
        if (raw != std::string::npos) {
            std::string context = classify_context(body, marker);
            bool executable = context == "script" || context == "attribute";
            Finding f = make_finding(name(), "Reflected cross-site scripting",
                                     executable ? Severity::HIGH : Severity::MEDIUM, point.request.url,
                                     "Parameter '" + point.parameter + "' is reflected without HTML encoding.",
                                     {{"parameter", point.parameter},
                                      {"payload", probe},
                                      {"context", context},
                                      {"source", point.source},
                                      {"method", req.method},
                                      {"snippet", snippet(body, raw, probe.size())}});
            f.classification = "CWE-79";
            f.confidence = executable ? 0.9 : 0.75;
            out.findings.push_back(std::move(f));
            continue;
        }

        size_t encoded = body.find(marker + "&lt;x&gt;");
        if (encoded != std::string::npos) {
            Finding f = make_finding(name(), "Parameter reflected with HTML encoding", Severity::LOW,
                                     point.request.url,
                                     "Parameter '" + point.parameter + "' is reflected; markup is encoded.",
                                     {{"parameter", point.parameter},
                                      {"payload", probe},
                                      {"context", classify_context(body, marker)},
                                      {"source", point.source},
                                      {"method", req.method},
                                      {"snippet", snippet(body, encoded, marker.size() + 9)}});
            f.classification = "CWE-79";
            f.confidence = 0.5;
            out.findings.push_back(std::move(f));
        }
    }
    return out;
}

// --- sql_injection ---

const std::vector<std::string>& SqlInjectionModule::error_payloads() {
    static const std::vector<std::string> payloads = {
        "1'",
        "1\"",
        "1')",
        "1' OR '1'='1",
        "1 AND 1=CONVERT(int,@@version)--"
    };
    return payloads;
}

std::vector<std::string> SqlInjectionModule::time_payloads(int delay_seconds) {
    std::string n = std::to_string(delay_seconds);
    return {
        "1' AND SLEEP(" + n + ")-- -",
        "1 AND SLEEP(" + n + ")",
        "1' OR SLEEP(" + n + ")#",
        "1'; SELECT pg_sleep(" + n + ")--",
        "1'; WAITFOR DELAY '0:0:" + n + "'--"
    };
}

bool SqlInjectionModule::initialize(const ScanConfig& config, std::string& error) {
    json opts = config.options_for(name());
    error_based_ = option_or(opts, "error_based", error_based_);
    time_based_ = option_or(opts, "time_based", time_based_);
    return read_timing_options(opts, delay_seconds_, time_threshold_ms_, baseline_samples_,
                               validation_samples_, max_targets_, error);
}

engine::ModuleOutcome SqlInjectionModule::run(const engine::TestContext& ctx) {
    engine::ModuleOutcome out;
    if (!ctx.fetcher) return out;

    FetchOptions fo;
    fo.use_cache = false;

    TimingAnalyzer analyzer(*ctx.fetcher, timing_options(delay_seconds_, time_threshold_ms_,
                                                         baseline_samples_, validation_samples_));

    for (const auto& point : injection_points(ctx, true, max_targets_)) {
        if (ctx.expired()) break;
        bool found = false;

        if (error_based_) {
            FetchResult clean = ctx.fetcher->fetch(point.request, fo);
            if (!has_response(clean)) {
                logging::debug("sql_injection: " + point.request.url + ": " + clean.error->message);
            }
            auto baseline_error = has_response(clean) ? find_sql_error(clean.response.body) : std::nullopt;

            for (const auto& payload : error_payloads()) {
                if (ctx.expired() || !has_response(clean)) break;
                FetchResult r = ctx.fetcher->fetch(TimingAnalyzer::inject(point.request, point.parameter, payload), fo);
                if (!has_response(r)) continue;

                auto match = find_sql_error(r.response.body);
                if (!match) continue;
                if (baseline_error && baseline_error->pattern == match->pattern) continue;

                Finding f = make_finding(name(), "SQL injection (error-based)", Severity::CRITICAL,
                                         point.request.url,
                                         "A " + match->database + " error appears when parameter '" +
                                         point.parameter + "' contains a quote.",
                                         {{"parameter", point.parameter},
                                          {"payload", payload},
                                          {"method", point.request.method},
                                          {"source", point.source},
                                          {"database", match->database},
                                          {"pattern", match->pattern},
                                          {"error_message", match->evidence},
                                          {"context", match->context},
                                          {"status", r.response.status}});
                f.classification = "CWE-89";
                f.confidence = match->confidence;
                out.findings.push_back(std::move(f));
                found = true;
                break;
            }
        }

        if (found || !time_based_ || ctx.expired()) continue;

        auto hit = first_delayed(analyzer, ctx, point, time_payloads(delay_seconds_), "sql");
        if (hit.second.is_anomaly) {
            out.findings.push_back(timing_finding(name(), "SQL injection (time-based)", "CWE-89", point,
                                                  hit.first, hit.second, time_threshold_ms_));
        }
    }
    return out;
}

// --- command_injection ---

const std::vector<std::string>& CommandInjectionModule::output_payloads() {
    static const std::vector<std::string> payloads = {
        "1; id",
        "1 | id",
        "1 && id",
        "1 $(id)",
        "1 `id`"
    };
    return payloads;
}

std::vector<std::string> CommandInjectionModule::time_payloads(int delay_seconds) {
    std::string n = std::to_string(delay_seconds);
    return {
        "1; sleep " + n,
        "1 | sleep " + n,
        "1 $(sleep " + n + ")",
        "1 `sleep " + n + "`",
        "1 & timeout /t " + n
    };
}

bool CommandInjectionModule::initialize(const ScanConfig& config, std::string& error) {
    json opts = config.options_for(name());
    output_based_ = option_or(opts, "output_based", output_based_);
    time_based_ = option_or(opts, "time_based", time_based_);
    return read_timing_options(opts, delay_seconds_, time_threshold_ms_, baseline_samples_,
                               validation_samples_, max_targets_, error);
}

engine::ModuleOutcome CommandInjectionModule::run(const engine::TestContext& ctx) {
    static const std::regex id_output(R"(uid=\d+\([^)]*\)\s+gid=\d+\([^)]*\))");

    engine::ModuleOutcome out;
    if (!ctx.fetcher) return out;

    FetchOptions fo;
    fo.use_cache = false;
    TimingAnalyzer analyzer(*ctx.fetcher, timing_options(delay_seconds_, time_threshold_ms_,
                                                         baseline_samples_, validation_samples_));

    for (const auto& point : injection_points(ctx, true, max_targets_)) {
        if (ctx.expired()) break;
        bool found = false;

        if (output_based_) {
            FetchResult clean = ctx.fetcher->fetch(point.request, fo);
            bool clean_prints_id = has_response(clean) && std::regex_search(clean.response.body, id_output);

            for (const auto& payload : output_payloads()) {
                if (ctx.expired() || clean_prints_id) break;
                FetchResult r = ctx.fetcher->fetch(TimingAnalyzer::inject(point.request, point.parameter, payload), fo);
                if (!has_response(r)) {
                    logging::debug("command_injection: " + point.request.url + ": " + r.error->message);
                    continue;
                }

                std::smatch m;
                if (!std::regex_search(r.response.body, m, id_output)) continue;

                size_t pos = static_cast<size_t>(m.position(0));
                Finding f = make_finding(name(), "OS command injection", Severity::CRITICAL, point.request.url,
                                         "Output of a shell command appended to parameter '" + point.parameter +
                                         "' appears in the response.",
                                         {{"parameter", point.parameter},
                                          {"payload", payload},
                                          {"method", point.request.method},
                                          {"source", point.source},
                                          {"command_output", m[0].str()},
                                          {"snippet", snippet(r.response.body, pos, static_cast<size_t>(m.length(0)))},
                                          {"status", r.response.status}});
                f.classification = "CWE-78";
                f.confidence = 0.95;
                out.findings.push_back(std::move(f));
                found = true;
                break;
            }
        }

        if (found || !time_based_ || ctx.expired()) continue;

        auto hit = first_delayed(analyzer, ctx, point, time_payloads(delay_seconds_), "command");
        if (hit.second.is_anomaly) {
            out.findings.push_back(timing_finding(name(), "OS command injection (time-based)", "CWE-78", point,
                                                  hit.first, hit.second, time_threshold_ms_));
        }
    }
    return out;
}

} // namespace modules
