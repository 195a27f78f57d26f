/**
 * @file timing_analyzer.cpp
 * @brief Baselines and delayed-payload detection
 */

#include "timing_analyzer.h"
#include "core/fetcher.h"
#include "core/url.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <regex>
#include <thread>

namespace {

double mean_of(const std::vector<double>& v) {
    return v.empty() ? 0.0 : std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double seconds_to_ms(const std::string& s) {
    return std::stod(s) * 1000.0;
}

} // namespace

TimingAnalyzer::TimingAnalyzer(const Fetcher& fetcher, const Options& opts)
    : fetcher_(fetcher), opts_(opts)
{
    opts_.baseline_samples = std::max<size_t>(opts_.baseline_samples, 3);
    opts_.validation_samples = std::max<size_t>(opts_.validation_samples, 1);
}

TimingBaseline TimingAnalyzer::establish_baseline(const HttpRequest& req) {
    std::vector<double> samples;
    for (size_t i = 0; i < opts_.baseline_samples; ++i) {
        double ms = time_request(req);
        if (ms >= 0.0) samples.push_back(ms);
    }

    TimingBaseline b;
    if (samples.empty()) return b;

    auto range = std::minmax_element(samples.begin(), samples.end());
    b.sample_count = samples.size();
    b.average_time_ms = mean_of(samples);
    b.min_time_ms = *range.first;
    b.max_time_ms = *range.second;
    b.variance_ms = calculate_variance(samples, b.average_time_ms);
    b.standard_deviation_ms = calculate_standard_deviation(b.variance_ms);
    return b;
}

HttpRequest TimingAnalyzer::inject(const HttpRequest& req, const std::string& param, const std::string& payload) {
    HttpRequest out = req;
    if (req.method == "GET" || req.method == "HEAD") {
        out.url = urls::with_query_param(req.url, param, payload);
        return out;
    }
    // A form body is encoded like a query string
    out.body = urls::with_query_param("?" + req.body, param, payload).substr(1);
    if (!out.headers.count("Content-Type")) {
        out.headers["Content-Type"] = "application/x-www-form-urlencoded";
    }
    return out;
}

double TimingAnalyzer::expected_delay_ms(const std::string& payload, const std::string& injection_type) {
    static const std::regex sql_sleep(R"((?:pg_)?sleep\(\s*(\d+(?:\.\d+)?)\s*\))", std::regex::icase);
    static const std::regex sql_waitfor(R"(waitfor\s+delay\s+'(\d+):(\d+):(\d+)')", std::regex::icase);
    static const std::regex shell_sleep(R"(sleep\s+(\d+(?:\.\d+)?))");
    static const std::regex shell_timeout(R"(timeout\s+(?:/t\s+)?(\d+))", std::regex::icase);

    std::smatch m;
    if (injection_type == "sql") {
        if (std::regex_search(payload, m, sql_sleep)) return seconds_to_ms(m[1].str());
        if (std::regex_search(payload, m, sql_waitfor)) {
            return (std::stod(m[1].str()) * 3600.0 + std::stod(m[2].str()) * 60.0 + std::stod(m[3].str())) * 1000.0;
        }
    } else if (injection_type == "command") {
        if (std::regex_search(payload, m, shell_sleep)) return seconds_to_ms(m[1].str());
        if (std::regex_search(payload, m, shell_timeout)) return seconds_to_ms(m[1].str());
    }
    return 0.0;
}

TimingResult TimingAnalyzer::start_result(const std::string& param,
                                          const std::string& payload,
                                          const TimingBaseline& baseline,
                                          const std::string& injection_type) const {
    TimingResult r;
    r.parameter = param;
    r.payload = payload;
    r.injection_type = injection_type;
    r.baseline_time_ms = baseline.average_time_ms;
    return r;
}

// Fills the deviation fields and confidence from measurements
void TimingAnalyzer::score(TimingResult& r, const TimingBaseline& baseline) const {
    r.measured_time_ms = mean_of(r.measurements);
    r.deviation_ms = r.measured_time_ms - baseline.average_time_ms;
    if (baseline.average_time_ms > 0.0) {
        r.deviation_percentage = r.deviation_ms / baseline.average_time_ms * 100.0;
    } else {
        r.deviation_percentage = r.deviation_ms > 0.0 ? 100000.0 : 0.0;
    }
    r.is_anomaly = delayed(r.deviation_ms, baseline);
    r.confidence = calculate_confidence(r.deviation_ms, baseline, expected_delay_ms(r.payload, r.injection_type));
}

TimingResult TimingAnalyzer::test_payload(const HttpRequest& req,
                                          const std::string& param,
                                          const std::string& payload,
                                          const TimingBaseline& baseline,
                                          const std::string& injection_type) {
    TimingResult r = start_result(param, payload, baseline, injection_type);
    double ms = time_request(inject(req, param, payload));
    if (ms < 0.0) return r;

    r.measurements.push_back(ms);
    score(r, baseline);
    return r;
}

TimingResult TimingAnalyzer::test_payload_validated(const HttpRequest& req,
                                                    const std::string& param,
                                                    const std::string& payload,
                                                    const TimingBaseline& baseline,
                                                    const std::string& injection_type) {
    TimingResult r = start_result(param, payload, baseline, injection_type);
    HttpRequest probe = inject(req, param, payload);

    bool every_probe_delayed = true;
    for (size_t i = 0; i < opts_.validation_samples; ++i) {
        if (i > 0) std::this_thread::sleep_for(std::chrono::milliseconds(100));
        double ms = time_request(probe);
        if (ms < 0.0) continue;
        r.measurements.push_back(ms);
        if (!delayed(ms - baseline.average_time_ms, baseline)) {
            every_probe_delayed = false;
            break;
        }
    }
    if (r.measurements.empty()) return r;

    score(r, baseline);
    r.is_anomaly = r.is_anomaly && every_probe_delayed &&
                   r.measurements.size() == opts_.validation_samples;

    // Repeated, tightly grouped delays are stronger evidence
    if (r.is_anomaly && r.measurements.size() >= 2) {
        auto range = std::minmax_element(r.measurements.begin(), r.measurements.end());
        double spread = *range.second - *range.first;
        if (spread < std::max(baseline.standard_deviation_ms * 2.0, r.deviation_ms * 0.2)) {
            r.confidence = std::min(1.0, r.confidence * 1.1);
        }
        if (r.measurements.size() >= 3) {
            r.confidence = std::min(1.0, r.confidence * 1.15);
        }
    }
    return r;
}

double TimingAnalyzer::calculate_confidence(double deviation_ms,
                                            const TimingBaseline& baseline,
                                            double expected_delay_ms) {
    if (deviation_ms <= 0.0) return 0.0;

    if (expected_delay_ms > 0.0) {
        double ratio = deviation_ms / expected_delay_ms;
        if (ratio < 0.5) return std::max(0.3, ratio * 0.6);
        if (ratio >= 0.8 && ratio <= 1.2) return std::min(0.99, 0.7 + (ratio - 0.8) * 0.5);
        if (ratio > 1.2) return std::min(0.95, 0.9 + (1.2 / ratio) * 0.05);
        // 0.5 to 0.8 falls through to the baseline comparison
    }

    if (baseline.standard_deviation_ms <= 0.0) return 0.9;

    double z = deviation_ms / baseline.standard_deviation_ms;
    if (z < 2.0) return 0.3 + z * 0.15;
    if (z < 5.0) return 0.6 + (z - 2.0) * 0.1;
    return 0.9 + std::min(0.1, (z - 5.0) / 10.0);
}

double TimingAnalyzer::time_request(const HttpRequest& req) const {
    FetchOptions fo;
    fo.use_cache = false;
    fo.max_retries = 0;
    fo.timeout_ms = opts_.probe_timeout_ms;

    auto start = std::chrono::steady_clock::now();
    FetchResult r = fetcher_.fetch(req, fo);
    double wall = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    // Error statuses still took the time they took
    if (!r.ok() && r.error->kind != FetchErrorKind::HttpStatus) return -1.0;

    // Limiter queueing is not server time
    return r.duration_ms > 0.0 ? std::min(wall, r.duration_ms) : wall;
}

double TimingAnalyzer::calculate_variance(const std::vector<double>& measurements, double mean) {
    if (measurements.size() < 2) return 0.0;
    double sum_sq = 0.0;
    for (double v : measurements) {
        sum_sq += (v - mean) * (v - mean);
    }
    return sum_sq / static_cast<double>(measurements.size() - 1);
}

double TimingAnalyzer::calculate_standard_deviation(double variance) {
    return std::sqrt(variance);
}

bool TimingAnalyzer::delayed(double deviation_ms, const TimingBaseline& baseline) const {
    if (deviation_ms <= 0.0) return false;
    if (opts_.threshold_ms) return deviation_ms >= *opts_.threshold_ms;

    if (deviation_ms < opts_.min_delay_ms) return false;
    if (baseline.average_time_ms > 0.0 &&
        deviation_ms / baseline.average_time_ms * 100.0 < opts_.threshold_percentage) {
        return false;
    }
    return baseline.standard_deviation_ms <= 0.0 || deviation_ms / baseline.standard_deviation_ms >= 2.0;
}
