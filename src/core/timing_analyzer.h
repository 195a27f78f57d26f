#pragma once
#include "http_client.h"
#include <optional>
#include <string>
#include <vector>

class Fetcher;

/**
 * @file timing_analyzer.h
 * @brief Response-time measurements for blind (time-based) injection probes
 *
 * With threshold_ms set, a payload counts as delaying the server when its
 * response time exceeds the clean baseline average by at least that much.
 * Without it, the excess must reach min_delay_ms, threshold_percentage of
 * the baseline average and two baseline standard deviations. Confidence is
 * reported alongside and never decides an anomaly.
 * Probes always bypass the cache and are never retried.
 */

struct TimingBaseline {
    double average_time_ms;
    double variance_ms;
    double standard_deviation_ms;
    double min_time_ms;
    double max_time_ms;
    size_t sample_count;          // 0 when no clean request succeeded

    TimingBaseline()
        : average_time_ms(0.0),
          variance_ms(0.0),
          standard_deviation_ms(0.0),
          min_time_ms(0.0),
          max_time_ms(0.0),
          sample_count(0)
    {}
};

struct TimingResult {
    std::string parameter;
    std::string payload;
    std::string injection_type;       // "sql" or "command"
    std::vector<double> measurements; // one per probe that got an answer
    double measured_time_ms;          // mean of measurements, -1 if none
    double baseline_time_ms;
    double deviation_ms;
    double deviation_percentage;
    double confidence;                // 0..1
    bool is_anomaly;

    TimingResult()
        : measured_time_ms(-1.0),
          baseline_time_ms(0.0),
          deviation_ms(0.0),
          deviation_percentage(0.0),
          confidence(0.0),
          is_anomaly(false)
    {}
};

class TimingAnalyzer {
public:
    struct Options {
        size_t baseline_samples;             // at least 3
        size_t validation_samples;           // probes per payload, at least 1
        double threshold_percentage;         // used when threshold_ms is unset
        double min_delay_ms;                 // used when threshold_ms is unset
        std::optional<double> threshold_ms;  // sole gate when set
        long probe_timeout_ms;               // 0 = fetcher default

        Options()
            : baseline_samples(3),
              validation_samples(3),
              threshold_percentage(80.0),
              min_delay_ms(1000.0),
              probe_timeout_ms(0)
        {}
    };

    TimingAnalyzer(const Fetcher& fetcher, const Options& opts = Options());

    /**
     * @brief Time baseline_samples clean copies of req
     *
     * Failed requests are left out of the statistics.
     */
    TimingBaseline establish_baseline(const HttpRequest& req);

    /// One probe with payload placed in param
    TimingResult test_payload(const HttpRequest& req,
                              const std::string& param,
                              const std::string& payload,
                              const TimingBaseline& baseline,
                              const std::string& injection_type = "sql");

    /**
     * @brief Up to validation_samples probes; stops at the first one
     *        that comes back without the delay
     *
     * is_anomaly requires every probe to be delayed.
     */
    TimingResult test_payload_validated(const HttpRequest& req,
                                        const std::string& param,
                                        const std::string& payload,
                                        const TimingBaseline& baseline,
                                        const std::string& injection_type = "sql");

    /**
     * @brief Score a deviation
     * @param expected_delay_ms Delay the payload asked for, 0 if unknown.
     *        When set, the score reflects how close the deviation came to it;
     *        otherwise it grows with the z-score against the baseline.
     */
    static double calculate_confidence(double deviation_ms,
                                       const TimingBaseline& baseline,
                                       double expected_delay_ms = 0.0);

    /**
     * @brief Delay requested by SLEEP(n), pg_sleep(n), WAITFOR DELAY,
     *        sleep n or timeout n, in milliseconds; 0 if none
     */
    static double expected_delay_ms(const std::string& payload, const std::string& injection_type);

    /// Sample variance (n - 1); 0 for fewer than two values
    static double calculate_variance(const std::vector<double>& measurements, double mean);

    static double calculate_standard_deviation(double variance);

    /// Copy of req with param set to payload: query string for GET and HEAD, form body otherwise
    static HttpRequest inject(const HttpRequest& req, const std::string& param, const std::string& payload);

private:
    const Fetcher& fetcher_;
    Options opts_;

    /// Transport time of one request, -1 on a transport failure
    double time_request(const HttpRequest& req) const;

    bool delayed(double deviation_ms, const TimingBaseline& baseline) const;

    TimingResult start_result(const std::string& param,
                              const std::string& payload,
                              const TimingBaseline& baseline,
                              const std::string& injection_type) const;

    void score(TimingResult& result, const TimingBaseline& baseline) const;
};
