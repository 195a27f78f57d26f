#pragma once
#include "crawled_page.h"
#include "finding.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

/**
 * @file scan_result.h
 * @brief Per-module and per-scan results handed to consumers
 */

enum class ModuleStatus {
    PENDING,
    RUNNING,
    PASSED,
    FAILED,     // ran to completion and reported at least one low+ finding
    ERROR       // initialize failed, run returned an error, threw or timed out
};

enum class Category {
    SECURITY,
    PERFORMANCE,
    SEO,
    ACCESSIBILITY,
    FUNCTIONAL,
    OTHER
};

enum class ScanState {
    CREATED,
    CRAWLING,
    TESTING,
    AGGREGATING,
    COMPLETED,
    FAILED
};

inline const char* module_status_to_string(ModuleStatus s) {
    switch (s) {
        case ModuleStatus::PENDING: return "pending";
        case ModuleStatus::RUNNING: return "running";
        case ModuleStatus::PASSED:  return "passed";
        case ModuleStatus::FAILED:  return "failed";
        case ModuleStatus::ERROR:   return "error";
    }
    return "pending";
}

inline const char* category_to_string(Category c) {
    switch (c) {
        case Category::SECURITY:      return "security";
        case Category::PERFORMANCE:   return "performance";
        case Category::SEO:           return "seo";
        case Category::ACCESSIBILITY: return "accessibility";
        case Category::FUNCTIONAL:    return "functional";
        case Category::OTHER:         return "other";
    }
    return "other";
}

inline const char* scan_state_to_string(ScanState s) {
    switch (s) {
        case ScanState::CREATED:     return "created";
        case ScanState::CRAWLING:    return "crawling";
        case ScanState::TESTING:     return "testing";
        case ScanState::AGGREGATING: return "aggregating";
        case ScanState::COMPLETED:   return "completed";
        case ScanState::FAILED:      return "failed";
    }
    return "created";
}

struct ModuleResult {
    using Clock = std::chrono::system_clock;

    std::string name;
    Category category = Category::OTHER;
    ModuleStatus status = ModuleStatus::PENDING;
    std::vector<Finding> findings;
    Clock::time_point start_time;
    Clock::time_point end_time;
    std::string error;    // set iff status == ERROR

    double duration_ms() const {
        return std::chrono::duration<double, std::milli>(end_time - start_time).count();
    }
};

/// Finding counts by severity
struct ScanSummary {
    size_t critical = 0;
    size_t high = 0;
    size_t medium = 0;
    size_t low = 0;
    size_t info = 0;
    size_t modules_passed = 0;
    size_t modules_failed = 0;
    size_t modules_errored = 0;

    size_t total() const { return critical + high + medium + low + info; }

    size_t count(Severity s) const {
        switch (s) {
            case Severity::CRITICAL: return critical;
            case Severity::HIGH:     return high;
            case Severity::MEDIUM:   return medium;
            case Severity::LOW:      return low;
            case Severity::INFO:     return info;
        }
        return 0;
    }
};

struct ScanResult {
    using Clock = std::chrono::system_clock;

    std::string target_url;
    Clock::time_point start_time;
    Clock::time_point end_time;
    ScanState state = ScanState::CREATED;

    std::vector<CrawledPage> pages;
    std::vector<ApiEndpoint> endpoints;
    std::vector<std::string> out_of_scope_links;
    std::vector<ModuleResult> module_results;   // resolved module order

    bool partial = false;         // scan deadline cut work short
    size_t robots_blocked = 0;
    size_t cache_hits = 0;

    ScanSummary summary() const {
        ScanSummary s;
        for (const auto& m : module_results) {
            switch (m.status) {
                case ModuleStatus::PASSED: ++s.modules_passed; break;
                case ModuleStatus::FAILED: ++s.modules_failed; break;
                case ModuleStatus::ERROR:  ++s.modules_errored; break;
                default: break;
            }
            for (const auto& f : m.findings) {
                switch (f.severity) {
                    case Severity::CRITICAL: ++s.critical; break;
                    case Severity::HIGH:     ++s.high; break;
                    case Severity::MEDIUM:   ++s.medium; break;
                    case Severity::LOW:      ++s.low; break;
                    case Severity::INFO:     ++s.info; break;
                }
            }
        }
        return s;
    }

    /// Result for a module by name, nullptr if it was not part of the scan
    const ModuleResult* module(const std::string& name) const {
        for (const auto& m : module_results) {
            if (m.name == name) return &m;
        }
        return nullptr;
    }
};
