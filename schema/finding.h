#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @file finding.h
 * @brief Data structure representing a single reported issue
 *
 * Findings are produced by test modules and never modified after a module
 * hands them back to the orchestrator.
 */

enum class Severity {
    CRITICAL,
    HIGH,
    MEDIUM,
    LOW,
    INFO
};

inline const char* severity_to_string(Severity s) {
    switch (s) {
        case Severity::CRITICAL: return "critical";
        case Severity::HIGH:     return "high";
        case Severity::MEDIUM:   return "medium";
        case Severity::LOW:      return "low";
        case Severity::INFO:     return "info";
    }
    return "info";
}

inline std::optional<Severity> parse_severity(const std::string& s) {
    if (s == "critical") return Severity::CRITICAL;
    if (s == "high")     return Severity::HIGH;
    if (s == "medium")   return Severity::MEDIUM;
    if (s == "low")      return Severity::LOW;
    if (s == "info")     return Severity::INFO;
    return std::nullopt;
}

/**
 * A single issue reported by a module
 */
struct Finding {
    std::string title;
    Severity severity = Severity::INFO;
    std::string description;
    nlohmann::json evidence = nlohmann::json::object();
    std::string module;
    std::string classification;   // CWE / OWASP id, empty if none
    std::string url;
    double confidence = 1.0;
};
