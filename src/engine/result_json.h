#pragma once
#include <schema/scan_result.h>
#include <nlohmann/json.hpp>

namespace engine {

// JSON form of scan results for reporters and storage. Page bodies are
// left out; everything else a consumer needs is included.

nlohmann::json to_json(const Finding& finding);
nlohmann::json to_json(const CrawledPage& page);
nlohmann::json to_json(const ApiEndpoint& endpoint);
nlohmann::json to_json(const ModuleResult& result);
nlohmann::json to_json(const ScanSummary& summary);
nlohmann::json to_json(const ScanResult& result);

/// "2024-01-31T12:00:00.000Z"
std::string format_time(std::chrono::system_clock::time_point tp);

} // namespace engine
