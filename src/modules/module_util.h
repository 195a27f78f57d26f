#pragma once
#include "engine/module.h"
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// Helpers shared by the built-in modules.

namespace modules {

std::string to_lower(const std::string& s);
std::string trim(const std::string& s);

/// Set-Cookie value split on ';', each token trimmed and lower-cased
std::vector<std::string> parse_cookie_attributes(const std::string& cookie_value);

/// Whether a fetch produced a response worth inspecting (error statuses included)
bool has_response(const FetchResult& r);

/// Pages worth checking: fetched without error, 2xx, HTML
std::vector<const CrawledPage*> html_pages(const engine::TestContext& ctx);

Finding make_finding(const std::string& module,
                     const std::string& title,
                     Severity severity,
                     const std::string& url,
                     const std::string& description,
                     nlohmann::json evidence = nlohmann::json::object());

/**
 * One request parameter that can carry a probe payload.
 * For GET the parameter lives in the query string, otherwise in a
 * form-encoded body built from the form's fields.
 */
struct InjectionPoint {
    HttpRequest request;       // request with original values
    std::string parameter;
    std::string source;        // "query", "form" or "endpoint"
};

/**
 * @brief Collect injection points from query strings, forms and endpoints
 * @param include_post Include forms submitted with POST
 * @param limit Stop after this many points
 * @return Points in page order, deduplicated by (method, url, parameter)
 */
std::vector<InjectionPoint> injection_points(const engine::TestContext& ctx,
                                             bool include_post,
                                             size_t limit);

/// Deterministic marker for one probe ("sc" + 12 hex digits)
std::string make_marker(const std::string& url, const std::string& param);

/// Where a marker appears: "script", "attribute", "json", "text" or "none"
std::string classify_context(const std::string& body, const std::string& marker);

/// Up to radius characters on each side of pos, newlines flattened
std::string snippet(const std::string& body, size_t pos, size_t length, size_t radius = 60);

struct SqlErrorMatch {
    std::string database;     // "mysql", "postgresql", "sql_server", "oracle", "sqlite", "generic"
    std::string pattern;
    std::string evidence;
    std::string context;
    double confidence = 0.0;
};

/**
 * @brief Look for database error messages in a response body
 *
 * Matches inside HTML comments are ignored.
 */
std::optional<SqlErrorMatch> find_sql_error(const std::string& body);

/**
 * @brief Read a module option
 * @return def when the key is absent or null
 * @throws std::invalid_argument when the value has the wrong type
 */
template <typename T>
T option_or(const nlohmann::json& options, const char* key, T def) {
    if (!options.is_object() || !options.contains(key)) return def;
    const nlohmann::json& v = options.at(key);
    if (v.is_null()) return def;
    bool ok;
    if constexpr (std::is_same_v<T, bool>) {
        ok = v.is_boolean();
    } else if constexpr (std::is_arithmetic_v<T>) {
        ok = v.is_number();
    } else {
        ok = v.is_string();
    }
    if (!ok) {
        throw std::invalid_argument(std::string("option '") + key + "' has the wrong type");
    }
    return v.get<T>();
}

} // namespace modules
