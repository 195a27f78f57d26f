#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

// URL helpers built on libcurl's URL API.
// The normalized form (lower-case scheme and host, default port dropped,
// fragment dropped, query parameters sorted) is the page identity used
// throughout a scan.

namespace urls {

/**
 * @brief Normalize an absolute http(s) URL
 * @param url Absolute URL
 * @return Normalized URL, or nullopt if the URL is malformed or not http(s)
 */
std::optional<std::string> normalize(const std::string& url);

/**
 * @brief Resolve a link found on a page against the page URL
 * @param base Absolute URL of the page the link was found on
 * @param href Link target as written in the document
 * @return Normalized absolute URL, or nullopt for non-navigable links
 *         (fragments, javascript:, mailto:, ...)
 */
std::optional<std::string> resolve(const std::string& base, const std::string& href);

/**
 * @brief Extract the origin (scheme + host + port) from a URL
 * @return Origin string, or empty if URL is invalid
 */
std::string origin_of(const std::string& url);

/// Lower-cased host, empty if the URL is invalid
std::string host_of(const std::string& url);

/// Path plus query ("/a/b?x=1"), "/" if the URL has no path
std::string path_of(const std::string& url);

/**
 * @brief Check a host against an allowed-domain list
 *
 * Entries match exactly (case-insensitive). An entry of the form
 * "*.example.com" also matches example.com and every subdomain of it.
 */
bool in_scope(const std::string& host, const std::vector<std::string>& allowed_domains);

std::string url_decode(const std::string& str);
std::string url_encode(const std::string& str);

/// Decoded query parameters in the order they appear
std::vector<std::pair<std::string, std::string>> parse_query(const std::string& url);

/**
 * @brief Return url with one query parameter set (replaced or appended)
 */
std::string with_query_param(const std::string& url, const std::string& name, const std::string& value);

} // namespace urls
