#pragma once
#include "http_client.h"
#include <map>
#include <string>

class Fetcher;

// Authenticated state for a scan.
// The session is established once before crawling and is read-only
// afterwards: the crawler and every module attach the same cookies and
// headers to their requests.

enum class AuthType {
    NONE,
    BEARER,      // Authorization: Bearer <token>
    API_KEY,     // <header_name>: <token>
    FORM         // username/password POST to login_url, cookies kept
};

bool parse_auth_type(const std::string& name, AuthType& out);

struct AuthOptions {
    AuthType type;
    std::string token;
    std::string header_name;
    std::string login_url;
    std::string username;
    std::string password;
    std::string username_field;
    std::string password_field;

    AuthOptions()
        : type(AuthType::NONE),
          header_name("X-API-Key"),
          username_field("username"),
          password_field("password")
    {}
};

struct AuthSession {
    std::map<std::string, std::string> cookies;   // name -> value
    std::map<std::string, std::string> headers;   // extra request headers
    bool authenticated = false;

    /// Add the session headers and Cookie header to a request
    void apply(HttpRequest& req) const;

    /// Session headers plus Cookie, ready to merge into a request
    std::map<std::string, std::string> request_headers() const;

    /// Store cookies set by a response
    void absorb(const HttpResponse& resp);
};

/**
 * @brief Build the session for a scan
 * @param fetcher Fetcher used for form login (bypasses the cache)
 * @param auth Authentication settings
 * @param cookies Static cookies from configuration
 * @param headers Static headers from configuration
 * @param out Session that gets populated
 * @param error Set when authentication fails
 * @return false if the configured authentication could not be performed;
 *         out still carries the static cookies and headers
 */
bool establish_session(const Fetcher& fetcher,
                       const AuthOptions& auth,
                       const std::map<std::string, std::string>& cookies,
                       const std::map<std::string, std::string>& headers,
                       AuthSession& out,
                       std::string& error);

/**
 * @brief Parse the name and value of one Set-Cookie header
 * @return Map with a single entry, empty if the header is malformed
 */
std::map<std::string, std::string> parse_set_cookie(const std::string& set_cookie_header);

/**
 * @brief Find a CSRF token in a login page (hidden input or meta tag)
 * @return Token, or empty if none is present
 */
std::string extract_csrf_token(const std::string& html);
