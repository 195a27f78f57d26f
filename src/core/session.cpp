/**
 * @file session.cpp
 * @brief Static and form-based authentication for scans
 */

#include "session.h"
#include "core/fetcher.h"
#include "core/html_extractor.h"
#include "core/url.h"
#include <cctype>
#include <regex>
#include <sstream>

bool parse_auth_type(const std::string& name, AuthType& out) {
    if (name == "none" || name.empty()) out = AuthType::NONE;
    else if (name == "bearer") out = AuthType::BEARER;
    else if (name == "api_key") out = AuthType::API_KEY;
    else if (name == "form") out = AuthType::FORM;
    else return false;
    return true;
}

void AuthSession::apply(HttpRequest& req) const {
    for (const auto& [name, value] : request_headers()) {
        req.headers[name] = value;
    }
}

std::map<std::string, std::string> AuthSession::request_headers() const {
    std::map<std::string, std::string> out = headers;
    if (!cookies.empty()) {
        out["Cookie"] = HttpClient::build_cookie_header(cookies);
    }
    return out;
}

void AuthSession::absorb(const HttpResponse& resp) {
    for (const auto& header : resp.headers) {
        if (header.first == "set-cookie") {
            for (const auto& cookie : parse_set_cookie(header.second)) {
                cookies[cookie.first] = cookie.second;
            }
        }
    }
}

std::map<std::string, std::string> parse_set_cookie(const std::string& set_cookie_header) {
    std::map<std::string, std::string> cookies;

    // Parse Set-Cookie header: name=value; Path=/; Domain=example.com; Secure; HttpOnly
    size_t eq_pos = set_cookie_header.find('=');
    size_t semi_pos = set_cookie_header.find(';');
    if (eq_pos == std::string::npos || (semi_pos != std::string::npos && semi_pos < eq_pos)) {
        return cookies;
    }

    std::string name = set_cookie_header.substr(0, eq_pos);
    name.erase(0, name.find_first_not_of(" \t"));
    name.erase(name.find_last_not_of(" \t") + 1);

    std::string value = semi_pos != std::string::npos
        ? set_cookie_header.substr(eq_pos + 1, semi_pos - eq_pos - 1)
        : set_cookie_header.substr(eq_pos + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t") + 1);

    if (!name.empty()) {
        cookies[name] = value;
    }
    return cookies;
}

std::string extract_csrf_token(const std::string& html) {
    // Hidden form fields first, then meta tags
    for (const auto& form : extract_html("http://localhost/", html).forms) {
        for (const auto& field : form.fields) {
            std::string lower = field.name;
            for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (!field.value.empty() &&
                (lower.find("csrf") != std::string::npos || lower == "_token" ||
                 lower == "authenticity_token")) {
                return field.value;
            }
        }
    }

    static const std::regex meta_re(
        R"(<meta[^>]*name=["'](?:csrf-token|_csrf)["'][^>]*content=["']([^"']+)["'])",
        std::regex::icase);
    std::smatch m;
    if (std::regex_search(html, m, meta_re)) {
        return m[1].str();
    }
    return "";
}

/// Two-step form login: GET the login page for cookies and a CSRF token, then POST credentials.
static bool form_login(const Fetcher& fetcher, const AuthOptions& auth,
                       AuthSession& session, std::string& error) {
    if (auth.login_url.empty() || auth.username.empty()) {
        error = "form login needs login_url and username";
        return false;
    }

    FetchOptions fo;
    fo.use_cache = false;

    HttpRequest req;
    req.method = "GET";
    req.url = auth.login_url;
    req.headers = session.request_headers();
    req.headers["Accept"] = "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8";
    FetchResult page = fetcher.fetch(req, fo);
    if (!page.ok() || page.response.status != 200) {
        error = "login page " + auth.login_url + " unavailable" +
                (page.ok() ? " (HTTP " + std::to_string(page.response.status) + ")"
                           : ": " + page.error->message);
        return false;
    }
    session.absorb(page.response);
    std::string csrf_token = extract_csrf_token(page.response.body);

    HttpRequest login_req;
    login_req.method = "POST";
    login_req.url = auth.login_url;
    login_req.headers = session.request_headers();
    login_req.headers["Content-Type"] = "application/x-www-form-urlencoded";
    login_req.headers["Referer"] = auth.login_url;

    std::ostringstream form_data;
    form_data << urls::url_encode(auth.username_field) << "=" << urls::url_encode(auth.username);
    form_data << "&" << urls::url_encode(auth.password_field) << "=" << urls::url_encode(auth.password);
    if (!csrf_token.empty()) {
        form_data << "&csrf_token=" << urls::url_encode(csrf_token);
        form_data << "&_token=" << urls::url_encode(csrf_token);
    }
    login_req.body = form_data.str();

    FetchResult login = fetcher.fetch(login_req, fo);
    if (!login.ok()) {
        error = "login request failed: " + login.error->message;
        return false;
    }
    if (login.response.status != 200 && login.response.status != 302 && login.response.status != 303) {
        error = "login rejected with HTTP " + std::to_string(login.response.status);
        return false;
    }
    session.absorb(login.response);
    return true;
}

bool establish_session(const Fetcher& fetcher,
                       const AuthOptions& auth,
                       const std::map<std::string, std::string>& cookies,
                       const std::map<std::string, std::string>& headers,
                       AuthSession& out,
                       std::string& error) {
    out.cookies = cookies;
    out.headers = headers;
    out.authenticated = false;

    switch (auth.type) {
        case AuthType::NONE:
            return true;
        case AuthType::BEARER:
            if (auth.token.empty()) {
                error = "bearer auth needs a token";
                return false;
            }
            out.headers["Authorization"] = "Bearer " + auth.token;
            out.authenticated = true;
            return true;
        case AuthType::API_KEY:
            if (auth.token.empty() || auth.header_name.empty()) {
                error = "api_key auth needs a token and header name";
                return false;
            }
            out.headers[auth.header_name] = auth.token;
            out.authenticated = true;
            return true;
        case AuthType::FORM:
            if (!form_login(fetcher, auth, out, error)) return false;
            out.authenticated = true;
            return true;
    }
    return true;
}
