/**
 * @file module_util.cpp
 * @brief Shared helpers for the built-in modules
 */

#include "module_util.h"
#include "core/digest.h"
#include "core/url.h"
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace modules {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

std::vector<std::string> parse_cookie_attributes(const std::string& cookie_value) {
    std::vector<std::string> attrs;
    size_t start = 0;
    while (start < cookie_value.size()) {
        size_t semi = cookie_value.find(';', start);
        std::string token = (semi == std::string::npos)
            ? cookie_value.substr(start)
            : cookie_value.substr(start, semi - start);
        attrs.push_back(to_lower(trim(token)));
        if (semi == std::string::npos) break;
        start = semi + 1;
    }
    return attrs;
}

bool has_response(const FetchResult& r) {
    return r.ok() || r.error->kind == FetchErrorKind::HttpStatus;
}

std::vector<const CrawledPage*> html_pages(const engine::TestContext& ctx) {
    std::vector<const CrawledPage*> out;
    for (const auto& page : ctx.pages) {
        if (page.fetch_error || page.status < 200 || page.status >= 300) continue;
        if (!page.is_html()) continue;
        out.push_back(&page);
    }
    return out;
}

Finding make_finding(const std::string& module,
                     const std::string& title,
                     Severity severity,
                     const std::string& url,
                     const std::string& description,
                     nlohmann::json evidence) {
    Finding f;
    f.module = module;
    f.title = title;
    f.severity = severity;
    f.url = url;
    f.description = description;
    f.evidence = std::move(evidence);
    return f;
}

namespace {

bool injectable_type(const std::string& type) {
    return type != "submit" && type != "button" && type != "image" &&
           type != "file" && type != "reset";
}

std::string strip_query(const std::string& url) {
    return url.substr(0, url.find('?'));
}

} // namespace

std::vector<InjectionPoint> injection_points(const engine::TestContext& ctx,
                                             bool include_post,
                                             size_t limit) {
    std::vector<InjectionPoint> out;
    std::set<std::string> seen;

    auto add = [&](const HttpRequest& req, const std::string& param, const char* source) {
        if (out.size() >= limit || param.empty()) return;
        std::string key = req.method + " " + strip_query(req.url) + " " + param;
        if (!seen.insert(key).second) return;
        out.push_back(InjectionPoint{req, param, source});
    };

    for (const auto& page : ctx.pages) {
        if (page.fetch_error) continue;

        for (const auto& q : urls::parse_query(page.url)) {
            add(ctx.request(page.url), q.first, "query");
        }

        for (const auto& form : page.forms) {
            if (form.action.empty()) continue;
            bool post = form.method == "POST";
            if (form.method != "GET" && !(post && include_post)) continue;

            // Every field keeps its value (or "1") while one is probed
            HttpRequest req = ctx.request(form.action, post ? "POST" : "GET");
            std::string encoded = post ? "?" : req.url;
            for (const auto& field : form.fields) {
                if (field.name.empty() || !injectable_type(field.type)) continue;
                encoded = urls::with_query_param(encoded, field.name, field.value.empty() ? "1" : field.value);
            }
            if (post) {
                req.body = encoded.substr(1);
                req.headers["Content-Type"] = "application/x-www-form-urlencoded";
            } else {
                req.url = encoded;
            }

            for (const auto& field : form.fields) {
                if (field.name.empty() || !injectable_type(field.type)) continue;
                add(req, field.name, "form");
            }
        }
    }

    for (const auto& ep : ctx.endpoints) {
        if (ep.method != "GET" && ep.method != "UNKNOWN") continue;
        for (const auto& q : urls::parse_query(ep.url)) {
            add(ctx.request(ep.url), q.first, "endpoint");
        }
    }
    return out;
}

std::string make_marker(const std::string& url, const std::string& param) {
    return "sc" + sha256_hex(url + "|" + param).substr(0, 12);
}

std::string classify_context(const std::string& body, const std::string& marker) {
    auto pos = body.find(marker);
    if (pos == std::string::npos) return "none";

    size_t start = (pos < 50) ? 0 : pos - 50;
    size_t end = std::min(body.size(), pos + marker.size() + 50);
    std::string window = body.substr(start, end - start);

    static const std::regex script_rx("<script", std::regex::icase);
    static const std::regex attr_rx(R"([a-zA-Z0-9_\-]+\s*=\s*["'][^"']*sc[0-9a-f]{12})");
    static const std::regex json_rx(R"(["'][^"']+["']\s*:\s*["'][^"']*sc[0-9a-f]{12})");

    if (std::regex_search(window, script_rx)) return "script";
    if (std::regex_search(window, attr_rx)) return "attribute";
    if (std::regex_search(window, json_rx)) return "json";
    return "text";
}

std::string snippet(const std::string& body, size_t pos, size_t length, size_t radius) {
    if (pos >= body.size()) return "";
    size_t start = pos > radius ? pos - radius : 0;
    size_t end = std::min(body.size(), pos + length + radius);
    std::string out = body.substr(start, end - start);
    std::replace(out.begin(), out.end(), '\n', ' ');
    std::replace(out.begin(), out.end(), '\r', ' ');
    return out;
}

namespace {

struct SqlErrorPattern {
    const char* database;
    const char* name;
    std::regex regex;
    double confidence;
};

const std::vector<SqlErrorPattern>& sql_error_patterns() {
    static const auto icase = std::regex::icase;
    static const std::vector<SqlErrorPattern> patterns = {
        {"mysql", "mysql_syntax_error",
         std::regex(R"(You have an error in your SQL syntax[^\n]*near)", icase), 0.95},
        {"mysql", "mysql_table_not_found",
         std::regex(R"(Table ['"]?[^'"\s]+['"]? doesn't exist)", icase), 0.90},
        {"mysql", "mysql_warning",
         std::regex(R"(Warning: mysqli?_[a-z_]+\(\))", icase), 0.85},
        {"postgresql", "postgresql_syntax_error",
         std::regex(R"(ERROR:\s+syntax error at or near)", icase), 0.95},
        {"postgresql", "postgresql_unterminated_string",
         std::regex(R"(unterminated quoted string at or near)", icase), 0.95},
        {"postgresql", "postgresql_relation_not_found",
         std::regex(R"(ERROR:\s+relation ['"]?[^'"\s]+['"]? does not exist)", icase), 0.90},
        {"sql_server", "mssql_unclosed_quote",
         std::regex(R"(Unclosed quotation mark after the character string)", icase), 0.95},
        {"sql_server", "mssql_invalid_object",
         std::regex(R"(Invalid object name ['"]?[^'"\s]+)", icase), 0.90},
        {"oracle", "oracle_error",
         std::regex(R"(ORA-\d{5}:\s*[^\n<]+)", icase), 0.95},
        {"sqlite", "sqlite_error",
         std::regex(R"((?:SQLITE_ERROR|sqlite3\.OperationalError|SQLite3::SQLException))", icase), 0.90},
        {"generic", "generic_sql_error",
         std::regex(R"(SQL syntax[^\n]{0,40}error|syntax error in SQL statement)", icase), 0.75}
    };
    return patterns;
}

bool inside_html_comment(const std::string& body, size_t pos) {
    size_t open = body.rfind("<!--", pos);
    if (open == std::string::npos) return false;
    size_t close = body.find("-->", open);
    return close == std::string::npos || close > pos;
}

} // namespace

std::optional<SqlErrorMatch> find_sql_error(const std::string& body) {
    for (const auto& p : sql_error_patterns()) {
        std::smatch m;
        if (!std::regex_search(body, m, p.regex)) continue;
        size_t pos = static_cast<size_t>(m.position(0));
        if (inside_html_comment(body, pos)) continue;

        SqlErrorMatch match;
        match.database = p.database;
        match.pattern = p.name;
        match.evidence = m[0].str();
        match.context = snippet(body, pos, static_cast<size_t>(m.length(0)), 100);
        match.confidence = p.confidence;
        return match;
    }
    return std::nullopt;
}

} // namespace modules
