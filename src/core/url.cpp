/**
 * @file url.cpp
 * @brief URL normalization, resolution and scope checks via libcurl's CURLU
 */

#include "url.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>

namespace urls {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* h) const { curl_url_cleanup(h); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

/// Read one part of a parsed URL; nullopt if the part is absent.
std::optional<std::string> get_part(CURLU* h, CURLUPart part, unsigned int flags = 0) {
    char* value = nullptr;
    if (curl_url_get(h, part, &value, flags) != CURLUE_OK || !value) {
        return std::nullopt;
    }
    std::string out(value);
    curl_free(value);
    return out;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(start, end - start);
}

/// Assemble the normalized form from a parsed handle.
std::optional<std::string> build_normalized(CURLU* h) {
    auto scheme = get_part(h, CURLUPART_SCHEME);
    auto host = get_part(h, CURLUPART_HOST);
    if (!scheme || !host || host->empty()) return std::nullopt;

    std::string s = to_lower(*scheme);
    if (s != "http" && s != "https") return std::nullopt;

    std::string out = s + "://" + to_lower(*host);
    // CURLU_NO_DEFAULT_PORT reports no port when it equals the scheme default
    if (auto port = get_part(h, CURLUPART_PORT, CURLU_NO_DEFAULT_PORT)) {
        out += ":" + *port;
    }

    auto path = get_part(h, CURLUPART_PATH);
    out += (path && !path->empty()) ? *path : "/";

    if (auto query = get_part(h, CURLUPART_QUERY)) {
        std::vector<std::string> params;
        size_t start = 0;
        while (start <= query->size()) {
            size_t amp = query->find('&', start);
            std::string token = query->substr(start, amp == std::string::npos ? std::string::npos : amp - start);
            if (!token.empty()) params.push_back(token);
            if (amp == std::string::npos) break;
            start = amp + 1;
        }
        std::stable_sort(params.begin(), params.end());
        if (!params.empty()) {
            out += '?';
            for (size_t i = 0; i < params.size(); i++) {
                if (i) out += '&';
                out += params[i];
            }
        }
    }
    return out;
}

} // namespace

std::optional<std::string> normalize(const std::string& url) {
    CurlUrlPtr h(curl_url());
    if (!h) return std::nullopt;
    std::string u = trim(url);
    if (u.empty()) return std::nullopt;
    if (curl_url_set(h.get(), CURLUPART_URL, u.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }
    return build_normalized(h.get());
}

std::optional<std::string> resolve(const std::string& base, const std::string& href) {
    std::string target = trim(href);
    if (target.empty() || target[0] == '#') return std::nullopt;

    std::string lower = to_lower(target.substr(0, std::min<size_t>(target.size(), 11)));
    for (const char* scheme : {"javascript:", "mailto:", "tel:", "data:"}) {
        if (lower.rfind(scheme, 0) == 0) return std::nullopt;
    }

    CurlUrlPtr h(curl_url());
    if (!h) return std::nullopt;
    if (curl_url_set(h.get(), CURLUPART_URL, base.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }
    // With a URL already set, a relative one is resolved against it
    if (curl_url_set(h.get(), CURLUPART_URL, target.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }
    return build_normalized(h.get());
}

std::string origin_of(const std::string& url) {
    CurlUrlPtr h(curl_url());
    if (!h) return {};
    if (curl_url_set(h.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return {};
    }
    auto scheme = get_part(h.get(), CURLUPART_SCHEME);
    auto host = get_part(h.get(), CURLUPART_HOST);
    if (!scheme || !host) return {};

    std::string origin = to_lower(*scheme) + "://" + to_lower(*host);
    if (auto port = get_part(h.get(), CURLUPART_PORT, CURLU_NO_DEFAULT_PORT)) {
        origin += ":" + *port;
    }
    return origin;
}

std::string host_of(const std::string& url) {
    CurlUrlPtr h(curl_url());
    if (!h) return {};
    if (curl_url_set(h.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return {};
    }
    auto host = get_part(h.get(), CURLUPART_HOST);
    return host ? to_lower(*host) : std::string();
}

std::string path_of(const std::string& url) {
    CurlUrlPtr h(curl_url());
    if (!h) return "/";
    if (curl_url_set(h.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return "/";
    }
    auto path = get_part(h.get(), CURLUPART_PATH);
    std::string out = (path && !path->empty()) ? *path : "/";
    if (auto query = get_part(h.get(), CURLUPART_QUERY)) {
        out += "?" + *query;
    }
    return out;
}

bool in_scope(const std::string& host, const std::vector<std::string>& allowed_domains) {
    std::string h = to_lower(host);
    if (h.empty()) return false;
    for (const auto& entry : allowed_domains) {
        std::string d = to_lower(trim(entry));
        if (d.empty()) continue;
        if (d.rfind("*.", 0) == 0) {
            std::string apex = d.substr(2);
            if (h == apex) return true;
            if (h.size() > apex.size() + 1 &&
                h.compare(h.size() - apex.size() - 1, std::string::npos, "." + apex) == 0) {
                return true;
            }
        } else if (h == d) {
            return true;
        }
    }
    return false;
}

std::string url_decode(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); i++) {
        if (str[i] == '%' && i + 2 < str.size() &&
            std::isxdigit(static_cast<unsigned char>(str[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(str[i + 2]))) {
            int val = 0;
            std::istringstream iss(str.substr(i + 1, 2));
            if (iss >> std::hex >> val) {
                result.push_back(static_cast<char>(val));
                i += 2;
            } else {
                result.push_back(str[i]);
            }
        } else if (str[i] == '+') {
            result.push_back(' ');
        } else {
            result.push_back(str[i]);
        }
    }
    return result;
}

std::string url_encode(const std::string& str) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

std::vector<std::pair<std::string, std::string>> parse_query(const std::string& url) {
    std::vector<std::pair<std::string, std::string>> params;
    std::string u = url.substr(0, url.find('#'));
    size_t qpos = u.find('?');
    if (qpos == std::string::npos || qpos + 1 >= u.size())
        return params;

    std::string query = u.substr(qpos + 1);
    size_t start = 0;
    while (start < query.size()) {
        size_t amp = query.find('&', start);
        std::string token = (amp == std::string::npos) ?
            query.substr(start) :
            query.substr(start, amp - start);

        size_t eq = token.find('=');
        std::string key = url_decode(eq == std::string::npos ? token : token.substr(0, eq));
        std::string val = (eq == std::string::npos) ? "" : url_decode(token.substr(eq + 1));

        if (!key.empty())
            params.emplace_back(key, val);

        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return params;
}

std::string with_query_param(const std::string& url, const std::string& name, const std::string& value) {
    std::string base = url.substr(0, url.find('#'));
    std::string query;
    size_t qpos = base.find('?');
    if (qpos != std::string::npos) {
        query = base.substr(qpos + 1);
        base = base.substr(0, qpos);
    }

    std::string replacement = url_encode(name) + "=" + url_encode(value);
    std::vector<std::string> tokens;
    bool replaced = false;
    size_t start = 0;
    while (start < query.size()) {
        size_t amp = query.find('&', start);
        std::string token = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!token.empty()) {
            std::string key = url_decode(token.substr(0, token.find('=')));
            if (key == name) {
                if (!replaced) tokens.push_back(replacement);
                replaced = true;
            } else {
                tokens.push_back(token);
            }
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    if (!replaced) tokens.push_back(replacement);

    std::string out = base + "?";
    for (size_t i = 0; i < tokens.size(); i++) {
        if (i) out += '&';
        out += tokens[i];
    }
    return out;
}

} // namespace urls
