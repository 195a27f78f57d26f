/**
 * @file http_client.cpp
 * @brief libcurl transport
 */

#include "http_client.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct EasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using Slist = std::unique_ptr<curl_slist, SlistDeleter>;

// curl_global_init is not thread-safe; run it once per process and never undo it
void init_curl_once() {
    static std::once_flag flag;
    static CURLcode rc = CURLE_OK;
    std::call_once(flag, [] { rc = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (rc != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init: ") + curl_easy_strerror(rc));
    }
}

size_t on_body(char* data, size_t size, size_t count, void* user) {
    static_cast<std::string*>(user)->append(data, size * count);
    return size * count;
}

std::string_view trim_view(std::string_view v) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.remove_prefix(1);
    while (!v.empty() && (v.back() == '\r' || v.back() == '\n' || v.back() == ' ')) v.remove_suffix(1);
    return v;
}

// Each status line opens a new block, so after redirects only the final
// response's headers remain
size_t on_header(char* data, size_t size, size_t count, void* user) {
    size_t n = size * count;
    std::string_view line(data, n);
    auto* headers = static_cast<HeaderList*>(user);

    if (line.substr(0, 5) == "HTTP/") {
        headers->clear();
        return n;
    }
    size_t colon = line.find(':');
    if (colon == std::string_view::npos) return n;

    std::string name(trim_view(line.substr(0, colon)));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    headers->emplace_back(std::move(name), std::string(trim_view(line.substr(colon + 1))));
    return n;
}

NetError net_error_of(CURLcode rc) {
    switch (rc) {
    case CURLE_OK:
        return NetError::None;
    case CURLE_OPERATION_TIMEDOUT:
        return NetError::Timeout;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
        return NetError::Connect;
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_SSL_CACERT_BADFILE:
        return NetError::Tls;
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
        return NetError::InvalidUrl;
    default:
        return NetError::Other;
    }
}

} // namespace

std::optional<std::string> HttpResponse::header(const std::string& lower_name) const {
    auto it = std::find_if(headers.begin(), headers.end(),
                           [&](const std::pair<std::string, std::string>& h) { return h.first == lower_name; });
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

HttpClient::HttpClient(const Options& opts) : opts_(opts) {
    init_curl_once();
}

bool HttpClient::perform(const HttpRequest& req, HttpResponse& resp) const {
    EasyHandle curl(curl_easy_init());
    if (!curl) {
        resp.error = "curl_easy_init failed";
        resp.net_error = NetError::Other;
        return false;
    }
    CURL* h = curl.get();

    std::string body;
    HeaderList headers;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, opts_.connect_timeout_seconds);
    if (req.timeout_ms > 0) {
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, req.timeout_ms);
    } else {
        curl_easy_setopt(h, CURLOPT_TIMEOUT, opts_.timeout_seconds);
    }
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, opts_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, opts_.max_redirects);
    curl_easy_setopt(h, CURLOPT_USERAGENT, opts_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
    if (!opts_.verify_tls) {
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &headers);

    Slist request_headers;
    for (const auto& kv : req.headers) {
        std::string line = kv.first + ": " + kv.second;
        curl_slist* head = curl_slist_append(request_headers.get(), line.c_str());
        if (!head) break;
        if (head != request_headers.get()) {
            request_headers.release();
            request_headers.reset(head);
        }
    }
    if (request_headers) curl_easy_setopt(h, CURLOPT_HTTPHEADER, request_headers.get());

    if (req.method == "HEAD") {
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    } else if (req.method != "GET") {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
        if (!req.body.empty() || req.method == "POST") {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
        }
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        resp.error = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        resp.net_error = net_error_of(rc);
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    char* effective = nullptr;
    if (curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        resp.effective_url = effective;
    }
    resp.body = std::move(body);
    resp.body_bytes = resp.body.size();
    resp.headers = std::move(headers);
    return rc == CURLE_OK;
}

std::string HttpClient::build_cookie_header(const std::map<std::string, std::string>& cookies) {
    std::string out;
    for (const auto& kv : cookies) {
        if (!out.empty()) out += "; ";
        out += kv.first + "=" + kv.second;
    }
    return out;
}
