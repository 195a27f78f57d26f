#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @file http_client.h
 * @brief Request/response types, the transport interface and its libcurl backend
 *
 * The fetcher, the remote cache tier and the session login all talk to
 * the network through HttpTransport; tests substitute an in-process fake.
 */

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    long timeout_ms = 0;    // 0 = transport default
};

/// Why perform() returned false
enum class NetError {
    None,
    Timeout,
    Connect,      // DNS, refused, reset, empty reply
    Tls,
    InvalidUrl,
    Other
};

struct HttpResponse {
    long status = 0;
    std::vector<std::pair<std::string, std::string>> headers;  // lower-cased names, arrival order
    std::string body;
    std::string effective_url;  // after redirects
    std::string error;
    NetError net_error = NetError::None;
    size_t body_bytes = 0;

    std::optional<std::string> header(const std::string& lower_name) const;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Send req and fill resp
     * @return false when no HTTP response arrived; resp.net_error says why
     *
     * Must be callable from several threads at once.
     */
    virtual bool perform(const HttpRequest& req, HttpResponse& resp) const = 0;
};

/// libcurl transport; one easy handle per request
class HttpClient : public HttpTransport {
public:
    struct Options {
        long timeout_seconds;
        long connect_timeout_seconds;
        bool follow_redirects;
        long max_redirects;
        std::string user_agent;
        bool verify_tls;

        Options()
            : timeout_seconds(30),
              connect_timeout_seconds(5),
              follow_redirects(true),
              max_redirects(5),
              user_agent("sitecheck/1.0"),
              verify_tls(true)
        {}
    };

    /// @throws std::runtime_error when libcurl cannot be initialized
    explicit HttpClient(const Options& opts = Options());

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    bool perform(const HttpRequest& req, HttpResponse& resp) const override;

    const Options& options() const { return opts_; }

    /// "a=1; b=2" in name order
    static std::string build_cookie_header(const std::map<std::string, std::string>& cookies);

private:
    Options opts_;
};
