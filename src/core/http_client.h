#pragma once
#include <atomic>
#include <string>
#include <map>
#include <vector>

// HTTP fetch capability built on libcurl.
// Single attempt per request, bounded timeouts, optional query parameters,
// and transport failures reported as a typed error kind instead of thrown.

enum class TransportError {
    NONE,
    TIMEOUT,
    CONNECTION,
    CANCELLED,
    OTHER
};

struct HttpRequest {
    std::string method = "GET";     // "GET" or "POST"
    std::string url;
    std::map<std::string, std::string> params;
    std::map<std::string, std::string> headers;
    std::string body;               // application/x-www-form-urlencoded, POST only
    long timeout_seconds = 0;   // 0 uses the client's configured timeout
    const std::atomic<bool>* cancel_flag = nullptr;
};

struct HttpResponse {
    long status = 0;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::string effective_url;
    std::string error;
    TransportError error_kind = TransportError::NONE;
    double total_time = 0.0;
    size_t body_bytes = 0;

    /**
     * @brief Look up a response header by name, ignoring case
     * @param name Header name
     * @return First matching value, or empty string
     */
    std::string header(const std::string& name) const;
};

// Anything that can execute an HttpRequest. The prober only depends on this
// interface so tests can script responses without a network.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    /**
     * @brief Execute a request and fill in the response
     * @return true if a response was received, false on transport error
     *         (resp.error and resp.error_kind describe the failure)
     */
    virtual bool perform(const HttpRequest& req, HttpResponse& resp) const = 0;
};

class HttpClient : public Fetcher {
public:
    struct Options {
        long timeout_seconds;
        long connect_timeout_seconds;
        bool follow_redirects;
        long max_redirects;
        std::string user_agent;
        bool accept_encoding;
        // Certificate and host name checks are off by default: probed
        // endpoints are surveyed ad hoc and are not a trust boundary.
        bool verify_tls;

        Options()
            : timeout_seconds(12),
              connect_timeout_seconds(5),
              follow_redirects(true),
              max_redirects(5),
              user_agent("apiscout/0.1"),
              accept_encoding(true),
              verify_tls(false)
        {}
    };

    /**
     * @brief Create an HTTP client with the given options
     * @param opts Client configuration (timeouts, redirects, TLS policy)
     */
    explicit HttpClient(const Options& opts = Options());

    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Make an HTTP request and fill in the response
     * @param req Request details (method, URL, params, headers, body)
     * @param resp Response object that gets populated
     * @return true if request succeeded, false on transport error
     */
    bool perform(const HttpRequest& req, HttpResponse& resp) const override;

    /**
     * @brief Append URL-encoded query parameters to a URL
     * @param url Base URL, may already carry a query string
     * @param params Parameters to append
     * @return URL with the parameters appended, or url unchanged if it cannot be parsed
     */
    static std::string build_url(const std::string& url, const std::map<std::string, std::string>& params);

    /**
     * @brief Encode form fields as an application/x-www-form-urlencoded body
     * @param fields Field names and values
     * @return "name=value&..." with both sides percent-encoded
     */
    static std::string encode_form(const std::map<std::string, std::string>& fields);

    const Options& options() const { return opts_; }

private:
    Options opts_;
};
