/**
 * @file http_client.cpp
 * @brief Single-attempt HTTP fetch using libcurl
 */

#include "http_client.h"
#include <curl/curl.h>
#include <stdexcept>
#include <string_view>
#include <algorithm>

/// Callback invoked by libcurl to write the received body data.
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* s = static_cast<std::string*>(userdata);
    s->append(ptr, size * nmemb);
    return size * nmemb;
}

/// Callback invoked once per header line to parse header into list.
static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    std::string_view hv(buffer, total);
    auto* headers = static_cast<std::vector<std::pair<std::string, std::string>>*>(userdata);

    // A new status line means a redirect hop; keep only the final hop's headers
    if (hv.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }

    auto pos = hv.find(':');
    if (pos != std::string_view::npos) {
        std::string name(hv.substr(0, pos));

        size_t val_start = pos + 1;
        while (val_start < hv.size() && (hv[val_start] == ' ' || hv[val_start] == '\t'))
            val_start++;

        size_t val_end = hv.size();
        while (val_end > val_start && (hv[val_end - 1] == '\r' || hv[val_end - 1] == '\n'))
            val_end--;
        std::string value(hv.substr(val_start, val_end - val_start));

        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return std::tolower(c); });

        headers->emplace_back(std::move(name), std::move(value));
    }
    return total;
}

/// Progress callback; a non-zero return makes libcurl abort the transfer.
static int cancel_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* flag = static_cast<const std::atomic<bool>*>(clientp);
    return (flag && flag->load()) ? 1 : 0;
}

/// Map a libcurl result code onto the transport error taxonomy.
static TransportError classify_curl_error(CURLcode rc) {
    switch (rc) {
        case CURLE_OK:
            return TransportError::NONE;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportError::TIMEOUT;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return TransportError::CONNECTION;
        case CURLE_ABORTED_BY_CALLBACK:
            return TransportError::CANCELLED;
        default:
            return TransportError::OTHER;
    }
}

std::string HttpResponse::header(const std::string& name) const {
    std::string wanted = name;
    std::transform(wanted.begin(), wanted.end(), wanted.begin(), [](unsigned char c){ return std::tolower(c); });
    for (const auto& [k, v] : headers) {
        std::string key = k;
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c){ return std::tolower(c); });
        if (key == wanted) return v;
    }
    return {};
}

/// Initialize global libcurl state.
HttpClient::HttpClient(const Options& opts) : opts_(opts) {
    CURLcode c = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (c != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

/// Clean up global libcurl state.
HttpClient::~HttpClient() {
    curl_global_cleanup();
}

/// Append each parameter as an encoded key=value pair.
std::string HttpClient::build_url(const std::string& url, const std::map<std::string, std::string>& params) {
    if (params.empty()) return url;

    CURLU* h = curl_url();
    if (!h) return url;
    if (curl_url_set(h, CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        curl_url_cleanup(h);
        return url;
    }
    for (const auto& [key, value] : params) {
        std::string pair = key + "=" + value;
        curl_url_set(h, CURLUPART_QUERY, pair.c_str(), CURLU_APPENDQUERY | CURLU_URLENCODE);
    }

    char* full = nullptr;
    std::string out = url;
    if (curl_url_get(h, CURLUPART_URL, &full, 0) == CURLUE_OK && full) {
        out = full;
        curl_free(full);
    }
    curl_url_cleanup(h);
    return out;
}

/// Encode fields the way an HTML form posts them, reusing the query encoder.
std::string HttpClient::encode_form(const std::map<std::string, std::string>& fields) {
    std::string url = build_url("http://form.invalid/", fields);
    auto q = url.find('?');
    return q == std::string::npos ? std::string() : url.substr(q + 1);
}

/// Execute an HTTP request and populate a response object.
bool HttpClient::perform(const HttpRequest& req, HttpResponse& resp) const {
    if (req.cancel_flag && req.cancel_flag->load()) {
        resp.error = "cancelled";
        resp.error_kind = TransportError::CANCELLED;
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        resp.error = "curl_easy_init failed";
        resp.error_kind = TransportError::OTHER;
        return false;
    }

    std::string body;
    std::vector<std::pair<std::string, std::string>> resp_headers;
    std::string url = build_url(req.url, req.params);

    // Basic configuration
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, opts_.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, req.timeout_seconds > 0 ? req.timeout_seconds : opts_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, opts_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, opts_.max_redirects);

    // TLS policy
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, opts_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, opts_.verify_tls ? 2L : 0L);

    // Response and header callbacks
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp_headers);

    // Cancellation
    if (req.cancel_flag) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, cancel_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(req.cancel_flag));
    }

    // Misc options
    curl_easy_setopt(curl, CURLOPT_USERAGENT, opts_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_VERBOSE, 0L);
    if (opts_.accept_encoding) curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    // Request headers
    struct curl_slist* curl_headers = nullptr;
    for (const auto& h : req.headers) {
        std::string line = h.first + ": " + h.second;
        curl_headers = curl_slist_append(curl_headers, line.c_str());
    }
    if (curl_headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);

    // Form submissions are the only requests with a body
    if (req.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        resp.error = errbuf[0] ? std::string(errbuf) : curl_easy_strerror(rc);
        resp.error_kind = classify_curl_error(rc);
    } else {
        resp.error_kind = TransportError::NONE;
    }

    // Extract response info
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);

    char* effective_url = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
    if (effective_url) resp.effective_url = effective_url;

    double total_time = 0.0;
    curl_easy_getinfo(curl, CURLINFO_TOTAL_TIME, &total_time);

    resp.total_time = total_time;
    resp.body = std::move(body);
    resp.body_bytes = resp.body.size();
    resp.headers = std::move(resp_headers);

    if (curl_headers) curl_slist_free_all(curl_headers);
    curl_easy_cleanup(curl);
    return rc == CURLE_OK;
}
