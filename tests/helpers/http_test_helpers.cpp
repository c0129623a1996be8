/**
 * @file http_test_helpers.cpp
 * @brief Implementation of the scripted fetcher and test utilities
 */

#include "http_test_helpers.h"
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <thread>

namespace test_helpers {

void FakeFetcher::respond(const std::string& url, long status, const std::string& content_type, const std::string& body) {
    FakeReply reply;
    reply.status = status;
    reply.content_type = content_type;
    reply.body = body;
    script(url, reply);
}

void FakeFetcher::fail(const std::string& url, TransportError kind, const std::string& error) {
    FakeReply reply;
    reply.status = 0;
    reply.error_kind = kind;
    reply.error = error;
    script(url, reply);
}

void FakeFetcher::script(const std::string& url, const FakeReply& reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    replies_[url] = reply;
}

bool FakeFetcher::perform(const HttpRequest& req, HttpResponse& resp) const {
    const std::string url = HttpClient::build_url(req.url, req.params);

    FakeReply reply;
    bool found = false;
    int delay_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requested_.push_back(url);
        last_request_ = req;
        last_request_.cancel_flag = nullptr;
        auto it = replies_.find(url);
        if (it != replies_.end()) {
            reply = it->second;
            found = true;
        }
        delay_ms = found && reply.delay_ms > 0 ? reply.delay_ms : default_delay_ms_;
    }

    int now = ++in_flight_;
    int prev = max_in_flight_.load();
    while (now > prev && !max_in_flight_.compare_exchange_weak(prev, now)) {
    }

    // Sleep in slices so a cancelled run does not wait for the full delay
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
    bool cancelled = false;
    while (std::chrono::steady_clock::now() < deadline) {
        if (req.cancel_flag && req.cancel_flag->load()) {
            cancelled = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    --in_flight_;

    resp = HttpResponse();
    resp.effective_url = url;

    if (cancelled) {
        resp.error_kind = TransportError::CANCELLED;
        resp.error = "Callback aborted";
        return false;
    }
    if (!found) {
        resp.error_kind = TransportError::CONNECTION;
        resp.error = "Could not resolve host (unscripted URL " + url + ")";
        return false;
    }
    if (reply.throw_exception) {
        throw std::runtime_error("scripted failure for " + url);
    }
    if (reply.error_kind != TransportError::NONE) {
        resp.error_kind = reply.error_kind;
        resp.error = reply.error;
        return false;
    }

    resp.status = reply.status;
    resp.body = reply.body;
    resp.body_bytes = reply.body.size();
    if (!reply.content_type.empty()) {
        resp.headers.push_back({"content-type", reply.content_type});
    }
    if (!reply.effective_url.empty()) {
        resp.effective_url = reply.effective_url;
    }
    return true;
}

std::vector<std::string> FakeFetcher::requested_urls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requested_;
}

int FakeFetcher::request_count(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    int n = 0;
    for (const auto& u : requested_) {
        if (u == url) n++;
    }
    return n;
}

std::map<std::string, std::string> FakeFetcher::last_headers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_request_.headers;
}

HttpRequest FakeFetcher::last_request() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_request_;
}

ProbeTarget make_target(const std::string& label, const std::string& url, ProbeVariant variant, ResponseHint hint) {
    ProbeTarget t;
    t.label = label;
    t.url = url;
    t.variant = variant;
    t.hint = hint;
    return t;
}

ProbeOutcome make_outcome(const ProbeTarget& target, long status, const std::string& content_type, const std::string& body) {
    ProbeOutcome o;
    o.target = target;
    o.transport = TransportStatus::SUCCESS;
    o.status_code = status;
    o.content_type = content_type;
    o.body = body;
    o.effective_url = target.url;
    return o;
}

ProbeOutcome make_failure(const ProbeTarget& target, TransportStatus transport, const std::string& error) {
    ProbeOutcome o;
    o.target = target;
    o.transport = transport;
    o.error = error;
    o.effective_url = target.url;
    return o;
}

std::string get_target_url(const std::string& default_url) {
    const char* env_url = std::getenv("TARGET_URL");
    if (env_url && strlen(env_url) > 0) {
        return std::string(env_url);
    }
    return default_url;
}

HttpClient create_test_client() {
    HttpClient::Options opts;
    opts.timeout_seconds = 15;
    opts.connect_timeout_seconds = 5;
    opts.follow_redirects = true;
    opts.max_redirects = 5;
    opts.user_agent = "apiscout-test/1.0";
    opts.accept_encoding = true;
    return HttpClient(opts);
}

std::string temp_path(const std::string& name) {
    std::filesystem::path p = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove(p, ec);
    return p.string();
}

} // namespace test_helpers
