/**
 * @file prober.cpp
 * @brief Single-attempt endpoint probing on top of the fetch capability
 */

#include "prober.h"
#include "content_parser.h"
#include <exception>

/// Map the fetcher's error kind onto the outcome's transport status.
static TransportStatus to_transport_status(TransportError kind) {
    switch (kind) {
        case TransportError::NONE:       return TransportStatus::SUCCESS;
        case TransportError::TIMEOUT:    return TransportStatus::TIMEOUT;
        case TransportError::CONNECTION: return TransportStatus::CONNECTION_ERROR;
        case TransportError::CANCELLED:
        case TransportError::OTHER:      return TransportStatus::OTHER_ERROR;
    }
    return TransportStatus::OTHER_ERROR;
}

Prober::Prober(const Fetcher& fetcher, const Options& opts)
    : fetcher_(fetcher), opts_(opts) {}

std::map<std::string, std::string> Prober::request_headers() const {
    std::map<std::string, std::string> headers = opts_.extra_headers;
    headers["User-Agent"] = opts_.user_agent;
    headers["Accept"] = opts_.accept;
    return headers;
}

void Prober::fetch_into(HttpRequest req, const std::atomic<bool>* cancel_flag, ProbeOutcome& outcome) const {
    outcome.status_code = 0;
    outcome.content_type.clear();
    outcome.body.clear();
    outcome.error.clear();
    outcome.effective_url.clear();

    if (cancel_flag && cancel_flag->load()) {
        outcome.transport = TransportStatus::OTHER_ERROR;
        outcome.error = "cancelled";
        return;
    }

    std::map<std::string, std::string> headers = request_headers();
    for (const auto& [name, value] : req.headers) {
        headers[name] = value;
    }
    req.headers = std::move(headers);
    req.timeout_seconds = opts_.timeout_seconds;
    req.cancel_flag = cancel_flag;

    HttpResponse resp;
    bool ok = false;
    try {
        ok = fetcher_.perform(req, resp);
    } catch (const std::exception& e) {
        outcome.transport = TransportStatus::OTHER_ERROR;
        outcome.error = e.what();
        return;
    }

    outcome.elapsed_seconds += resp.total_time;
    if (!ok) {
        outcome.transport = resp.error_kind == TransportError::NONE
            ? TransportStatus::OTHER_ERROR
            : to_transport_status(resp.error_kind);
        outcome.error = resp.error.empty() ? "transport error" : resp.error;
        return;
    }

    outcome.transport = TransportStatus::SUCCESS;
    outcome.status_code = resp.status;
    outcome.content_type = resp.header("content-type");
    outcome.body = std::move(resp.body);
    outcome.effective_url = resp.effective_url.empty() ? req.url : resp.effective_url;
}

HttpRequest Prober::form_submission(const std::string& page_url, const std::string& body) {
    HttpRequest req;
    MarkupScan scan = extract_markup(body);
    for (const auto& form : scan.forms) {
        if (form.action.empty()) continue;
        std::string resolved = resolve_url(page_url, form.action);
        if (resolved.empty()) continue;

        // A repeated input name keeps its first value
        std::map<std::string, std::string> fields(form.inputs.begin(), form.inputs.end());
        req.url = resolved;
        if (form.method == "post") {
            req.method = "POST";
            req.body = HttpClient::encode_form(fields);
            req.headers["Content-Type"] = "application/x-www-form-urlencoded";
        } else {
            req.params = std::move(fields);
        }
        break;
    }
    return req;
}

ProbeOutcome Prober::probe(const ProbeTarget& target, const std::atomic<bool>* cancel_flag) const {
    ProbeOutcome outcome;
    outcome.target = target;

    HttpRequest first;
    first.url = target.url;
    first.params = target.params;
    fetch_into(first, cancel_flag, outcome);

    // FollowForm: one extra hop to the first form action, never further
    if (target.variant == ProbeVariant::FOLLOW_FORM &&
        outcome.transport == TransportStatus::SUCCESS &&
        outcome.status_code == 200) {
        HttpRequest follow = form_submission(outcome.effective_url, outcome.body);
        if (!follow.url.empty()) {
            outcome.form_action_url = follow.url;
            fetch_into(follow, cancel_flag, outcome);
        }
    }
    return outcome;
}
