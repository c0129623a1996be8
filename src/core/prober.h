#pragma once
#include "http_client.h"
#include <schema/probe_result.h>
#include <atomic>
#include <map>
#include <string>

// Executes one probe target against a Fetcher.
// One bounded attempt per target, no retries. Transport failures and
// exceptions are converted into a ProbeOutcome; probe() never throws.

class Prober {
public:
    struct Options {
        long timeout_seconds;
        std::string user_agent;
        std::string accept;
        std::map<std::string, std::string> extra_headers;

        Options()
            : timeout_seconds(12),
              user_agent("apiscout/0.1"),
              accept("application/json, application/xml, text/html, */*"),
              extra_headers({{"Accept-Language", "en-US,en;q=0.9"}})
        {}
    };

    /**
     * @brief Create a prober bound to a fetch capability
     * @param fetcher Transport used for every request (must outlive the prober)
     * @param opts Identification headers and timeout
     */
    explicit Prober(const Fetcher& fetcher, const Options& opts = Options());

    /**
     * @brief Probe a single target
     * @param target Endpoint description
     * @param cancel_flag Optional run-wide cancellation flag
     * @return Outcome of the attempt (FollowForm may fold a second request into it)
     */
    virtual ProbeOutcome probe(const ProbeTarget& target, const std::atomic<bool>* cancel_flag = nullptr) const;

    /**
     * @brief Headers sent with every probe request
     */
    std::map<std::string, std::string> request_headers() const;

    const Options& options() const { return opts_; }

private:
    const Fetcher& fetcher_;
    Options opts_;

    /**
     * @brief Issue one request and fill the transport fields of an outcome
     * @param req Request to send; identification headers and timeout are added
     * @param cancel_flag Optional cancellation flag
     * @param outcome Outcome whose transport fields are overwritten
     */
    void fetch_into(HttpRequest req, const std::atomic<bool>* cancel_flag, ProbeOutcome& outcome) const;

    /**
     * @brief Build the submission of the first form that has an action
     *
     * Named inputs are sent with their default values: as query parameters
     * for method="get", as an urlencoded body for method="post".
     *
     * @param page_url URL the body was fetched from
     * @param body HTML body
     * @return Request for the resolved action, or one with an empty url when
     *         the page has no usable form
     */
    static HttpRequest form_submission(const std::string& page_url, const std::string& body);
};
