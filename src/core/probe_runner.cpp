/**
 * @file probe_runner.cpp
 * @brief Concurrent probe pipeline with depth-limited discovery
 */

#include "probe_runner.h"
#include "content_parser.h"
#include "recommender.h"
#include "worker_pool.h"
#include "logging/chain.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>

struct ProbeRunner::RunState {
    Aggregator aggregator;
    std::mutex url_mutex;
    std::set<std::string> claimed_urls;
    std::mutex record_mutex;
    WorkerPool* pool = nullptr;
};

/// Get current timestamp in ISO8601 format.
static std::string current_utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.';
    ss << std::setw(3) << std::setfill('0') << ms.count() << "Z";
    return ss.str();
}

/// Result recorded for a target that never reached the network.
static ClassifiedResult unreachable_result(const ProbeTarget& target, const std::string& note) {
    ClassifiedResult r;
    r.target_label = target.label;
    r.url = target.url;
    r.category = Category::UNREACHABLE;
    r.note = note;
    return r;
}

std::string ProbeRunner::generate_run_id() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << "run_" << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

ProbeRunner::ProbeRunner(const Prober& prober, const Classifier& classifier, const Options& opts)
    : prober_(prober), classifier_(classifier), opts_(opts) {}

void ProbeRunner::validate_labels(const std::vector<ProbeTarget>& targets) {
    std::set<std::string> labels;
    for (const auto& t : targets) {
        if (t.label.empty()) {
            throw std::invalid_argument("probe target without label: " + t.url);
        }
        if (!labels.insert(t.label).second) {
            throw std::invalid_argument("duplicate probe target label: " + t.label);
        }
    }
}

bool ProbeRunner::claim_url(RunState& state, const std::string& url) {
    // Discovered URLs come out of resolve_url; put catalog URLs in the same form
    std::string key = resolve_url(url, url);
    if (key.empty()) key = url;
    std::lock_guard<std::mutex> lock(state.url_mutex);
    return state.claimed_urls.insert(key).second;
}

void ProbeRunner::record(RunState& state, ClassifiedResult result) {
    std::lock_guard<std::mutex> lock(state.record_mutex);
    state.aggregator.add(result);

    // Stored first: a failing sink never drops a result
    try {
        if (logger_) {
            logger_->append_result(result);
        }
        if (on_result_) {
            on_result_(result);
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: result sink failed for " << result.target_label << ": " << e.what() << "\n";
    }
}

void ProbeRunner::process(RunState& state, const ProbeTarget& target, int depth) {
    if (cancelled_.load()) {
        // Discovered targets are optional; catalog targets must still appear
        if (depth == 0) {
            record(state, unreachable_result(target, "cancelled before probe"));
        }
        return;
    }

    ClassifiedResult result;
    try {
        ProbeOutcome outcome = prober_.probe(target, &cancelled_);
        result = classifier_.classify(outcome);
    } catch (const std::exception& e) {
        result = unreachable_result(target, std::string("internal error: ") + e.what());
    }

    // Depth limit: discovered targets never spawn further targets
    if (depth > 0) {
        result.secondary_targets.clear();
    }

    std::vector<ProbeTarget> to_queue;
    if (depth == 0 && opts_.probe_secondary) {
        for (const auto& secondary : result.secondary_targets) {
            if (claim_url(state, secondary.url)) {
                to_queue.push_back(secondary);
            }
        }
    }

    record(state, std::move(result));

    for (auto& secondary : to_queue) {
        if (cancelled_.load()) break;
        state.pool->submit([this, &state, secondary] {
            process(state, secondary, 1);
        });
    }
}

Report ProbeRunner::run(const std::vector<ProbeTarget>& targets) {
    validate_labels(targets);

    const std::string run_id = opts_.run_id.empty() ? generate_run_id() : opts_.run_id;
    const std::string started_at = current_utc_timestamp();
    const size_t concurrency = opts_.concurrency == 0 ? 1 : opts_.concurrency;

    if (logger_) {
        nlohmann::json payload;
        payload["targets"] = targets.size();
        payload["concurrency"] = concurrency;
        payload["probe_secondary"] = opts_.probe_secondary;
        logger_->append("run_started", payload);
    }

    RunState state;
    for (const auto& t : targets) {
        claim_url(state, t.url);
    }

    {
        WorkerPool pool(concurrency);
        state.pool = &pool;
        for (const auto& t : targets) {
            pool.submit([this, &state, t] {
                process(state, t, 0);
            });
        }
        pool.wait_idle();
        pool.shutdown();
        state.pool = nullptr;
    }

    Report report = state.aggregator.snapshot();
    report.recommendations = Recommender().recommend(report);
    report.run_id = run_id;
    report.started_at = started_at;
    report.finished_at = current_utc_timestamp();
    report.cancelled = cancelled_.load();

    if (logger_) {
        nlohmann::json payload;
        payload["results"] = report.results.size();
        payload["cancelled"] = report.cancelled;
        nlohmann::json counts = nlohmann::json::object();
        for (const auto& [category, count] : report.counts_by_category) {
            counts[to_string(category)] = count;
        }
        payload["counts_by_category"] = counts;
        payload["recommendations"] = report.recommendations;
        logger_->append("run_completed", payload);
    }
    return report;
}
