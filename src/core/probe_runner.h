#pragma once
#include "prober.h"
#include "classifier.h"
#include "aggregator.h"
#include <schema/report.h>
#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace logging { class ChainLogger; }

class WorkerPool;

// Runs the probe -> classify -> aggregate -> recommend pipeline over a list
// of targets. Top-level targets run concurrently on a bounded worker pool;
// form targets found by a DeepScan are probed once, at depth 1, on the
// same pool. Every top-level target ends up in the report, even when the
// run is cancelled.

class ProbeRunner {
public:
    struct Options {
        size_t concurrency;
        bool probe_secondary;
        std::string run_id;     // Generated when empty

        Options()
            : concurrency(8),
              probe_secondary(true)
        {}
    };

    using ResultCallback = std::function<void(const ClassifiedResult&)>;

    /**
     * @brief Create a runner
     * @param prober Prober used for every target (must outlive the runner)
     * @param classifier Classifier used for every outcome (must outlive the runner)
     * @param opts Concurrency and secondary-target policy
     */
    ProbeRunner(const Prober& prober, const Classifier& classifier, const Options& opts = Options());

    /**
     * @brief Attach an audit log; entries are written for the run and each result
     * @param logger Logger owned by the caller, or nullptr to disable
     */
    void set_logger(logging::ChainLogger* logger) { logger_ = logger; }

    /**
     * @brief Register a callback invoked once per recorded result
     *
     * Calls are serialized, so the callback may write to a shared stream.
     */
    void on_result(ResultCallback cb) { on_result_ = std::move(cb); }

    /**
     * @brief Probe all targets and build the report
     * @param targets Targets with unique, non-empty labels
     * @return Report with one entry per target plus discovered targets
     * @throws std::invalid_argument if labels are empty or duplicated
     *
     * A cancel() issued before run() is kept: every target is then recorded
     * as cancelled without touching the network. Call reset() to reuse a
     * cancelled runner.
     */
    Report run(const std::vector<ProbeTarget>& targets);

    /**
     * @brief Request cancellation of the current run
     *
     * Only stores an atomic flag, so it may be called from a signal handler.
     * In-flight transfers abort, queued targets are recorded as cancelled
     * and no new secondary targets are queued.
     */
    void cancel() { cancelled_.store(true); }

    bool cancelled() const { return cancelled_.load(); }

    /// Clear a cancellation request so the runner can run again.
    void reset() { cancelled_.store(false); }

    /**
     * @brief Generate a run identifier from the current UTC time
     * @return "run_YYYYMMDD_HHMMSS"
     */
    static std::string generate_run_id();

private:
    struct RunState;

    const Prober& prober_;
    const Classifier& classifier_;
    Options opts_;
    logging::ChainLogger* logger_ = nullptr;
    ResultCallback on_result_;
    std::atomic<bool> cancelled_{false};

    /**
     * @brief Probe and classify one target, then queue its secondary targets
     * @param state Shared state of the current run
     * @param target Target to process
     * @param depth 0 for catalog targets, 1 for discovered ones
     */
    void process(RunState& state, const ProbeTarget& target, int depth);

    /**
     * @brief Store a result and notify the logger and callback
     */
    void record(RunState& state, ClassifiedResult result);

    /**
     * @brief Claim a URL for probing in this run
     *
     * URLs are compared after curl normalization, so "https://a.test" and
     * "https://a.test/" are the same endpoint.
     *
     * @return true if nobody probed or queued it yet
     */
    static bool claim_url(RunState& state, const std::string& url);

    static void validate_labels(const std::vector<ProbeTarget>& targets);
};
