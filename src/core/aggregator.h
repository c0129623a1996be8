#pragma once
#include <schema/report.h>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Collects classified results into a Report.
// add() may be called from several worker threads; every write goes
// through one mutex. Counts are always zero-filled for all categories.

class Aggregator {
public:
    Aggregator() = default;

    /**
     * @brief Store a result under its label
     *
     * Labels are expected to be unique per run; a repeated label
     * overwrites the earlier result.
     *
     * @param result Classified result
     */
    void add(ClassifiedResult result);

    /**
     * @brief Check whether a label has already been recorded
     */
    bool contains(const std::string& label) const;

    /**
     * @brief Number of recorded results
     */
    size_t size() const;

    /**
     * @brief Copy the current state into a Report (recommendations left empty)
     * @return Report with results and zero-filled counts
     */
    Report snapshot() const;

    /**
     * @brief Build a Report from a batch of results
     * @param results Results in arrival order; later duplicates overwrite earlier ones
     * @return Report with results and zero-filled counts
     */
    static Report aggregate(const std::vector<ClassifiedResult>& results);

    /**
     * @brief Count results per category
     * @param results Results keyed by label
     * @return Map holding every category, zero when absent
     */
    static std::map<Category, int> tally(const std::map<std::string, ClassifiedResult>& results);

private:
    mutable std::mutex mutex_;
    std::map<std::string, ClassifiedResult> results_;
};
