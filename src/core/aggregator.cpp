// Result aggregation implementation

#include "aggregator.h"

void Aggregator::add(ClassifiedResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string label = result.target_label;
    results_[label] = std::move(result);
}

bool Aggregator::contains(const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.count(label) > 0;
}

size_t Aggregator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

std::map<Category, int> Aggregator::tally(const std::map<std::string, ClassifiedResult>& results) {
    std::map<Category, int> counts;
    for (Category c : kAllCategories) {
        counts[c] = 0;
    }
    for (const auto& [label, result] : results) {
        counts[result.category]++;
    }
    return counts;
}

Report Aggregator::snapshot() const {
    Report report;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        report.results = results_;
    }
    report.counts_by_category = tally(report.results);
    return report;
}

Report Aggregator::aggregate(const std::vector<ClassifiedResult>& results) {
    Aggregator aggregator;
    for (const auto& r : results) {
        aggregator.add(r);
    }
    return aggregator.snapshot();
}
