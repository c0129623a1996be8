#pragma once
#include <schema/report.h>
#include <string>
#include <vector>

// Turns a report into a prioritized list of actions.
// Precedence: JSON APIs, else XML APIs, else scrapable HTML; an auth note
// is appended when gated endpoints exist; a single fallback line is
// emitted when nothing but UNREACHABLE/MALFORMED results were found.

class Recommender {
public:
    static const char* const kFallback;

    /**
     * @brief Derive recommendations from a report
     * @param report Aggregated report (results and counts)
     * @return Ordered recommendations, highest priority first
     */
    std::vector<std::string> recommend(const Report& report) const;

private:
    /**
     * @brief Results in a category, in label order
     */
    static std::vector<const ClassifiedResult*> members(const Report& report, Category c);
};
