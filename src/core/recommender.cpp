// Recommendation ranking implementation

#include "recommender.h"

const char* const Recommender::kFallback =
    "No usable endpoints discovered; consider alternative data sources (bulk downloads, commercial APIs)";

std::vector<const ClassifiedResult*> Recommender::members(const Report& report, Category c) {
    std::vector<const ClassifiedResult*> out;
    for (const auto& [label, result] : report.results) {
        if (result.category == c) out.push_back(&result);
    }
    return out;
}

std::vector<std::string> Recommender::recommend(const Report& report) const {
    std::vector<std::string> recs;

    if (report.count(Category::JSON_API) > 0) {
        for (const auto* r : members(report, Category::JSON_API)) {
            recs.push_back("Prefer direct JSON API access via " + r->target_label + " (" + r->url + ")");
        }
    } else if (report.count(Category::XML_API) > 0) {
        for (const auto* r : members(report, Category::XML_API)) {
            recs.push_back("Use XML API access via " + r->target_label + " (" + r->url + ")");
        }
    } else if (report.count(Category::HTML_SCRAPABLE) > 0) {
        for (const auto* r : members(report, Category::HTML_SCRAPABLE)) {
            recs.push_back("Scrape HTML content from " + r->target_label + " (" + r->url + ")");
        }
    }

    if (report.count(Category::AUTH_REQUIRED) > 0) {
        std::string line = "Authenticated access may be viable with credentials for: ";
        bool first = true;
        for (const auto* r : members(report, Category::AUTH_REQUIRED)) {
            if (!first) line += ", ";
            line += r->target_label;
            first = false;
        }
        recs.push_back(line);
    }

    bool any_usable = false;
    for (Category c : kAllCategories) {
        if (c == Category::UNREACHABLE || c == Category::MALFORMED) continue;
        if (report.count(c) > 0) any_usable = true;
    }
    if (!any_usable) {
        recs.assign(1, kFallback);
    }
    return recs;
}
