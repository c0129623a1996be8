/**
 * @file report_writer.cpp
 * @brief JSON and console output for probe reports
 */

#include "report_writer.h"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace report {

using json = nlohmann::json;

/// Upper-case headline used for each category block.
static std::string category_heading(Category c) {
    switch (c) {
        case Category::JSON_API:        return "JSON APIs";
        case Category::XML_API:         return "XML APIs";
        case Category::HTML_SCRAPABLE:  return "Scrapable web interfaces";
        case Category::AUTH_REQUIRED:   return "Authentication required";
        case Category::UNREACHABLE:     return "Unreachable";
        case Category::MALFORMED:       return "Malformed responses";
    }
    return "Unknown";
}

static json result_to_json(const ClassifiedResult& r) {
    json j;
    j["category"] = to_string(r.category);
    j["url"] = r.url;
    j["note"] = r.note;
    j["status_code"] = r.status_code;
    j["content_type"] = r.content_type;
    j["elapsed_seconds"] = r.elapsed_seconds;
    j["api_hints"] = r.api_hints;
    j["download_links"] = r.download_links;

    json secondaries = json::array();
    for (const auto& t : r.secondary_targets) {
        json s;
        s["label"] = t.label;
        s["url"] = t.url;
        secondaries.push_back(s);
    }
    j["secondary_targets"] = secondaries;
    return j;
}

json to_json(const Report& r) {
    json j;
    j["run_id"] = r.run_id;
    j["started_at"] = r.started_at;
    j["finished_at"] = r.finished_at;
    j["cancelled"] = r.cancelled;

    json results = json::object();
    for (const auto& [label, result] : r.results) {
        results[label] = result_to_json(result);
    }
    j["results"] = results;

    json counts = json::object();
    for (Category c : kAllCategories) {
        counts[to_string(c)] = r.count(c);
    }
    j["counts_by_category"] = counts;
    j["recommendations"] = r.recommendations;
    return j;
}

bool write_json(const Report& r, const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Error: cannot create " << parent.string() << ": " << ec.message() << "\n";
            return false;
        }
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        std::cerr << "Error: cannot write report " << path << "\n";
        return false;
    }
    out << to_json(r).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    return static_cast<bool>(out);
}

std::string format_progress(const ClassifiedResult& result) {
    std::ostringstream ss;
    ss << "  [" << std::left << std::setw(14) << to_string(result.category) << "] "
       << result.target_label << " - " << result.note;
    return ss.str();
}

void print_summary(const Report& r, std::ostream& out) {
    out << "\n=== Endpoint Discovery Report ===\n\n";
    if (!r.run_id.empty()) {
        out << "Run: " << r.run_id << "\n";
    }
    if (r.cancelled) {
        out << "Run was cancelled; results are partial\n";
    }

    for (Category c : kAllCategories) {
        if (r.count(c) == 0) continue;
        out << "\n" << category_heading(c) << " (" << r.count(c) << "):\n";
        for (const auto& [label, result] : r.results) {
            if (result.category != c) continue;
            out << "  - " << label << ": " << result.url << "\n";
            out << "      " << result.note << "\n";
        }
    }

    out << "\nTotals:\n";
    for (Category c : kAllCategories) {
        out << "  " << std::left << std::setw(16) << to_string(c) << r.count(c) << "\n";
    }
    out << "  " << std::left << std::setw(16) << "total" << r.results.size() << "\n";

    out << "\nRecommendations:\n";
    for (size_t i = 0; i < r.recommendations.size(); i++) {
        out << "  " << (i + 1) << ". " << r.recommendations[i] << "\n";
    }
    out << "\n";
}

} // namespace report
