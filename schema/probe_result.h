#pragma once
#include "probe_target.h"
#include <array>
#include <string>
#include <vector>

/**
 * @file probe_result.h
 * @brief Raw probe outcomes and their classification
 *
 * A ProbeOutcome is what the transport reported for one attempt. The
 * classifier turns it into a ClassifiedResult carrying exactly one
 * Category.
 */

enum class TransportStatus {
    SUCCESS,
    TIMEOUT,
    CONNECTION_ERROR,
    OTHER_ERROR
};

/**
 * Result of a single probe attempt
 * Only status_code, content_type and body are meaningful on SUCCESS;
 * error holds the transport message otherwise.
 */
struct ProbeOutcome {
    ProbeTarget target;
    TransportStatus transport = TransportStatus::OTHER_ERROR;
    long status_code = 0;
    std::string content_type;
    std::string body;
    std::string error;
    std::string effective_url;
    std::string form_action_url;    // Set when a FollowForm probe folded a form response
    double elapsed_seconds = 0.0;
};

enum class Category {
    JSON_API,
    XML_API,
    HTML_SCRAPABLE,
    AUTH_REQUIRED,
    UNREACHABLE,
    MALFORMED
};

inline constexpr std::array<Category, 6> kAllCategories = {
    Category::JSON_API,
    Category::XML_API,
    Category::HTML_SCRAPABLE,
    Category::AUTH_REQUIRED,
    Category::UNREACHABLE,
    Category::MALFORMED
};

inline const char* to_string(Category c) {
    switch (c) {
        case Category::JSON_API:       return "json_api";
        case Category::XML_API:        return "xml_api";
        case Category::HTML_SCRAPABLE: return "html_scrapable";
        case Category::AUTH_REQUIRED:  return "auth_required";
        case Category::UNREACHABLE:    return "unreachable";
        case Category::MALFORMED:      return "malformed";
    }
    return "unreachable";
}

inline const char* to_string(TransportStatus s) {
    switch (s) {
        case TransportStatus::SUCCESS:          return "success";
        case TransportStatus::TIMEOUT:          return "timeout";
        case TransportStatus::CONNECTION_ERROR: return "connection_error";
        case TransportStatus::OTHER_ERROR:      return "other_error";
    }
    return "other_error";
}

struct ClassifiedResult {
    std::string target_label;
    Category category = Category::UNREACHABLE;
    std::string url;
    std::string note;
    long status_code = 0;
    std::string content_type;
    double elapsed_seconds = 0.0;
    std::vector<std::string> api_hints;          // Script endpoint candidates, informational only
    std::vector<std::string> download_links;     // Resolved links to bulk data files on an HTML page
    std::vector<ProbeTarget> secondary_targets;  // Populated by DeepScan at depth 0 only
};
