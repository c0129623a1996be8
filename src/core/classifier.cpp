/**
 * @file classifier.cpp
 * @brief Rule-ordered classification of probe outcomes
 */

#include "classifier.h"
#include "content_parser.h"
#include <nlohmann/json.hpp>
#include <cctype>
#include <set>
#include <sstream>

/// Content types that say nothing about the payload format.
static bool is_unhelpful_content_type(const std::string& ct) {
    return ct.empty() ||
           ct.rfind("text/plain", 0) == 0 ||
           ct.rfind("application/octet-stream", 0) == 0 ||
           ct.rfind("binary/octet-stream", 0) == 0;
}

/// First non-whitespace byte of a body, or '\0'.
static char leading_byte(const std::string& body) {
    for (char c : body) {
        if (!std::isspace(static_cast<unsigned char>(c))) return c;
    }
    return '\0';
}

static std::string describe_json(const nlohmann::json& j) {
    std::ostringstream ss;
    ss << "valid JSON";
    if (j.is_object()) {
        ss << " (object, " << j.size() << " keys)";
    } else if (j.is_array()) {
        ss << " (array, " << j.size() << " items)";
    }
    return ss.str();
}

Classifier::Classifier(const Options& opts) : opts_(opts) {}

bool Classifier::is_discovered_label(const std::string& label) {
    return label.find("/discovered/") != std::string::npos;
}

std::string Classifier::discovered_label(const std::string& parent, size_t n) {
    return parent + "/discovered/" + std::to_string(n);
}

std::string Classifier::truncate(const std::string& text) const {
    if (text.size() <= opts_.note_limit) return text;
    return text.substr(0, opts_.note_limit) + "...";
}

bool Classifier::classify_structured(const ProbeOutcome& outcome, ClassifiedResult& result) const {
    const std::string ct = to_lower(outcome.content_type);
    const ResponseHint hint = outcome.target.hint;
    nlohmann::json parsed;
    std::string parse_error;

    // Claimed formats are verified, never trusted
    if (ct.find("json") != std::string::npos) {
        if (parse_json(outcome.body, parsed, parse_error)) {
            result.category = Category::JSON_API;
            result.note = describe_json(parsed);
        } else {
            result.category = Category::MALFORMED;
            result.note = "claims JSON, invalid";
        }
        return true;
    }

    if (ct.find("xml") != std::string::npos && ct.find("html") == std::string::npos) {
        if (is_well_formed_xml(outcome.body)) {
            result.category = Category::XML_API;
            result.note = "valid XML";
        } else {
            result.category = Category::MALFORMED;
            result.note = "claims XML, malformed";
        }
        return true;
    }

    if (!is_unhelpful_content_type(ct)) return false;

    if (hint == ResponseHint::EXPECT_JSON && parse_json(outcome.body, parsed, parse_error)) {
        result.category = Category::JSON_API;
        result.note = describe_json(parsed) + ", sniffed without JSON content type";
        return true;
    }

    if ((hint == ResponseHint::EXPECT_XML || leading_byte(outcome.body) == '<') &&
        is_well_formed_xml(outcome.body)) {
        result.category = Category::XML_API;
        result.note = "valid XML, sniffed without XML content type";
        return true;
    }
    return false;
}

bool Classifier::is_download_link(const std::string& href) {
    std::string path = to_lower(href.substr(0, href.find_first_of("?#")));
    for (const char* ext : {".xml", ".json", ".zip", ".tar", ".tar.gz", ".tgz"}) {
        const std::string suffix(ext);
        if (path.size() > suffix.size() &&
            path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

void Classifier::collect_downloads(const MarkupScan& scan, const std::string& page_url, ClassifiedResult& result) const {
    std::set<std::string> seen;
    size_t total = 0;
    for (const auto& href : scan.links) {
        if (!is_download_link(href)) continue;
        std::string resolved = resolve_url(page_url, href);
        if (resolved.empty() || !seen.insert(resolved).second) continue;
        total++;
        if (result.download_links.size() < opts_.max_download_links) {
            result.download_links.push_back(std::move(resolved));
        }
    }
    if (total > 0) {
        result.note += "; " + std::to_string(total) + " bulk download link(s)";
    }
}

void Classifier::deep_scan(const ProbeOutcome& outcome, const MarkupScan& scan, ClassifiedResult& result) const {
    const std::string page_url = outcome.effective_url.empty() ? outcome.target.url : outcome.effective_url;

    // Script hints are informational; they are never probed automatically
    std::set<std::string> seen_hints;
    for (const auto& script : scan.scripts) {
        std::string lower = to_lower(script);
        if (lower.find("/api/") == std::string::npos &&
            lower.find("search") == std::string::npos &&
            lower.find("query") == std::string::npos) {
            continue;
        }
        for (auto& candidate : find_script_endpoints(script)) {
            if (result.api_hints.size() >= opts_.max_script_hints) break;
            if (seen_hints.insert(candidate).second) {
                result.api_hints.push_back(std::move(candidate));
            }
        }
    }

    // Root-relative form actions become depth-1 secondary targets
    std::set<std::string> seen_actions;
    for (const auto& form : scan.forms) {
        const std::string& action = form.action;
        if (action.empty() || action[0] != '/' || action.rfind("//", 0) == 0) continue;

        std::string resolved = resolve_url(page_url, action);
        if (resolved.empty() || !seen_actions.insert(resolved).second) continue;

        ProbeTarget secondary;
        secondary.label = discovered_label(outcome.target.label, result.secondary_targets.size() + 1);
        secondary.url = resolved;
        secondary.variant = ProbeVariant::PLAIN;
        secondary.hint = ResponseHint::NONE;
        result.secondary_targets.push_back(std::move(secondary));
    }

    if (!result.api_hints.empty()) {
        std::ostringstream ss;
        ss << "; script API hints: ";
        for (size_t i = 0; i < result.api_hints.size(); i++) {
            if (i) ss << ", ";
            ss << result.api_hints[i];
        }
        result.note += ss.str();
    }
    if (!result.secondary_targets.empty()) {
        result.note += "; " + std::to_string(result.secondary_targets.size()) + " form target(s) queued";
    }
}

ClassifiedResult Classifier::classify(const ProbeOutcome& outcome) const {
    ClassifiedResult result;
    result.target_label = outcome.target.label;
    result.url = outcome.target.url;
    result.status_code = outcome.status_code;
    result.content_type = outcome.content_type;
    result.elapsed_seconds = outcome.elapsed_seconds;

    if (outcome.transport != TransportStatus::SUCCESS) {
        result.category = Category::UNREACHABLE;
        switch (outcome.transport) {
            case TransportStatus::TIMEOUT:
                result.note = "timeout: ";
                break;
            case TransportStatus::CONNECTION_ERROR:
                result.note = "connection error: ";
                break;
            default:
                result.note = "error: ";
                break;
        }
        result.note += truncate(outcome.error);
    } else if (outcome.status_code == 401 || outcome.status_code == 403) {
        result.category = Category::AUTH_REQUIRED;
        result.note = "requires authentication (HTTP " + std::to_string(outcome.status_code) + ")";
    } else if (outcome.status_code != 200) {
        result.category = Category::UNREACHABLE;
        result.note = "HTTP " + std::to_string(outcome.status_code);
    } else if (!classify_structured(outcome, result)) {
        result.category = Category::HTML_SCRAPABLE;
        result.note = "web interface, may be scrapable";
        if (!outcome.content_type.empty()) {
            result.note += " (" + outcome.content_type + ")";
        }
        MarkupScan scan = extract_markup(outcome.body);
        if (outcome.target.variant == ProbeVariant::DEEP_SCAN &&
            !is_discovered_label(outcome.target.label)) {
            deep_scan(outcome, scan, result);
        }
        collect_downloads(scan, outcome.effective_url.empty() ? outcome.target.url : outcome.effective_url, result);
    }

    // Record disagreement between the catalog's expectation and what came back
    if (result.category == Category::HTML_SCRAPABLE || result.category == Category::XML_API) {
        if (outcome.target.hint == ResponseHint::EXPECT_JSON) result.note += " (expected JSON)";
    }
    if (result.category == Category::HTML_SCRAPABLE || result.category == Category::JSON_API) {
        if (outcome.target.hint == ResponseHint::EXPECT_XML) result.note += " (expected XML)";
    }

    if (!outcome.form_action_url.empty()) {
        result.note += " [via form action " + outcome.form_action_url + "]";
    }
    return result;
}
