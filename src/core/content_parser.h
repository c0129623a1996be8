#pragma once
#include <string>
#include <vector>
#include <utility>
#include <nlohmann/json.hpp>

// Payload inspection helpers used by the prober and classifier.
// JSON goes through nlohmann::json, XML well-formedness through libxml2,
// HTML markup through gumbo. None of these functions throw on bad input.

struct HtmlForm {
    std::string action;     // Raw attribute value, not resolved
    std::string method;     // Lowercase, "get" when absent
    std::vector<std::pair<std::string, std::string>> inputs;
};

struct MarkupScan {
    std::vector<std::string> scripts;   // Inline <script> text, in document order
    std::vector<HtmlForm> forms;
    std::vector<std::string> links;     // Raw href values of <a> elements
};

/**
 * @brief Parse a body as JSON
 * @param body Response body
 * @param out Parsed value on success
 * @param error Parser message on failure
 * @return true if body is valid JSON
 */
bool parse_json(const std::string& body, nlohmann::json& out, std::string& error);

/**
 * @brief Check whether a body is a well-formed XML document
 * @param body Response body
 * @return true if libxml2 parses it without errors
 */
bool is_well_formed_xml(const std::string& body);

/**
 * @brief Extract inline scripts, forms and links from HTML
 * @param body HTML content
 * @return Extracted fragments; empty when the body has none
 */
MarkupScan extract_markup(const std::string& body);

/**
 * @brief Find quoted endpoint-like strings inside script text
 *
 * Candidates are string literals starting with "/" or "http(s)://" that
 * mention "/api/", "search" or "query".
 *
 * @param script Script source
 * @return Candidates in order of appearance, without duplicates
 */
std::vector<std::string> find_script_endpoints(const std::string& script);

/**
 * @brief Resolve href against a base URL
 * @param base Absolute base URL
 * @param href Absolute or relative reference
 * @return Absolute URL without fragment, or empty if it cannot be resolved
 */
std::string resolve_url(const std::string& base, const std::string& href);

/**
 * @brief Lowercase copy of a string
 */
std::string to_lower(std::string s);
