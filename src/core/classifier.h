#pragma once
#include "content_parser.h"
#include <schema/probe_result.h>
#include <string>
#include <vector>

// Assigns exactly one Category to a probe outcome.
// Rules are evaluated in a fixed order and the first match wins:
//   1. transport failure                    -> UNREACHABLE
//   2. HTTP 401 / 403                       -> AUTH_REQUIRED
//   3. any other non-200 status             -> UNREACHABLE
//   4. 200 + JSON content type              -> JSON_API or MALFORMED
//   5. 200 + XML content type / XML sniff   -> XML_API or MALFORMED
//   6. everything else                      -> HTML_SCRAPABLE (links to bulk files are
//                                              collected, DeepScan inspects markup)
// classify() is a pure function of its input.

class Classifier {
public:
    struct Options {
        size_t note_limit;          // Cap for error text copied into notes
        size_t max_script_hints;    // Cap for script endpoint candidates per page
        size_t max_download_links;  // Cap for bulk download links per page

        Options()
            : note_limit(100),
              max_script_hints(10),
              max_download_links(20)
        {}
    };

    explicit Classifier(const Options& opts = Options());

    /**
     * @brief Classify one probe outcome
     * @param outcome Raw outcome from the prober
     * @return Classified result; secondary_targets is only populated for
     *         top-level DeepScan targets
     */
    ClassifiedResult classify(const ProbeOutcome& outcome) const;

    /**
     * @brief Whether a label names a target discovered by a deep scan
     * @param label Target label
     * @return true if the label contains "/discovered/"
     */
    static bool is_discovered_label(const std::string& label);

    /**
     * @brief Build the label for the n-th secondary target of a parent
     * @param parent Parent target label
     * @param n 1-based index
     * @return "<parent>/discovered/<n>"
     */
    static std::string discovered_label(const std::string& parent, size_t n);

    /**
     * @brief Whether a link points at a bulk data file
     * @param href Link target, absolute or relative
     * @return true if the path ends in .xml, .json, .zip, .tar, .tar.gz or .tgz
     */
    static bool is_download_link(const std::string& href);

    const Options& options() const { return opts_; }

private:
    Options opts_;

    /**
     * @brief Truncate text for a note, marking the cut with "..."
     */
    std::string truncate(const std::string& text) const;

    /**
     * @brief Classify a 200 response body by its claimed or sniffed format
     * @param outcome Successful outcome
     * @param result Result to fill (category and note)
     * @return true if a JSON/XML rule matched, false to fall through to HTML
     */
    bool classify_structured(const ProbeOutcome& outcome, ClassifiedResult& result) const;

    /**
     * @brief Collect anchors that link to bulk data files
     * @param scan Markup of the page
     * @param page_url URL links are resolved against
     * @param result Result receiving download_links and note text
     */
    void collect_downloads(const MarkupScan& scan, const std::string& page_url, ClassifiedResult& result) const;

    /**
     * @brief Inspect HTML markup for script endpoint hints and form targets
     * @param outcome Successful DeepScan outcome
     * @param scan Markup of the outcome body
     * @param result Result receiving hints, note text and secondary targets
     */
    void deep_scan(const ProbeOutcome& outcome, const MarkupScan& scan, ClassifiedResult& result) const;
};
