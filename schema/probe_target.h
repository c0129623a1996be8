#pragma once
#include <map>
#include <string>

/**
 * @file probe_target.h
 * @brief Data structure describing one endpoint to probe
 *
 * Targets are defined once when the catalog is built and are never
 * modified afterwards. Secondary targets discovered by a deep scan use
 * the same structure.
 */

enum class ProbeVariant {
    PLAIN,
    FOLLOW_FORM,
    DEEP_SCAN
};

enum class ResponseHint {
    NONE,
    EXPECT_JSON,
    EXPECT_XML
};

struct ProbeTarget {
    std::string label;
    std::string url;
    std::map<std::string, std::string> params;
    ProbeVariant variant = ProbeVariant::PLAIN;
    ResponseHint hint = ResponseHint::NONE;
};

inline const char* to_string(ProbeVariant v) {
    switch (v) {
        case ProbeVariant::PLAIN:       return "plain";
        case ProbeVariant::FOLLOW_FORM: return "follow_form";
        case ProbeVariant::DEEP_SCAN:   return "deep_scan";
    }
    return "plain";
}

inline const char* to_string(ResponseHint h) {
    switch (h) {
        case ResponseHint::NONE:        return "none";
        case ResponseHint::EXPECT_JSON: return "json";
        case ResponseHint::EXPECT_XML:  return "xml";
    }
    return "none";
}
