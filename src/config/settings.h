#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace config {

// Run configuration for apiscout.
// Loaded from a JSON or flat YAML file; keys that are absent keep their
// defaults, and command-line flags override whatever the file says.

struct Settings {
    // Transport
    long timeout_seconds;
    long connect_timeout_seconds;
    std::string user_agent;
    bool verify_tls;
    bool follow_redirects;
    long max_redirects;

    // Pipeline
    size_t concurrency;
    size_t note_limit;
    bool probe_secondary;

    // Files
    std::string catalog;        // Empty means the built-in catalog
    std::string report_path;
    std::string log_path;       // Empty disables the audit log

    static constexpr const char* kDefaultPath = "config/apiscout.yaml";

    /**
     * @brief Load settings from a YAML or JSON file
     * @param path Path to settings file
     * @return Loaded settings; defaults with a warning if the file cannot be opened
     * @throws std::runtime_error if a JSON value has the wrong type
     */
    static Settings load(const std::string& path);

    /**
     * @brief Get default settings
     * @return Default settings
     */
    static Settings get_default();

    /**
     * @brief Apply the keys of a parsed document on top of these settings
     * @param j JSON object; unknown keys are ignored
     */
    void apply(const nlohmann::json& j);

    nlohmann::json to_json() const;
};

} // namespace config
