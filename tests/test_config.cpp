/**
 * @file test_config.cpp
 * @brief Unit tests for settings loading
 */

#include <catch2/catch.hpp>
#include "config/settings.h"
#include "helpers/http_test_helpers.h"
#include <fstream>
#include <stdexcept>

using config::Settings;

static std::string write_file(const std::string& name, const std::string& content) {
    std::string path = test_helpers::temp_path(name);
    std::ofstream out(path);
    out << content;
    return path;
}

TEST_CASE("Settings defaults", "[config]") {
    Settings s = Settings::get_default();
    REQUIRE(s.timeout_seconds == 12);
    REQUIRE(s.concurrency == 8);
    REQUIRE(s.note_limit == 100);
    REQUIRE_FALSE(s.verify_tls);
    REQUIRE(s.probe_secondary);
    REQUIRE(s.catalog.empty());
}

TEST_CASE("Settings fall back to defaults for a missing file", "[config]") {
    Settings s = Settings::load("/nonexistent/apiscout.yaml");
    REQUIRE(s.timeout_seconds == 12);
    REQUIRE(s.concurrency == 8);
}

TEST_CASE("Settings load from JSON", "[config]") {
    std::string path = write_file("apiscout_settings.json", R"({
        "timeout_seconds": 20,
        "concurrency": 4,
        "verify_tls": true,
        "catalog": "config/fixture_catalog.json",
        "log_path": ""
    })");
    Settings s = Settings::load(path);
    REQUIRE(s.timeout_seconds == 20);
    REQUIRE(s.concurrency == 4);
    REQUIRE(s.verify_tls);
    REQUIRE(s.catalog == "config/fixture_catalog.json");
    REQUIRE(s.log_path.empty());
    REQUIRE(s.max_redirects == 5);
}

TEST_CASE("Settings reject mistyped JSON values", "[config]") {
    std::string path = write_file("apiscout_settings_bad.json", R"({"concurrency": "many"})");
    REQUIRE_THROWS_AS(Settings::load(path), std::runtime_error);
}

TEST_CASE("Settings load from flat YAML", "[config]") {
    std::string path = write_file("apiscout_settings.yaml",
        "# probe settings\n"
        "timeout_seconds: 7\n"
        "concurrency: 0\n"
        "user_agent: \"apiscout-ci/1.0\"\n"
        "verify_tls: yes\n"
        "probe_secondary: false\n"
        "note_limit: 60   # shorter notes\n"
        "report_path: out/ci_report.json\n");
    Settings s = Settings::load(path);
    REQUIRE(s.timeout_seconds == 7);
    REQUIRE(s.concurrency == 1);
    REQUIRE(s.user_agent == "apiscout-ci/1.0");
    REQUIRE(s.verify_tls);
    REQUIRE_FALSE(s.probe_secondary);
    REQUIRE(s.note_limit == 60);
    REQUIRE(s.report_path == "out/ci_report.json");
    REQUIRE(s.connect_timeout_seconds == 5);
}

TEST_CASE("Settings ignore non-numeric YAML values", "[config]") {
    std::string path = write_file("apiscout_settings_nan.yaml", "timeout_seconds: soon\n");
    Settings s = Settings::load(path);
    REQUIRE(s.timeout_seconds == 12);
}
