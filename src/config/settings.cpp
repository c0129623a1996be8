// Loading of run settings from JSON or flat YAML files

#include "settings.h"
#include <fstream>
#include <iostream>
#include <regex>
#include <stdexcept>

namespace config {

using json = nlohmann::json;

Settings Settings::get_default() {
    Settings s;
    s.timeout_seconds = 12;
    s.connect_timeout_seconds = 5;
    s.user_agent = "apiscout/0.1";
    s.verify_tls = false;
    s.follow_redirects = true;
    s.max_redirects = 5;

    s.concurrency = 8;
    s.note_limit = 100;
    s.probe_secondary = true;

    s.catalog = "";
    s.report_path = "out/apiscout_report.json";
    s.log_path = "out/apiscout.log.jsonl";
    return s;
}

// Simple YAML parser helpers - extract the scalar for a top-level key
static bool find_yaml_scalar(const std::string& yaml, const std::string& key, std::string& out) {
    std::regex rx("(^|\\n)" + key + "\\s*:[ \\t]*([^\\n#]*)");
    std::smatch m;
    if (!std::regex_search(yaml, m, rx)) return false;

    std::string value = m[2].str();
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) {
        value.pop_back();
    }
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.size() - 2);
    }
    out = value;
    return true;
}

static long parse_yaml_int(const std::string& yaml, const std::string& key, long defv) {
    std::string value;
    if (!find_yaml_scalar(yaml, key, value)) return defv;
    try {
        size_t pos = 0;
        long parsed = std::stol(value, &pos);
        return pos == value.size() ? parsed : defv;
    } catch (const std::exception&) {
        std::cerr << "Warning: ignoring non-numeric value for " << key << ": " << value << "\n";
        return defv;
    }
}

static bool parse_yaml_bool(const std::string& yaml, const std::string& key, bool defv) {
    std::string value;
    if (!find_yaml_scalar(yaml, key, value)) return defv;
    if (value == "true" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "no" || value == "off") return false;
    std::cerr << "Warning: ignoring non-boolean value for " << key << ": " << value << "\n";
    return defv;
}

static std::string parse_yaml_string(const std::string& yaml, const std::string& key, const std::string& defv) {
    std::string value;
    return find_yaml_scalar(yaml, key, value) ? value : defv;
}

void Settings::apply(const json& j) {
    try {
        timeout_seconds = j.value("timeout_seconds", timeout_seconds);
        connect_timeout_seconds = j.value("connect_timeout_seconds", connect_timeout_seconds);
        user_agent = j.value("user_agent", user_agent);
        verify_tls = j.value("verify_tls", verify_tls);
        follow_redirects = j.value("follow_redirects", follow_redirects);
        max_redirects = j.value("max_redirects", max_redirects);
        long workers = j.value("concurrency", static_cast<long>(concurrency));
        concurrency = workers < 1 ? 1 : static_cast<size_t>(workers);
        long limit = j.value("note_limit", static_cast<long>(note_limit));
        if (limit >= 0) note_limit = static_cast<size_t>(limit);
        probe_secondary = j.value("probe_secondary", probe_secondary);
        catalog = j.value("catalog", catalog);
        report_path = j.value("report_path", report_path);
        log_path = j.value("log_path", log_path);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid settings value: ") + e.what());
    }
}

// Load settings from file (supports both YAML and JSON)
Settings Settings::load(const std::string& path) {
    Settings s = get_default();

    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "Warning: Could not open config file " << path << ", using defaults\n";
        return s;
    }

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());

    // Try parsing as JSON first
    json j = json::parse(content, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        s.apply(j);
        return s;
    }

    // Fall back to flat "key: value" YAML
    s.timeout_seconds = parse_yaml_int(content, "timeout_seconds", s.timeout_seconds);
    s.connect_timeout_seconds = parse_yaml_int(content, "connect_timeout_seconds", s.connect_timeout_seconds);
    s.user_agent = parse_yaml_string(content, "user_agent", s.user_agent);
    s.verify_tls = parse_yaml_bool(content, "verify_tls", s.verify_tls);
    s.follow_redirects = parse_yaml_bool(content, "follow_redirects", s.follow_redirects);
    s.max_redirects = parse_yaml_int(content, "max_redirects", s.max_redirects);

    long concurrency = parse_yaml_int(content, "concurrency", static_cast<long>(s.concurrency));
    s.concurrency = concurrency < 1 ? 1 : static_cast<size_t>(concurrency);
    long note_limit = parse_yaml_int(content, "note_limit", static_cast<long>(s.note_limit));
    s.note_limit = note_limit < 0 ? s.note_limit : static_cast<size_t>(note_limit);
    s.probe_secondary = parse_yaml_bool(content, "probe_secondary", s.probe_secondary);

    s.catalog = parse_yaml_string(content, "catalog", s.catalog);
    s.report_path = parse_yaml_string(content, "report_path", s.report_path);
    s.log_path = parse_yaml_string(content, "log_path", s.log_path);
    return s;
}

json Settings::to_json() const {
    json j;
    j["timeout_seconds"] = timeout_seconds;
    j["connect_timeout_seconds"] = connect_timeout_seconds;
    j["user_agent"] = user_agent;
    j["verify_tls"] = verify_tls;
    j["follow_redirects"] = follow_redirects;
    j["max_redirects"] = max_redirects;
    j["concurrency"] = concurrency;
    j["note_limit"] = note_limit;
    j["probe_secondary"] = probe_secondary;
    j["catalog"] = catalog;
    j["report_path"] = report_path;
    j["log_path"] = log_path;
    return j;
}

} // namespace config
