/**
 * @file chain.cpp
 * @brief Hash-chained JSONL audit log for probe runs
 */

#include "chain.h"
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <iostream>
#include <filesystem>

namespace logging {

using json = nlohmann::json;

json LogEntry::to_json() const {
    json j;
    j["event_type"] = event_type;
    j["run_id"] = run_id;
    j["timestamp"] = timestamp;
    j["prev_hash"] = prev_hash;
    j["entry_hash"] = entry_hash;
    j["payload"] = payload;
    if (!label.empty()) {
        j["label"] = label;
    }
    return j;
}

LogEntry LogEntry::from_json(const json& j) {
    LogEntry entry;
    entry.event_type = j.value("event_type", "");
    entry.run_id = j.value("run_id", "");
    entry.label = j.value("label", "");
    entry.timestamp = j.value("timestamp", "");
    entry.prev_hash = j.value("prev_hash", "");
    entry.entry_hash = j.value("entry_hash", "");
    entry.payload = j.value("payload", json::object());
    return entry;
}

ChainLogger::ChainLogger(const std::string& log_path, const std::string& run_id)
    : log_path_(log_path), run_id_(run_id) {

    std::filesystem::path parent = std::filesystem::path(log_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    // Continue an existing chain
    auto entries = load(log_path);
    if (!entries.empty()) {
        last_hash_ = entries.back().entry_hash;
    }

    log_stream_.open(log_path_, std::ios::app);
    if (!log_stream_.is_open()) {
        std::cerr << "Warning: cannot open audit log " << log_path_ << "\n";
    }
}

std::string ChainLogger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm;
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string ChainLogger::compute_hash(const LogEntry& entry) {
    // prev_hash | timestamp | event | run | label | compact payload
    std::ostringstream canonical;
    canonical << entry.prev_hash;
    canonical << entry.timestamp;
    canonical << entry.event_type;
    canonical << entry.run_id;
    canonical << entry.label;
    canonical << entry.payload.dump(-1, ' ', false, json::error_handler_t::replace);

    std::string data = canonical.str();

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::ostringstream hex;
    hex << "sha256:";
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return hex.str();
}

bool ChainLogger::append(const std::string& event_type, const json& payload, const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!log_stream_.is_open()) {
        return false;
    }

    LogEntry entry;
    entry.event_type = event_type;
    entry.run_id = run_id_;
    entry.label = label;
    entry.timestamp = get_timestamp();
    entry.prev_hash = last_hash_.empty() ? kGenesis : last_hash_;
    entry.payload = payload;
    entry.entry_hash = compute_hash(entry);

    log_stream_ << entry.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    log_stream_.flush();
    if (!log_stream_) {
        return false;
    }

    last_hash_ = entry.entry_hash;
    return true;
}

bool ChainLogger::append_result(const ClassifiedResult& result) {
    json payload;
    payload["category"] = to_string(result.category);
    payload["url"] = result.url;
    payload["status_code"] = result.status_code;
    payload["note"] = result.note;
    payload["secondary_targets"] = result.secondary_targets.size();
    return append("probe_classified", payload, result.target_label);
}

std::string ChainLogger::last_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_hash_;
}

std::vector<LogEntry> ChainLogger::load(const std::string& log_path) {
    std::vector<LogEntry> entries;
    std::ifstream in(log_path);
    if (!in.is_open()) {
        return entries;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            std::cerr << "Skipping unparseable log line\n";
            continue;
        }
        entries.push_back(LogEntry::from_json(j));
    }
    return entries;
}

bool ChainLogger::verify(const std::string& log_path) {
    auto entries = load(log_path);

    if (entries.empty()) {
        std::cout << "Log is empty (valid)\n";
        return true;
    }

    if (entries[0].prev_hash != kGenesis) {
        std::cerr << "   First entry does not start the chain\n";
        std::cerr << "   Expected: " << kGenesis << "\n";
        std::cerr << "   Got: " << entries[0].prev_hash << "\n";
        return false;
    }

    for (size_t i = 0; i < entries.size(); i++) {
        const auto& entry = entries[i];

        std::string computed = compute_hash(entry);
        if (computed != entry.entry_hash) {
            std::cerr << "   Hash mismatch at entry " << i << " (" << entry.event_type;
            if (!entry.label.empty()) std::cerr << " " << entry.label;
            std::cerr << ")\n";
            std::cerr << "   Stored:   " << entry.entry_hash << "\n";
            std::cerr << "   Computed: " << computed << "\n";
            return false;
        }

        if (i > 0 && entry.prev_hash != entries[i - 1].entry_hash) {
            std::cerr << "   Chain break at entry " << i << "\n";
            std::cerr << "   prev_hash: " << entry.prev_hash << "\n";
            std::cerr << "   previous entry_hash: " << entries[i - 1].entry_hash << "\n";
            return false;
        }
    }

    std::cout << "Log verified: " << entries.size() << " entries, chain intact\n";
    return true;
}

} // namespace logging
