#pragma once
#include <schema/probe_result.h>
#include <string>
#include <vector>
#include <mutex>
#include <nlohmann/json.hpp>
#include <fstream>

namespace logging {

// Append-only audit log for probe runs.
// Every line is one JSON entry that carries the hash of the entry before
// it, so edits or deletions break the chain and show up in verify().

struct LogEntry {
    std::string event_type;
    std::string run_id;
    std::string label;
    nlohmann::json payload;
    std::string prev_hash;
    std::string entry_hash;
    std::string timestamp;

    nlohmann::json to_json() const;
    static LogEntry from_json(const nlohmann::json& j);
};

class ChainLogger {
public:
    static constexpr const char* kGenesis = "sha256:genesis";

    /**
     * @brief Open (or continue) a chained log file
     * @param log_path Path to the JSONL file; an existing chain is continued
     * @param run_id Identifier of the current probe run
     */
    ChainLogger(const std::string& log_path, const std::string& run_id);

    /**
     * @brief Append an entry; safe to call from several threads
     * @param event_type Event name ("run_started", "probe_classified", ...)
     * @param payload Event data
     * @param label Target label the event refers to, empty for run events
     * @return true if the entry was written
     */
    bool append(const std::string& event_type, const nlohmann::json& payload, const std::string& label = "");

    /**
     * @brief Append a "probe_classified" entry for one result
     * @param result Classified result
     * @return true if the entry was written
     */
    bool append_result(const ClassifiedResult& result);

    std::string last_hash() const;

    bool is_open() const { return log_stream_.is_open(); }

    /**
     * @brief Check every hash and every link of a log file
     * @param log_path Log to check
     * @return true if the chain is intact (an empty log is valid)
     */
    static bool verify(const std::string& log_path);

    /**
     * @brief Read all entries of a log file, skipping unparseable lines
     */
    static std::vector<LogEntry> load(const std::string& log_path);

private:
    std::string log_path_;
    std::string run_id_;
    std::string last_hash_;
    std::ofstream log_stream_;
    mutable std::mutex mutex_;

    static std::string compute_hash(const LogEntry& entry);
    static std::string get_timestamp();
};

} // namespace logging
