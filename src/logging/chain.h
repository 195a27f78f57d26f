#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @file chain.h
 * @brief Scan audit trail kept as hash-linked JSON lines
 *
 * One line per event (scan_start, crawl_complete, module_result,
 * hook_error, scan_complete, scan_failed). Every line names the hash of
 * the line before it and carries a sequence number, so an edited,
 * dropped or moved line is caught by verify().
 */

namespace logging {

struct LogEntry {
    uint64_t seq = 0;           // position in the file, from 0
    std::string event_type;
    std::string run_id;
    std::string timestamp;      // UTC, millisecond precision
    std::string prev_hash;      // "sha256:genesis" for the first line
    std::string entry_hash;
    nlohmann::json payload = nlohmann::json::object();

    nlohmann::json to_json() const;
    static LogEntry from_json(const nlohmann::json& j);
};

class ChainLogger {
public:
    /**
     * @brief Open (or create) an audit file for appending
     *
     * When the file already holds entries the new ones link onto the last.
     */
    ChainLogger(const std::string& log_path, const std::string& run_id);

    /**
     * @brief Write one event
     * @return false when the file is not writable
     *
     * Thread-safe.
     */
    bool append(const std::string& event_type, const nlohmann::json& payload);

    /// Hash of the newest line, empty before the first append to a new file
    std::string last_hash() const;

    const std::string& run_id() const { return run_id_; }

    /**
     * @brief Check every link of an audit file
     * @param error First problem found: unreadable file, unparsable line,
     *              broken link, sequence gap or hash mismatch
     */
    static bool verify(const std::string& log_path, std::string& error);

    static bool verify(const std::string& log_path) {
        std::string ignored;
        return verify(log_path, ignored);
    }

    /// Entries of an audit file; lines that do not parse are skipped
    static std::vector<LogEntry> load(const std::string& log_path);

    static std::string hash_of(const LogEntry& entry);

private:
    std::string log_path_;
    std::string run_id_;
    std::string last_hash_;
    uint64_t next_seq_ = 0;
    std::ofstream out_;
    mutable std::mutex mutex_;
};

} // namespace logging
