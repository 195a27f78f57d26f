/**
 * @file chain.cpp
 * @brief Hash-linked audit trail
 */

#include "chain.h"
#include "core/digest.h"
#include "logging/console.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace logging {

using json = nlohmann::json;

namespace {

const char* const kGenesis = "sha256:genesis";

std::string utc_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    long ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000);

    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream out;
    out << buf << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return out.str();
}

std::string dump_line(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

json LogEntry::to_json() const {
    return {
        {"seq", seq},
        {"event_type", event_type},
        {"run_id", run_id},
        {"timestamp", timestamp},
        {"prev_hash", prev_hash},
        {"entry_hash", entry_hash},
        {"payload", payload}
    };
}

LogEntry LogEntry::from_json(const json& j) {
    LogEntry e;
    e.seq = j.value("seq", static_cast<uint64_t>(0));
    e.event_type = j.value("event_type", "");
    e.run_id = j.value("run_id", "");
    e.timestamp = j.value("timestamp", "");
    e.prev_hash = j.value("prev_hash", "");
    e.entry_hash = j.value("entry_hash", "");
    e.payload = j.value("payload", json::object());
    return e;
}

// Everything but entry_hash, as sorted-key JSON
std::string ChainLogger::hash_of(const LogEntry& entry) {
    json canonical = entry.to_json();
    canonical.erase("entry_hash");
    return "sha256:" + sha256_hex(dump_line(canonical));
}

ChainLogger::ChainLogger(const std::string& log_path, const std::string& run_id)
    : log_path_(log_path), run_id_(run_id)
{
    std::vector<LogEntry> existing = load(log_path_);
    if (!existing.empty()) {
        last_hash_ = existing.back().entry_hash;
        next_seq_ = existing.back().seq + 1;
    }

    out_.open(log_path_, std::ios::app);
    if (!out_.is_open()) {
        warn("audit log " + log_path_ + " is not writable; events will not be recorded");
    }
}

std::string ChainLogger::last_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_hash_;
}

bool ChainLogger::append(const std::string& event_type, const json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) return false;

    LogEntry entry;
    entry.seq = next_seq_;
    entry.event_type = event_type;
    entry.run_id = run_id_;
    entry.timestamp = utc_now();
    entry.prev_hash = last_hash_.empty() ? kGenesis : last_hash_;
    entry.payload = payload;
    entry.entry_hash = hash_of(entry);

    out_ << dump_line(entry.to_json()) << '\n';
    out_.flush();
    if (!out_) return false;

    last_hash_ = entry.entry_hash;
    ++next_seq_;
    return true;
}

std::vector<LogEntry> ChainLogger::load(const std::string& log_path) {
    std::vector<LogEntry> entries;
    std::ifstream in(log_path);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        try {
            entries.push_back(LogEntry::from_json(json::parse(line)));
        } catch (const json::exception& e) {
            warn("audit log " + log_path + ": skipping unreadable line: " + e.what());
        }
    }
    return entries;
}

bool ChainLogger::verify(const std::string& log_path, std::string& error) {
    std::ifstream in(log_path);
    if (!in.is_open()) {
        error = "cannot open " + log_path;
        return false;
    }

    std::string expected_prev = kGenesis;
    uint64_t index = 0;
    size_t line_no = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;

        LogEntry entry;
        try {
            entry = LogEntry::from_json(json::parse(line));
        } catch (const json::exception& e) {
            error = "line " + std::to_string(line_no) + " is not valid JSON: " + e.what();
            return false;
        }

        std::string at = " at entry " + std::to_string(index);
        if (entry.prev_hash != expected_prev) {
            error = "chain break" + at + ": prev_hash " + entry.prev_hash + ", expected " + expected_prev;
            return false;
        }
        if (entry.seq != index) {
            error = "sequence gap" + at + ": seq " + std::to_string(entry.seq);
            return false;
        }
        if (hash_of(entry) != entry.entry_hash) {
            error = "hash mismatch" + at + " (" + entry.event_type + ", " + entry.timestamp + ")";
            return false;
        }

        expected_prev = entry.entry_hash;
        ++index;
    }
    return true;
}

} // namespace logging
