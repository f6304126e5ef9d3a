#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace lfscache {

/// One completed transfer, as persisted in a run's .jsonl log.
struct TransferRecord {
    std::string operation;  // "download" or "upload"
    std::string oid;
    uint64_t size = 0;
    std::optional<std::string> cache_backend;   // set when served from the cache
    std::optional<std::string> cache_location;
    std::chrono::system_clock::time_point start;
    std::chrono::system_clock::time_point finish;
};

/// Append-only JSON-lines log of completed transfers for one agent run.
class TransferLog {
public:
    /// Opens <logs_dir>/<timestamp>-<pid>.jsonl. Throws std::runtime_error
    /// if the file cannot be created.
    explicit TransferLog(const std::filesystem::path& logs_dir);

    TransferLog(const TransferLog&) = delete;
    TransferLog& operator=(const TransferLog&) = delete;

    /// Thread-safe. Returns false if the line could not be written.
    bool append(const TransferRecord& record);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
    std::ofstream out_;
};

/// File stem shared by a run's .jsonl and .log files.
std::string run_file_stem();

std::string format_timestamp(std::chrono::system_clock::time_point tp);

struct StatLine {
    uint64_t objects = 0;
    uint64_t bytes = 0;

    void add(uint64_t size) {
        ++objects;
        bytes += size;
    }
    std::string to_string() const;  // "N objects (SIZE)"
};

struct TransferReport {
    StatLine total;
    StatLine hit;
    StatLine miss;
    size_t files = 0;
    size_t malformed_lines = 0;

    std::string format() const;
};

/// Aggregate every .jsonl transfer log in `logs_dir`. A missing directory
/// yields an empty report.
TransferReport summarize_transfer_logs(const std::filesystem::path& logs_dir);

}  // namespace lfscache
