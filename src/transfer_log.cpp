#include "lfscache/transfer_log.hpp"
#include "lfscache/logging.hpp"
#include "lfscache/stats.hpp"

#include <cstdio>
#include <ctime>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <unistd.h>

namespace lfscache {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                      tp.time_since_epoch()).count() % 1000000;
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%06dZ", stamp, static_cast<int>(micros));
    return out;
}

std::string run_file_stem() {
    std::time_t t = std::time(nullptr);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%SZ", &tm_buf);
    return std::string(stamp) + "-" + std::to_string(getpid());
}

// --- TransferLog ---

TransferLog::TransferLog(const std::filesystem::path& logs_dir)
    : path_(logs_dir / (run_file_stem() + ".jsonl")) {
    std::filesystem::create_directories(logs_dir);
    out_.open(path_, std::ios::app);
    if (!out_) {
        throw std::runtime_error("cannot open transfer log " + path_.string());
    }
}

bool TransferLog::append(const TransferRecord& record) {
    nlohmann::json j;
    j["operation"] = record.operation;
    j["oid"] = record.oid;
    j["size"] = record.size;
    if (record.cache_backend) {
        j["cache"] = {{"backend", *record.cache_backend},
                      {"location", record.cache_location.value_or("")}};
    } else {
        j["cache"] = nullptr;
    }
    j["start"] = format_timestamp(record.start);
    j["finish"] = format_timestamp(record.finish);

    std::lock_guard lock(mutex_);
    out_ << j.dump() << '\n';
    out_.flush();
    return static_cast<bool>(out_);
}

// --- Report ---

std::string StatLine::to_string() const {
    return std::to_string(objects) + " objects (" + format_size(bytes) + ")";
}

std::string TransferReport::format() const {
    return "total: " + total.to_string() + "\n" +
           "hit: " + hit.to_string() + "\n" +
           "miss: " + miss.to_string() + "\n";
}

TransferReport summarize_transfer_logs(const std::filesystem::path& logs_dir) {
    TransferReport report;
    std::error_code ec;
    if (!std::filesystem::is_directory(logs_dir, ec)) return report;

    for (const auto& entry : std::filesystem::directory_iterator(logs_dir, ec)) {
        if (entry.path().extension() != ".jsonl") continue;
        std::ifstream in(entry.path());
        if (!in) {
            log_warn("cannot read transfer log %s", entry.path().c_str());
            continue;
        }
        ++report.files;

        std::string line;
        while (std::getline(in, line)) {
            if (line.empty()) continue;
            auto j = nlohmann::json::parse(line, nullptr, false);
            if (j.is_discarded() || !j.is_object() || !j.contains("size") ||
                !j["size"].is_number_unsigned()) {
                ++report.malformed_lines;
                continue;
            }
            uint64_t size = j["size"].get<uint64_t>();
            report.total.add(size);
            if (j.contains("cache") && !j["cache"].is_null()) {
                report.hit.add(size);
            } else {
                report.miss.add(size);
            }
        }
    }
    return report;
}

}  // namespace lfscache
