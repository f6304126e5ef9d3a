#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace lfscache {

struct StatsSnapshot {
    uint64_t cache_hits = 0;
    uint64_t cache_hit_bytes = 0;
    uint64_t origin_fetches = 0;
    uint64_t origin_fetch_bytes = 0;
    uint64_t uploads = 0;
    uint64_t upload_bytes = 0;
    uint64_t cache_stores = 0;
    uint64_t cache_store_failures = 0;
    uint64_t cache_corrupt = 0;
    uint64_t failures = 0;
    uint64_t cache_lookup_micros = 0;  // summed over all lookups
    uint64_t cache_lookups = 0;
    uint64_t origin_micros = 0;        // summed over origin transfers
};

/// Process-wide transfer counters. Updated concurrently by workers and read
/// at any time without stopping them.
class StatsAggregator {
public:
    void record_cache_lookup(std::chrono::microseconds latency);
    void record_cache_hit(uint64_t bytes);
    void record_origin_fetch(uint64_t bytes, std::chrono::microseconds latency);
    void record_upload(uint64_t bytes, std::chrono::microseconds latency);
    void record_cache_store(bool success);
    void record_cache_corrupt();
    void record_failure();

    StatsSnapshot snapshot() const;

    /// One-line summary for the log at shutdown.
    std::string summary() const;

private:
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> cache_hit_bytes_{0};
    std::atomic<uint64_t> origin_fetches_{0};
    std::atomic<uint64_t> origin_fetch_bytes_{0};
    std::atomic<uint64_t> uploads_{0};
    std::atomic<uint64_t> upload_bytes_{0};
    std::atomic<uint64_t> cache_stores_{0};
    std::atomic<uint64_t> cache_store_failures_{0};
    std::atomic<uint64_t> cache_corrupt_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> cache_lookup_micros_{0};
    std::atomic<uint64_t> cache_lookups_{0};
    std::atomic<uint64_t> origin_micros_{0};
};

/// Binary-unit size, e.g. "512 B", "64 KiB", "1.50 MiB".
std::string format_size(uint64_t bytes);

}  // namespace lfscache
