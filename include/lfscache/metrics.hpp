#pragma once

#include "lfscache/stats.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace lfscache {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports lfs-cache metrics to a Prometheus textfile for node_exporter pickup.
///
/// Counters mirror a StatsAggregator: each write adds the delta since the
/// previous snapshot. Latency histograms are observed directly by workers.
/// A background writer thread serializes the registry to a .prom file using
/// atomic temp+rename.
class MetricsExporter {
public:
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    void set_stats(const StatsAggregator* stats) { stats_ = stats; }
    void set_in_flight_source(std::function<size_t()> source) { in_flight_source_ = std::move(source); }

    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Serialize now. Returns false if the file could not be written.
    bool write_file();

    prometheus::Histogram& cache_lookup_duration() { return *cache_lookup_duration_; }
    prometheus::Histogram& origin_transfer_duration() { return *origin_transfer_duration_; }

private:
    void writer_loop();
    void update_from_stats();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    const StatsAggregator* stats_ = nullptr;
    std::function<size_t()> in_flight_source_;
    std::mutex update_mutex_;
    StatsSnapshot prev_;

    // --- Counters ---
    prometheus::Counter* downloads_cache_;
    prometheus::Counter* downloads_origin_;
    prometheus::Counter* bytes_cache_;
    prometheus::Counter* bytes_origin_;
    prometheus::Counter* bytes_upload_;
    prometheus::Counter* uploads_;
    prometheus::Counter* failures_;
    prometheus::Counter* cache_stores_success_;
    prometheus::Counter* cache_stores_failure_;
    prometheus::Counter* cache_corrupt_;

    // --- Gauges ---
    prometheus::Gauge* transfers_in_flight_;

    // --- Histograms ---
    prometheus::Histogram* cache_lookup_duration_;
    prometheus::Histogram* origin_transfer_duration_;

    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace lfscache
