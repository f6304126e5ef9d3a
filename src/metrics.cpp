#include "lfscache/metrics.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace lfscache {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& downloads_family = prometheus::BuildCounter()
        .Name("lfscache_downloads_total")
        .Help("Completed downloads by source")
        .Labels(labels)
        .Register(*registry_);
    downloads_cache_ = &downloads_family.Add({{"source", "cache"}});
    downloads_origin_ = &downloads_family.Add({{"source", "origin"}});

    auto& bytes_family = prometheus::BuildCounter()
        .Name("lfscache_transfer_bytes_total")
        .Help("Object bytes moved by source")
        .Labels(labels)
        .Register(*registry_);
    bytes_cache_ = &bytes_family.Add({{"source", "cache"}});
    bytes_origin_ = &bytes_family.Add({{"source", "origin"}});
    bytes_upload_ = &bytes_family.Add({{"source", "upload"}});

    uploads_ = &prometheus::BuildCounter()
        .Name("lfscache_uploads_total")
        .Help("Completed uploads")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    failures_ = &prometheus::BuildCounter()
        .Name("lfscache_failures_total")
        .Help("Transfers reported to the host as failed")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& stores_family = prometheus::BuildCounter()
        .Name("lfscache_cache_stores_total")
        .Help("Cache population attempts")
        .Labels(labels)
        .Register(*registry_);
    cache_stores_success_ = &stores_family.Add({{"result", "success"}});
    cache_stores_failure_ = &stores_family.Add({{"result", "failure"}});

    cache_corrupt_ = &prometheus::BuildCounter()
        .Name("lfscache_cache_corrupt_total")
        .Help("Cache hits rejected by digest verification")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    transfers_in_flight_ = &prometheus::BuildGauge()
        .Name("lfscache_transfers_in_flight")
        .Help("Transfers admitted and not yet completed")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    cache_lookup_duration_ = &prometheus::BuildHistogram()
        .Name("lfscache_cache_lookup_duration_seconds")
        .Help("Cache lookup duration in seconds, including the copy on a hit")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1, 5, 10, 30});

    origin_transfer_duration_ = &prometheus::BuildHistogram()
        .Name("lfscache_origin_transfer_duration_seconds")
        .Help("Origin download/upload duration in seconds, including retries")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
        // Final snapshot
        write_file();
    }
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

void MetricsExporter::update_from_stats() {
    std::lock_guard lock(update_mutex_);

    if (in_flight_source_) {
        transfers_in_flight_->Set(static_cast<double>(in_flight_source_()));
    }
    if (!stats_) return;

    auto s = stats_->snapshot();
    // Increment counters by deltas since last snapshot
    auto bump = [](prometheus::Counter* counter, uint64_t now, uint64_t& prev) {
        if (now > prev) {
            counter->Increment(static_cast<double>(now - prev));
            prev = now;
        }
    };
    bump(downloads_cache_, s.cache_hits, prev_.cache_hits);
    bump(downloads_origin_, s.origin_fetches, prev_.origin_fetches);
    bump(bytes_cache_, s.cache_hit_bytes, prev_.cache_hit_bytes);
    bump(bytes_origin_, s.origin_fetch_bytes, prev_.origin_fetch_bytes);
    bump(bytes_upload_, s.upload_bytes, prev_.upload_bytes);
    bump(uploads_, s.uploads, prev_.uploads);
    bump(failures_, s.failures, prev_.failures);
    bump(cache_stores_success_, s.cache_stores, prev_.cache_stores);
    bump(cache_stores_failure_, s.cache_store_failures, prev_.cache_store_failures);
    bump(cache_corrupt_, s.cache_corrupt, prev_.cache_corrupt);
}

bool MetricsExporter::write_file() {
    update_from_stats();

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return false;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    return !ec;
}

}  // namespace lfscache
