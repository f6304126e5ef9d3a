#pragma once

#include "lfscache/channel.hpp"
#include "lfscache/constants.hpp"
#include "lfscache/retry.hpp"
#include "lfscache/transfer.hpp"

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lfscache {

class CacheStore;
class MetricsExporter;
class OriginTransport;
class StatsAggregator;
class TransferLog;

struct OrchestratorOptions {
    size_t concurrency = constants::DEFAULT_CONCURRENT_TRANSFERS;
    std::filesystem::path temp_dir;
    RetryPolicy cache_retry;  // cache get/put; origin retries live in OriginTransport
    uint64_t progress_interval = constants::PROGRESS_INTERVAL_BYTES;
};

/// Runs admitted transfers on a fixed worker pool, cache first and origin
/// second, and reports exactly one outcome per request.
///
/// At most `concurrency` transfers are in flight; dispatch() blocks the
/// caller while all slots are taken. Callbacks are invoked from worker
/// threads and must be thread-safe.
class TransferOrchestrator {
public:
    using ProgressSink = std::function<void(const ProgressUpdate&)>;
    using CompletionSink = std::function<void(const TransferOutcome&)>;

    /// `cache` may be null (origin only). All referenced objects must
    /// outlive the orchestrator.
    TransferOrchestrator(OrchestratorOptions options, CacheStore* cache,
                         const OriginTransport& origin, StatsAggregator& stats,
                         ProgressSink on_progress, CompletionSink on_complete);
    ~TransferOrchestrator();

    TransferOrchestrator(const TransferOrchestrator&) = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

    void set_transfer_log(TransferLog* log) { transfer_log_ = log; }
    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Admit one transfer. Blocks while `concurrency` transfers are in flight.
    /// Returns false after drain() has started.
    bool dispatch(TransferRequest request);

    /// Stop admitting, wait for every admitted transfer to report, and join
    /// the workers. Idempotent.
    void drain();

    /// Run one transfer on the calling thread.
    TransferOutcome execute(const TransferRequest& request);

    size_t in_flight() const;
    size_t concurrency() const { return options_.concurrency; }
    const std::filesystem::path& temp_dir() const { return options_.temp_dir; }

private:
    void worker_loop();
    void release_slot();

    TransferOutcome download(const TransferRequest& request);
    TransferOutcome upload(const TransferRequest& request);
    /// `replace` overwrites an entry that failed verification.
    bool populate_cache(const std::string& oid, const std::filesystem::path& source, bool replace);
    TransferOutcome fail(const TransferRequest& request, int code, const std::string& message);

    OrchestratorOptions options_;
    CacheStore* cache_;
    const OriginTransport& origin_;
    StatsAggregator& stats_;
    TransferLog* transfer_log_ = nullptr;
    MetricsExporter* metrics_ = nullptr;
    ProgressSink on_progress_;
    CompletionSink on_complete_;

    Channel<TransferRequest> queue_;
    std::vector<std::thread> workers_;

    mutable std::mutex slot_mutex_;
    std::condition_variable slot_cv_;
    size_t active_ = 0;
    bool draining_ = false;
};

}  // namespace lfscache
