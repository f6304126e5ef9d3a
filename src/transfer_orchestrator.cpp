#include "lfscache/transfer_orchestrator.hpp"
#include "lfscache/cache_store.hpp"
#include "lfscache/logging.hpp"
#include "lfscache/metrics.hpp"
#include "lfscache/oid.hpp"
#include "lfscache/origin_transport.hpp"
#include "lfscache/stats.hpp"
#include "lfscache/transfer_log.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <unistd.h>

namespace lfscache {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::microseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

/// Uniquely named file in the temp dir that is removed unless released.
class StagingFile {
public:
    StagingFile(const std::filesystem::path& dir, const std::string& oid) {
        std::string tpl = (dir / (oid + ".part.XXXXXX")).string();
        int fd = mkstemp(tpl.data());
        if (fd < 0) {
            error_ = "cannot create staging file in " + dir.string() + ": " + std::strerror(errno);
            return;
        }
        close(fd);
        path_ = tpl;
    }

    ~StagingFile() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
    }

    StagingFile(const StagingFile&) = delete;
    StagingFile& operator=(const StagingFile&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::string& error() const { return error_; }
    const std::filesystem::path& path() const { return path_; }

    /// Atomically move into place. On success the staging file is gone.
    bool install(const std::filesystem::path& dest, std::string& error) {
        std::error_code ec;
        std::filesystem::rename(path_, dest, ec);
        if (ec) {
            error = "cannot install " + dest.string() + ": " + ec.message();
            return false;
        }
        path_.clear();
        return true;
    }

private:
    std::filesystem::path path_;
    std::string error_;
};

/// Turns cumulative byte counts into throttled progress events. A retried
/// attempt restarts from zero; nothing is reported until it passes the
/// previous high-water mark, so bytesSoFar never decreases.
class ProgressThrottle {
public:
    ProgressThrottle(std::string oid, uint64_t interval,
                     const TransferOrchestrator::ProgressSink& sink)
        : oid_(std::move(oid)), interval_(interval), sink_(sink) {}

    void update(uint64_t bytes_so_far) {
        if (!sink_ || bytes_so_far < reported_ + interval_) return;
        emit(bytes_so_far);
    }

    void finish(uint64_t total) {
        if (sink_ && total > reported_) emit(total);
    }

private:
    void emit(uint64_t bytes_so_far) {
        sink_(ProgressUpdate{oid_, bytes_so_far, bytes_so_far - reported_});
        reported_ = bytes_so_far;
    }

    std::string oid_;
    uint64_t interval_;
    const TransferOrchestrator::ProgressSink& sink_;
    uint64_t reported_ = 0;
};

int error_code_for(const OriginResult& result) {
    switch (result.failure) {
        case TransferFailure::Expired: return constants::ERROR_CODE_EXPIRED;
        case TransferFailure::Integrity: return constants::ERROR_CODE_INTEGRITY;
        default: break;
    }
    if (result.http_status > 0) return result.http_status;
    return constants::ERROR_CODE_INTERNAL;
}

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

TransferOrchestrator::TransferOrchestrator(OrchestratorOptions options, CacheStore* cache,
                                           const OriginTransport& origin, StatsAggregator& stats,
                                           ProgressSink on_progress, CompletionSink on_complete)
    : options_(std::move(options))
    , cache_(cache)
    , origin_(origin)
    , stats_(stats)
    , on_progress_(std::move(on_progress))
    , on_complete_(std::move(on_complete)) {
    if (options_.concurrency == 0) options_.concurrency = 1;
    if (options_.concurrency > constants::MAX_CONCURRENT_TRANSFERS) {
        options_.concurrency = constants::MAX_CONCURRENT_TRANSFERS;
    }
    if (options_.progress_interval == 0) options_.progress_interval = constants::PROGRESS_INTERVAL_BYTES;

    workers_.reserve(options_.concurrency);
    for (size_t i = 0; i < options_.concurrency; ++i) {
        workers_.emplace_back(&TransferOrchestrator::worker_loop, this);
    }
    log_debug("Orchestrator started: %zu workers, temp dir %s, cache %s", options_.concurrency,
              options_.temp_dir.c_str(), cache_ ? cache_->describe().c_str() : "(none)");
}

TransferOrchestrator::~TransferOrchestrator() {
    drain();
}

bool TransferOrchestrator::dispatch(TransferRequest request) {
    {
        std::unique_lock lock(slot_mutex_);
        slot_cv_.wait(lock, [this] { return draining_ || active_ < options_.concurrency; });
        if (draining_) return false;
        ++active_;
    }
    if (!queue_.push(std::move(request))) {
        release_slot();
        return false;
    }
    return true;
}

void TransferOrchestrator::drain() {
    {
        std::lock_guard lock(slot_mutex_);
        if (draining_ && workers_.empty()) return;
        draining_ = true;
    }
    slot_cv_.notify_all();
    queue_.close();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

size_t TransferOrchestrator::in_flight() const {
    std::lock_guard lock(slot_mutex_);
    return active_;
}

void TransferOrchestrator::release_slot() {
    {
        std::lock_guard lock(slot_mutex_);
        --active_;
    }
    slot_cv_.notify_all();
}

void TransferOrchestrator::worker_loop() {
    while (auto request = queue_.pop()) {
        auto outcome = execute(*request);
        if (on_complete_) on_complete_(outcome);
        release_slot();
    }
}

TransferOutcome TransferOrchestrator::execute(const TransferRequest& request) {
    try {
        if (!is_valid_oid(request.oid)) {
            return fail(request, constants::ERROR_CODE_BAD_REQUEST,
                        "invalid object id '" + request.oid + "'");
        }
        return request.operation == Operation::Upload ? upload(request) : download(request);
    } catch (const std::exception& e) {
        log_error("%s %s: unexpected error: %s", operation_name(request.operation),
                  request.oid.c_str(), e.what());
        return fail(request, constants::ERROR_CODE_INTERNAL, e.what());
    }
}

TransferOutcome TransferOrchestrator::fail(const TransferRequest& request, int code,
                                           const std::string& message) {
    stats_.record_failure();
    log_error("%s %s failed (%d): %s", operation_name(request.operation), request.oid.c_str(),
              code, message.c_str());
    return TransferOutcome::failed(request.oid, code, message);
}

// ============================================================================
// Download
// ============================================================================

TransferOutcome TransferOrchestrator::download(const TransferRequest& request) {
    const auto& oid = request.oid;
    auto started = std::chrono::system_clock::now();

    StagingFile staging(options_.temp_dir, oid);
    if (!staging.ok()) {
        return fail(request, constants::ERROR_CODE_INTERNAL, staging.error());
    }

    ProgressThrottle progress(oid, options_.progress_interval, on_progress_);
    bool from_cache = false;
    bool cache_corrupt = false;

    // --- Cache lookup ---
    if (cache_) {
        auto lookup_start = Clock::now();
        CacheGetResult got;
        {
            std::optional<ScopedTimer> timer;
            if (metrics_) timer.emplace(metrics_->cache_lookup_duration());
            got = options_.cache_retry.run(
                [&] { return cache_->get(oid, staging.path()); }, TransientFailure{},
                [&](const CacheGetResult& r, size_t attempt, std::chrono::milliseconds delay) {
                    log_warn("cache get %s attempt %zu failed (%s), retrying in %lld ms",
                             oid.c_str(), attempt, r.error_message.c_str(),
                             static_cast<long long>(delay.count()));
                });
        }
        stats_.record_cache_lookup(since(lookup_start));

        switch (got.status) {
            case CacheLookup::Hit: {
                std::string why;
                if (verify_file(staging.path(), oid, request.size, &why)) {
                    from_cache = true;
                } else {
                    cache_corrupt = true;
                    stats_.record_cache_corrupt();
                    log_warn("cache entry for %s is corrupt (%s), fetching from origin",
                             oid.c_str(), why.c_str());
                }
                break;
            }
            case CacheLookup::Miss:
                log_debug("cache %s for %s", cache_lookup_name(got.status), oid.c_str());
                break;
            case CacheLookup::Error:
                log_warn("cache lookup for %s failed (%s), fetching from origin", oid.c_str(),
                         got.error_message.c_str());
                break;
        }
    }

    // --- Origin fetch ---
    if (!from_cache) {
        if (!request.action) {
            return fail(request, constants::ERROR_CODE_BAD_REQUEST,
                        "no download action for " + oid);
        }
        auto fetch_start = Clock::now();
        OriginResult fetched;
        {
            std::optional<ScopedTimer> timer;
            if (metrics_) timer.emplace(metrics_->origin_transfer_duration());
            fetched = origin_.download(oid, request.size, *request.action, staging.path(),
                                       [&](uint64_t n) { progress.update(n); });
        }
        if (!fetched.success) {
            if (fetched.failure == TransferFailure::Integrity) {
                log_warn("origin returned bad content for %s: %s", oid.c_str(),
                         fetched.error_message.c_str());
            } else {
                log_debug("origin fetch for %s failed (%s): %s", oid.c_str(),
                          transfer_failure_name(fetched.failure), fetched.error_message.c_str());
            }
            return fail(request, error_code_for(fetched), fetched.error_message);
        }
        stats_.record_origin_fetch(request.size, since(fetch_start));

        if (cache_) {
            stats_.record_cache_store(populate_cache(oid, staging.path(), cache_corrupt));
        }
    } else {
        stats_.record_cache_hit(request.size);
    }

    progress.finish(request.size);

    // --- Install ---
    auto dest = options_.temp_dir / oid;
    std::string install_error;
    if (!staging.install(dest, install_error)) {
        return fail(request, constants::ERROR_CODE_INTERNAL, install_error);
    }

    if (transfer_log_) {
        TransferRecord record;
        record.operation = "download";
        record.oid = oid;
        record.size = request.size;
        if (from_cache) {
            record.cache_backend = cache_->type_name();
            record.cache_location = cache_->describe();
        }
        record.start = started;
        record.finish = std::chrono::system_clock::now();
        if (!transfer_log_->append(record)) {
            log_warn("cannot append to transfer log %s", transfer_log_->path().c_str());
        }
    }

    log_debug("download %s complete (%s)", oid.c_str(), from_cache ? "cache" : "origin");
    return TransferOutcome::completed(oid, dest);
}

bool TransferOrchestrator::populate_cache(const std::string& oid,
                                          const std::filesystem::path& source, bool replace) {
    auto stored = options_.cache_retry.run(
        [&] { return replace ? cache_->replace(oid, source) : cache_->put(oid, source); },
        TransientFailure{},
        [&](const CachePutResult& r, size_t attempt, std::chrono::milliseconds delay) {
            log_warn("cache put %s attempt %zu failed (%s), retrying in %lld ms", oid.c_str(),
                     attempt, r.error_message.c_str(), static_cast<long long>(delay.count()));
        });
    if (!stored.success) {
        log_warn("cannot store %s in cache %s: %s", oid.c_str(), cache_->describe().c_str(),
                 stored.error_message.c_str());
        return false;
    }
    if (stored.already_present) {
        log_debug("cache already holds %s", oid.c_str());
    }
    return true;
}

// ============================================================================
// Upload
// ============================================================================

TransferOutcome TransferOrchestrator::upload(const TransferRequest& request) {
    const auto& oid = request.oid;
    auto started = std::chrono::system_clock::now();

    if (!request.action) {
        return fail(request, constants::ERROR_CODE_BAD_REQUEST, "no upload action for " + oid);
    }

    ProgressThrottle progress(oid, options_.progress_interval, on_progress_);
    auto upload_start = Clock::now();
    OriginResult sent;
    {
        std::optional<ScopedTimer> timer;
        if (metrics_) timer.emplace(metrics_->origin_transfer_duration());
        sent = origin_.upload(oid, request.size, *request.action, request.path,
                              [&](uint64_t n) { progress.update(n); });
    }
    if (!sent.success) {
        return fail(request, error_code_for(sent), sent.error_message);
    }
    stats_.record_upload(request.size, since(upload_start));
    progress.finish(request.size);

    // Seed the cache so the next clone is served locally
    if (cache_) {
        std::string why;
        if (verify_file(request.path, oid, request.size, &why)) {
            stats_.record_cache_store(populate_cache(oid, request.path, false));
        } else {
            log_warn("not caching upload %s: %s", oid.c_str(), why.c_str());
        }
    }

    if (transfer_log_) {
        TransferRecord record;
        record.operation = "upload";
        record.oid = oid;
        record.size = request.size;
        record.start = started;
        record.finish = std::chrono::system_clock::now();
        if (!transfer_log_->append(record)) {
            log_warn("cannot append to transfer log %s", transfer_log_->path().c_str());
        }
    }

    log_debug("upload %s complete", oid.c_str());
    return TransferOutcome::completed(oid);
}

}  // namespace lfscache
