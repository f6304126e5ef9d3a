#include "lfscache/stats.hpp"

#include <cstdio>

namespace lfscache {

namespace {

uint64_t micros(std::chrono::microseconds d) {
    return d.count() > 0 ? static_cast<uint64_t>(d.count()) : 0;
}

}  // namespace

void StatsAggregator::record_cache_lookup(std::chrono::microseconds latency) {
    cache_lookups_.fetch_add(1, std::memory_order_relaxed);
    cache_lookup_micros_.fetch_add(micros(latency), std::memory_order_relaxed);
}

void StatsAggregator::record_cache_hit(uint64_t bytes) {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
    cache_hit_bytes_.fetch_add(bytes, std::memory_order_relaxed);
}

void StatsAggregator::record_origin_fetch(uint64_t bytes, std::chrono::microseconds latency) {
    origin_fetches_.fetch_add(1, std::memory_order_relaxed);
    origin_fetch_bytes_.fetch_add(bytes, std::memory_order_relaxed);
    origin_micros_.fetch_add(micros(latency), std::memory_order_relaxed);
}

void StatsAggregator::record_upload(uint64_t bytes, std::chrono::microseconds latency) {
    uploads_.fetch_add(1, std::memory_order_relaxed);
    upload_bytes_.fetch_add(bytes, std::memory_order_relaxed);
    origin_micros_.fetch_add(micros(latency), std::memory_order_relaxed);
}

void StatsAggregator::record_cache_store(bool success) {
    if (success) {
        cache_stores_.fetch_add(1, std::memory_order_relaxed);
    } else {
        cache_store_failures_.fetch_add(1, std::memory_order_relaxed);
    }
}

void StatsAggregator::record_cache_corrupt() {
    cache_corrupt_.fetch_add(1, std::memory_order_relaxed);
}

void StatsAggregator::record_failure() {
    failures_.fetch_add(1, std::memory_order_relaxed);
}

StatsSnapshot StatsAggregator::snapshot() const {
    StatsSnapshot s;
    s.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    s.cache_hit_bytes = cache_hit_bytes_.load(std::memory_order_relaxed);
    s.origin_fetches = origin_fetches_.load(std::memory_order_relaxed);
    s.origin_fetch_bytes = origin_fetch_bytes_.load(std::memory_order_relaxed);
    s.uploads = uploads_.load(std::memory_order_relaxed);
    s.upload_bytes = upload_bytes_.load(std::memory_order_relaxed);
    s.cache_stores = cache_stores_.load(std::memory_order_relaxed);
    s.cache_store_failures = cache_store_failures_.load(std::memory_order_relaxed);
    s.cache_corrupt = cache_corrupt_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    s.cache_lookup_micros = cache_lookup_micros_.load(std::memory_order_relaxed);
    s.cache_lookups = cache_lookups_.load(std::memory_order_relaxed);
    s.origin_micros = origin_micros_.load(std::memory_order_relaxed);
    return s;
}

std::string StatsAggregator::summary() const {
    auto s = snapshot();
    char buf[512];
    std::snprintf(buf, sizeof(buf),
                  "cache hits: %llu (%s), origin fetches: %llu (%s), uploads: %llu (%s), "
                  "cache stores: %llu ok / %llu failed, failures: %llu",
                  static_cast<unsigned long long>(s.cache_hits), format_size(s.cache_hit_bytes).c_str(),
                  static_cast<unsigned long long>(s.origin_fetches), format_size(s.origin_fetch_bytes).c_str(),
                  static_cast<unsigned long long>(s.uploads), format_size(s.upload_bytes).c_str(),
                  static_cast<unsigned long long>(s.cache_stores),
                  static_cast<unsigned long long>(s.cache_store_failures),
                  static_cast<unsigned long long>(s.failures));
    return buf;
}

std::string format_size(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
    if (bytes < 1024) return std::to_string(bytes) + " B";

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    std::string number = buf;
    // "64.00" -> "64", "1.50" stays
    if (number.ends_with(".00")) number.resize(number.size() - 3);
    return number + " " + units[unit];
}

}  // namespace lfscache
