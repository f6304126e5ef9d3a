#include "test_support.hpp"
#include "lfscache/metrics.hpp"
#include "lfscache/stats.hpp"
#include "lfscache/transfer_log.hpp"

#include <nlohmann/json.hpp>

using namespace lfscache;
using namespace std::chrono_literals;

namespace {

void test_aggregator() {
    std::cout << "\n=== Stats aggregation ===" << std::endl;

    {
        TEST(format_size_units);
        ASSERT_EQ(format_size(0), "0 B", "zero");
        ASSERT_EQ(format_size(512), "512 B", "bytes");
        ASSERT_EQ(format_size(64 * 1024), "64 KiB", "whole KiB");
        ASSERT_EQ(format_size(1536 * 1024), "1.50 MiB", "fractional MiB");
        PASS();
    }
    {
        TEST(counters_accumulate);
        StatsAggregator stats;
        stats.record_cache_hit(100);
        stats.record_cache_hit(50);
        stats.record_origin_fetch(1000, 20ms);
        stats.record_upload(10, 5ms);
        stats.record_cache_store(true);
        stats.record_cache_store(false);
        stats.record_cache_corrupt();
        stats.record_failure();
        stats.record_cache_lookup(300us);
        auto s = stats.snapshot();
        ASSERT_EQ(s.cache_hits, 2u, "hits");
        ASSERT_EQ(s.cache_hit_bytes, 150u, "hit bytes");
        ASSERT_EQ(s.origin_fetches, 1u, "fetches");
        ASSERT_EQ(s.origin_fetch_bytes, 1000u, "fetch bytes");
        ASSERT_EQ(s.uploads, 1u, "uploads");
        ASSERT_EQ(s.cache_stores, 1u, "stores");
        ASSERT_EQ(s.cache_store_failures, 1u, "store failures");
        ASSERT_EQ(s.cache_corrupt, 1u, "corrupt");
        ASSERT_EQ(s.failures, 1u, "failures");
        ASSERT_EQ(s.cache_lookups, 1u, "lookups");
        ASSERT_EQ(s.cache_lookup_micros, 300u, "lookup time");
        PASS();
    }
    {
        TEST(concurrent_updates);
        StatsAggregator stats;
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 1000; ++i) stats.record_cache_hit(1);
            });
        }
        for (auto& t : threads) t.join();
        ASSERT_EQ(stats.snapshot().cache_hits, 4000u, "no lost updates");
        PASS();
    }
    {
        TEST(summary_mentions_counts);
        StatsAggregator stats;
        stats.record_cache_hit(2048);
        auto line = stats.summary();
        ASSERT_TRUE(line.find("cache hits: 1 (2 KiB)") != std::string::npos, line);
        PASS();
    }
}

TransferRecord record(const std::string& oid, uint64_t size, bool hit) {
    TransferRecord r;
    r.operation = "download";
    r.oid = oid;
    r.size = size;
    if (hit) {
        r.cache_backend = "filesystem";
        r.cache_location = "/srv/lfs-cache";
    }
    r.start = std::chrono::system_clock::now();
    r.finish = r.start + 15ms;
    return r;
}

void test_transfer_log() {
    std::cout << "\n=== Transfer log ===" << std::endl;

    auto tmpdir = make_temp_dir("lfscache-log");
    auto logs = tmpdir / "logs";

    {
        TEST(timestamp_format);
        auto tp = std::chrono::system_clock::from_time_t(1478791747) + 250ms;
        ASSERT_EQ(format_timestamp(tp), "2016-11-10T15:29:07.250000Z", "utc micros");
        PASS();
    }
    {
        TEST(append_writes_json_lines);
        TransferLog log(logs);
        ASSERT_EQ(log.path().extension().string(), ".jsonl", "extension");
        ASSERT_TRUE(log.append(record(std::string(64, 'a'), 1024, true)), "append hit");
        ASSERT_TRUE(log.append(record(std::string(64, 'b'), 2048, false)), "append miss");

        std::ifstream in(log.path());
        std::string line;
        std::vector<nlohmann::json> lines;
        while (std::getline(in, line)) lines.push_back(nlohmann::json::parse(line));
        ASSERT_EQ(lines.size(), 2u, "two lines");
        ASSERT_EQ(lines[0]["cache"]["backend"].get<std::string>(), "filesystem", "backend");
        ASSERT_EQ(lines[0]["cache"]["location"].get<std::string>(), "/srv/lfs-cache", "location");
        ASSERT_TRUE(lines[1]["cache"].is_null(), "miss has null cache");
        ASSERT_EQ(lines[1]["operation"].get<std::string>(), "download", "operation");
        PASS();
    }
    {
        TEST(summarize_counts_hits_and_misses);
        // A second run's log plus some junk the reader must skip
        write_file(logs / "older.jsonl",
                   nlohmann::json{{"operation", "download"}, {"oid", std::string(64, 'c')},
                                  {"size", 4096}, {"cache", nullptr}}.dump() +
                       "\nnot json\n\n{\"oid\":\"x\"}\n");
        write_file(logs / "agent.log", "ignored\n");

        auto report = summarize_transfer_logs(logs);
        ASSERT_EQ(report.files, 2u, "two jsonl files");
        ASSERT_EQ(report.total.objects, 3u, "total objects");
        ASSERT_EQ(report.total.bytes, 7168u, "total bytes");
        ASSERT_EQ(report.hit.objects, 1u, "hits");
        ASSERT_EQ(report.miss.objects, 2u, "misses");
        ASSERT_EQ(report.malformed_lines, 2u, "malformed lines counted");
        ASSERT_EQ(report.format(),
                  "total: 3 objects (7 KiB)\nhit: 1 objects (1 KiB)\nmiss: 2 objects (6 KiB)\n",
                  "report text");
        PASS();
    }
    {
        TEST(missing_dir_is_empty_report);
        auto report = summarize_transfer_logs(tmpdir / "nowhere");
        ASSERT_EQ(report.files, 0u, "no files");
        ASSERT_EQ(report.total.objects, 0u, "no objects");
        PASS();
    }

    fs::remove_all(tmpdir);
}

void test_metrics() {
    std::cout << "\n=== Metrics export ===" << std::endl;

    auto tmpdir = make_temp_dir("lfscache-metrics");
    auto prom = tmpdir / "lfs-cache.prom";

    {
        TEST(write_file_serializes_counters);
        StatsAggregator stats;
        MetricsExporter exporter(prom, 60s, {{"agent", "lfs-cache"}});
        exporter.set_stats(&stats);
        exporter.set_in_flight_source([] { return size_t{3}; });
        stats.record_cache_hit(100);
        stats.record_origin_fetch(200, 1ms);
        exporter.cache_lookup_duration().Observe(0.002);

        ASSERT_TRUE(exporter.write_file(), "write");
        ASSERT_TRUE(!fs::exists(fs::path(prom.string() + ".tmp")), "temp file renamed");
        auto text = read_file(prom);
        ASSERT_TRUE(text.find("lfscache_downloads_total{agent=\"lfs-cache\",source=\"cache\"} 1") !=
                        std::string::npos,
                    "cache downloads");
        ASSERT_TRUE(text.find("lfscache_transfers_in_flight{agent=\"lfs-cache\"} 3") !=
                        std::string::npos,
                    "in flight gauge");
        ASSERT_TRUE(text.find("lfscache_cache_lookup_duration_seconds_count") != std::string::npos,
                    "histogram");
        PASS();
    }
    {
        TEST(counters_track_deltas);
        StatsAggregator stats;
        MetricsExporter exporter(prom, 60s, {{"agent", "lfs-cache"}});
        exporter.set_stats(&stats);
        stats.record_failure();
        ASSERT_TRUE(exporter.write_file(), "first write");
        stats.record_failure();
        stats.record_failure();
        ASSERT_TRUE(exporter.write_file(), "second write");
        auto text = read_file(prom);
        ASSERT_TRUE(text.find("lfscache_failures_total{agent=\"lfs-cache\"} 3") != std::string::npos,
                    "failures counted once each");
        PASS();
    }
    {
        TEST(unwritable_path_reported);
        MetricsExporter exporter(tmpdir / "missing" / "x.prom", 60s, {});
        ASSERT_TRUE(!exporter.write_file(), "write fails");
        PASS();
    }
    {
        TEST(start_stop_writes_final_snapshot);
        fs::remove(prom);
        StatsAggregator stats;
        MetricsExporter exporter(prom, 60s, {{"agent", "lfs-cache"}});
        exporter.set_stats(&stats);
        exporter.start();
        stats.record_upload(10, 1ms);
        exporter.stop();
        auto text = read_file(prom);
        ASSERT_TRUE(text.find("lfscache_uploads_total{agent=\"lfs-cache\"} 1") != std::string::npos,
                    "final snapshot");
        PASS();
    }

    fs::remove_all(tmpdir);
}

}  // namespace

void test_stats() {
    test_aggregator();
    test_transfer_log();
    test_metrics();
}
