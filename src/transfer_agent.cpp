#include "lfscache/transfer_agent.hpp"
#include "lfscache/cache_store.hpp"
#include "lfscache/constants.hpp"
#include "lfscache/logging.hpp"
#include "lfscache/metrics.hpp"
#include "lfscache/net/http.hpp"
#include "lfscache/origin_transport.hpp"
#include "lfscache/protocol_engine.hpp"
#include "lfscache/stats.hpp"
#include "lfscache/transfer_log.hpp"

#include <atomic>
#include <future>
#include <istream>
#include <ostream>
#include <thread>

namespace lfscache {

size_t session_concurrency(const InitEvent& init, const AgentConfig& config) {
    if (!init.concurrent) return 1;
    size_t n = init.concurrent_transfers > 0 ? init.concurrent_transfers
                                             : config.default_concurrency;
    if (n == 0) n = 1;
    if (n > constants::MAX_CONCURRENT_TRANSFERS) n = constants::MAX_CONCURRENT_TRANSFERS;
    return n;
}

int run_transfer_agent(const AgentConfig& config, std::istream& input, std::ostream& output) {
    net::HttpClientConfig http_config;
    http_config.user_agent = constants::USER_AGENT;
    http_config.verbose = config.verbose && log_verbose();
    auto http = std::make_shared<net::HttpClient>(http_config);

    RetryPolicy retry(config.backoff);
    OriginTransport origin(http, retry);
    StatsAggregator stats;

    std::unique_ptr<TransferLog> transfer_log;
    if (!config.logs_dir.empty()) {
        try {
            transfer_log = std::make_unique<TransferLog>(config.logs_dir);
            log_debug("transfer log: %s", transfer_log->path().c_str());
        } catch (const std::exception& e) {
            log_warn("transfer log disabled: %s", e.what());
        }
    }

    std::unique_ptr<MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"agent", constants::AGENT_NAME}});
        metrics->set_stats(&stats);
        metrics->start();
    }

    // The cache is created at init so configuration problems reach the host
    // as an init error rather than a silent exit.
    std::unique_ptr<CacheStore> cache;
    std::atomic<TransferOrchestrator*> active{nullptr};

    auto factory = [&](const InitEvent& init, TransferOrchestrator::ProgressSink on_progress,
                       TransferOrchestrator::CompletionSink on_complete) {
        if (!config.cache.empty()) {
            cache = CacheStoreFactory::create(config.cache, http);
            log_info("cache: %s", cache->describe().c_str());
        } else {
            log_info("no cache configured, all downloads go to the origin");
        }

        std::error_code ec;
        std::filesystem::create_directories(config.temp_dir, ec);
        if (ec) {
            throw std::runtime_error("cannot create temp dir " + config.temp_dir.string() + ": " +
                                     ec.message());
        }

        OrchestratorOptions options;
        options.concurrency = session_concurrency(init, config);
        options.temp_dir = config.temp_dir;
        options.cache_retry = retry;

        auto orchestrator = std::make_unique<TransferOrchestrator>(
            options, cache.get(), origin, stats, std::move(on_progress), std::move(on_complete));
        orchestrator->set_transfer_log(transfer_log.get());
        orchestrator->set_metrics(metrics.get());
        active = orchestrator.get();
        return orchestrator;
    };

    // The reader may outlive this function (see below), so it shares ownership.
    auto inbound = std::make_shared<Channel<InboundMessage>>();
    Channel<std::string> outbound;

    if (metrics) {
        metrics->set_in_flight_source([&active]() -> size_t {
            auto* orchestrator = active.load();
            return orchestrator ? orchestrator->in_flight() : 0;
        });
    }

    // --- Writer: one line per reply, flushed immediately ---
    std::thread writer([&] {
        while (auto line = outbound.pop()) {
            output << *line << '\n';
            output.flush();
        }
    });

    // --- Reader: decode lines until terminate, a bad line or end of input ---
    std::promise<void> reader_exited;
    auto reader_done = reader_exited.get_future();
    std::thread reader([&input, inbound, exited = std::move(reader_exited)]() mutable {
        std::string line;
        while (std::getline(input, line)) {
            if (line.empty() || line == "\r") continue;
            InboundMessage msg;
            try {
                msg = InboundMessage::decoded(decode_event(line));
            } catch (const ProtocolError& e) {
                msg = InboundMessage::malformed(e.what());
            }
            bool stop = !msg.event || msg.event->type == EventType::Terminate;
            if (!inbound->push(std::move(msg)) || stop) break;
        }
        inbound->close();
        exited.set_value();
    });

    int code;
    {
        ProtocolEngine engine(*inbound, outbound, factory);
        code = engine.run();
        active = nullptr;
    }

    writer.join();
    inbound->close();
    // A host that keeps the pipe open after an error leaves the reader in
    // getline(); the process is about to exit, so let it go.
    if (reader_done.wait_for(std::chrono::milliseconds(200)) == std::future_status::ready) {
        reader.join();
    } else {
        reader.detach();
    }

    if (metrics) {
        metrics->set_in_flight_source({});
        metrics->stop();
    }
    log_info("session finished (exit %d): %s", code, stats.summary().c_str());
    return code;
}

}  // namespace lfscache
