#pragma once

#include <cstddef>
#include <cstdint>

namespace lfscache::constants {

constexpr const char* AGENT_NAME = "lfs-cache";
constexpr const char* USER_AGENT = "lfs-cache/0.1";

// Transfer defaults
constexpr size_t DEFAULT_CONCURRENT_TRANSFERS = 8;     // when init omits concurrenttransfers
constexpr size_t MAX_CONCURRENT_TRANSFERS = 256;
constexpr uint64_t PROGRESS_INTERVAL_BYTES = 1 << 16;  // 64KB
constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

// Backoff defaults
constexpr int64_t DEFAULT_INITIAL_INTERVAL_MS = 500;
constexpr double DEFAULT_BACKOFF_MULTIPLIER = 1.5;
constexpr double DEFAULT_RANDOMIZATION_FACTOR = 0.5;
constexpr int64_t DEFAULT_MAX_INTERVAL_MS = 60 * 1000;
constexpr int64_t DEFAULT_MAX_ELAPSED_MS = 15 * 60 * 1000;
constexpr size_t DEFAULT_MAX_RETRIES = 10;

// HTTP defaults
constexpr int DEFAULT_CONNECT_TIMEOUT_SECONDS = 30;
constexpr int DEFAULT_LOW_SPEED_TIME_SECONDS = 60;    // abort stalled transfers
constexpr size_t DEFAULT_ERROR_BODY_LIMIT = 64 * 1024;

// Host-facing error codes
constexpr int ERROR_CODE_BAD_REQUEST = 400;
constexpr int ERROR_CODE_EXPIRED = 410;
constexpr int ERROR_CODE_INTEGRITY = 422;
constexpr int ERROR_CODE_INTERNAL = 500;
constexpr int ERROR_CODE_PROTOCOL = 32;

// Layout under the git directory
constexpr const char* TEMP_SUBDIR = "lfs/tmp";
constexpr const char* LOGS_SUBDIR = "lfs-cache/logs";

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

}  // namespace lfscache::constants
