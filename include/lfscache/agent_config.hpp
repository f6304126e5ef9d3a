#pragma once

#include "lfscache/constants.hpp"
#include "lfscache/retry.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace lfscache {

/// Configuration for the cache backend: "filesystem", "google_cloud_storage" or "http".
struct BackendConfig {
    std::string type;
    std::map<std::string, std::string> params;  // Passed to CacheStoreFactory

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;

    /// Parse the externally tagged JSON form used by --cache, e.g.
    /// {"filesystem":{"dir":"/var/cache/lfs"}} or
    /// {"http":{"endpoint":"https://cache/lfs","authorization":{"bearer":{"token_path":"/t"}}}}.
    /// Returns nullopt and sets `error` when the document is malformed.
    static std::optional<BackendConfig> from_json(const std::string& text, std::string& error);

    /// Inverse of from_json().
    std::string to_json() const;
};

/// Configuration for the transfer agent.
struct AgentConfig {
    BackendConfig cache;  // optional: without it every download goes to the origin

    std::filesystem::path git_dir;
    std::filesystem::path temp_dir;  // Default: <git_dir>/lfs/tmp
    std::filesystem::path logs_dir;  // Default: <git_dir>/lfs-cache/logs

    size_t default_concurrency = constants::DEFAULT_CONCURRENT_TRANSFERS;
    BackoffSettings backoff;

    bool verbose = false;
    std::filesystem::path log_file;  // Default: <logs_dir>/<timestamp>-<pid>.log

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    /// Parse the transfer-agent arguments (argv[0] is the subcommand).
    static std::optional<AgentConfig> from_args(int argc, char* argv[]);

    /// Overlay settings from a JSON config file.
    bool load_json(const std::filesystem::path& path);

    /// Fill directory defaults from git_dir.
    void apply_defaults();

    /// Returns error message or empty string on success.
    std::string validate() const;
};

}  // namespace lfscache
