#pragma once

#include "lfscache/retry.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace lfscache {

namespace net {
class HttpClient;
}

/// A pre-authorized request the host handed us for one object.
struct TransferAction {
    std::string href;
    std::map<std::string, std::string> headers;
    std::optional<std::chrono::system_clock::time_point> expires_at;

    bool expired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
};

/// Parse an RFC 3339 timestamp ("2016-11-10T15:29:07Z", fractional seconds
/// and numeric offsets accepted).
std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string& text);

enum class TransferFailure { None, Transient, Permanent, Integrity, Expired };

const char* transfer_failure_name(TransferFailure failure);

struct OriginResult {
    bool success = false;
    bool transient = false;
    TransferFailure failure = TransferFailure::None;
    int http_status = 0;
    uint64_t bytes = 0;
    size_t attempts = 0;
    std::string error_message;

    static OriginResult fail(TransferFailure failure, std::string message, int http_status = 0);
};

/// Cumulative bytes moved for the current attempt.
using ByteProgress = std::function<void(uint64_t bytes_so_far)>;

/// Moves object bytes between the local disk and the origin's
/// pre-authorized URLs, retrying transient failures.
class OriginTransport {
public:
    OriginTransport(std::shared_ptr<net::HttpClient> http, RetryPolicy retry);

    /// GET action.href into `dest`. On success `dest` holds exactly `size`
    /// bytes hashing to `oid`; anything else is an Integrity failure and is
    /// never retried.
    OriginResult download(const std::string& oid, uint64_t size, const TransferAction& action,
                          const std::filesystem::path& dest, const ByteProgress& progress = {}) const;

    /// PUT the bytes of `source` to action.href.
    OriginResult upload(const std::string& oid, uint64_t size, const TransferAction& action,
                        const std::filesystem::path& source, const ByteProgress& progress = {}) const;

private:
    OriginResult download_once(const std::string& oid, uint64_t size, const TransferAction& action,
                               const std::filesystem::path& dest, const ByteProgress& progress) const;
    OriginResult upload_once(const TransferAction& action, const std::filesystem::path& source,
                             const ByteProgress& progress) const;

    std::shared_ptr<net::HttpClient> http_;
    RetryPolicy retry_;
};

}  // namespace lfscache
