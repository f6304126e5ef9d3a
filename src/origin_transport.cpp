#include "lfscache/origin_transport.hpp"
#include "lfscache/logging.hpp"
#include "lfscache/net/http.hpp"
#include "lfscache/oid.hpp"

#include <cstdio>
#include <ctime>
#include <fstream>

namespace lfscache {

// ============================================================================
// TransferAction
// ============================================================================

bool TransferAction::expired(std::chrono::system_clock::time_point now) const {
    return expires_at && *expires_at <= now;
}

std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%*1[Tt ]%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    std::chrono::nanoseconds fraction{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int64_t scale = 100000000;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            fraction += std::chrono::nanoseconds((text[pos] - '0') * scale);
            scale /= 10;
            ++pos;
        }
    }

    int offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int oh = 0, om = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) return std::nullopt;
        offset_seconds = (oh * 3600 + om * 60) * (text[pos] == '-' ? -1 : 1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;

    auto tp = std::chrono::system_clock::from_time_t(t) - std::chrono::seconds(offset_seconds);
    return tp + std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
}

const char* transfer_failure_name(TransferFailure failure) {
    switch (failure) {
        case TransferFailure::None: return "none";
        case TransferFailure::Transient: return "transient";
        case TransferFailure::Permanent: return "permanent";
        case TransferFailure::Integrity: return "integrity";
        case TransferFailure::Expired: return "expired";
    }
    return "permanent";
}

OriginResult OriginResult::fail(TransferFailure failure, std::string message, int http_status) {
    OriginResult r;
    r.failure = failure;
    r.transient = failure == TransferFailure::Transient;
    r.http_status = http_status;
    r.error_message = std::move(message);
    return r;
}

namespace {

OriginResult classify_http_failure(const std::string& what, const net::HttpResponse& response) {
    if (response.is_network_error) {
        return OriginResult::fail(TransferFailure::Transient, what + ": " + response.error);
    }
    if (!response.error.empty()) {
        return OriginResult::fail(TransferFailure::Permanent, what + ": " + response.error,
                                  response.status_code);
    }
    auto failure = net::is_transient_status(response.status_code)
        ? TransferFailure::Transient : TransferFailure::Permanent;
    std::string message = what + ": HTTP " + std::to_string(response.status_code);
    if (!response.body.empty()) {
        message += ": " + response.body_string().substr(0, 256);
    }
    return OriginResult::fail(failure, message, response.status_code);
}

void apply_action_headers(net::HttpRequest& request, const TransferAction& action) {
    for (const auto& [name, value] : action.headers) {
        request.headers.set(name, value);
    }
}

}  // namespace

// ============================================================================
// OriginTransport
// ============================================================================

OriginTransport::OriginTransport(std::shared_ptr<net::HttpClient> http, RetryPolicy retry)
    : http_(std::move(http))
    , retry_(std::move(retry)) {}

OriginResult OriginTransport::download(const std::string& oid, uint64_t size,
                                       const TransferAction& action,
                                       const std::filesystem::path& dest,
                                       const ByteProgress& progress) const {
    size_t attempts = 0;
    auto result = retry_.run(
        [&] {
            ++attempts;
            return download_once(oid, size, action, dest, progress);
        },
        TransientFailure{},
        [&](const OriginResult& r, size_t attempt, std::chrono::milliseconds delay) {
            log_warn("download %s attempt %zu failed (%s), retrying in %lld ms",
                     oid.c_str(), attempt, r.error_message.c_str(),
                     static_cast<long long>(delay.count()));
        });
    result.attempts = attempts;
    return result;
}

OriginResult OriginTransport::download_once(const std::string& oid, uint64_t size,
                                            const TransferAction& action,
                                            const std::filesystem::path& dest,
                                            const ByteProgress& progress) const {
    if (action.expired()) {
        return OriginResult::fail(TransferFailure::Expired, "download action for " + oid + " has expired");
    }

    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
        return OriginResult::fail(TransferFailure::Permanent, "cannot create " + dest.string());
    }

    Sha256 hasher;
    uint64_t received = 0;
    bool oversized = false;

    auto request = net::HttpRequest::get(action.href);
    apply_action_headers(request, action);
    request.sink = [&](const uint8_t* data, size_t len) {
        if (received + len > size) {
            oversized = true;
            return false;
        }
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        if (!out) return false;
        hasher.update(data, len);
        received += len;
        return true;
    };
    request.progress_callback = progress;

    auto response = http_->execute(request);
    out.close();

    if (response.aborted_by_sink) {
        if (oversized) {
            return OriginResult::fail(TransferFailure::Integrity,
                "origin sent more than the expected " + std::to_string(size) + " bytes for " + oid);
        }
        return OriginResult::fail(TransferFailure::Permanent, "write error on " + dest.string());
    }
    if (!response.ok()) {
        return classify_http_failure("download " + oid, response);
    }
    if (!out) {
        return OriginResult::fail(TransferFailure::Permanent, "write error on " + dest.string());
    }
    if (received != size) {
        return OriginResult::fail(TransferFailure::Integrity,
            "size mismatch for " + oid + ": expected " + std::to_string(size) +
            " bytes, got " + std::to_string(received));
    }
    auto digest = hasher.hex_digest();
    if (digest != oid) {
        return OriginResult::fail(TransferFailure::Integrity,
            "digest mismatch for " + oid + ": content hashes to " + digest);
    }

    OriginResult result;
    result.success = true;
    result.http_status = response.status_code;
    result.bytes = received;
    return result;
}

OriginResult OriginTransport::upload(const std::string& oid, uint64_t size,
                                     const TransferAction& action,
                                     const std::filesystem::path& source,
                                     const ByteProgress& progress) const {
    std::error_code ec;
    auto actual = std::filesystem::file_size(source, ec);
    if (ec) {
        return OriginResult::fail(TransferFailure::Permanent,
                                  "cannot stat " + source.string() + ": " + ec.message());
    }
    if (actual != size) {
        return OriginResult::fail(TransferFailure::Integrity,
            "local file for " + oid + " has " + std::to_string(actual) +
            " bytes, expected " + std::to_string(size));
    }

    size_t attempts = 0;
    auto result = retry_.run(
        [&] {
            ++attempts;
            return upload_once(action, source, progress);
        },
        TransientFailure{},
        [&](const OriginResult& r, size_t attempt, std::chrono::milliseconds delay) {
            log_warn("upload %s attempt %zu failed (%s), retrying in %lld ms",
                     oid.c_str(), attempt, r.error_message.c_str(),
                     static_cast<long long>(delay.count()));
        });
    result.attempts = attempts;
    if (result.success) result.bytes = size;
    return result;
}

OriginResult OriginTransport::upload_once(const TransferAction& action,
                                          const std::filesystem::path& source,
                                          const ByteProgress& progress) const {
    if (action.expired()) {
        return OriginResult::fail(TransferFailure::Expired, "upload action has expired");
    }

    auto request = net::HttpRequest::put_file(action.href, source);
    request.headers.set_content_type("application/octet-stream");
    apply_action_headers(request, action);
    request.progress_callback = progress;

    auto response = http_->execute(request);
    if (!response.ok()) {
        return classify_http_failure("upload", response);
    }

    OriginResult result;
    result.success = true;
    result.http_status = response.status_code;
    return result;
}

}  // namespace lfscache
