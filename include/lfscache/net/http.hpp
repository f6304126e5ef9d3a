#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lfscache::net {

enum class HttpMethod { GET, POST, PUT };

bool is_success_status(int status);
bool is_server_error_status(int status);

/// Statuses worth retrying: request timeout, rate limiting and server errors.
bool is_transient_status(int status);

std::string url_encode(const std::string& str);
std::string base64url_encode(const std::string& data);

/// Case-insensitive header collection.
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    std::vector<HeaderPair> all() const;
    bool empty() const { return headers_.empty(); }

    void set_content_type(const std::string& content_type);
    void set_bearer_token(const std::string& token);

private:
    static std::string normalize_name(const std::string& name);
    std::map<std::string, std::vector<std::string>> headers_;
};

/// Receives response body bytes of a successful (2xx) response.
/// Returning false aborts the transfer.
using BodySink = std::function<bool(const uint8_t* data, size_t len)>;

/// Reports cumulative bytes moved in the request's main direction
/// (received for downloads, sent for uploads).
using TransferProgressCallback = std::function<void(uint64_t bytes_now)>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;

    // Request body: either in memory or streamed from a file.
    std::vector<uint8_t> body;
    std::filesystem::path body_file;

    // When set, 2xx response bodies are streamed here instead of collected.
    BodySink sink;
    TransferProgressCallback progress_callback;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{0};     // 0 = unbounded (large objects)
    std::chrono::seconds low_speed_time{60};        // abort if below 1 B/s this long
    bool verify_ssl = true;

    static HttpRequest get(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);
    static HttpRequest put_file(const std::string& url, const std::filesystem::path& file);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;      // empty when streamed through a sink
    uint64_t body_bytes = 0;        // bytes delivered to the sink or body
    std::string error;
    bool is_network_error = false;  // no usable HTTP response
    bool aborted_by_sink = false;
    std::chrono::milliseconds total_time{0};

    bool ok() const { return error.empty() && is_success_status(status_code); }
    std::string body_string() const { return std::string(body.begin(), body.end()); }

    /// Short description for logs: network error text or "HTTP <status>".
    std::string describe() const;
};

struct HttpClientConfig {
    std::string user_agent;
    bool verify_ssl_by_default = true;
    std::string default_ca_bundle;
    size_t max_idle_handles = 64;
    size_t max_error_body = 64 * 1024;
    bool verbose = false;
};

/// Thread-safe libcurl client. Easy handles are pooled so that connections
/// (and TLS sessions) are reused across requests from any thread.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lfscache::net
