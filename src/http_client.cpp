#include "lfscache/net/http.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace lfscache::net {

// ============================================================================
// Utility functions
// ============================================================================

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_server_error_status(int status) {
    return status >= 500 && status < 600;
}

bool is_transient_status(int status) {
    return status == 408 || status == 429 || is_server_error_status(status);
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string base64url_encode(const std::string& data) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        uint32_t triple = (static_cast<uint8_t>(data[i]) << 16) |
                          (static_cast<uint8_t>(data[i + 1]) << 8) |
                          static_cast<uint8_t>(data[i + 2]);
        result += table[(triple >> 18) & 0x3F];
        result += table[(triple >> 12) & 0x3F];
        result += table[(triple >> 6) & 0x3F];
        result += table[triple & 0x3F];
        i += 3;
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t triple = static_cast<uint8_t>(data[i]) << 16;
        result += table[(triple >> 18) & 0x3F];
        result += table[(triple >> 12) & 0x3F];
    } else if (rest == 2) {
        uint32_t triple = (static_cast<uint8_t>(data[i]) << 16) |
                          (static_cast<uint8_t>(data[i + 1]) << 8);
        result += table[(triple >> 18) & 0x3F];
        result += table[(triple >> 12) & 0x3F];
        result += table[(triple >> 6) & 0x3F];
    }
    return result;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

void HttpHeaders::set_bearer_token(const std::string& token) {
    set("Authorization", "Bearer " + token);
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    req.body.assign(body.begin(), body.end());
    return req;
}

HttpRequest HttpRequest::put_file(const std::string& url, const std::filesystem::path& file) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.body_file = file;
    return req;
}

std::string HttpResponse::describe() const {
    if (!error.empty()) return error;
    return "HTTP " + std::to_string(status_code);
}

// ============================================================================
// CURL callback functions
// ============================================================================

namespace {

struct WriteContext {
    CURL* curl = nullptr;
    const BodySink* sink = nullptr;
    const TransferProgressCallback* progress = nullptr;
    std::vector<uint8_t>* body = nullptr;
    size_t error_body_limit = 0;
    bool status_known = false;
    bool streaming = false;
    bool aborted = false;
    uint64_t delivered = 0;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    size_t bytes = size * nmemb;

    // Decide once per response whether the body goes to the sink
    if (!ctx->status_known) {
        long code = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
        ctx->streaming = ctx->sink && *ctx->sink && is_success_status(static_cast<int>(code));
        ctx->status_known = true;
    }

    if (ctx->streaming) {
        if (!(*ctx->sink)(reinterpret_cast<const uint8_t*>(ptr), bytes)) {
            ctx->aborted = true;
            return 0;
        }
        ctx->delivered += bytes;
        if (ctx->progress && *ctx->progress) (*ctx->progress)(ctx->delivered);
        return bytes;
    }

    // Non-streamed bodies are kept; error bodies are truncated to the limit
    bool bounded = ctx->sink && *ctx->sink;
    size_t keep = bytes;
    if (bounded) {
        size_t room = ctx->body->size() < ctx->error_body_limit
            ? ctx->error_body_limit - ctx->body->size() : 0;
        keep = std::min(bytes, room);
    }
    ctx->body->insert(ctx->body->end(), ptr, ptr + keep);
    ctx->delivered += bytes;
    return bytes;
}

struct HeaderContext {
    HttpHeaders* headers = nullptr;
    WriteContext* write = nullptr;
};

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<HeaderContext*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a new response (100 Continue, redirects)
    if (line.starts_with("HTTP/")) {
        *ctx->headers = HttpHeaders{};
        ctx->write->status_known = false;
        return bytes;
    }
    if (line.empty()) return bytes;

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? std::string{} : value.substr(start);
        ctx->headers->add(name, value);
    }
    return bytes;
}

struct ReadContext {
    const std::vector<uint8_t>* memory = nullptr;
    std::ifstream* file = nullptr;
    const TransferProgressCallback* progress = nullptr;
    size_t pos = 0;
    uint64_t sent = 0;
};

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* rd = static_cast<ReadContext*>(userdata);
    size_t max_bytes = size * nitems;
    size_t copied = 0;

    if (rd->file) {
        rd->file->read(buffer, static_cast<std::streamsize>(max_bytes));
        if (rd->file->bad()) return CURL_READFUNC_ABORT;
        copied = static_cast<size_t>(rd->file->gcount());
    } else if (rd->memory) {
        size_t remaining = rd->memory->size() - rd->pos;
        copied = std::min(max_bytes, remaining);
        if (copied > 0) {
            std::memcpy(buffer, rd->memory->data() + rd->pos, copied);
            rd->pos += copied;
        }
    }

    rd->sent += copied;
    if (copied > 0 && rd->progress && *rd->progress) (*rd->progress)(rd->sent);
    return copied;
}

}  // namespace

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    const HttpClientConfig& config() const { return config_; }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "failed to create curl handle";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        // Request body source
        std::ifstream body_stream;
        ReadContext read_ctx;
        read_ctx.progress = &request.progress_callback;
        curl_off_t upload_size = 0;
        if (!request.body_file.empty()) {
            std::error_code ec;
            auto fsize = std::filesystem::file_size(request.body_file, ec);
            body_stream.open(request.body_file, std::ios::binary);
            if (ec || !body_stream) {
                release_handle(curl);
                response.error = "cannot open request body file " + request.body_file.string();
                return response;
            }
            read_ctx.file = &body_stream;
            upload_size = static_cast<curl_off_t>(fsize);
        } else {
            read_ctx.memory = &request.body;
            upload_size = static_cast<curl_off_t>(request.body.size());
        }

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
                curl_easy_setopt(curl, CURLOPT_READDATA, &read_ctx);
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, upload_size);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
                curl_easy_setopt(curl, CURLOPT_READDATA, &read_ctx);
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, upload_size);
                break;
        }

        // Headers. An empty Expect suppresses the 100-continue round trip.
        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        if ((request.method == HttpMethod::PUT || request.method == HttpMethod::POST) &&
            !request.headers.has("Expect")) {
            headers_list = curl_slist_append(headers_list, "Expect:");
        }
        if (headers_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);
        }
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        // Response callbacks
        WriteContext write_ctx;
        write_ctx.curl = curl;
        write_ctx.sink = &request.sink;
        write_ctx.body = &response.body;
        write_ctx.error_body_limit = config_.max_error_body;
        if (request.method != HttpMethod::PUT && request.method != HttpMethod::POST) {
            write_ctx.progress = &request.progress_callback;
        }
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        HeaderContext header_ctx{&response.headers, &write_ctx};
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_ctx);

        // Timeouts. Large objects have no total bound; stalled ones are cut off.
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        if (request.total_timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                             static_cast<long>(request.total_timeout.count()));
        }
        if (request.low_speed_time.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                             static_cast<long>(request.low_speed_time.count()));
        }
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

        bool ssl_verify = request.verify_ssl && config_.verify_ssl_by_default;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, ssl_verify ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, ssl_verify ? 2L : 0L);
        if (!config_.default_ca_bundle.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.default_ca_bundle.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        response.body_bytes = write_ctx.delivered;

        if (res == CURLE_OK) {
            response.status_code = static_cast<int>(code);
        } else if (res == CURLE_WRITE_ERROR && write_ctx.aborted) {
            response.status_code = static_cast<int>(code);
            response.aborted_by_sink = true;
            response.error = "transfer aborted by body sink";
        } else if (res == CURLE_ABORTED_BY_CALLBACK || res == CURLE_READ_ERROR) {
            response.error = std::string("request body read failed: ") + curl_easy_strerror(res);
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        if (headers_list) {
            curl_slist_free_all(headers_list);
        }
        release_handle(curl);

        return response;
    }

private:
    CURL* acquire_handle() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!idle_handles_.empty()) {
                CURL* handle = idle_handles_.back();
                idle_handles_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release_handle(CURL* handle) {
        if (!handle) return;
        curl_easy_reset(handle);

        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_handles_.size() < config_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

// ============================================================================
// HttpClient
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

}  // namespace lfscache::net
