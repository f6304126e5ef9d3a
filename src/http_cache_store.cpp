#include "lfscache/cache_stores.hpp"
#include "lfscache/logging.hpp"
#include "lfscache/net/http.hpp"
#include "lfscache/oid.hpp"

#include <fstream>
#include <sstream>

namespace lfscache {

HttpCacheStore::HttpCacheStore(const Config& config, std::shared_ptr<net::HttpClient> http)
    : config_(config)
    , http_(std::move(http)) {
    while (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
        config_.endpoint.pop_back();
    }
}

std::string HttpCacheStore::object_url(const std::string& oid) const {
    return config_.endpoint + "/" + oid;
}

std::string HttpCacheStore::add_auth_header(net::HttpRequest& request) const {
    if (config_.token_path.empty()) return {};

    // Re-read on every request so rotated tokens are picked up
    std::ifstream in(config_.token_path);
    if (!in) return "cannot read bearer token file " + config_.token_path;
    std::stringstream ss;
    ss << in.rdbuf();
    std::string token = ss.str();
    auto end = token.find_last_not_of(" \t\r\n");
    token.erase(end == std::string::npos ? 0 : end + 1);
    if (token.empty()) return "bearer token file is empty: " + config_.token_path;

    request.headers.set_bearer_token(token);
    return {};
}

CacheGetResult HttpCacheStore::get(const std::string& oid, const std::filesystem::path& dest) const {
    if (!is_valid_oid(oid)) {
        return CacheGetResult::error("invalid oid: " + oid, false);
    }

    auto request = net::HttpRequest::get(object_url(oid));
    request.verify_ssl = config_.verify_ssl;
    auto auth_error = add_auth_header(request);
    if (!auth_error.empty()) return CacheGetResult::error(auth_error, false);

    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) return CacheGetResult::error("cannot create " + dest.string(), false);
    request.sink = [&out](const uint8_t* data, size_t len) {
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        return static_cast<bool>(out);
    };

    auto response = http_->execute(request);
    out.close();

    if (response.is_network_error) {
        return CacheGetResult::error("GET " + request.url + ": " + response.error, true);
    }
    if (!response.error.empty()) {
        return CacheGetResult::error("GET " + request.url + ": " + response.error, false);
    }
    if (response.status_code == 404) {
        return CacheGetResult::miss();
    }
    if (!net::is_success_status(response.status_code)) {
        return CacheGetResult::error("GET " + request.url + ": " + response.describe(),
                                     net::is_transient_status(response.status_code));
    }
    if (!out) {
        return CacheGetResult::error("write error on " + dest.string(), false);
    }

    log_debug("http cache hit %s (%llu bytes)", oid.c_str(),
              static_cast<unsigned long long>(response.body_bytes));
    return CacheGetResult::hit(response.body_bytes);
}

CachePutResult HttpCacheStore::put(const std::string& oid, const std::filesystem::path& source) {
    CachePutResult result;
    if (!is_valid_oid(oid)) {
        result.error_message = "invalid oid: " + oid;
        return result;
    }

    auto request = net::HttpRequest::put_file(object_url(oid), source);
    request.verify_ssl = config_.verify_ssl;
    request.headers.set_content_type("application/octet-stream");
    auto auth_error = add_auth_header(request);
    if (!auth_error.empty()) {
        result.error_message = auth_error;
        return result;
    }

    auto response = http_->execute(request);
    if (response.ok()) {
        result.success = true;
        return result;
    }

    result.error_message = "PUT " + request.url + ": " + response.describe();
    result.transient = response.is_network_error ||
                       (response.error.empty() && net::is_transient_status(response.status_code));
    return result;
}

}  // namespace lfscache
