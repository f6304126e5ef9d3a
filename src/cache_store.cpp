#include "lfscache/cache_store.hpp"
#include "lfscache/agent_config.hpp"
#include "lfscache/cache_stores.hpp"
#include "lfscache/constants.hpp"
#include "lfscache/net/http.hpp"

#include <stdexcept>

namespace lfscache {

const char* cache_lookup_name(CacheLookup lookup) {
    switch (lookup) {
        case CacheLookup::Hit: return "hit";
        case CacheLookup::Miss: return "miss";
        case CacheLookup::Error: return "error";
    }
    return "error";
}

CacheGetResult CacheGetResult::hit(uint64_t bytes) {
    CacheGetResult r;
    r.status = CacheLookup::Hit;
    r.bytes = bytes;
    return r;
}

CacheGetResult CacheGetResult::miss() {
    return CacheGetResult{};
}

CacheGetResult CacheGetResult::error(std::string message, bool transient) {
    CacheGetResult r;
    r.status = CacheLookup::Error;
    r.success = false;
    r.transient = transient;
    r.error_message = std::move(message);
    return r;
}

// ============================================================================
// CacheStoreFactory
// ============================================================================

std::unique_ptr<CacheStore> CacheStoreFactory::create(const BackendConfig& config,
                                                      std::shared_ptr<net::HttpClient> http) {
    auto err = config.validate();
    if (!err.empty()) {
        throw std::runtime_error(err);
    }

    auto param = [&](const char* key) -> std::string {
        auto it = config.params.find(key);
        return it == config.params.end() ? std::string{} : it->second;
    };
    auto verify_ssl = [&]() {
        auto v = param("verify_ssl");
        return !(v == "false" || v == "0");
    };

    if (config.type == "filesystem") {
        return create_filesystem(param("dir"));
    }

    if (!http) {
        net::HttpClientConfig http_config;
        http_config.user_agent = constants::USER_AGENT;
        http = std::make_shared<net::HttpClient>(http_config);
    }

    if (config.type == "google_cloud_storage") {
        GcsCacheStore::Config gcs;
        gcs.bucket = param("bucket");
        gcs.prefix = param("prefix");
        gcs.endpoint = param("endpoint");
        gcs.credentials_file = param("credentials_file");
        gcs.verify_ssl = verify_ssl();
        return std::make_unique<GcsCacheStore>(gcs, std::move(http));
    }

    if (config.type == "http") {
        HttpCacheStore::Config hc;
        hc.endpoint = param("endpoint");
        hc.token_path = param("token_path");
        hc.verify_ssl = verify_ssl();
        return std::make_unique<HttpCacheStore>(hc, std::move(http));
    }

    throw std::runtime_error("unknown cache backend type: " + config.type);
}

std::unique_ptr<CacheStore> CacheStoreFactory::create_filesystem(const std::filesystem::path& dir) {
    return std::make_unique<FilesystemCacheStore>(dir);
}

}  // namespace lfscache
