#pragma once

#include "lfscache/cache_store.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace lfscache {

namespace net {
class HttpClient;
struct HttpRequest;
}

/// Entries live at <dir>/<oid[0:2]>/<oid[2:4]>/<oid>.
class FilesystemCacheStore : public CacheStore {
public:
    explicit FilesystemCacheStore(const std::filesystem::path& dir);

    std::string type_name() const override { return "filesystem"; }
    std::string describe() const override { return root_.string(); }

    CacheGetResult get(const std::string& oid, const std::filesystem::path& dest) const override;
    CachePutResult put(const std::string& oid, const std::filesystem::path& source) override;

    std::filesystem::path entry_path(const std::string& oid) const;

private:
    std::filesystem::path root_;
};

/// Google Cloud Storage bucket; object name is <prefix><oid>.
class GcsCacheStore : public CacheStore {
public:
    struct Config {
        std::string bucket;
        std::string prefix;
        std::string endpoint;          // Empty for Google, custom for emulator
        std::string credentials_file;  // Default: $GOOGLE_APPLICATION_CREDENTIALS
        bool verify_ssl = true;
    };

    GcsCacheStore(const Config& config, std::shared_ptr<net::HttpClient> http);

    std::string type_name() const override { return "google_cloud_storage"; }
    std::string describe() const override;

    CacheGetResult get(const std::string& oid, const std::filesystem::path& dest) const override;
    CachePutResult put(const std::string& oid, const std::filesystem::path& source) override;

    /// Upload without the create-only precondition.
    CachePutResult replace(const std::string& oid, const std::filesystem::path& source) override;

private:
    CachePutResult upload(const std::string& oid, const std::filesystem::path& source,
                          bool create_only);

    std::string object_name(const std::string& oid) const;
    std::string download_url(const std::string& oid) const;
    std::string upload_url(const std::string& oid, bool create_only) const;

    /// Adds a bearer token when credentials are available. Returns an error
    /// message when credentials exist but no token could be obtained.
    std::string add_auth_header(net::HttpRequest& request) const;
    std::string fetch_access_token(std::string& token, std::chrono::seconds& lifetime) const;

    Config config_;
    std::string credentials_json_;
    std::shared_ptr<net::HttpClient> http_;

    mutable std::mutex token_mutex_;
    mutable std::string cached_token_;
    mutable std::chrono::steady_clock::time_point token_expiry_;
};

/// Plain HTTP object store: GET/PUT <endpoint>/<oid>.
class HttpCacheStore : public CacheStore {
public:
    struct Config {
        std::string endpoint;
        std::string token_path;  // Optional bearer token file, re-read per request
        bool verify_ssl = true;
    };

    HttpCacheStore(const Config& config, std::shared_ptr<net::HttpClient> http);

    std::string type_name() const override { return "http"; }
    std::string describe() const override { return config_.endpoint; }

    CacheGetResult get(const std::string& oid, const std::filesystem::path& dest) const override;
    CachePutResult put(const std::string& oid, const std::filesystem::path& source) override;

    std::string object_url(const std::string& oid) const;

private:
    std::string add_auth_header(net::HttpRequest& request) const;

    Config config_;
    std::shared_ptr<net::HttpClient> http_;
};

}  // namespace lfscache
