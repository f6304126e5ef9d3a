#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace lfscache {

struct BackendConfig;

namespace net {
class HttpClient;
}

enum class CacheLookup { Hit, Miss, Error };

const char* cache_lookup_name(CacheLookup lookup);

struct CacheGetResult {
    CacheLookup status = CacheLookup::Miss;
    uint64_t bytes = 0;          // bytes written to the destination on a hit
    bool success = true;         // false only for Error
    bool transient = false;      // Error worth retrying
    std::string error_message;

    static CacheGetResult hit(uint64_t bytes);
    static CacheGetResult miss();
    static CacheGetResult error(std::string message, bool transient);
};

struct CachePutResult {
    bool success = false;
    bool transient = false;
    bool already_present = false;  // an entry existed; nothing was written
    std::string error_message;
};

/// Content-addressed object cache keyed by oid.
///
/// Implementations are shared by all transfer workers and must be safe for
/// concurrent use. Entries are immutable: storing an oid that is already
/// present is a successful no-op, and readers never observe a partially
/// written entry. The one exception is replace(), used once an entry has
/// been seen to hold the wrong bytes.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    /// Short backend identifier, e.g. "filesystem".
    virtual std::string type_name() const = 0;

    /// Human-readable location for logs and the transfer log (no secrets).
    virtual std::string describe() const = 0;

    /// Copy the entry for `oid` into `dest` (created or truncated).
    /// A missing entry is a Miss, not an Error. On anything but Hit the
    /// contents of `dest` are unspecified.
    virtual CacheGetResult get(const std::string& oid, const std::filesystem::path& dest) const = 0;

    /// Store the bytes of `source` (already verified against `oid`).
    virtual CachePutResult put(const std::string& oid, const std::filesystem::path& source) = 0;

    /// Overwrite an entry that failed verification. Backends whose put()
    /// already replaces damaged entries use put().
    virtual CachePutResult replace(const std::string& oid, const std::filesystem::path& source) {
        return put(oid, source);
    }
};

/// Factory for creating cache stores from configuration.
class CacheStoreFactory {
public:
    /// Throws std::runtime_error on invalid configuration.
    static std::unique_ptr<CacheStore> create(const BackendConfig& config,
                                              std::shared_ptr<net::HttpClient> http);

    static std::unique_ptr<CacheStore> create_filesystem(const std::filesystem::path& dir);
};

}  // namespace lfscache
