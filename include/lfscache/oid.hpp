#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace lfscache {

/// True for a 64-character lowercase hex SHA-256 digest.
bool is_valid_oid(std::string_view oid);

/// Incremental SHA-256 over streamed bytes.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, size_t len);

    /// Finish the digest and return it as lowercase hex. The hasher is reset.
    std::string hex_digest();

private:
    EVP_MD_CTX* ctx_;
};

struct FileDigest {
    bool success = false;
    uint64_t size = 0;
    std::string oid;
    std::string error_message;
};

/// Hash a file on disk.
FileDigest digest_file(const std::filesystem::path& path);

/// True if the file's content has exactly `size` bytes and hashes to `oid`.
bool verify_file(const std::filesystem::path& path, const std::string& oid, uint64_t size,
                 std::string* error = nullptr);

}  // namespace lfscache
