#include "lfscache/oid.hpp"
#include "lfscache/constants.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <stdexcept>
#include <vector>

namespace lfscache {

bool is_valid_oid(std::string_view oid) {
    if (oid.size() != 64) return false;
    for (char c : oid) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) return false;
    }
    return true;
}

// --- Sha256 ---

Sha256::Sha256()
    : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("failed to initialize SHA-256 context");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const void* data, size_t len) {
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256::hex_digest() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &len) != 1) {
        throw std::runtime_error("SHA-256 finalize failed");
    }
    EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr);

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0F];
    }
    return out;
}

// --- File helpers ---

FileDigest digest_file(const std::filesystem::path& path) {
    FileDigest result;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        result.error_message = "cannot open " + path.string();
        return result;
    }

    Sha256 hasher;
    std::vector<char> buf(constants::COPY_BUFFER_SIZE);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = in.gcount();
        if (n <= 0) break;
        hasher.update(buf.data(), static_cast<size_t>(n));
        result.size += static_cast<uint64_t>(n);
    }
    if (in.bad()) {
        result.error_message = "read error on " + path.string();
        return result;
    }

    result.oid = hasher.hex_digest();
    result.success = true;
    return result;
}

bool verify_file(const std::filesystem::path& path, const std::string& oid, uint64_t size,
                 std::string* error) {
    auto digest = digest_file(path);
    if (!digest.success) {
        if (error) *error = digest.error_message;
        return false;
    }
    if (digest.size != size) {
        if (error) {
            *error = "size mismatch: expected " + std::to_string(size) +
                     " bytes, got " + std::to_string(digest.size);
        }
        return false;
    }
    if (digest.oid != oid) {
        if (error) *error = "digest mismatch: content hashes to " + digest.oid;
        return false;
    }
    return true;
}

}  // namespace lfscache
