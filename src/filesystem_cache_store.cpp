#include "lfscache/cache_stores.hpp"
#include "lfscache/constants.hpp"
#include "lfscache/oid.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <unistd.h>
#include <vector>

namespace lfscache {

namespace {

/// Copy `from` into an already opened output stream. Returns bytes copied or
/// sets `error`.
uint64_t copy_stream(std::ifstream& in, std::ofstream& out, std::string& error) {
    std::vector<char> buf(constants::COPY_BUFFER_SIZE);
    uint64_t total = 0;
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = in.gcount();
        if (n <= 0) break;
        out.write(buf.data(), n);
        if (!out) {
            error = std::strerror(errno);
            return total;
        }
        total += static_cast<uint64_t>(n);
    }
    if (in.bad()) error = "read error";
    return total;
}

}  // namespace

FilesystemCacheStore::FilesystemCacheStore(const std::filesystem::path& dir)
    : root_(std::filesystem::absolute(dir)) {
    std::filesystem::create_directories(root_);
}

std::filesystem::path FilesystemCacheStore::entry_path(const std::string& oid) const {
    return root_ / oid.substr(0, 2) / oid.substr(2, 2) / oid;
}

CacheGetResult FilesystemCacheStore::get(const std::string& oid,
                                         const std::filesystem::path& dest) const {
    if (!is_valid_oid(oid)) {
        return CacheGetResult::error("invalid oid: " + oid, false);
    }

    auto path = entry_path(oid);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) return CacheGetResult::error("cannot stat " + path.string() + ": " + ec.message(), false);
        return CacheGetResult::miss();
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return CacheGetResult::error("cannot open cache entry " + path.string(), false);
    }

    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
        return CacheGetResult::error("cannot create " + dest.string(), false);
    }

    std::string error;
    uint64_t bytes = copy_stream(in, out, error);
    out.close();
    if (!error.empty() || !out) {
        return CacheGetResult::error("copy from cache failed: " +
                                     (error.empty() ? std::string("write error") : error), false);
    }
    return CacheGetResult::hit(bytes);
}

CachePutResult FilesystemCacheStore::put(const std::string& oid,
                                         const std::filesystem::path& source) {
    CachePutResult result;
    if (!is_valid_oid(oid)) {
        result.error_message = "invalid oid: " + oid;
        return result;
    }

    auto path = entry_path(oid);
    std::error_code ec;

    // Existing intact entry: nothing to do. A damaged one is replaced.
    if (std::filesystem::exists(path, ec)) {
        auto source_size = std::filesystem::file_size(source, ec);
        if (!ec && verify_file(path, oid, source_size)) {
            result.success = true;
            result.already_present = true;
            return result;
        }
    }

    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        result.error_message = "cannot create " + path.parent_path().string() + ": " + ec.message();
        return result;
    }

    // Write to a temp file in the same directory, then rename (atomic)
    std::string tpl = (path.parent_path() / ("." + oid + ".tmp.XXXXXX")).string();
    int fd = mkstemp(tpl.data());
    if (fd < 0) {
        result.error_message = "cannot create temp file in " + path.parent_path().string() +
                               ": " + std::strerror(errno);
        return result;
    }
    close(fd);
    std::filesystem::path temp_path = tpl;

    {
        std::ifstream in(source, std::ios::binary);
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!in || !out) {
            std::filesystem::remove(temp_path, ec);
            result.error_message = "cannot open " + (!in ? source.string() : temp_path.string());
            return result;
        }
        std::string error;
        copy_stream(in, out, error);
        out.close();
        if (!error.empty() || !out) {
            std::filesystem::remove(temp_path, ec);
            result.error_message = "write to cache failed: " +
                                   (error.empty() ? std::string("write error") : error);
            return result;
        }
    }

    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignore;
        std::filesystem::remove(temp_path, ignore);
        result.error_message = "rename into cache failed: " + ec.message();
        return result;
    }

    result.success = true;
    return result;
}

}  // namespace lfscache
