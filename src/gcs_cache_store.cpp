#include "lfscache/cache_stores.hpp"
#include "lfscache/logging.hpp"
#include "lfscache/net/http.hpp"
#include "lfscache/oid.hpp"

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <map>
#include <sstream>
#include <stdexcept>

namespace lfscache {

namespace {

constexpr const char* GCS_SCOPE = "https://www.googleapis.com/auth/devstorage.read_write";
constexpr const char* DEFAULT_TOKEN_URI = "https://oauth2.googleapis.com/token";
constexpr const char* METADATA_TOKEN_URL =
    "http://metadata.google.internal/computeMetadata/v1/instance/service-accounts/default/token";

// RSA-SHA256 signing using OpenSSL
std::string rsa_sign_sha256(const std::string& pem_key, const std::string& data) {
    BIO* bio = BIO_new_mem_buf(pem_key.data(), static_cast<int>(pem_key.size()));
    if (!bio) return "";

    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (!pkey) return "";

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        EVP_PKEY_free(pkey);
        return "";
    }

    std::string signature;
    if (EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, pkey) == 1 &&
        EVP_DigestSignUpdate(ctx, data.data(), data.size()) == 1) {
        size_t sig_len = 0;
        if (EVP_DigestSignFinal(ctx, nullptr, &sig_len) == 1) {
            signature.resize(sig_len);
            if (EVP_DigestSignFinal(ctx, reinterpret_cast<unsigned char*>(signature.data()),
                                    &sig_len) == 1) {
                signature.resize(sig_len);
            } else {
                signature.clear();
            }
        }
    }

    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return signature;
}

std::string form_encode(const std::map<std::string, std::string>& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty()) out += '&';
        out += net::url_encode(key) + "=" + net::url_encode(value);
    }
    return out;
}

}  // namespace

GcsCacheStore::GcsCacheStore(const Config& config, std::shared_ptr<net::HttpClient> http)
    : config_(config)
    , http_(std::move(http)) {
    while (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
        config_.endpoint.pop_back();
    }

    std::string cred_path = config_.credentials_file;
    if (cred_path.empty()) {
        if (const char* env = std::getenv("GOOGLE_APPLICATION_CREDENTIALS")) {
            cred_path = env;
        }
    }
    if (!cred_path.empty()) {
        std::ifstream cred_file(cred_path);
        if (!cred_file) {
            throw std::runtime_error("cannot read GCS credentials file " + cred_path);
        }
        std::ostringstream ss;
        ss << cred_file.rdbuf();
        credentials_json_ = ss.str();
    }
}

std::string GcsCacheStore::describe() const {
    return "gs://" + config_.bucket + "/" + config_.prefix;
}

std::string GcsCacheStore::object_name(const std::string& oid) const {
    return config_.prefix + oid;
}

std::string GcsCacheStore::download_url(const std::string& oid) const {
    std::string base = config_.endpoint.empty() ? "https://storage.googleapis.com" : config_.endpoint;
    return base + "/storage/v1/b/" + config_.bucket + "/o/" +
           net::url_encode(object_name(oid)) + "?alt=media";
}

std::string GcsCacheStore::upload_url(const std::string& oid, bool create_only) const {
    std::string base = config_.endpoint.empty() ? "https://storage.googleapis.com" : config_.endpoint;
    std::string url = base + "/upload/storage/v1/b/" + config_.bucket + "/o?uploadType=media";
    // ifGenerationMatch=0: create only, so concurrent stores of one oid collapse
    if (create_only) url += "&ifGenerationMatch=0";
    return url + "&name=" + net::url_encode(object_name(oid));
}

// ============================================================================
// Credentials
// ============================================================================

std::string GcsCacheStore::add_auth_header(net::HttpRequest& request) const {
    // Emulators accept unauthenticated requests
    if (credentials_json_.empty() && !config_.endpoint.empty()) return {};

    std::lock_guard lock(token_mutex_);

    // Return cached token if still valid (with 5-minute margin)
    auto now = std::chrono::steady_clock::now();
    if (cached_token_.empty() || now >= token_expiry_ - std::chrono::minutes(5)) {
        std::string token;
        std::chrono::seconds lifetime{0};
        auto err = fetch_access_token(token, lifetime);
        if (!err.empty()) return err;
        cached_token_ = token;
        token_expiry_ = now + lifetime;
    }

    request.headers.set_bearer_token(cached_token_);
    return {};
}

std::string GcsCacheStore::fetch_access_token(std::string& token,
                                              std::chrono::seconds& lifetime) const {
    net::HttpRequest token_request;

    if (credentials_json_.empty()) {
        // Running on GCE/GKE: ask the metadata server
        token_request = net::HttpRequest::get(METADATA_TOKEN_URL);
        token_request.headers.set("Metadata-Flavor", "Google");
    } else {
        nlohmann::json creds;
        try {
            creds = nlohmann::json::parse(credentials_json_);
        } catch (const nlohmann::json::exception& e) {
            return std::string("invalid GCS credentials JSON: ") + e.what();
        }
        std::string type = creds.value("type", "");

        if (type == "service_account") {
            std::string client_email = creds.value("client_email", "");
            std::string private_key = creds.value("private_key", "");
            std::string token_uri = creds.value("token_uri", DEFAULT_TOKEN_URI);
            if (client_email.empty() || private_key.empty()) {
                return "service account credentials lack client_email or private_key";
            }

            auto iat = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            nlohmann::json header = {{"alg", "RS256"}, {"typ", "JWT"}};
            nlohmann::json claims = {
                {"iss", client_email},
                {"scope", GCS_SCOPE},
                {"aud", token_uri},
                {"iat", iat},
                {"exp", iat + 3600},
            };
            std::string signing_input = net::base64url_encode(header.dump()) + "." +
                                        net::base64url_encode(claims.dump());
            std::string signature = rsa_sign_sha256(private_key, signing_input);
            if (signature.empty()) {
                return "failed to sign service account JWT";
            }
            std::string jwt = signing_input + "." + net::base64url_encode(signature);

            token_request = net::HttpRequest::post(token_uri, form_encode({
                {"grant_type", "urn:ietf:params:oauth:grant-type:jwt-bearer"},
                {"assertion", jwt},
            }));
        } else if (type == "authorized_user") {
            token_request = net::HttpRequest::post(DEFAULT_TOKEN_URI, form_encode({
                {"grant_type", "refresh_token"},
                {"client_id", creds.value("client_id", "")},
                {"client_secret", creds.value("client_secret", "")},
                {"refresh_token", creds.value("refresh_token", "")},
            }));
        } else {
            return "unsupported GCS credentials type: " + type;
        }
        token_request.headers.set_content_type("application/x-www-form-urlencoded");
    }

    auto response = http_->execute(token_request);
    if (!response.ok()) {
        return "GCS token request failed: " + response.describe();
    }

    try {
        auto j = nlohmann::json::parse(response.body_string());
        token = j.at("access_token").get<std::string>();
        lifetime = std::chrono::seconds(j.value("expires_in", 3300));
    } catch (const nlohmann::json::exception& e) {
        return std::string("invalid GCS token response: ") + e.what();
    }
    return {};
}

// ============================================================================
// Object operations
// ============================================================================

CacheGetResult GcsCacheStore::get(const std::string& oid, const std::filesystem::path& dest) const {
    if (!is_valid_oid(oid)) {
        return CacheGetResult::error("invalid oid: " + oid, false);
    }

    auto request = net::HttpRequest::get(download_url(oid));
    request.verify_ssl = config_.verify_ssl;
    auto auth_error = add_auth_header(request);
    if (!auth_error.empty()) {
        // Token endpoints fail transiently as often as storage does
        return CacheGetResult::error(auth_error, true);
    }

    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) return CacheGetResult::error("cannot create " + dest.string(), false);
    request.sink = [&out](const uint8_t* data, size_t len) {
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        return static_cast<bool>(out);
    };

    auto response = http_->execute(request);
    out.close();

    if (response.is_network_error) {
        return CacheGetResult::error("GCS get " + object_name(oid) + ": " + response.error, true);
    }
    if (!response.error.empty()) {
        return CacheGetResult::error("GCS get " + object_name(oid) + ": " + response.error, false);
    }
    if (response.status_code == 404) {
        return CacheGetResult::miss();
    }
    if (!net::is_success_status(response.status_code)) {
        return CacheGetResult::error("GCS get " + object_name(oid) + ": " + response.describe(),
                                     net::is_transient_status(response.status_code));
    }
    if (!out) {
        return CacheGetResult::error("write error on " + dest.string(), false);
    }
    return CacheGetResult::hit(response.body_bytes);
}

CachePutResult GcsCacheStore::put(const std::string& oid, const std::filesystem::path& source) {
    return upload(oid, source, true);
}

CachePutResult GcsCacheStore::replace(const std::string& oid, const std::filesystem::path& source) {
    return upload(oid, source, false);
}

CachePutResult GcsCacheStore::upload(const std::string& oid, const std::filesystem::path& source,
                                     bool create_only) {
    CachePutResult result;
    if (!is_valid_oid(oid)) {
        result.error_message = "invalid oid: " + oid;
        return result;
    }

    net::HttpRequest request;
    request.method = net::HttpMethod::POST;
    request.url = upload_url(oid, create_only);
    request.body_file = source;
    request.verify_ssl = config_.verify_ssl;
    request.headers.set_content_type("application/octet-stream");
    auto auth_error = add_auth_header(request);
    if (!auth_error.empty()) {
        result.error_message = auth_error;
        result.transient = true;
        return result;
    }

    auto response = http_->execute(request);
    if (response.ok()) {
        result.success = true;
        return result;
    }
    if (response.error.empty() && response.status_code == 412) {
        // Precondition failed: the object already exists
        result.success = true;
        result.already_present = true;
        return result;
    }

    result.error_message = "GCS put " + object_name(oid) + ": " + response.describe();
    result.transient = response.is_network_error ||
                       (response.error.empty() && net::is_transient_status(response.status_code));
    return result;
}

}  // namespace lfscache
