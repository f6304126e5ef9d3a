#include "test_support.hpp"
#include "lfscache/agent_config.hpp"
#include "lfscache/cache_stores.hpp"
#include "lfscache/net/http.hpp"
#include "lfscache/origin_transport.hpp"
#include "lfscache/stats.hpp"
#include "lfscache/transfer_orchestrator.hpp"

#include <atomic>

using namespace lfscache;

namespace {

std::shared_ptr<net::HttpClient> make_http() {
    net::HttpClientConfig config;
    config.user_agent = "lfs-cache-test";
    return std::make_shared<net::HttpClient>(config);
}

/// GCS JSON API subset: media download and create-only media upload.
class FakeGcsServer {
public:
    explicit FakeGcsServer(std::string bucket)
        : bucket_(std::move(bucket))
        , server_([this](const TestRequest& r) { return handle(r); }) {}

    std::string url() const { return server_.url(); }
    size_t objects() const {
        std::lock_guard lock(mutex_);
        return objects_.size();
    }
    std::string last_auth() const {
        std::lock_guard lock(mutex_);
        return last_auth_;
    }

private:
    static std::string query_param(const std::string& query, const std::string& key) {
        size_t pos = 0;
        while (pos <= query.size()) {
            size_t amp = query.find('&', pos);
            if (amp == std::string::npos) amp = query.size();
            auto kv = query.substr(pos, amp - pos);
            if (kv.rfind(key + "=", 0) == 0) return kv.substr(key.size() + 1);
            pos = amp + 1;
        }
        return {};
    }

    TestResponse handle(const TestRequest& r) {
        std::lock_guard lock(mutex_);
        last_auth_ = r.header("authorization");
        TestResponse resp;

        std::string download_prefix = "/storage/v1/b/" + bucket_ + "/o/";
        std::string upload_path = "/upload/storage/v1/b/" + bucket_ + "/o";

        if (r.method == "GET" && r.path.rfind(download_prefix, 0) == 0) {
            auto name = r.path.substr(download_prefix.size());
            auto it = objects_.find(name);
            if (query_param(r.query, "alt") != "media") {
                resp.status = 400;
            } else if (it == objects_.end()) {
                resp.status = 404;
                resp.body = R"({"error":{"code":404,"message":"No such object"}})";
            } else {
                resp.body = it->second;
            }
        } else if (r.method == "POST" && r.path == upload_path) {
            auto name = query_param(r.query, "name");
            if (query_param(r.query, "ifGenerationMatch") == "0" && objects_.count(name)) {
                resp.status = 412;
                resp.body = R"({"error":{"code":412,"message":"Precondition Failed"}})";
            } else {
                objects_[name] = r.body;
                resp.body = R"({"kind":"storage#object"})";
            }
        } else {
            resp.status = 404;
        }
        return resp;
    }

    std::string bucket_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> objects_;
    std::string last_auth_;
    TestHttpServer server_;
};

void test_filesystem_store() {
    std::cout << "\n=== Filesystem cache store ===" << std::endl;

    auto tmpdir = make_temp_dir("lfscache-fs");
    auto content = make_object(100 * 1024, 1);
    auto oid = sha256_hex(content);
    auto source = tmpdir / "source.bin";
    write_file(source, content);

    FilesystemCacheStore store(tmpdir / "cache");

    {
        TEST(absent_entry_is_miss);
        auto r = store.get(oid, tmpdir / "out.bin");
        ASSERT_TRUE(r.status == CacheLookup::Miss, "miss expected");
        ASSERT_TRUE(r.success, "miss is not an error");
        ASSERT_EQ(std::string(cache_lookup_name(r.status)), "miss", "lookup name");
        PASS();
    }
    {
        TEST(put_then_get_roundtrip);
        auto put = store.put(oid, source);
        ASSERT_TRUE(put.success, "put: " + put.error_message);
        ASSERT_TRUE(!put.already_present, "first put writes");
        ASSERT_TRUE(fs::exists(store.entry_path(oid)), "entry file exists");
        ASSERT_EQ(store.entry_path(oid).parent_path().filename().string(), oid.substr(2, 2),
                  "sharded layout");

        auto r = store.get(oid, tmpdir / "out.bin");
        ASSERT_TRUE(r.status == CacheLookup::Hit, "hit expected");
        ASSERT_EQ(r.bytes, content.size(), "bytes");
        ASSERT_TRUE(read_file(tmpdir / "out.bin") == content, "same content");
        PASS();
    }
    {
        TEST(second_put_is_noop);
        auto put = store.put(oid, source);
        ASSERT_TRUE(put.success && put.already_present, "already present");
        PASS();
    }
    {
        TEST(no_temp_files_left);
        size_t files = 0;
        for (auto& e : fs::recursive_directory_iterator(tmpdir / "cache")) {
            if (e.is_regular_file()) ++files;
        }
        ASSERT_EQ(files, 1u, "only the entry itself");
        PASS();
    }
    {
        TEST(damaged_entry_replaced);
        write_file(store.entry_path(oid), "garbage");
        auto put = store.put(oid, source);
        ASSERT_TRUE(put.success && !put.already_present, "rewritten");
        ASSERT_TRUE(read_file(store.entry_path(oid)) == content, "entry repaired");
        PASS();
    }
    {
        TEST(invalid_oid_rejected);
        auto r = store.get("../../etc/passwd", tmpdir / "out.bin");
        ASSERT_TRUE(r.status == CacheLookup::Error && !r.transient, "permanent error");
        auto put = store.put("ABC", source);
        ASSERT_TRUE(!put.success, "put rejected");
        PASS();
    }
    {
        TEST(concurrent_puts_same_oid);
        auto other = make_object(4096, 2);
        auto other_oid = sha256_hex(other);
        auto other_src = tmpdir / "other.bin";
        write_file(other_src, other);
        std::atomic<int> ok{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] {
                if (store.put(other_oid, other_src).success) ++ok;
            });
        }
        for (auto& t : threads) t.join();
        ASSERT_EQ(ok.load(), 8, "all puts succeed");
        ASSERT_TRUE(read_file(store.entry_path(other_oid)) == other, "entry intact");
        PASS();
    }
    {
        TEST(factory_builds_filesystem);
        BackendConfig bc;
        bc.type = "filesystem";
        bc.params["dir"] = (tmpdir / "cache").string();
        auto made = CacheStoreFactory::create(bc, nullptr);
        ASSERT_EQ(made->type_name(), "filesystem", "type");
        auto r = made->get(oid, tmpdir / "out2.bin");
        ASSERT_TRUE(r.status == CacheLookup::Hit, "shared directory");
        PASS();
    }
    {
        TEST(factory_rejects_invalid_config);
        BackendConfig bc;
        bc.type = "http";
        bool threw = false;
        try {
            CacheStoreFactory::create(bc, nullptr);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "missing endpoint throws");
        PASS();
    }

    fs::remove_all(tmpdir);
}

void test_http_store() {
    std::cout << "\n=== HTTP cache store ===" << std::endl;

    auto tmpdir = make_temp_dir("lfscache-http");
    auto content = make_object(70 * 1024, 3);
    auto oid = sha256_hex(content);
    auto source = tmpdir / "source.bin";
    write_file(source, content);

    FakeObjectServer server("/lfs");
    auto http = make_http();

    HttpCacheStore::Config config;
    config.endpoint = server.base_url() + "/";
    HttpCacheStore store(config, http);

    {
        TEST(object_url_joins_endpoint);
        ASSERT_EQ(store.object_url(oid), server.object_url(oid), "no doubled slash");
        PASS();
    }
    {
        TEST(not_found_is_miss);
        auto r = store.get(oid, tmpdir / "out.bin");
        ASSERT_TRUE(r.status == CacheLookup::Miss, "404 is a miss");
        PASS();
    }
    {
        TEST(put_then_get);
        auto put = store.put(oid, source);
        ASSERT_TRUE(put.success, "put: " + put.error_message);
        ASSERT_TRUE(server.object(oid) == content, "server received body");
        auto r = store.get(oid, tmpdir / "out.bin");
        ASSERT_TRUE(r.status == CacheLookup::Hit, "hit");
        ASSERT_TRUE(read_file(tmpdir / "out.bin") == content, "content");
        PASS();
    }
    {
        TEST(server_error_is_transient);
        server.fail_next(1, 503);
        auto r = store.get(oid, tmpdir / "out.bin");
        ASSERT_TRUE(r.status == CacheLookup::Error && r.transient, "503 transient");
        PASS();
    }
    {
        TEST(forbidden_is_permanent);
        server.fail_next(1, 403);
        auto r = store.get(oid, tmpdir / "out.bin");
        ASSERT_TRUE(r.status == CacheLookup::Error && !r.transient, "403 permanent");
        server.fail_next(1, 403);
        auto put = store.put(oid, source);
        ASSERT_TRUE(!put.success && !put.transient, "403 put permanent");
        PASS();
    }
    {
        TEST(bearer_token_reread_per_request);
        auto token_path = tmpdir / "token";
        write_file(token_path, "first-token\n");
        HttpCacheStore::Config authed = config;
        authed.token_path = token_path.string();
        HttpCacheStore auth_store(authed, http);

        auth_store.get(oid, tmpdir / "out.bin");
        ASSERT_EQ(server.last_header("authorization"), "Bearer first-token", "first token");
        write_file(token_path, "second-token");
        auth_store.get(oid, tmpdir / "out.bin");
        ASSERT_EQ(server.last_header("authorization"), "Bearer second-token", "rotated token");
        PASS();
    }
    {
        TEST(unreachable_is_transient);
        server.stop();
        auto r = store.get(oid, tmpdir / "out.bin");
        ASSERT_TRUE(r.status == CacheLookup::Error && r.transient, "connection refused");
        PASS();
    }

    fs::remove_all(tmpdir);
}

void test_gcs_store() {
    std::cout << "\n=== GCS cache store (emulator) ===" << std::endl;

    auto tmpdir = make_temp_dir("lfscache-gcs");
    auto content = make_object(80 * 1024, 4);
    auto oid = sha256_hex(content);
    auto source = tmpdir / "source.bin";
    write_file(source, content);

    FakeGcsServer gcs("lfs-bucket");

    BackendConfig bc;
    bc.type = "google_cloud_storage";
    bc.params["bucket"] = "lfs-bucket";
    bc.params["prefix"] = "objects/";
    bc.params["endpoint"] = gcs.url();
    auto store = CacheStoreFactory::create(bc, make_http());

    {
        TEST(describe_names_bucket);
        ASSERT_EQ(store->describe(), "gs://lfs-bucket/objects/", "describe");
        PASS();
    }
    {
        TEST(missing_object_is_miss);
        auto r = store->get(oid, tmpdir / "out.bin");
        ASSERT_TRUE(r.status == CacheLookup::Miss, "404 is a miss: " + r.error_message);
        PASS();
    }
    {
        TEST(put_then_get);
        auto put = store->put(oid, source);
        ASSERT_TRUE(put.success && !put.already_present, "put: " + put.error_message);
        auto r = store->get(oid, tmpdir / "out.bin");
        ASSERT_TRUE(r.status == CacheLookup::Hit, "hit: " + r.error_message);
        ASSERT_TRUE(read_file(tmpdir / "out.bin") == content, "content");
        PASS();
    }
    {
        TEST(duplicate_put_precondition_is_success);
        auto put = store->put(oid, source);
        ASSERT_TRUE(put.success && put.already_present, "412 treated as present");
        ASSERT_EQ(gcs.objects(), 1u, "one object");
        PASS();
    }
    {
        TEST(replace_overwrites_existing_object);
        auto good = make_object(30 * 1024, 5);
        auto good_oid = sha256_hex(good);
        write_file(tmpdir / "good.bin", good);
        write_file(tmpdir / "junk.bin", "junk");
        ASSERT_TRUE(store->put(good_oid, tmpdir / "junk.bin").success, "seed damaged object");
        auto again = store->put(good_oid, tmpdir / "good.bin");
        ASSERT_TRUE(again.already_present, "create-only put keeps the object");
        auto fixed = store->replace(good_oid, tmpdir / "good.bin");
        ASSERT_TRUE(fixed.success && !fixed.already_present, "replace: " + fixed.error_message);
        store->get(good_oid, tmpdir / "out.bin");
        ASSERT_TRUE(read_file(tmpdir / "out.bin") == good, "good bytes stored");
        PASS();
    }
    {
        TEST(corrupt_object_repaired_by_download);
        auto good = make_object(40 * 1024, 6);
        auto good_oid = sha256_hex(good);
        write_file(tmpdir / "junk.bin", "definitely not the object");
        ASSERT_TRUE(store->put(good_oid, tmpdir / "junk.bin").success, "seed damaged object");

        FakeObjectServer origin;
        origin.put_object(good_oid, good);
        OriginTransport transport(make_http(),
                                  RetryPolicy(BackoffSettings{}, [](std::chrono::milliseconds) {}));
        StatsAggregator stats;
        OrchestratorOptions options;
        options.concurrency = 1;
        options.temp_dir = tmpdir / "staging";
        fs::create_directories(options.temp_dir);
        TransferOrchestrator orch(options, store.get(), transport, stats, {}, {});

        TransferRequest request;
        request.operation = Operation::Download;
        request.oid = good_oid;
        request.size = good.size();
        request.action = TransferAction{origin.object_url(good_oid), {}, std::nullopt};
        auto out = orch.execute(request);
        ASSERT_TRUE(out.success, "download: " + out.error.message);
        ASSERT_EQ(stats.snapshot().cache_corrupt, 1u, "corruption detected");
        ASSERT_EQ(origin.gets(), 1u, "fetched from origin");

        auto r = store->get(good_oid, tmpdir / "out.bin");
        ASSERT_TRUE(r.status == CacheLookup::Hit, "hit");
        ASSERT_TRUE(read_file(tmpdir / "out.bin") == good, "bucket holds the good bytes");
        PASS();
    }
    {
        TEST(emulator_needs_no_auth);
        ASSERT_TRUE(gcs.last_auth().empty(), "no Authorization header");
        PASS();
    }
    {
        TEST(unreadable_credentials_rejected);
        auto with_creds = bc;
        with_creds.params["credentials_file"] = (tmpdir / "missing.json").string();
        bool threw = false;
        try {
            CacheStoreFactory::create(with_creds, make_http());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "missing credentials file throws");
        PASS();
    }

    fs::remove_all(tmpdir);
}

}  // namespace

void test_cache_store() {
    test_filesystem_store();
    test_http_store();
    test_gcs_store();
}
