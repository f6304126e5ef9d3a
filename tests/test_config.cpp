#include "test_support.hpp"
#include "lfscache/agent_config.hpp"

using namespace lfscache;

namespace {

/// Build a mutable argv for AgentConfig::from_args().
struct Argv {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;

    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& s : storage) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return ptrs.data(); }
};

void test_backend_config() {
    std::cout << "\n=== BackendConfig ===" << std::endl;

    {
        TEST(empty_type_fails);
        BackendConfig bc;
        ASSERT_NOT_EMPTY(bc.validate(), "empty type should fail");
        PASS();
    }
    {
        TEST(unknown_type_fails);
        BackendConfig bc;
        bc.type = "ftp";
        auto err = bc.validate();
        ASSERT_TRUE(err.find("unknown") != std::string::npos, "should say unknown");
        PASS();
    }
    {
        TEST(filesystem_requires_dir);
        BackendConfig bc;
        bc.type = "filesystem";
        ASSERT_TRUE(bc.validate().find("dir") != std::string::npos, "filesystem needs dir");
        bc.params["dir"] = "/var/cache/lfs";
        ASSERT_EMPTY(bc.validate(), "filesystem with dir should pass");
        PASS();
    }
    {
        TEST(gcs_requires_bucket);
        BackendConfig bc;
        bc.type = "google_cloud_storage";
        ASSERT_TRUE(bc.validate().find("bucket") != std::string::npos, "gcs needs bucket");
        bc.params["bucket"] = "lfs-objects";
        ASSERT_EMPTY(bc.validate(), "gcs with bucket should pass");
        PASS();
    }
    {
        TEST(http_requires_url_endpoint);
        BackendConfig bc;
        bc.type = "http";
        ASSERT_TRUE(bc.validate().find("endpoint") != std::string::npos, "http needs endpoint");
        bc.params["endpoint"] = "cache.internal/lfs";
        ASSERT_TRUE(bc.validate().find("http(s)") != std::string::npos, "scheme required");
        bc.params["endpoint"] = "https://cache.internal/lfs";
        ASSERT_EMPTY(bc.validate(), "https endpoint should pass");
        PASS();
    }
    {
        TEST(from_json_filesystem);
        std::string error;
        auto bc = BackendConfig::from_json(R"({"filesystem":{"dir":"/srv/lfs"}})", error);
        ASSERT_TRUE(bc.has_value(), "should parse: " + error);
        ASSERT_EQ(bc->type, "filesystem", "type");
        ASSERT_EQ(bc->params["dir"], "/srv/lfs", "dir");
        PASS();
    }
    {
        TEST(from_json_http_bearer_token);
        std::string error;
        auto bc = BackendConfig::from_json(
            R"({"http":{"endpoint":"https://c/lfs","authorization":{"bearer":{"token_path":"/run/token"}}}})",
            error);
        ASSERT_TRUE(bc.has_value(), "should parse: " + error);
        ASSERT_EQ(bc->params["token_path"], "/run/token", "token path flattened");
        ASSERT_EQ(bc->params.count("authorization"), 0u, "authorization not kept raw");
        PASS();
    }
    {
        TEST(from_json_rejects_two_backends);
        std::string error;
        auto bc = BackendConfig::from_json(
            R"({"filesystem":{"dir":"/a"},"http":{"endpoint":"http://b"}})", error);
        ASSERT_TRUE(!bc.has_value(), "two backends should fail");
        ASSERT_NOT_EMPTY(error, "error message");
        PASS();
    }
    {
        TEST(from_json_rejects_garbage);
        std::string error;
        ASSERT_TRUE(!BackendConfig::from_json("{not json", error).has_value(), "garbage");
        ASSERT_TRUE(error.find("invalid cache JSON") != std::string::npos, "parse error reported");
        PASS();
    }
    {
        TEST(to_json_reparses_identically);
        std::string error;
        auto bc = BackendConfig::from_json(
            R"({"http":{"endpoint":"https://c/lfs","authorization":{"bearer":{"token_path":"/t"}}}})",
            error);
        ASSERT_TRUE(bc.has_value(), "parse");
        auto again = BackendConfig::from_json(bc->to_json(), error);
        ASSERT_TRUE(again.has_value(), "reparse: " + error);
        ASSERT_EQ(again->type, bc->type, "type");
        ASSERT_TRUE(again->params == bc->params, "params survive to_json");
        PASS();
    }
}

void test_agent_cli() {
    std::cout << "\n=== AgentConfig CLI ===" << std::endl;

    {
        TEST(git_dir_derives_directories);
        Argv a({"transfer-agent", "--git-dir", "/repo/.git"});
        auto config = AgentConfig::from_args(a.argc(), a.argv());
        ASSERT_TRUE(config.has_value(), "should parse");
        ASSERT_EQ(config->temp_dir.string(), "/repo/.git/lfs/tmp", "temp dir");
        ASSERT_EQ(config->logs_dir.string(), "/repo/.git/lfs-cache/logs", "logs dir");
        ASSERT_TRUE(config->cache.empty(), "no cache by default");
        ASSERT_EQ(config->default_concurrency, 8u, "default concurrency");
        PASS();
    }
    {
        TEST(explicit_dirs_win);
        Argv a({"transfer-agent", "--temp-dir", "/tmp/x", "--git-dir", "/repo/.git"});
        auto config = AgentConfig::from_args(a.argc(), a.argv());
        ASSERT_TRUE(config.has_value(), "should parse");
        ASSERT_EQ(config->temp_dir.string(), "/tmp/x", "temp dir kept");
        PASS();
    }
    {
        TEST(cache_and_tuning_flags);
        Argv a({"transfer-agent", "--cache", R"({"filesystem":{"dir":"/c"}})",
                "--temp-dir", "/t", "--concurrency", "3", "--max-retries", "2",
                "--retry-initial-ms", "5", "--retry-max-elapsed-secs", "9", "--verbose",
                "--metrics-file", "/m.prom", "--metrics-interval", "4"});
        auto config = AgentConfig::from_args(a.argc(), a.argv());
        ASSERT_TRUE(config.has_value(), "should parse");
        ASSERT_EQ(config->cache.type, "filesystem", "cache type");
        ASSERT_EQ(config->default_concurrency, 3u, "concurrency");
        ASSERT_EQ(config->backoff.max_retries, 2u, "retries");
        ASSERT_EQ(config->backoff.initial_interval.count(), 5, "initial interval");
        ASSERT_EQ(config->backoff.max_elapsed.count(), 9000, "max elapsed");
        ASSERT_TRUE(config->verbose, "verbose");
        ASSERT_EQ(config->metrics_file.string(), "/m.prom", "metrics file");
        ASSERT_EQ(config->metrics_interval_secs, 4u, "metrics interval");
        ASSERT_EMPTY(config->validate(), "valid");
        PASS();
    }
    {
        TEST(bad_cache_json_rejected);
        Argv a({"transfer-agent", "--cache", R"({"filesystem":{}})"});
        ASSERT_TRUE(!AgentConfig::from_args(a.argc(), a.argv()).has_value(), "invalid cache");
        PASS();
    }
    {
        TEST(unknown_option_rejected);
        Argv a({"transfer-agent", "--bogus"});
        ASSERT_TRUE(!AgentConfig::from_args(a.argc(), a.argv()).has_value(), "unknown option");
        PASS();
    }
    {
        TEST(missing_value_rejected);
        Argv a({"transfer-agent", "--concurrency"});
        ASSERT_TRUE(!AgentConfig::from_args(a.argc(), a.argv()).has_value(), "missing value");
        PASS();
    }
    {
        TEST(non_numeric_rejected);
        Argv a({"transfer-agent", "--concurrency", "many"});
        ASSERT_TRUE(!AgentConfig::from_args(a.argc(), a.argv()).has_value(), "non-numeric");
        PASS();
    }
}

void test_agent_json_and_validation() {
    std::cout << "\n=== AgentConfig JSON and validation ===" << std::endl;

    auto tmpdir = make_temp_dir("lfscache-config");

    {
        TEST(load_json_overlay);
        auto path = tmpdir / "agent.json";
        write_file(path, R"({
            "cache": {"google_cloud_storage": {"bucket": "b", "prefix": "lfs/"}},
            "git_dir": "/r/.git",
            "concurrency": 16,
            "verbose": true,
            "retry": {"initial_interval_ms": 10, "max_retries": 4, "multiplier": 2.0}
        })");
        AgentConfig config;
        ASSERT_TRUE(config.load_json(path), "load");
        config.apply_defaults();
        ASSERT_EQ(config.cache.type, "google_cloud_storage", "cache type");
        ASSERT_EQ(config.cache.params["prefix"], "lfs/", "prefix");
        ASSERT_EQ(config.default_concurrency, 16u, "concurrency");
        ASSERT_EQ(config.backoff.max_retries, 4u, "retries");
        ASSERT_EQ(config.backoff.initial_interval.count(), 10, "interval");
        ASSERT_EQ(config.temp_dir.string(), "/r/.git/lfs/tmp", "temp from git dir");
        ASSERT_EMPTY(config.validate(), "valid");
        PASS();
    }
    {
        TEST(load_json_missing_file);
        AgentConfig config;
        ASSERT_TRUE(!config.load_json(tmpdir / "nope.json"), "missing file fails");
        PASS();
    }
    {
        TEST(validate_requires_temp_dir);
        AgentConfig config;
        ASSERT_TRUE(config.validate().find("temp_dir") != std::string::npos, "temp dir needed");
        PASS();
    }
    {
        TEST(validate_concurrency_bounds);
        AgentConfig config;
        config.temp_dir = "/t";
        config.default_concurrency = 0;
        ASSERT_NOT_EMPTY(config.validate(), "zero rejected");
        config.default_concurrency = 10000;
        ASSERT_NOT_EMPTY(config.validate(), "huge rejected");
        config.default_concurrency = 4;
        ASSERT_EMPTY(config.validate(), "4 ok");
        PASS();
    }
    {
        TEST(validate_backoff);
        AgentConfig config;
        config.temp_dir = "/t";
        config.backoff.multiplier = 0.5;
        ASSERT_NOT_EMPTY(config.validate(), "shrinking backoff rejected");
        PASS();
    }

    fs::remove_all(tmpdir);
}

}  // namespace

void test_config() {
    test_backend_config();
    test_agent_cli();
    test_agent_json_and_validation();
}
