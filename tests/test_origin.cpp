#include "test_support.hpp"
#include "lfscache/net/http.hpp"
#include "lfscache/origin_transport.hpp"

using namespace lfscache;
using namespace std::chrono_literals;

namespace {

RetryPolicy quick_retry(size_t max_retries) {
    BackoffSettings s;
    s.initial_interval = 1ms;
    s.max_interval = 5ms;
    s.max_retries = max_retries;
    return RetryPolicy(s, [](std::chrono::milliseconds) {});
}

std::shared_ptr<net::HttpClient> make_http() {
    net::HttpClientConfig config;
    config.user_agent = "lfs-cache-test";
    return std::make_shared<net::HttpClient>(config);
}

void test_rfc3339() {
    std::cout << "\n=== Action expiry ===" << std::endl;

    {
        TEST(parse_utc);
        auto tp = parse_rfc3339("2016-11-10T15:29:07Z");
        ASSERT_TRUE(tp.has_value(), "parses");
        ASSERT_EQ(std::chrono::system_clock::to_time_t(*tp), 1478791747, "epoch seconds");
        PASS();
    }
    {
        TEST(parse_offset_and_fraction);
        auto a = parse_rfc3339("2016-11-10T17:29:07.500+02:00");
        auto b = parse_rfc3339("2016-11-10T15:29:07.5Z");
        ASSERT_TRUE(a && b, "both parse");
        ASSERT_TRUE(*a == *b, "same instant");
        PASS();
    }
    {
        TEST(reject_garbage);
        ASSERT_TRUE(!parse_rfc3339("yesterday").has_value(), "garbage");
        ASSERT_TRUE(!parse_rfc3339("2016-11-10T15:29:07").has_value(), "zone required");
        PASS();
    }
    {
        TEST(expired_compares_now);
        TransferAction action;
        ASSERT_TRUE(!action.expired(), "no expiry never expires");
        action.expires_at = std::chrono::system_clock::now() - 1s;
        ASSERT_TRUE(action.expired(), "past");
        action.expires_at = std::chrono::system_clock::now() + 1h;
        ASSERT_TRUE(!action.expired(), "future");
        PASS();
    }
    {
        TEST(failure_names);
        ASSERT_EQ(std::string(transfer_failure_name(TransferFailure::Integrity)), "integrity",
                  "integrity");
        ASSERT_EQ(std::string(transfer_failure_name(TransferFailure::Expired)), "expired",
                  "expired");
        ASSERT_EQ(std::string(transfer_failure_name(TransferFailure::None)), "none", "none");
        PASS();
    }
}

void test_download() {
    std::cout << "\n=== Origin download ===" << std::endl;

    auto tmpdir = make_temp_dir("lfscache-origin");
    auto content = make_object(200 * 1024, 11);
    auto oid = sha256_hex(content);

    FakeObjectServer origin;
    origin.put_object(oid, content);
    auto http = make_http();
    OriginTransport transport(http, quick_retry(3));

    TransferAction action;
    action.href = origin.object_url(oid);
    action.headers["Authorization"] = "RemoteAuth secret";

    {
        TEST(verified_download);
        std::vector<uint64_t> progress;
        auto r = transport.download(oid, content.size(), action, tmpdir / "a",
                                    [&](uint64_t n) { progress.push_back(n); });
        ASSERT_TRUE(r.success, "download: " + r.error_message);
        ASSERT_EQ(r.bytes, content.size(), "bytes");
        ASSERT_TRUE(read_file(tmpdir / "a") == content, "content");
        ASSERT_EQ(origin.last_header("authorization"), "RemoteAuth secret", "action headers sent");
        ASSERT_TRUE(!progress.empty() && progress.back() == content.size(), "progress reaches size");
        PASS();
    }
    {
        TEST(transient_failures_retried);
        origin.fail_next(2, 502);
        auto before = origin.gets();
        auto r = transport.download(oid, content.size(), action, tmpdir / "b");
        ASSERT_TRUE(r.success, "recovers: " + r.error_message);
        ASSERT_EQ(r.attempts, 3u, "three attempts");
        ASSERT_EQ(origin.gets() - before, 1u, "one successful GET after failures");
        PASS();
    }
    {
        TEST(retry_budget_exhausted);
        origin.fail_next(10, 503);
        auto r = transport.download(oid, content.size(), action, tmpdir / "c");
        ASSERT_TRUE(!r.success && r.failure == TransferFailure::Transient, "transient failure");
        ASSERT_EQ(r.attempts, 4u, "initial + 3 retries");
        ASSERT_EQ(r.http_status, 503, "status kept");
        origin.fail_next(0);
        PASS();
    }
    {
        TEST(not_found_is_permanent);
        TransferAction missing = action;
        missing.href = origin.object_url(std::string(64, 'a'));
        auto r = transport.download(std::string(64, 'a'), 10, missing, tmpdir / "d");
        ASSERT_TRUE(!r.success && r.failure == TransferFailure::Permanent, "permanent");
        ASSERT_EQ(r.attempts, 1u, "no retry");
        ASSERT_EQ(r.http_status, 404, "status");
        PASS();
    }
    {
        TEST(digest_mismatch_is_integrity);
        auto wrong = content;
        wrong[1000] ^= 0x5a;
        auto bad_oid = std::string(64, 'b');
        origin.put_object(bad_oid, wrong);
        TransferAction bad = action;
        bad.href = origin.object_url(bad_oid);
        auto r = transport.download(bad_oid, wrong.size(), bad, tmpdir / "e");
        ASSERT_TRUE(!r.success && r.failure == TransferFailure::Integrity, "integrity");
        ASSERT_EQ(r.attempts, 1u, "never retried");
        PASS();
    }
    {
        TEST(short_body_is_integrity);
        auto r = transport.download(oid, content.size() + 10, action, tmpdir / "f");
        ASSERT_TRUE(!r.success && r.failure == TransferFailure::Integrity, "size mismatch");
        PASS();
    }
    {
        TEST(oversized_body_aborted);
        auto r = transport.download(oid, 1024, action, tmpdir / "g");
        ASSERT_TRUE(!r.success && r.failure == TransferFailure::Integrity, "oversized");
        ASSERT_TRUE(fs::file_size(tmpdir / "g") <= 1024, "stopped writing at declared size");
        PASS();
    }
    {
        TEST(expired_action_fails_fast);
        TransferAction expired = action;
        expired.expires_at = std::chrono::system_clock::now() - 1s;
        auto before = origin.gets();
        auto r = transport.download(oid, content.size(), expired, tmpdir / "h");
        ASSERT_TRUE(!r.success && r.failure == TransferFailure::Expired, "expired");
        ASSERT_EQ(origin.gets(), before, "no request made");
        PASS();
    }

    fs::remove_all(tmpdir);
}

void test_upload() {
    std::cout << "\n=== Origin upload ===" << std::endl;

    auto tmpdir = make_temp_dir("lfscache-upload");
    auto content = make_object(90 * 1024, 12);
    auto oid = sha256_hex(content);
    write_file(tmpdir / "obj", content);

    FakeObjectServer origin;
    OriginTransport transport(make_http(), quick_retry(2));
    TransferAction action;
    action.href = origin.object_url(oid);

    {
        TEST(put_body);
        auto r = transport.upload(oid, content.size(), action, tmpdir / "obj");
        ASSERT_TRUE(r.success, "upload: " + r.error_message);
        ASSERT_TRUE(origin.object(oid) == content, "origin has bytes");
        PASS();
    }
    {
        TEST(size_mismatch_rejected_locally);
        auto before = origin.puts();
        auto r = transport.upload(oid, content.size() - 1, action, tmpdir / "obj");
        ASSERT_TRUE(!r.success && r.failure == TransferFailure::Integrity, "integrity");
        ASSERT_EQ(origin.puts(), before, "nothing sent");
        PASS();
    }
    {
        TEST(transient_then_success);
        origin.fail_next(1, 500);
        auto r = transport.upload(oid, content.size(), action, tmpdir / "obj");
        ASSERT_TRUE(r.success, "recovers: " + r.error_message);
        ASSERT_EQ(r.attempts, 2u, "two attempts");
        PASS();
    }
    {
        TEST(unauthorized_permanent);
        origin.fail_next(1, 401);
        auto r = transport.upload(oid, content.size(), action, tmpdir / "obj");
        ASSERT_TRUE(!r.success && r.failure == TransferFailure::Permanent, "permanent");
        ASSERT_EQ(r.http_status, 401, "status");
        PASS();
    }

    fs::remove_all(tmpdir);
}

}  // namespace

void test_origin() {
    test_rfc3339();
    test_download();
    test_upload();
}
