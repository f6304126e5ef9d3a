#include "test_support.hpp"
#include "lfscache/retry.hpp"

#include <algorithm>

using namespace lfscache;
using namespace std::chrono_literals;

namespace {

struct Attempt {
    bool success = false;
    bool transient = false;
    int value = 0;
};

BackoffSettings fast_settings(size_t max_retries) {
    BackoffSettings s;
    s.initial_interval = 100ms;
    s.multiplier = 2.0;
    s.randomization_factor = 0.5;
    s.max_interval = 1000ms;
    s.max_elapsed = 60s;
    s.max_retries = max_retries;
    return s;
}

void test_backoff_schedule() {
    std::cout << "\n=== Exponential backoff ===" << std::endl;

    {
        TEST(delays_within_jitter_bounds);
        ExponentialBackoff backoff(fast_settings(6), 42);
        double interval = 100;
        for (int i = 0; i < 6; ++i) {
            auto d = backoff.next_delay();
            ASSERT_TRUE(d.has_value(), "delay expected");
            double ms = static_cast<double>(d->count());
            ASSERT_TRUE(ms >= interval * 0.5 - 1 && ms <= interval * 1.5 + 1,
                        "delay outside [i(1-r), i(1+r)]");
            interval = std::min(interval * 2.0, 1000.0);
        }
        PASS();
    }
    {
        TEST(interval_capped_at_max);
        ExponentialBackoff backoff(fast_settings(20), 7);
        for (int i = 0; i < 10; ++i) backoff.next_delay();
        ASSERT_EQ(backoff.current_interval().count(), 1000, "capped interval");
        PASS();
    }
    {
        TEST(exhausted_after_max_retries);
        ExponentialBackoff backoff(fast_settings(3), 1);
        ASSERT_TRUE(backoff.next_delay().has_value(), "1");
        ASSERT_TRUE(backoff.next_delay().has_value(), "2");
        ASSERT_TRUE(backoff.next_delay().has_value(), "3");
        ASSERT_TRUE(!backoff.next_delay().has_value(), "exhausted");
        ASSERT_EQ(backoff.retries(), 3u, "retry count");
        backoff.reset();
        ASSERT_TRUE(backoff.next_delay().has_value(), "reset restores budget");
        PASS();
    }
    {
        TEST(exhausted_after_max_elapsed);
        auto s = fast_settings(100);
        s.max_elapsed = 20ms;
        ExponentialBackoff backoff(s, 1);
        std::this_thread::sleep_for(30ms);
        ASSERT_TRUE(!backoff.next_delay().has_value(), "elapsed budget spent");
        PASS();
    }
    {
        TEST(no_jitter_is_exact);
        auto s = fast_settings(3);
        s.randomization_factor = 0.0;
        ExponentialBackoff backoff(s, 9);
        ASSERT_EQ(backoff.next_delay()->count(), 100, "first");
        ASSERT_EQ(backoff.next_delay()->count(), 200, "second");
        ASSERT_EQ(backoff.next_delay()->count(), 400, "third");
        PASS();
    }
    {
        TEST(settings_validation);
        BackoffSettings s;
        ASSERT_EMPTY(s.validate(), "defaults valid");
        s.randomization_factor = 1.0;
        ASSERT_NOT_EMPTY(s.validate(), "factor 1 rejected");
        s = BackoffSettings{};
        s.max_interval = 1ms;
        ASSERT_NOT_EMPTY(s.validate(), "max below initial rejected");
        PASS();
    }
}

void test_retry_policy() {
    std::cout << "\n=== Retry policy ===" << std::endl;

    std::vector<std::chrono::milliseconds> slept;
    RetryPolicy policy(fast_settings(4), [&slept](std::chrono::milliseconds d) { slept.push_back(d); });

    {
        TEST(success_first_try);
        slept.clear();
        int calls = 0;
        auto r = policy.run([&] { ++calls; return Attempt{true, false, 1}; }, TransientFailure{});
        ASSERT_TRUE(r.success, "success");
        ASSERT_EQ(calls, 1, "one call");
        ASSERT_TRUE(slept.empty(), "no sleeps");
        PASS();
    }
    {
        TEST(transient_then_success);
        slept.clear();
        int calls = 0;
        auto r = policy.run(
            [&] {
                ++calls;
                return calls < 3 ? Attempt{false, true, calls} : Attempt{true, false, calls};
            },
            TransientFailure{});
        ASSERT_TRUE(r.success, "eventually succeeds");
        ASSERT_EQ(r.value, 3, "third attempt");
        ASSERT_EQ(slept.size(), 2u, "two waits");
        PASS();
    }
    {
        TEST(permanent_not_retried);
        slept.clear();
        int calls = 0;
        auto r = policy.run([&] { ++calls; return Attempt{false, false, 0}; }, TransientFailure{});
        ASSERT_TRUE(!r.success, "fails");
        ASSERT_EQ(calls, 1, "no retry for permanent failure");
        PASS();
    }
    {
        TEST(gives_up_after_budget);
        slept.clear();
        int calls = 0;
        size_t retry_callbacks = 0;
        auto r = policy.run(
            [&] { ++calls; return Attempt{false, true, calls}; }, TransientFailure{},
            [&](const Attempt&, size_t attempt, std::chrono::milliseconds) {
                retry_callbacks = attempt;
            });
        ASSERT_TRUE(!r.success && r.transient, "last transient result returned");
        ASSERT_EQ(calls, 5, "initial attempt plus four retries");
        ASSERT_EQ(retry_callbacks, 4u, "on_retry saw every retry");
        ASSERT_EQ(slept.size(), 4u, "four waits");
        PASS();
    }
    {
        TEST(sleeps_grow);
        ASSERT_TRUE(slept.size() == 4 && slept[3] > slept[0], "later waits are longer");
        PASS();
    }
}

}  // namespace

void test_retry() {
    test_backoff_schedule();
    test_retry_policy();
}
