#pragma once

#include "lfscache/constants.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>

namespace lfscache {

struct BackoffSettings {
    std::chrono::milliseconds initial_interval{constants::DEFAULT_INITIAL_INTERVAL_MS};
    double multiplier = constants::DEFAULT_BACKOFF_MULTIPLIER;
    double randomization_factor = constants::DEFAULT_RANDOMIZATION_FACTOR;
    std::chrono::milliseconds max_interval{constants::DEFAULT_MAX_INTERVAL_MS};
    std::chrono::milliseconds max_elapsed{constants::DEFAULT_MAX_ELAPSED_MS};
    size_t max_retries = constants::DEFAULT_MAX_RETRIES;

    /// Returns error message or empty string.
    std::string validate() const;
};

/// Exponential backoff schedule with jitter.
///
/// Each call to next_delay() returns the wait before the next attempt, drawn
/// uniformly from [interval * (1 - r), interval * (1 + r)]. The interval grows
/// by `multiplier` up to `max_interval`. Returns nullopt once `max_retries`
/// delays have been handed out or `max_elapsed` has passed since construction
/// (or the last reset()).
class ExponentialBackoff {
public:
    explicit ExponentialBackoff(const BackoffSettings& settings);
    ExponentialBackoff(const BackoffSettings& settings, uint64_t seed);

    std::optional<std::chrono::milliseconds> next_delay();
    void reset();

    size_t retries() const { return retries_; }
    std::chrono::milliseconds current_interval() const { return current_interval_; }

private:
    BackoffSettings settings_;
    std::chrono::milliseconds current_interval_;
    std::chrono::steady_clock::time_point start_;
    size_t retries_ = 0;
    std::mt19937_64 rng_;
};

/// Runs an operation until it succeeds, fails permanently, or the backoff
/// schedule is exhausted. Whether an outcome is retried is decided by the
/// caller-supplied classifier, so the policy knows nothing about the error
/// types of the wrapped operation.
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryPolicy();
    explicit RetryPolicy(BackoffSettings settings, Sleeper sleeper = {});

    const BackoffSettings& settings() const { return settings_; }

    template <typename Op, typename IsTransient>
    auto run(Op&& op, IsTransient&& is_transient) const -> decltype(op()) {
        ExponentialBackoff backoff(settings_);
        while (true) {
            auto result = op();
            if (!is_transient(result)) return result;
            auto delay = backoff.next_delay();
            if (!delay) return result;
            sleeper_(*delay);
        }
    }

    /// Same as run(), invoking on_retry(result, attempt, delay) before each wait.
    template <typename Op, typename IsTransient, typename OnRetry>
    auto run(Op&& op, IsTransient&& is_transient, OnRetry&& on_retry) const -> decltype(op()) {
        ExponentialBackoff backoff(settings_);
        while (true) {
            auto result = op();
            if (!is_transient(result)) return result;
            auto delay = backoff.next_delay();
            if (!delay) return result;
            on_retry(result, backoff.retries(), *delay);
            sleeper_(*delay);
        }
    }

private:
    BackoffSettings settings_;
    Sleeper sleeper_;
};

/// Classifier for the project's result structs (`success` + `transient`).
struct TransientFailure {
    template <typename R>
    bool operator()(const R& r) const { return !r.success && r.transient; }
};

}  // namespace lfscache
