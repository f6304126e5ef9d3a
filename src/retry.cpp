#include "lfscache/retry.hpp"

#include <algorithm>
#include <string>
#include <thread>

namespace lfscache {

std::string BackoffSettings::validate() const {
    if (initial_interval.count() <= 0) return "backoff initial interval must be > 0";
    if (multiplier < 1.0) return "backoff multiplier must be >= 1";
    if (randomization_factor < 0.0 || randomization_factor >= 1.0)
        return "backoff randomization factor must be in [0, 1)";
    if (max_interval < initial_interval) return "backoff max interval must be >= initial interval";
    return {};
}

// --- ExponentialBackoff ---

ExponentialBackoff::ExponentialBackoff(const BackoffSettings& settings)
    : ExponentialBackoff(settings, std::random_device{}()) {}

ExponentialBackoff::ExponentialBackoff(const BackoffSettings& settings, uint64_t seed)
    : settings_(settings)
    , current_interval_(settings.initial_interval)
    , start_(std::chrono::steady_clock::now())
    , rng_(seed) {}

std::optional<std::chrono::milliseconds> ExponentialBackoff::next_delay() {
    if (retries_ >= settings_.max_retries) return std::nullopt;
    if (std::chrono::steady_clock::now() - start_ >= settings_.max_elapsed) return std::nullopt;

    double interval = static_cast<double>(current_interval_.count());
    double delta = settings_.randomization_factor * interval;
    std::uniform_real_distribution<double> dist(interval - delta, interval + delta);
    auto delay = std::chrono::milliseconds(static_cast<int64_t>(dist(rng_)));

    double next = interval * settings_.multiplier;
    double cap = static_cast<double>(settings_.max_interval.count());
    current_interval_ = std::chrono::milliseconds(static_cast<int64_t>(std::min(next, cap)));

    ++retries_;
    return delay;
}

void ExponentialBackoff::reset() {
    current_interval_ = settings_.initial_interval;
    start_ = std::chrono::steady_clock::now();
    retries_ = 0;
}

// --- RetryPolicy ---

RetryPolicy::RetryPolicy()
    : RetryPolicy(BackoffSettings{}) {}

RetryPolicy::RetryPolicy(BackoffSettings settings, Sleeper sleeper)
    : settings_(settings)
    , sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

}  // namespace lfscache
