// Exponential backoff with jitter around a single unit of work (one file
// attempt). Only transient error kinds are repeated.
#pragma once
#include "ErrorClassifier.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <random>
#include <utility>

namespace sitebackup {

struct RetrySettings {
    std::chrono::milliseconds initialInterval{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds maxInterval{60000};
    std::chrono::milliseconds maxElapsed{300000}; // overall budget per unit of work
    double jitter = 0.10;                         // +/- fraction of each interval
};

class RetryPolicy {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    // Waits for the given delay. Returns false if the wait was interrupted
    // (cancellation); the policy then stops with CancelledByUser.
    using SleepFn = std::function<bool(std::chrono::milliseconds)>;
    // One unit of work. Returns true on success, fills err otherwise.
    using Attempt = std::function<bool(BackupError& err)>;
    // Called before each backoff wait: retry number (1-based), delay, and the
    // error that triggered it.
    using RetryObserver = std::function<void(int, std::chrono::milliseconds, const BackupError&)>;

    explicit RetryPolicy(RetrySettings settings = {},
                         SleepFn sleep = {},
                         NowFn now = {},
                         std::uint32_t seed = std::random_device{}());

    void setObserver(RetryObserver observer) { observer_ = std::move(observer); }
    const RetrySettings& settings() const { return settings_; }

    // Runs attempt until it succeeds, fails with a permanent kind, or the
    // budget is used up. retries (optional) receives the number of waits.
    bool run(const Attempt& attempt, BackupError& err, int* retries = nullptr);

    // Interval before the n-th retry (0-based), capped, without jitter.
    std::chrono::milliseconds baseDelay(int retryIndex) const;
    // baseDelay with jitter applied.
    std::chrono::milliseconds nextDelay(int retryIndex);

private:
    RetrySettings settings_;
    SleepFn sleep_;
    NowFn now_;
    std::mt19937 rng_;
    RetryObserver observer_;
};

} // namespace sitebackup
