#include "sitebackup/RetryPolicy.hpp"
#include <algorithm>
#include <cmath>
#include <thread>
#include <utility>

namespace sitebackup {

RetryPolicy::RetryPolicy(RetrySettings settings, SleepFn sleep, NowFn now, std::uint32_t seed)
    : settings_(settings),
      sleep_(sleep ? std::move(sleep) : SleepFn([](std::chrono::milliseconds d) {
          std::this_thread::sleep_for(d);
          return true;
      })),
      now_(now ? std::move(now) : NowFn([]() { return Clock::now(); })),
      rng_(seed) {}

std::chrono::milliseconds RetryPolicy::baseDelay(int retryIndex) const {
    const double initial = static_cast<double>(settings_.initialInterval.count());
    const double cap = static_cast<double>(settings_.maxInterval.count());
    const double raw = initial * std::pow(settings_.multiplier, std::max(0, retryIndex));
    return std::chrono::milliseconds(static_cast<long long>(std::min(raw, cap)));
}

std::chrono::milliseconds RetryPolicy::nextDelay(int retryIndex) {
    const double base = static_cast<double>(baseDelay(retryIndex).count());
    if (settings_.jitter <= 0.0) return std::chrono::milliseconds(static_cast<long long>(base));
    std::uniform_real_distribution<double> dist(-settings_.jitter, settings_.jitter);
    const double jittered = base * (1.0 + dist(rng_));
    return std::chrono::milliseconds(static_cast<long long>(std::max(0.0, jittered)));
}

bool RetryPolicy::run(const Attempt& attempt, BackupError& err, int* retries) {
    const auto start = now_();
    int waits = 0;
    if (retries) *retries = 0;
    for (;;) {
        BackupError attemptErr;
        if (attempt(attemptErr)) return true;
        err = attemptErr;
        if (!isTransient(attemptErr.kind)) return false;

        const auto delay = nextDelay(waits);
        const auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(now_() - start);
        if (spent + delay > settings_.maxElapsed) return false;

        ++waits;
        if (retries) *retries = waits;
        if (observer_) observer_(waits, delay, attemptErr);
        if (!sleep_(delay)) {
            err = makeError(ErrorKind::CancelledByUser,
                            "cancelled while waiting to retry: " + attemptErr.detail);
            return false;
        }
    }
}

} // namespace sitebackup
