// Cooperative cancellation flag shared between the caller (writer) and the
// engine (reader). Also lets backoff waits wake up as soon as it is set.
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sitebackup {

class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    // Re-arm before a new run.
    void reset() { cancelled_.store(false); }

    bool isCancelled() const { return cancelled_.load(); }

    // Sleeps up to `d`; returns true if cancelled before or during the wait.
    bool waitFor(std::chrono::milliseconds d) {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, d, [this]() { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace sitebackup
