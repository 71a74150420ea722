#include "sitebackup/ProgressThrottle.hpp"
#include <utility>

namespace sitebackup {

ProgressThrottle::ProgressThrottle(NowFn now,
                                   std::chrono::milliseconds interval,
                                   std::uint64_t byteThreshold)
    : now_(now ? std::move(now) : NowFn([]() { return Clock::now(); })),
      interval_(interval),
      byteThreshold_(byteThreshold) {
    start_ = now_();
    lastUpdate_ = start_;
}

bool ProgressThrottle::shouldUpdate(std::uint64_t transferredBytes) {
    const auto t = now_();
    const bool first = !emitted_;
    const bool timeElapsed = (t - lastUpdate_) >= interval_;
    const bool bytesElapsed = transferredBytes >= lastBytes_ &&
                              (transferredBytes - lastBytes_) >= byteThreshold_;
    if (first || timeElapsed || bytesElapsed) {
        emitted_ = true;
        lastUpdate_ = t;
        lastBytes_ = transferredBytes;
        return true;
    }
    return false;
}

std::optional<double> ProgressThrottle::calculateSpeed(std::uint64_t transferredBytes) const {
    const double elapsed = std::chrono::duration<double>(now_() - start_).count();
    if (elapsed <= 0.0) return std::nullopt;
    return static_cast<double>(transferredBytes) / elapsed;
}

std::uint64_t ProgressThrottle::elapsedSeconds() const {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(now_() - start_).count();
    return secs > 0 ? static_cast<std::uint64_t>(secs) : 0;
}

} // namespace sitebackup
