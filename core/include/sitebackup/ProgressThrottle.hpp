// Rate limiter for progress notifications: one event per interval unless a
// large amount of data moved in between.
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace sitebackup {

class ProgressThrottle {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    static constexpr std::chrono::seconds kDefaultInterval{3};
    static constexpr std::uint64_t kDefaultByteThreshold = 50ull * 1024 * 1024;

    explicit ProgressThrottle(NowFn now = {},
                              std::chrono::milliseconds interval = kDefaultInterval,
                              std::uint64_t byteThreshold = kDefaultByteThreshold);

    // True on the first call; afterwards when the interval elapsed or the
    // byte threshold was crossed since the last true.
    bool shouldUpdate(std::uint64_t transferredBytes);

    // Average bytes/second since construction; empty while no time elapsed.
    std::optional<double> calculateSpeed(std::uint64_t transferredBytes) const;

    std::uint64_t elapsedSeconds() const;

private:
    NowFn now_;
    std::chrono::milliseconds interval_;
    std::uint64_t byteThreshold_;
    Clock::time_point start_;
    Clock::time_point lastUpdate_;
    std::uint64_t lastBytes_ = 0;
    bool emitted_ = false;
};

} // namespace sitebackup
