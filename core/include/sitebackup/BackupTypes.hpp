// Values exchanged between the engine and its callers: progress events,
// the terminal result and the live transfer counters.
#pragma once
#include "ErrorClassifier.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sitebackup {

enum class BackupPhase {
    Connecting,
    Preparing,
    Transferring,
    Completed,
    Cancelled,
    Failed
};

const char* backupPhaseName(BackupPhase phase);

struct BackupProgress {
    BackupPhase phase = BackupPhase::Preparing;
    std::uint64_t transferred_files = 0;
    std::optional<std::uint64_t> total_files;
    std::uint64_t transferred_bytes = 0;
    std::optional<std::string> current_file;
    std::uint64_t elapsed_seconds = 0;
    std::optional<double> transfer_speed; // bytes/second
};

using ProgressSink = std::function<void(const BackupProgress&)>;

// A file (or unreadable directory) skipped after its retries ran out.
struct FailedFile {
    std::string remote_path;
    BackupError error;
};

struct BackupResult {
    std::string message;
    std::uint64_t transferred_files = 0;
    std::uint64_t elapsed_seconds = 0;
    std::uint64_t transferred_bytes = 0;
    std::uint64_t retries = 0; // backoff waits across all files
    std::vector<FailedFile> failed_files;

    bool partial() const { return !failed_files.empty(); }
};

// Live counters of one run. Written by the engine thread only; any thread may
// call snapshot().
class TransferState {
public:
    using Clock = std::chrono::steady_clock;

    struct Snapshot {
        std::uint64_t transferred_files = 0;
        std::uint64_t transferred_bytes = 0;
        std::string current_file;
        std::uint64_t elapsed_seconds = 0;
    };

    TransferState() : runStart_(Clock::now()) {}

    void addFile() { transferredFiles_.fetch_add(1, std::memory_order_relaxed); }
    void addBytes(std::uint64_t n) { transferredBytes_.fetch_add(n, std::memory_order_relaxed); }
    void setCurrentFile(const std::string& path) {
        std::lock_guard<std::mutex> lk(mtx_);
        currentFile_ = path;
    }

    std::uint64_t transferredFiles() const { return transferredFiles_.load(std::memory_order_relaxed); }
    std::uint64_t transferredBytes() const { return transferredBytes_.load(std::memory_order_relaxed); }
    std::string currentFile() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return currentFile_;
    }
    Clock::time_point runStart() const { return runStart_; }

    Snapshot snapshot() const;

private:
    std::atomic<std::uint64_t> transferredFiles_{0};
    std::atomic<std::uint64_t> transferredBytes_{0};
    mutable std::mutex mtx_;
    std::string currentFile_;
    const Clock::time_point runStart_;
};

} // namespace sitebackup
