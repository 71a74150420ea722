// One-way recursive copy of a remote directory tree into a local folder.
#pragma once
#include "BackupTypes.hpp"
#include "CancellationToken.hpp"
#include "ConnectionManager.hpp"
#include "ProgressThrottle.hpp"
#include "RetryPolicy.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace sitebackup {

constexpr int kMaxTraversalDepth = 50;
constexpr std::size_t kTransferChunkSize = 256 * 1024;

// Per-file timeout chosen by size: <10 MB 60 s, <100 MB 120 s, <1 GB 600 s,
// otherwise 1800 s (decimal megabytes).
std::chrono::seconds calculateFileTimeout(std::uint64_t sizeBytes);

struct EngineOptions {
    RetrySettings retry;
    std::size_t chunkSize = kTransferChunkSize;
    int maxDepth = kMaxTraversalDepth;
    // Clock for progress throttling, elapsed time and the retry budget
    // (tests inject one).
    ProgressThrottle::NowFn clock;
    // Backoff wait. Default: waits on the run's CancellationToken.
    RetryPolicy::SleepFn sleep;
    // Notified before every backoff wait.
    RetryPolicy::RetryObserver onRetry;
};

class RecursiveTransferEngine {
public:
    explicit RecursiveTransferEngine(EngineOptions options = {});

    // Mirrors remoteRoot into localRoot over session. Returns false with a
    // classified error when the run aborts (including CancelledByUser); result
    // carries the counters reached either way. Files that still fail after
    // their retries are listed in result.failed_files and do not abort.
    bool backup(Session& session,
                const std::string& remoteRoot,
                const std::string& localRoot,
                const ProgressSink& sink,
                CancellationToken& cancel,
                BackupResult& result,
                BackupError& err);

    // Counters of the current (or last) run; safe to poll from other threads.
    std::shared_ptr<const TransferState> currentState() const;

private:
    struct RunContext;

    EngineOptions options_;
    mutable std::mutex stateMtx_;
    std::shared_ptr<TransferState> state_;

    bool prepare(RunContext& ctx, const std::string& remoteRoot, BackupError& err);
    bool walk(RunContext& ctx,
              const std::string& remoteDir,
              const std::filesystem::path& localDir,
              int depth,
              BackupError& err);
    bool transferFile(RunContext& ctx,
                      const FileInfo& entry,
                      const std::string& remotePath,
                      const std::filesystem::path& localPath,
                      BackupError& err);
    void emitProgress(RunContext& ctx, BackupPhase phase, bool force);
};

} // namespace sitebackup
