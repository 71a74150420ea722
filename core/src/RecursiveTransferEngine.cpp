// Depth-first backup walk: one file at a time over a single session, with
// cooperative cancellation at directory and file boundaries.
#include "sitebackup/RecursiveTransferEngine.hpp"
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace sitebackup {

namespace {

constexpr std::uint64_t kTier1 = 10000000ull;    // 10 MB
constexpr std::uint64_t kTier2 = 100000000ull;   // 100 MB
constexpr std::uint64_t kTier3 = 1000000000ull;  // 1 GB

std::string joinRemote(const std::string& base, const std::string& name) {
    if (base.empty()) return "/" + name;
    if (base.back() == '/') return base + name;
    return base + "/" + name;
}

bool isHidden(const std::string& name) {
    return name.empty() || name.front() == '.';
}

// A listed name must stay a single path component below its local folder.
bool isUnsafeName(const std::string& name) {
    return name == "." || name == ".." || name.find('/') != std::string::npos ||
           name.find('\0') != std::string::npos;
}

// Unknown type (no permission bits reported) counts as a regular file.
bool isRegularFile(const FileInfo& fi) {
    if (fi.is_dir) return false;
    if (fi.mode == 0) return true;
    return (fi.mode & 0170000u) == 0100000u;
}

// Kinds after which no further file can succeed on this run.
bool abortsRun(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ConnectionFailure:
    case ErrorKind::AuthenticationFailure:
    case ErrorKind::DiskSpaceFailure:
    case ErrorKind::DepthLimitExceeded:
    case ErrorKind::CancelledByUser:
        return true;
    case ErrorKind::PermissionFailure:
    case ErrorKind::TimeoutFailure:
    case ErrorKind::FilesystemFailure:
    case ErrorKind::UnknownFailure:
        return false;
    }
    return true;
}

BackupError localError(const std::error_code& ec, const std::string& what) {
    return makeError(makeFailure(FailureSource::LocalIo, ec.value(), ec.message()), what);
}

struct TransferGuard {
    Session& session;
    ~TransferGuard() { session.endTransfer(); }
};

} // namespace

std::chrono::seconds calculateFileTimeout(std::uint64_t sizeBytes) {
    if (sizeBytes < kTier1) return std::chrono::seconds(60);
    if (sizeBytes < kTier2) return std::chrono::seconds(120);
    if (sizeBytes < kTier3) return std::chrono::seconds(600);
    return std::chrono::seconds(1800);
}

struct RecursiveTransferEngine::RunContext {
    Session& session;
    CancellationToken& cancel;
    const ProgressSink& sink;
    TransferState& state;
    ProgressThrottle throttle;
    RetryPolicy retry;
    BackupResult& result;
};

RecursiveTransferEngine::RecursiveTransferEngine(EngineOptions options)
    : options_(std::move(options)) {}

std::shared_ptr<const TransferState> RecursiveTransferEngine::currentState() const {
    std::lock_guard<std::mutex> lk(stateMtx_);
    return state_;
}

void RecursiveTransferEngine::emitProgress(RunContext& ctx, BackupPhase phase, bool force) {
    const std::uint64_t bytes = ctx.state.transferredBytes();
    if (!force && !ctx.throttle.shouldUpdate(bytes)) return;
    if (!ctx.sink) return;
    BackupProgress p;
    p.phase = phase;
    p.transferred_files = ctx.state.transferredFiles();
    p.transferred_bytes = bytes;
    const std::string current = ctx.state.currentFile();
    if (!current.empty()) p.current_file = current;
    p.elapsed_seconds = ctx.throttle.elapsedSeconds();
    p.transfer_speed = ctx.throttle.calculateSpeed(bytes);
    if (phase == BackupPhase::Completed) p.total_files = p.transferred_files;
    ctx.sink(p);
}

bool RecursiveTransferEngine::prepare(RunContext& ctx, const std::string& remoteRoot,
                                      BackupError& err) {
    FileInfo info;
    BackupError statErr;
    const bool found = ctx.retry.run(
        [&](BackupError& e) {
            if (!ctx.session.restore(e)) return false;
            Failure f;
            if (!ctx.session.client().stat(remoteRoot, info, f)) {
                e = makeError(f, "checking remote folder " + remoteRoot);
                return false;
            }
            return true;
        },
        statErr);
    if (!found) {
        err = statErr;
        return false;
    }
    if (!info.is_dir) {
        err = makeError(makeFailure(FailureSource::UnexpectedType, 0,
                                    "remote path is not a directory: " + remoteRoot),
                        std::string());
        return false;
    }
    return true;
}

bool RecursiveTransferEngine::backup(Session& session,
                                     const std::string& remoteRoot,
                                     const std::string& localRoot,
                                     const ProgressSink& sink,
                                     CancellationToken& cancel,
                                     BackupResult& result,
                                     BackupError& err) {
    result = BackupResult{};
    if (!session.beginTransfer()) {
        err = makeError(ErrorKind::UnknownFailure, "another transfer is already running on this session");
        return false;
    }
    TransferGuard guard{session};

    auto state = std::make_shared<TransferState>();
    {
        std::lock_guard<std::mutex> lk(stateMtx_);
        state_ = state;
    }

    RetryPolicy::SleepFn sleep = options_.sleep;
    if (!sleep) {
        sleep = [&cancel](std::chrono::milliseconds d) { return !cancel.waitFor(d); };
    }
    RunContext ctx{session, cancel, sink, *state,
                   ProgressThrottle(options_.clock),
                   RetryPolicy(options_.retry, sleep, options_.clock),
                   result};
    std::uint64_t retries = 0;
    ctx.retry.setObserver([this, &retries](int n, std::chrono::milliseconds d, const BackupError& e) {
        ++retries;
        if (options_.onRetry) options_.onRetry(n, d, e);
    });

    emitProgress(ctx, BackupPhase::Preparing, true);

    bool ok = true;
    std::error_code ec;
    fs::create_directories(localRoot, ec);
    if (ec) {
        err = localError(ec, "creating local backup folder " + localRoot);
        ok = false;
    }
    if (ok) ok = prepare(ctx, remoteRoot, err);
    if (ok) ok = walk(ctx, remoteRoot, fs::path(localRoot), 0, err);

    result.transferred_files = state->transferredFiles();
    result.transferred_bytes = state->transferredBytes();
    result.elapsed_seconds = ctx.throttle.elapsedSeconds();
    result.retries = retries;

    if (!ok) {
        result.message = err.kind == ErrorKind::CancelledByUser
                             ? "Backup cancelled after " + std::to_string(result.transferred_files) + " files"
                             : "Backup failed after " + std::to_string(result.transferred_files) +
                                   " files: " + err.describe();
        emitProgress(ctx, err.kind == ErrorKind::CancelledByUser ? BackupPhase::Cancelled
                                                                  : BackupPhase::Failed,
                     true);
        return false;
    }

    result.message = "Backup completed: " + std::to_string(result.transferred_files) +
                     " files (" + std::to_string(result.transferred_bytes) + " bytes) from " +
                     remoteRoot + " to " + localRoot;
    if (result.partial())
        result.message += "; " + std::to_string(result.failed_files.size()) + " entries failed";
    emitProgress(ctx, BackupPhase::Completed, true);
    return true;
}

bool RecursiveTransferEngine::walk(RunContext& ctx,
                                   const std::string& remoteDir,
                                   const fs::path& localDir,
                                   int depth,
                                   BackupError& err) {
    if (ctx.cancel.isCancelled()) {
        err = makeError(ErrorKind::CancelledByUser, "cancelled before " + remoteDir);
        return false;
    }
    if (depth > options_.maxDepth) {
        err = makeError(ErrorKind::DepthLimitExceeded,
                        "depth " + std::to_string(depth) + " exceeds limit " +
                            std::to_string(options_.maxDepth) + " at " + remoteDir);
        return false;
    }

    std::vector<FileInfo> entries;
    BackupError listErr;
    const bool listed = ctx.retry.run(
        [&](BackupError& e) {
            if (!ctx.session.restore(e)) return false;
            Failure f;
            if (!ctx.session.client().list(remoteDir, entries, f)) {
                e = makeError(f, "listing " + remoteDir);
                return false;
            }
            return true;
        },
        listErr);
    if (!listed) {
        if (depth == 0 || abortsRun(listErr.kind)) {
            err = listErr;
            return false;
        }
        ctx.result.failed_files.push_back(FailedFile{remoteDir, listErr});
        return true;
    }

    std::error_code ec;
    fs::create_directories(localDir, ec);
    if (ec) {
        BackupError dirErr = localError(ec, "creating local folder " + localDir.string());
        if (abortsRun(dirErr.kind)) {
            err = dirErr;
            return false;
        }
        ctx.result.failed_files.push_back(FailedFile{remoteDir, dirErr});
        return true;
    }

    for (const auto& entry : entries) {
        if (isHidden(entry.name)) continue;
        if (ctx.cancel.isCancelled()) {
            err = makeError(ErrorKind::CancelledByUser, "cancelled in " + remoteDir);
            return false;
        }
        const std::string remotePath = joinRemote(remoteDir, entry.name);
        if (isUnsafeName(entry.name)) {
            ctx.result.failed_files.push_back(FailedFile{
                remotePath,
                makeError(makeFailure(FailureSource::UnexpectedType, 0,
                                      "entry name is not a plain file name"),
                          "listing " + remoteDir)});
            continue;
        }
        const fs::path localPath = localDir / entry.name;
        if (entry.is_dir) {
            if (!walk(ctx, remotePath, localPath, depth + 1, err)) return false;
        } else if (isRegularFile(entry)) {
            if (!transferFile(ctx, entry, remotePath, localPath, err)) return false;
        }
    }
    return true;
}

bool RecursiveTransferEngine::transferFile(RunContext& ctx,
                                           const FileInfo& entry,
                                           const std::string& remotePath,
                                           const fs::path& localPath,
                                           BackupError& err) {
    ctx.state.setCurrentFile(remotePath);
    emitProgress(ctx, BackupPhase::Transferring, false);

    const auto timeout = calculateFileTimeout(entry.size);
    const std::string local = localPath.string();
    auto onChunk = [&ctx, this](std::size_t n) {
        ctx.state.addBytes(n);
        emitProgress(ctx, BackupPhase::Transferring, false);
    };

    BackupError fileErr;
    const bool ok = ctx.retry.run(
        [&](BackupError& e) {
            if (!ctx.session.restore(e)) return false;
            const auto deadline = SftpClient::Clock::now() + timeout;
            Failure f;
            if (ctx.session.client().get(remotePath, local, options_.chunkSize, deadline, f, onChunk))
                return true;
            std::error_code rmEc;
            if (!fs::is_directory(localPath, rmEc))
                fs::remove(localPath, rmEc); // no partial file is left behind
            e = makeError(f, "downloading " + remotePath);
            return false;
        },
        fileErr);

    if (ok) {
        ctx.state.addFile();
        return true;
    }
    if (abortsRun(fileErr.kind)) {
        err = fileErr;
        return false;
    }
    ctx.result.failed_files.push_back(FailedFile{remotePath, fileErr});
    return true;
}

} // namespace sitebackup
