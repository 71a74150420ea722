#include "sitebackup/BackupTypes.hpp"

namespace sitebackup {

const char* backupPhaseName(BackupPhase phase) {
    switch (phase) {
    case BackupPhase::Connecting:
        return "Connecting";
    case BackupPhase::Preparing:
        return "Preparing";
    case BackupPhase::Transferring:
        return "Transferring";
    case BackupPhase::Completed:
        return "Completed";
    case BackupPhase::Cancelled:
        return "Cancelled";
    case BackupPhase::Failed:
        return "Failed";
    }
    return "Unknown";
}

TransferState::Snapshot TransferState::snapshot() const {
    Snapshot s;
    s.transferred_files = transferredFiles();
    s.transferred_bytes = transferredBytes();
    s.current_file = currentFile();
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - runStart_).count();
    s.elapsed_seconds = secs > 0 ? static_cast<std::uint64_t>(secs) : 0;
    return s;
}

} // namespace sitebackup
