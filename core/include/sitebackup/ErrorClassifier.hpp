// Backup error taxonomy and the mapping from raw backend failures into it.
#pragma once
#include "SftpTypes.hpp"
#include <string>

namespace sitebackup {

enum class ErrorKind {
    AuthenticationFailure,
    ConnectionFailure,
    PermissionFailure,
    DiskSpaceFailure,
    TimeoutFailure,
    FilesystemFailure,   // remote path missing or of unexpected type
    DepthLimitExceeded,
    CancelledByUser,
    UnknownFailure
};

// Terminal or per-file error. `message` is user guidance; `detail` keeps the
// technical text untouched.
struct BackupError {
    ErrorKind kind = ErrorKind::UnknownFailure;
    std::string message;
    std::string detail;

    // "message (detail)" for logs and history.
    std::string describe() const;
};

const char* errorKindName(ErrorKind kind);

// Exhaustive mapping of a backend failure to the taxonomy.
ErrorKind classify(const Failure& failure);

// Only connection and timeout failures may succeed when repeated.
bool isTransient(ErrorKind kind);

// Guidance shown to the user for each kind.
std::string guidanceFor(ErrorKind kind);

// Builds a BackupError from a backend failure; `context` names the operation
// ("listing /site", "downloading a.txt") and prefixes the detail.
BackupError makeError(const Failure& failure, const std::string& context);

BackupError makeError(ErrorKind kind, const std::string& detail);

} // namespace sitebackup
