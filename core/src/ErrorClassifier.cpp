#include "sitebackup/ErrorClassifier.hpp"
#include <cerrno>

namespace sitebackup {

namespace {

ErrorKind classifyRemoteStatus(long status) {
    switch (status) {
    case SftpStatus::PermissionDenied:
    case SftpStatus::WriteProtect:
        return ErrorKind::PermissionFailure;
    case SftpStatus::NoSuchFile:
    case SftpStatus::NoSuchPath:
    case SftpStatus::NotADirectory:
    case SftpStatus::InvalidFilename:
    case SftpStatus::FileAlreadyExists:
    case SftpStatus::LinkLoop:
    case SftpStatus::NoMedia:
        return ErrorKind::FilesystemFailure;
    case SftpStatus::NoSpaceOnFilesystem:
    case SftpStatus::QuotaExceeded:
        return ErrorKind::DiskSpaceFailure;
    case SftpStatus::NoConnection:
    case SftpStatus::ConnectionLost:
        return ErrorKind::ConnectionFailure;
    default:
        return ErrorKind::UnknownFailure;
    }
}

ErrorKind classifyErrno(long code) {
    switch (code) {
    case EACCES:
    case EPERM:
    case EROFS:
        return ErrorKind::PermissionFailure;
    case ENOSPC:
    case EDQUOT:
    case EFBIG:
        return ErrorKind::DiskSpaceFailure;
    case ENOENT:
    case ENOTDIR:
    case EISDIR:
    case EEXIST:
    case ENAMETOOLONG:
    case ELOOP:
        return ErrorKind::FilesystemFailure;
    case ETIMEDOUT:
        return ErrorKind::TimeoutFailure;
    default:
        return ErrorKind::UnknownFailure;
    }
}

} // namespace

std::string BackupError::describe() const {
    if (detail.empty()) return message;
    if (message.empty()) return detail;
    return message + " (" + detail + ")";
}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::AuthenticationFailure:
        return "AuthenticationFailure";
    case ErrorKind::ConnectionFailure:
        return "ConnectionFailure";
    case ErrorKind::PermissionFailure:
        return "PermissionFailure";
    case ErrorKind::DiskSpaceFailure:
        return "DiskSpaceFailure";
    case ErrorKind::TimeoutFailure:
        return "TimeoutFailure";
    case ErrorKind::FilesystemFailure:
        return "FilesystemFailure";
    case ErrorKind::DepthLimitExceeded:
        return "DepthLimitExceeded";
    case ErrorKind::CancelledByUser:
        return "CancelledByUser";
    case ErrorKind::UnknownFailure:
        return "UnknownFailure";
    }
    return "UnknownFailure";
}

ErrorKind classify(const Failure& failure) {
    switch (failure.source) {
    case FailureSource::Network:
        return failure.code == ETIMEDOUT ? ErrorKind::TimeoutFailure
                                         : ErrorKind::ConnectionFailure;
    case FailureSource::Handshake:
        return ErrorKind::ConnectionFailure;
    case FailureSource::Authentication:
        return ErrorKind::AuthenticationFailure;
    case FailureSource::Timeout:
        return ErrorKind::TimeoutFailure;
    case FailureSource::RemoteStatus:
        return classifyRemoteStatus(failure.code);
    case FailureSource::LocalIo:
        return classifyErrno(failure.code);
    case FailureSource::UnexpectedType:
        return ErrorKind::FilesystemFailure;
    case FailureSource::None:
    case FailureSource::Internal:
        return ErrorKind::UnknownFailure;
    }
    return ErrorKind::UnknownFailure;
}

bool isTransient(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ConnectionFailure:
    case ErrorKind::TimeoutFailure:
        return true;
    case ErrorKind::AuthenticationFailure:
    case ErrorKind::PermissionFailure:
    case ErrorKind::DiskSpaceFailure:
    case ErrorKind::FilesystemFailure:
    case ErrorKind::DepthLimitExceeded:
    case ErrorKind::CancelledByUser:
    case ErrorKind::UnknownFailure:
        return false;
    }
    return false;
}

std::string guidanceFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::AuthenticationFailure:
        return "SSH authentication failed. Check the user name and that the private key "
               "is registered on the server (PEM format may be required; convert with "
               "ssh-keygen -p -m PEM -f <key>).";
    case ErrorKind::ConnectionFailure:
        return "Could not reach the SSH server. Check host name, port and network "
               "connectivity.";
    case ErrorKind::PermissionFailure:
        return "Access denied. Check permissions on the remote path and on the local "
               "backup folder.";
    case ErrorKind::DiskSpaceFailure:
        return "Not enough disk space. Free space in the local backup folder and retry.";
    case ErrorKind::TimeoutFailure:
        return "The operation timed out. The server or the network may be slow; retry "
               "later.";
    case ErrorKind::FilesystemFailure:
        return "The path does not exist or is not of the expected type. Check the "
               "configured folders.";
    case ErrorKind::DepthLimitExceeded:
        return "The remote directory tree is nested too deeply (possible link cycle).";
    case ErrorKind::CancelledByUser:
        return "The backup was cancelled.";
    case ErrorKind::UnknownFailure:
        return "An unexpected error occurred.";
    }
    return "An unexpected error occurred.";
}

BackupError makeError(const Failure& failure, const std::string& context) {
    BackupError e;
    e.kind = classify(failure);
    e.message = guidanceFor(e.kind);
    if (context.empty())
        e.detail = failure.detail;
    else if (failure.detail.empty())
        e.detail = context;
    else
        e.detail = context + ": " + failure.detail;
    return e;
}

BackupError makeError(ErrorKind kind, const std::string& detail) {
    BackupError e;
    e.kind = kind;
    e.message = guidanceFor(kind);
    e.detail = detail;
    return e;
}

} // namespace sitebackup
