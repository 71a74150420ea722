// Basic types shared by the SFTP backends, the engine and the host app.
// Kept plain so they can be copied across threads and serialized by the host.
#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace sitebackup {

// Connection parameters of one backup profile. Authentication is public-key
// only, so there is no password field.
struct SshConnectionConfig {
    std::string hostname;
    std::uint16_t port = 22;
    std::string username;
    std::string key_path;
};

// Directory entry as reported by the remote listing.
struct FileInfo {
    std::string   name;       // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (if known)
    std::uint64_t mtime = 0;  // epoch seconds
    std::uint32_t mode  = 0;  // POSIX bits
};

// SFTP status codes (draft-ietf-secsh-filexfer-13, section 9.1).
namespace SftpStatus {
constexpr long Ok                  = 0;
constexpr long Eof                 = 1;
constexpr long NoSuchFile          = 2;
constexpr long PermissionDenied    = 3;
constexpr long Failure             = 4;
constexpr long BadMessage          = 5;
constexpr long NoConnection        = 6;
constexpr long ConnectionLost      = 7;
constexpr long OpUnsupported       = 8;
constexpr long InvalidHandle       = 9;
constexpr long NoSuchPath          = 10;
constexpr long FileAlreadyExists   = 11;
constexpr long WriteProtect        = 12;
constexpr long NoMedia             = 13;
constexpr long NoSpaceOnFilesystem = 14;
constexpr long QuotaExceeded       = 15;
constexpr long NotADirectory       = 19;
constexpr long InvalidFilename     = 20;
constexpr long LinkLoop            = 21;
} // namespace SftpStatus

// Where a low-level failure came from. The code field is interpreted per
// source: errno for Network/LocalIo, a backend error number for
// Handshake/Authentication/Timeout, an SftpStatus value for RemoteStatus.
enum class FailureSource {
    None,
    Network,
    Handshake,
    Authentication,
    Timeout,
    RemoteStatus,
    LocalIo,
    UnexpectedType,
    Internal
};

// Raw failure reported by an SftpClient. Never shown to users directly; the
// ErrorClassifier turns it into a BackupError.
struct Failure {
    FailureSource source = FailureSource::None;
    long code = 0;
    std::string detail;

    bool empty() const { return source == FailureSource::None; }
    void clear() {
        source = FailureSource::None;
        code = 0;
        detail.clear();
    }
};

inline Failure makeFailure(FailureSource source, long code, std::string detail) {
    Failure f;
    f.source = source;
    f.code = code;
    f.detail = std::move(detail);
    return f;
}

} // namespace sitebackup
