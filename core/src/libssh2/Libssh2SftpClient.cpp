// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Public-key authentication only; every blocking call is bounded by a
// deadline through libssh2_session_set_timeout.
#include "sitebackup/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace sitebackup {

namespace {

// Session timeout applied between transfers (ms).
constexpr long kIdleTimeoutMs = 30000;
// Room for a PATH_MAX name plus the long-format prefix of its listing line.
constexpr std::size_t kReaddirBufferSize = 8192;

std::once_flag g_libssh2_once;

long remainingMs(SftpClient::Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SftpClient::Clock::now());
    return std::max<long>(0, static_cast<long>(left.count()));
}

bool isSocketError(long rc) {
    return rc == LIBSSH2_ERROR_SOCKET_NONE ||
           rc == LIBSSH2_ERROR_SOCKET_SEND ||
           rc == LIBSSH2_ERROR_SOCKET_RECV ||
           rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
           rc == LIBSSH2_ERROR_SOCKET_TIMEOUT;
}

bool isTransportStatus(unsigned long st) {
    return st == LIBSSH2_FX_NO_CONNECTION || st == LIBSSH2_FX_CONNECTION_LOST;
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, []() { (void)libssh2_init(0); });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, std::uint16_t port,
                                   Clock::time_point deadline, Failure& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = makeFailure(FailureSource::Network, 0,
                          std::string("getaddrinfo: ") + gai_strerror(gai));
        return false;
    }

    int lastErrno = ECONNREFUSED;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            lastErrno = errno;
            continue;
        }
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        // Non-blocking connect so the connect timeout is enforced.
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            const int pr = ::poll(&pfd, 1, static_cast<int>(remainingMs(deadline)));
            if (pr == 0) {
                ::close(s);
                freeaddrinfo(res);
                err = makeFailure(FailureSource::Timeout, ETIMEDOUT,
                                  "TCP connect to " + host + ":" + portStr + " timed out");
                return false;
            }
            int soErr = 0;
            socklen_t len = sizeof(soErr);
            if (pr < 0) {
                soErr = errno;
            } else if (::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len) != 0) {
                soErr = errno;
            }
            rc = soErr == 0 ? 0 : -1;
            if (soErr != 0) errno = soErr;
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, flags);
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        lastErrno = errno;
        ::close(s);
    }
    freeaddrinfo(res);
    err = makeFailure(FailureSource::Network, lastErrno,
                      "could not connect to " + host + ":" + portStr + ": " +
                          std::strerror(lastErrno));
    return false;
}

Failure Libssh2SftpClient::lastFailure(const std::string& what) const {
    if (!session_) return makeFailure(FailureSource::Internal, 0, what);
    char* emsg = nullptr;
    int emlen = 0;
    const int rc = libssh2_session_last_error(session_, &emsg, &emlen, 0);
    std::string detail = what;
    if (emsg && emlen > 0) detail += ": " + std::string(emsg, static_cast<std::size_t>(emlen));

    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        const unsigned long st = libssh2_sftp_last_error(sftp_);
        detail += " (sftp status " + std::to_string(st) + ")";
        if (isTransportStatus(st)) return makeFailure(FailureSource::Network, 0, detail);
        return makeFailure(FailureSource::RemoteStatus, static_cast<long>(st), detail);
    }
    if (rc == LIBSSH2_ERROR_TIMEOUT)
        return makeFailure(FailureSource::Timeout, rc, detail);
    if (isSocketError(rc))
        return makeFailure(FailureSource::Network, rc, detail);
    return makeFailure(FailureSource::Internal, rc, detail + " [rc=" + std::to_string(rc) + "]");
}

void Libssh2SftpClient::applyTimeout(std::optional<Clock::time_point> deadline) {
    if (!session_) return;
    // 0 would mean "no timeout" to libssh2, so keep at least 1 ms.
    const long ms = deadline ? std::max<long>(1, remainingMs(*deadline)) : kIdleTimeoutMs;
    libssh2_session_set_timeout(session_, ms);
}

bool Libssh2SftpClient::sshHandshakeAuth(const SshConnectionConfig& cfg,
                                         Clock::time_point deadline, Failure& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = makeFailure(FailureSource::Internal, 0, "libssh2_session_init failed");
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    applyTimeout(deadline);

    int rc = libssh2_session_handshake(session_, sock_);
    if (rc != 0) {
        err = lastFailure("SSH handshake failed");
        if (err.source == FailureSource::Internal) err.source = FailureSource::Handshake;
        return false;
    }

    libssh2_keepalive_config(session_, 1, 30);

    // The server must offer publickey; nothing else is attempted.
    applyTimeout(deadline);
    char* methods = libssh2_userauth_list(session_, cfg.username.c_str(),
                                          static_cast<unsigned>(cfg.username.size()));
    if (!methods && !libssh2_userauth_authenticated(session_)) {
        err = lastFailure("could not query authentication methods");
        if (err.source == FailureSource::Internal) err.source = FailureSource::Authentication;
        return false;
    }
    const std::string authlist = methods ? std::string(methods) : std::string();
    if (!libssh2_userauth_authenticated(session_)) {
        if (authlist.find("publickey") == std::string::npos) {
            err = makeFailure(FailureSource::Authentication, 0,
                              "server does not offer publickey authentication (methods: " +
                                  authlist + ")");
            return false;
        }
        applyTimeout(deadline);
        rc = libssh2_userauth_publickey_fromfile(session_,
                                                 cfg.username.c_str(),
                                                 nullptr,  // public key derived from the private one
                                                 cfg.key_path.c_str(),
                                                 nullptr);
        if (rc != 0) {
            err = lastFailure("publickey authentication failed");
            if (err.source == FailureSource::Internal) {
                err.source = FailureSource::Authentication;
                err.code = rc;
            }
            return false;
        }
    }

    applyTimeout(deadline);
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = lastFailure("could not start SFTP subsystem");
        if (err.source == FailureSource::Internal) err.source = FailureSource::Handshake;
        return false;
    }
    applyTimeout(std::nullopt);
    return true;
}

bool Libssh2SftpClient::connect(const SshConnectionConfig& cfg,
                                std::chrono::milliseconds timeout,
                                Failure& err) {
    if (connected_) {
        err = makeFailure(FailureSource::Internal, 0, "already connected");
        return false;
    }
    const auto deadline = Clock::now() + timeout;
    if (!tcpConnect(cfg.hostname, cfg.port, deadline, err)) return false;
    if (!sshHandshakeAuth(cfg, deadline, err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             Failure& err) {
    if (!connected_ || !sftp_) {
        err = makeFailure(FailureSource::Network, ENOTCONN, "not connected");
        return false;
    }

    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = lastFailure("sftp_opendir failed for " + path);
        if (err.source == FailureSource::Network) connected_ = false;
        return false;
    }

    out.clear();
    out.reserve(64);

    // libssh2 cannot step past an entry that does not fit the buffers.
    std::vector<char> filename(kReaddirBufferSize);
    std::vector<char> longentry(kReaddirBufferSize);
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename.data(), filename.size(),
                                         longentry.data(), longentry.size(),
                                         &attrs);
        if (rc > 0) {
            FileInfo fi{};
            fi.name = std::string(filename.data(), static_cast<std::size_t>(rc));
            if (fi.name == "." || fi.name == "..") continue;
            fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                            ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                            : false;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = static_cast<std::uint32_t>(attrs.permissions);
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break; // end of directory
        } else if (rc == LIBSSH2_ERROR_BUFFER_TOO_SMALL) {
            err = makeFailure(FailureSource::UnexpectedType, rc,
                              "directory entry name too long in " + path);
            libssh2_sftp_closedir(dir);
            return false;
        } else {
            err = lastFailure("sftp_readdir failed for " + path);
            libssh2_sftp_closedir(dir);
            if (err.source == FailureSource::Network) connected_ = false;
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             Failure& err) {
    if (!connected_ || !sftp_) {
        err = makeFailure(FailureSource::Network, ENOTCONN, "not connected");
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                                  static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        err = lastFailure("sftp_stat failed for " + remote_path);
        if (err.source == FailureSource::Network) connected_ = false;
        return false;
    }
    const auto slash = remote_path.find_last_of('/');
    info.name = slash == std::string::npos ? remote_path : remote_path.substr(slash + 1);
    info.is_dir = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                      ? ((st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                      : false;
    info.size = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? static_cast<std::uint64_t>(st.filesize) : 0;
    info.mtime = (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? static_cast<std::uint64_t>(st.mtime) : 0;
    info.mode = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) ? static_cast<std::uint32_t>(st.permissions) : 0;
    return true;
}

// Streams a remote file to disk. The deadline is re-applied to the session
// before each read so a stalled server cannot block past it.
bool Libssh2SftpClient::get(const std::string& remote,
                            const std::string& local,
                            std::size_t chunkSize,
                            std::optional<Clock::time_point> deadline,
                            Failure& err,
                            const ChunkCB& onChunk) {
    if (!connected_ || !sftp_) {
        err = makeFailure(FailureSource::Network, ENOTCONN, "not connected");
        return false;
    }

    applyTimeout(deadline);
    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = lastFailure("cannot open remote file " + remote);
        if (err.source == FailureSource::Network) connected_ = false;
        applyTimeout(std::nullopt);
        return false;
    }

    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        const int e = errno;
        libssh2_sftp_close(rh);
        applyTimeout(std::nullopt);
        err = makeFailure(FailureSource::LocalIo, e,
                          "cannot create local file " + local + ": " + std::strerror(e));
        return false;
    }

    std::vector<char> buf(std::max<std::size_t>(chunkSize, 4096));
    bool ok = true;
    while (true) {
        if (deadline && Clock::now() >= *deadline) {
            err = makeFailure(FailureSource::Timeout, 0, "file transfer deadline exceeded: " + remote);
            ok = false;
            break;
        }
        applyTimeout(deadline);
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), lf) != static_cast<std::size_t>(n)) {
                const int e = errno;
                err = makeFailure(FailureSource::LocalIo, e,
                                  "local write failed for " + local + ": " + std::strerror(e));
                ok = false;
                break;
            }
            if (onChunk) onChunk(static_cast<std::size_t>(n));
        } else if (n == 0) {
            break; // EOF
        } else {
            err = lastFailure("remote read failed for " + remote);
            // A read interrupted by the session timeout leaves the channel
            // out of sync, so the session must be rebuilt either way.
            if (err.source == FailureSource::Network || err.source == FailureSource::Timeout)
                connected_ = false;
            ok = false;
            break;
        }
    }

    if (std::fclose(lf) != 0 && ok) {
        const int e = errno;
        err = makeFailure(FailureSource::LocalIo, e,
                          "closing local file failed for " + local + ": " + std::strerror(e));
        ok = false;
    }
    libssh2_sftp_close(rh);
    applyTimeout(std::nullopt);
    return ok;
}

} // namespace sitebackup
