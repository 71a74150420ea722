#pragma once
#include "SftpClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2's internal types (underscore names).
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace sitebackup {

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    Libssh2SftpClient(const Libssh2SftpClient&) = delete;
    Libssh2SftpClient& operator=(const Libssh2SftpClient&) = delete;

    bool connect(const SshConnectionConfig& cfg,
                 std::chrono::milliseconds timeout,
                 Failure& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              Failure& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              Failure& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             std::size_t chunkSize,
             std::optional<Clock::time_point> deadline,
             Failure& err,
             const ChunkCB& onChunk = {}) override;

private:
    bool connected_ = false;
    int  sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP*    sftp_    = nullptr;

    bool tcpConnect(const std::string& host, std::uint16_t port,
                    Clock::time_point deadline, Failure& err);
    bool sshHandshakeAuth(const SshConnectionConfig& cfg,
                          Clock::time_point deadline, Failure& err);
    // Failure describing the last libssh2/SFTP error for an operation.
    Failure lastFailure(const std::string& what) const;
    void applyTimeout(std::optional<Clock::time_point> deadline);
};

} // namespace sitebackup
