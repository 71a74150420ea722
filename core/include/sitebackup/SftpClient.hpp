// Abstract interface for the SFTP operations a backup needs. Concrete backends
// (libssh2, in-memory mock) implement it so the engine stays backend-agnostic.
#pragma once
#include "SftpTypes.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace sitebackup {

class SftpClient {
public:
    using Clock = std::chrono::steady_clock;
    // Called after each chunk with the bytes copied by that chunk.
    using ChunkCB = std::function<void(std::size_t /*chunkBytes*/)>;

    virtual ~SftpClient() = default;

    // Connect/authenticate. timeout bounds TCP connect, handshake and auth.
    virtual bool connect(const SshConnectionConfig& cfg,
                         std::chrono::milliseconds timeout,
                         Failure& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Remote directory listing ("." and ".." are never returned).
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      Failure& err) = 0;

    // Metadata of a single path. Returns false (err set) if it does not exist.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      Failure& err) = 0;

    // Download remote file into local (create/truncate), chunkSize bytes per
    // read. Fails with a Timeout failure once deadline has passed.
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     std::size_t chunkSize,
                     std::optional<Clock::time_point> deadline,
                     Failure& err,
                     const ChunkCB& onChunk = {}) = 0;
};

} // namespace sitebackup
