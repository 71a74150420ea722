// Opens the single authenticated session a backup run works on.
#pragma once
#include "ErrorClassifier.hpp"
#include "SftpClient.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace sitebackup {

// Authenticated transport owned by exactly one run. Disconnects on
// destruction, whatever path the run took.
class Session {
public:
    Session(std::unique_ptr<SftpClient> client,
            SshConnectionConfig config,
            std::chrono::milliseconds connectTimeout);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    SftpClient& client() { return *client_; }
    const SshConnectionConfig& config() const { return config_; }
    bool isConnected() const { return client_->isConnected(); }

    // Re-establishes the transport after it dropped; no-op while connected.
    bool restore(BackupError& err);
    int restoreCount() const { return restores_; }

    // At most one transfer may run on a session at a time.
    bool beginTransfer() { return !transferActive_.exchange(true); }
    void endTransfer() { transferActive_.store(false); }
    bool transferActive() const { return transferActive_.load(); }

private:
    std::unique_ptr<SftpClient> client_;
    SshConnectionConfig config_;
    std::chrono::milliseconds connectTimeout_;
    std::atomic<bool> transferActive_{false};
    int restores_ = 0;
};

class ConnectionManager {
public:
    using ClientFactory = std::function<std::unique_ptr<SftpClient>()>;

    static constexpr std::chrono::seconds kDefaultConnectTimeout{30};

    // Without a factory sessions use the libssh2 backend.
    explicit ConnectionManager(ClientFactory factory = {});

    // Field checks and private key checks; no network I/O.
    bool validate(const SshConnectionConfig& cfg, BackupError& err) const;

    // Validates, connects and authenticates with the key. Fails with
    // ConnectionFailure, TimeoutFailure or AuthenticationFailure.
    std::unique_ptr<Session> connect(const SshConnectionConfig& cfg,
                                     BackupError& err,
                                     std::chrono::milliseconds timeout = kDefaultConnectTimeout) const;

private:
    ClientFactory factory_;
};

} // namespace sitebackup
