#include "sitebackup/ConnectionManager.hpp"
#include "sitebackup/Libssh2SftpClient.hpp"
#include "sitebackup/RuntimeLogging.hpp"
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace sitebackup {

Session::Session(std::unique_ptr<SftpClient> client,
                 SshConnectionConfig config,
                 std::chrono::milliseconds connectTimeout)
    : client_(std::move(client)),
      config_(std::move(config)),
      connectTimeout_(connectTimeout) {}

Session::~Session() {
    if (client_) client_->disconnect();
}

bool Session::restore(BackupError& err) {
    if (client_->isConnected()) return true;
    client_->disconnect(); // drop whatever is left of the old transport
    Failure f;
    if (!client_->connect(config_, connectTimeout_, f)) {
        err = makeError(f, "reconnecting to " + config_.hostname);
        return false;
    }
    ++restores_;
    return true;
}

ConnectionManager::ConnectionManager(ClientFactory factory)
    : factory_(factory ? std::move(factory) : ClientFactory([]() -> std::unique_ptr<SftpClient> {
          return std::make_unique<Libssh2SftpClient>();
      })) {}

bool ConnectionManager::validate(const SshConnectionConfig& cfg, BackupError& err) const {
    if (cfg.hostname.empty() || cfg.username.empty() || cfg.key_path.empty() || cfg.port == 0) {
        err = makeError(ErrorKind::ConnectionFailure,
                        "connection settings incomplete: host, port, user and key path are required");
        err.message = "Connection settings are incomplete.";
        return false;
    }

    std::error_code ec;
    const auto st = fs::status(cfg.key_path, ec);
    if (ec || !fs::exists(st) || !fs::is_regular_file(st)) {
        err = makeError(ErrorKind::AuthenticationFailure,
                        "private key file not found: " + redactSensitive(cfg.key_path));
        return false;
    }
#ifndef _WIN32
    const auto loose = fs::perms::group_all | fs::perms::others_all;
    if ((st.permissions() & loose) != fs::perms::none) {
        err = makeError(ErrorKind::AuthenticationFailure,
                        "private key file is accessible by other users: " +
                            redactSensitive(cfg.key_path));
        err.message = "The private key permissions are too open; run chmod 600 on the key file.";
        return false;
    }
#endif
    return true;
}

std::unique_ptr<Session> ConnectionManager::connect(const SshConnectionConfig& cfg,
                                                    BackupError& err,
                                                    std::chrono::milliseconds timeout) const {
    if (!validate(cfg, err)) return nullptr;

    std::unique_ptr<SftpClient> client = factory_();
    if (!client) {
        err = makeError(ErrorKind::UnknownFailure, "no SFTP backend available");
        return nullptr;
    }
    Failure f;
    if (!client->connect(cfg, timeout, f)) {
        client->disconnect();
        err = makeError(f, "connecting to " + cfg.hostname + ":" + std::to_string(cfg.port));
        return nullptr;
    }
    return std::make_unique<Session>(std::move(client), cfg, timeout);
}

} // namespace sitebackup
