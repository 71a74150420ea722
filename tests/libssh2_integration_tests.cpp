// Integration tests for the libssh2 backend and a full backup run against a
// real SFTP server. The test is skipped (exit code 77) unless the required
// SITE_BACKUP_IT_* env vars exist. The remote tree is only read.
#include "sitebackup/ConnectionManager.hpp"
#include "sitebackup/DomainDiscovery.hpp"
#include "sitebackup/Libssh2SftpClient.hpp"
#include "sitebackup/RecursiveTransferEngine.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace sitebackup;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    char *end = nullptr;
    const long n = std::strtol(raw->c_str(), &end, 10);
    if (!end || *end != '\0' || n < 1 || n > 65535)
        return false;
    out = static_cast<std::uint16_t>(n);
    return true;
}

} // namespace

int main() {
    const auto host = envValue("SITE_BACKUP_IT_SFTP_HOST");
    const auto user = envValue("SITE_BACKUP_IT_SFTP_USER");
    const auto keyPath = envValue("SITE_BACKUP_IT_SFTP_KEY");
    const auto remoteRoot = envValue("SITE_BACKUP_IT_REMOTE_ROOT");

    if (!host.has_value() || !user.has_value() || !keyPath.has_value() ||
        !remoteRoot.has_value()) {
        std::cout << "[SKIP] sitebackup_sftp_integration_tests requires env vars: "
                  << "SITE_BACKUP_IT_SFTP_HOST, SITE_BACKUP_IT_SFTP_USER, "
                     "SITE_BACKUP_IT_SFTP_KEY and SITE_BACKUP_IT_REMOTE_ROOT\n";
        return kSkipExitCode;
    }
    if (!fs::exists(*keyPath)) {
        std::cerr << "[FAIL] SITE_BACKUP_IT_SFTP_KEY does not exist\n";
        return EXIT_FAILURE;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("SITE_BACKUP_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] SITE_BACKUP_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    SshConnectionConfig cfg;
    cfg.hostname = *host;
    cfg.port = port;
    cfg.username = *user;
    cfg.key_path = *keyPath;

    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("sitebackup-it-" + uniqueToken());

    ConnectionManager mgr;
    BackupError err;

    // Nothing listens on port 1 of the loopback interface.
    {
        SshConnectionConfig closed = cfg;
        closed.hostname = "127.0.0.1";
        closed.port = 1;
        auto none = mgr.connect(closed, err, std::chrono::seconds(5));
        t.check(!none, "connect to a closed port should fail");
        t.check(err.kind == ErrorKind::ConnectionFailure,
                "closed port should be a ConnectionFailure: " + err.describe());
    }

    auto session = mgr.connect(cfg, err);
    t.check(session != nullptr, "connect should succeed: " + err.describe());
    if (session) {
        FileInfo rootInfo;
        Failure f;
        t.check(session->client().stat(*remoteRoot, rootInfo, f),
                "stat(remoteRoot) should succeed: " + f.detail);
        t.check(rootInfo.is_dir, "remote root should be a directory");

        std::vector<FileInfo> entries;
        f.clear();
        t.check(session->client().list(*remoteRoot, entries, f),
                "list(remoteRoot) should succeed: " + f.detail);
        for (const auto &e : entries)
            t.check(e.name != "." && e.name != "..", "list should skip dot entries");

        std::vector<std::string> dirs;
        t.check(listDirectories(*session, *remoteRoot, dirs, err),
                "listDirectories should succeed: " + err.describe());

        f.clear();
        std::vector<FileInfo> missing;
        t.check(!session->client().list(joinRemotePath(*remoteRoot, "sitebackup-missing-" +
                                                                     uniqueToken()),
                                        missing, f),
                "listing a missing directory should fail");
        t.check(classify(f) == ErrorKind::FilesystemFailure,
                "missing directory should classify as FilesystemFailure");

        RecursiveTransferEngine engine;
        CancellationToken cancel;
        BackupResult result;
        std::vector<BackupProgress> events;
        const bool ok = engine.backup(*session, *remoteRoot, localTmpRoot.string(),
                                      [&events](const BackupProgress &p) { events.push_back(p); },
                                      cancel, result, err);
        t.check(ok, "backup should succeed: " + err.describe());
        t.check(!events.empty() && events.back().phase == BackupPhase::Completed,
                "last progress event should be Completed");

        // Top-level visible regular files must be mirrored with their size.
        for (const auto &e : entries) {
            if (e.is_dir || e.name.empty() || e.name.front() == '.')
                continue;
            if (e.mode != 0 && (e.mode & 0170000u) != 0100000u)
                continue;
            const fs::path local = localTmpRoot / e.name;
            std::error_code ec;
            t.check(fs::exists(local, ec), "file should be copied: " + e.name);
            if (fs::exists(local, ec))
                t.check(fs::file_size(local, ec) == e.size, "copied size should match: " + e.name);
        }
        for (const auto &e : entries) {
            if (!e.name.empty() && e.name.front() == '.')
                t.check(!fs::exists(localTmpRoot / e.name), "hidden entries are not copied");
        }

        BackupResult missingResult;
        t.check(!engine.backup(*session, joinRemotePath(*remoteRoot, "sitebackup-missing-" +
                                                                        uniqueToken()),
                               (localTmpRoot / "missing").string(), {}, cancel, missingResult,
                               err),
                "backup of a missing remote root should fail");
        t.check(err.kind == ErrorKind::FilesystemFailure,
                "missing remote root should be a FilesystemFailure");
    }
    session.reset();

    std::error_code ec;
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sitebackup_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
