// Command-line entry point: backup runs, connection checks, remote folder
// discovery, history and profile management.
#include "AppSettings.hpp"
#include "BackupHistory.hpp"
#include "BackupRunner.hpp"
#include "LogCategories.hpp"
#include "TimeUtils.hpp"
#include "sitebackup/DomainDiscovery.hpp"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <QTimer>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <vector>

using namespace sitebackup;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitCancelled = 2;
constexpr int kExitUsage = 64;

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void onInterrupt(int) {
    g_interrupted = 1;
}

QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream& errOut() {
    static QTextStream s(stderr);
    return s;
}

int usageError(const QCommandLineParser& parser, const QString& why) {
    errOut() << why << "\n\n" << parser.helpText();
    errOut().flush();
    return kExitUsage;
}

std::unique_ptr<Session> openSession(const BackupProfile& profile, BackupError& err) {
    ConnectionManager mgr;
    return mgr.connect(profile.connection, err, std::chrono::seconds(profile.connectTimeoutSec));
}

int reportError(const BackupError& err) {
    errOut() << QString::fromStdString(err.message) << "\n";
    if (!err.detail.empty())
        errOut() << "  " << QString::fromStdString(err.detail) << "\n";
    errOut().flush();
    return kExitFailure;
}

int runBackup(QCoreApplication& app, const BackupProfile& profile) {
    BackupHistory history;
    BackupRunner runner(&history);
    int exitCode = kExitFailure;

    QObject::connect(&runner, &BackupRunner::progressChanged,
                     [](const QString& phase, quint64 files, quint64 bytes,
                        const QString& current, double speed) {
                         out() << "[" << phase << "] " << files << " files, "
                               << sitebackupapp::formatBytes(bytes);
                         if (speed > 0.0)
                             out() << " @ " << sitebackupapp::formatBytes(static_cast<quint64>(speed)) << "/s";
                         if (!current.isEmpty())
                             out() << "  " << current;
                         out() << "\n";
                         out().flush();
                     });
    QObject::connect(&runner, &BackupRunner::finished,
                     [&app, &exitCode](int status, const QString& message, quint64 failedFiles) {
                         out() << message << "\n";
                         out().flush();
                         switch (static_cast<BackupStatus>(status)) {
                         case BackupStatus::Success:
                             exitCode = failedFiles == 0 ? kExitOk : kExitFailure;
                             break;
                         case BackupStatus::Cancelled:
                             exitCode = kExitCancelled;
                             break;
                         case BackupStatus::Failed:
                             exitCode = kExitFailure;
                             break;
                         }
                         app.quit();
                     });

    std::signal(SIGINT, onInterrupt);
    QTimer interruptPoll;
    QObject::connect(&interruptPoll, &QTimer::timeout, [&runner]() {
        if (g_interrupted) {
            g_interrupted = 0;
            runner.cancel();
        }
    });
    interruptPoll.start(200);

    if (!runner.start(profile))
        return kExitFailure;
    app.exec();
    std::signal(SIGINT, SIG_DFL);
    return exitCode;
}

int runTestConnection(const BackupProfile& profile) {
    BackupError err;
    auto session = openSession(profile, err);
    if (!session) {
        qCWarning(sbConn) << "test connection failed:" << QString::fromStdString(err.describe());
        return reportError(err);
    }
    out() << "Connected to " << QString::fromStdString(profile.connection.hostname) << ":"
          << profile.connection.port << " as " << QString::fromStdString(profile.connection.username)
          << "\n";
    return kExitOk;
}

int runDomains(const BackupProfile& profile) {
    BackupError err;
    auto session = openSession(profile, err);
    if (!session)
        return reportError(err);
    std::vector<std::string> sites;
    if (!discoverSites(*session, sites, err))
        return reportError(err);
    for (const auto& s : sites)
        out() << QString::fromStdString(s) << "\n";
    return kExitOk;
}

int runList(const BackupProfile& profile, const QString& path) {
    BackupError err;
    auto session = openSession(profile, err);
    if (!session)
        return reportError(err);
    std::vector<std::string> dirs;
    if (!listDirectories(*session, path.toStdString(), dirs, err))
        return reportError(err);
    for (const auto& d : dirs)
        out() << QString::fromStdString(d) << "/\n";
    return kExitOk;
}

int runHistory(const QCommandLineParser& parser) {
    BackupHistory history;
    QString err;
    if (parser.isSet("clear")) {
        if (!history.clear(err)) {
            errOut() << err << "\n";
            return kExitFailure;
        }
        out() << "History cleared\n";
        return kExitOk;
    }
    if (parser.isSet("delete")) {
        bool removed = false;
        const QString id = parser.value("delete");
        if (!history.remove(id, removed, err)) {
            errOut() << err << "\n";
            return kExitFailure;
        }
        if (!removed) {
            errOut() << "No history entry with id " << id << "\n";
            return kExitFailure;
        }
        out() << "Deleted " << id << "\n";
        return kExitOk;
    }

    int limit = 20;
    if (parser.isSet("limit")) {
        bool ok = false;
        limit = parser.value("limit").toInt(&ok);
        if (!ok || limit < 0)
            return usageError(parser, "--limit expects a non-negative number");
    }
    QVector<BackupHistoryEntry> entries;
    if (!history.recent(limit, entries, err)) {
        errOut() << err << "\n";
        return kExitFailure;
    }
    for (const auto& e : entries) {
        out() << sitebackupapp::localShortTime(e.timestamp) << "  "
              << backupStatusName(e.status) << "  " << e.transferredFiles << " files  "
              << sitebackupapp::formatDuration(e.elapsedSeconds) << "  "
              << e.remotePath << " -> " << e.localPath << "  [" << e.id << "]\n";
        if (e.status != BackupStatus::Success)
            out() << "    " << e.message << "\n";
    }
    return kExitOk;
}

int runStats() {
    BackupHistory history;
    BackupStatistics st;
    QString err;
    if (!history.statistics(st, err)) {
        errOut() << err << "\n";
        return kExitFailure;
    }
    out() << "Backups:        " << st.totalBackups << " (" << st.successfulBackups << " ok, "
          << st.failedBackups << " failed)\n"
          << "Success rate:   " << QString::number(st.successRate, 'f', 1) << "%\n"
          << "Files copied:   " << st.totalFilesTransferred << "\n"
          << "Time spent:     " << sitebackupapp::formatDuration(st.totalTimeSpent) << "\n"
          << "Avg files/run:  " << QString::number(st.avgFilesPerBackup, 'f', 1) << "\n"
          << "Avg time/run:   " << sitebackupapp::formatDuration(static_cast<quint64>(st.avgTimePerBackup)) << "\n"
          << "Last backup:    " << sitebackupapp::localShortTime(st.lastBackupTimestamp) << "\n";
    return kExitOk;
}

int runConfig(const QCommandLineParser& parser) {
    BackupProfile p = loadBackupProfile();
    if (parser.isSet("host"))
        p.connection.hostname = parser.value("host").trimmed().toStdString();
    if (parser.isSet("port")) {
        bool ok = false;
        const uint port = parser.value("port").toUInt(&ok);
        if (!ok || port == 0 || port > 65535)
            return usageError(parser, "--port expects a number between 1 and 65535");
        p.connection.port = static_cast<std::uint16_t>(port);
    }
    if (parser.isSet("user"))
        p.connection.username = parser.value("user").trimmed().toStdString();
    if (parser.isSet("key"))
        p.connection.key_path = parser.value("key").toStdString();
    if (parser.isSet("remote"))
        p.remoteFolder = parser.value("remote");
    if (parser.isSet("local"))
        p.localFolder = parser.value("local");
    saveBackupProfile(p);

    out() << "host:   " << QString::fromStdString(p.connection.hostname) << "\n"
          << "port:   " << p.connection.port << "\n"
          << "user:   " << QString::fromStdString(p.connection.username) << "\n"
          << "key:    " << (p.connection.key_path.empty() ? "(not set)" : "(set)") << "\n"
          << "remote: " << p.remoteFolder << "\n"
          << "local:  " << p.localFolder << "\n";
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("SiteBackup");
    QCoreApplication::setApplicationName("SiteBackup");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("One-way SFTP backup of a hosted website into a local folder.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command",
                                 "backup | test-connection | domains | ls <path> | history | stats | config");
    parser.addOptions({
        {"remote", "Remote folder to back up.", "path"},
        {"local", "Local destination folder.", "path"},
        {"limit", "Number of history entries to show (0 = all).", "n"},
        {"clear", "Remove every history entry."},
        {"delete", "Remove one history entry.", "id"},
        {"host", "SSH host name.", "host"},
        {"port", "SSH port.", "port"},
        {"user", "SSH user name.", "user"},
        {"key", "Private key file.", "path"},
    });
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        return usageError(parser, "Missing command.");
    const QString command = args.first();

    if (command == "history")
        return runHistory(parser);
    if (command == "stats")
        return runStats();
    if (command == "config")
        return runConfig(parser);

    BackupProfile profile = loadBackupProfile();
    const QStringList missing = missingProfileFields(profile);
    if (!missing.isEmpty()) {
        errOut() << "Connection profile incomplete, missing: " << missing.join(", ")
                 << "\nRun 'sitebackup config' first.\n";
        return kExitUsage;
    }

    if (command == "test-connection")
        return runTestConnection(profile);
    if (command == "domains")
        return runDomains(profile);
    if (command == "ls") {
        if (args.size() < 2)
            return usageError(parser, "ls expects a remote path.");
        return runList(profile, args.at(1));
    }
    if (command == "backup") {
        if (parser.isSet("remote"))
            profile.remoteFolder = parser.value("remote");
        if (parser.isSet("local"))
            profile.localFolder = parser.value("local");
        if (profile.remoteFolder.isEmpty() || profile.localFolder.isEmpty())
            return usageError(parser, "backup needs a remote and a local folder (--remote/--local or saved profile).");
        return runBackup(app, profile);
    }
    return usageError(parser, QString("Unknown command: %1").arg(command));
}
