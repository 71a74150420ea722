#include "BackupRunner.hpp"
#include "LogCategories.hpp"
#include "sitebackup/RecursiveTransferEngine.hpp"
#include "sitebackup/RuntimeLogging.hpp"
#include <QDateTime>
#include <QMetaObject>
#include <chrono>
#include <utility>

using namespace sitebackup;

struct BackupRunner::Outcome {
    BackupProfile profile;
    bool ok = false;
    BackupResult result;
    BackupError error;
    qint64 startedAtSecs = 0;
};

BackupRunner::BackupRunner(BackupHistory* history,
                           ConnectionManager::ClientFactory factory,
                           QObject* parent)
    : QObject(parent), history_(history), manager_(std::move(factory)) {}

BackupRunner::~BackupRunner() {
    cancel_.cancel();
    if (worker_.joinable())
        worker_.join();
}

bool BackupRunner::start(const BackupProfile& profile) {
    if (running_) {
        qCWarning(sbXfer) << "backup already running; start ignored";
        return false;
    }
    if (worker_.joinable())
        worker_.join();
    cancel_.reset();
    running_ = true;
    qCInfo(sbXfer) << "backup start"
                   << "remote=" << profile.remoteFolder
                   << "local=" << profile.localFolder;
    worker_ = std::thread([this, profile]() { runWorker(profile); });
    return true;
}

void BackupRunner::cancel() {
    if (!running_)
        return;
    qCInfo(sbXfer) << "cancel requested";
    cancel_.cancel();
}

void BackupRunner::runWorker(BackupProfile profile) {
    Outcome out;
    out.profile = profile;
    out.startedAtSecs = QDateTime::currentSecsSinceEpoch();

    QMetaObject::invokeMethod(
        this,
        [this]() { emit progressChanged(QString::fromLatin1(backupPhaseName(BackupPhase::Connecting)), 0, 0, QString(), 0.0); },
        Qt::QueuedConnection);

    qCInfo(sbConn) << "connecting"
                   << "host=" << QString::fromStdString(profile.connection.hostname)
                   << "port=" << profile.connection.port
                   << "user=" << QString::fromStdString(redactSensitive(profile.connection.username));
    auto session = manager_.connect(profile.connection, out.error,
                                    std::chrono::seconds(profile.connectTimeoutSec));
    if (!session) {
        qCWarning(sbConn) << "connect failed:" << QString::fromStdString(out.error.describe());
    } else {
        qCInfo(sbConn) << "connected";
        EngineOptions opts;
        opts.onRetry = [](int n, std::chrono::milliseconds delay, const BackupError& e) {
            qCWarning(sbXfer) << "retry" << n << "in" << delay.count() << "ms after"
                              << errorKindName(e.kind) << QString::fromStdString(e.detail);
        };
        RecursiveTransferEngine engine(opts);
        const ProgressSink sink = [this](const BackupProgress& p) {
            const QString phase = QString::fromLatin1(backupPhaseName(p.phase));
            const QString current = p.current_file ? QString::fromStdString(*p.current_file) : QString();
            const double speed = p.transfer_speed.value_or(0.0);
            const quint64 files = p.transferred_files;
            const quint64 bytes = p.transferred_bytes;
            QMetaObject::invokeMethod(
                this,
                [this, phase, files, bytes, current, speed]() {
                    emit progressChanged(phase, files, bytes, current, speed);
                },
                Qt::QueuedConnection);
        };
        out.ok = engine.backup(*session,
                               profile.remoteFolder.toStdString(),
                               profile.localFolder.toStdString(),
                               sink, cancel_, out.result, out.error);
        qCInfo(sbConn) << "disconnecting; transport restores:" << session->restoreCount();
        session.reset();
    }

    QMetaObject::invokeMethod(
        this, [this, out]() { complete(out); }, Qt::QueuedConnection);
}

void BackupRunner::complete(const Outcome& out) {
    if (worker_.joinable())
        worker_.join();
    running_ = false;

    BackupStatus status = BackupStatus::Success;
    QString message = QString::fromStdString(out.result.message);
    if (!out.ok) {
        status = out.error.kind == ErrorKind::CancelledByUser ? BackupStatus::Cancelled
                                                              : BackupStatus::Failed;
        if (message.isEmpty())
            message = QString::fromStdString(out.error.describe());
    }
    for (const auto& ff : out.result.failed_files) {
        qCWarning(sbXfer) << "not copied:" << QString::fromStdString(ff.remote_path)
                          << QString::fromStdString(ff.error.describe());
    }
    qCInfo(sbXfer) << "backup finished" << backupStatusName(status)
                   << "files=" << out.result.transferred_files
                   << "bytes=" << out.result.transferred_bytes
                   << "retries=" << out.result.retries
                   << "elapsed=" << out.result.elapsed_seconds;

    if (history_) {
        BackupHistoryEntry entry;
        entry.id = BackupHistory::newEntryId();
        entry.timestamp = static_cast<quint64>(out.startedAtSecs);
        entry.remotePath = out.profile.remoteFolder;
        entry.localPath = out.profile.localFolder;
        entry.transferredFiles = out.result.transferred_files;
        entry.elapsedSeconds = out.result.elapsed_seconds;
        entry.status = status;
        entry.message = message;
        entry.sshHost = QString::fromStdString(out.profile.connection.hostname);
        entry.sshUser = QString::fromStdString(out.profile.connection.username);
        QString err;
        if (!history_->add(entry, err))
            qCWarning(sbHistory) << "could not record backup:" << err;
    }

    emit finished(static_cast<int>(status), message,
                  static_cast<quint64>(out.result.failed_files.size()));
}
