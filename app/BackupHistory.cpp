#include "BackupHistory.hpp"
#include "LogCategories.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>
#include <QThread>
#include <algorithm>
#include <atomic>
#include <utility>

namespace {

quint64 nowSecs() {
    return static_cast<quint64>(QDateTime::currentSecsSinceEpoch());
}

bool parseStatus(const QString& s, BackupStatus& out) {
    if (s == QLatin1String("Success")) {
        out = BackupStatus::Success;
        return true;
    }
    if (s == QLatin1String("Failed")) {
        out = BackupStatus::Failed;
        return true;
    }
    if (s == QLatin1String("Cancelled")) {
        out = BackupStatus::Cancelled;
        return true;
    }
    return false;
}

// JSON numbers are doubles; counters and timestamps stay well below 2^53.
quint64 toU64(const QJsonValue& v) {
    const double d = v.toDouble(0.0);
    return d > 0.0 ? static_cast<quint64>(d) : 0;
}

QJsonObject entryToJson(const BackupHistoryEntry& e) {
    QJsonObject o;
    o["id"] = e.id;
    o["timestamp"] = static_cast<double>(e.timestamp);
    o["remote_path"] = e.remotePath;
    o["local_path"] = e.localPath;
    o["transferred_files"] = static_cast<double>(e.transferredFiles);
    o["elapsed_seconds"] = static_cast<double>(e.elapsedSeconds);
    o["status"] = QString::fromLatin1(backupStatusName(e.status));
    o["message"] = e.message;
    o["ssh_host"] = e.sshHost;
    o["ssh_user"] = e.sshUser;
    return o;
}

bool entryFromJson(const QJsonObject& o, BackupHistoryEntry& e) {
    e.id = o.value("id").toString();
    if (e.id.isEmpty())
        return false;
    if (!parseStatus(o.value("status").toString(), e.status))
        return false;
    e.timestamp = toU64(o.value("timestamp"));
    e.remotePath = o.value("remote_path").toString();
    e.localPath = o.value("local_path").toString();
    e.transferredFiles = toU64(o.value("transferred_files"));
    e.elapsedSeconds = toU64(o.value("elapsed_seconds"));
    e.message = o.value("message").toString();
    e.sshHost = o.value("ssh_host").toString();
    e.sshUser = o.value("ssh_user").toString();
    return true;
}

void sortNewestFirst(QVector<BackupHistoryEntry>& v) {
    std::stable_sort(v.begin(), v.end(),
                     [](const BackupHistoryEntry& a, const BackupHistoryEntry& b) {
                         return a.timestamp > b.timestamp;
                     });
}

} // namespace

const char* backupStatusName(BackupStatus status) {
    switch (status) {
    case BackupStatus::Success:
        return "Success";
    case BackupStatus::Failed:
        return "Failed";
    case BackupStatus::Cancelled:
        return "Cancelled";
    }
    return "Failed";
}

BackupHistory::BackupHistory(QString filePath) : path_(std::move(filePath)) {}

QString BackupHistory::defaultFilePath() {
    const QString overridePath = qEnvironmentVariable("SITE_BACKUP_HISTORY_FILE");
    if (!overridePath.isEmpty())
        return overridePath;
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(dir).filePath("backup_history.json");
}

QString BackupHistory::newEntryId() {
    static std::atomic<quint32> seq{0};
    const qint64 ms = QDateTime::currentMSecsSinceEpoch();
    const quintptr tid = reinterpret_cast<quintptr>(QThread::currentThreadId());
    const size_t h = qHash(QString::number(ms) + QLatin1Char(':') + QString::number(tid) +
                           QLatin1Char(':') + QString::number(seq.fetch_add(1)));
    return QString("backup_%1_%2").arg(ms).arg(static_cast<quint32>(h));
}

bool BackupHistory::load(BackupHistoryData& out, QString& err) const {
    out = BackupHistoryData{};
    QFile f(path_);
    if (!f.exists())
        return true;
    if (!f.open(QIODevice::ReadOnly)) {
        err = QString("Cannot read backup history %1: %2").arg(path_, f.errorString());
        return false;
    }
    QJsonParseError pe{};
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        err = QString("Backup history %1 is not valid JSON: %2").arg(path_, pe.errorString());
        return false;
    }
    const QJsonObject root = doc.object();
    const QJsonArray entries = root.value("entries").toArray();
    for (const QJsonValue& v : entries) {
        BackupHistoryEntry e;
        if (!v.isObject() || !entryFromJson(v.toObject(), e)) {
            qCWarning(sbHistory) << "Skipping malformed history entry in" << path_;
            continue;
        }
        out.entries.push_back(e);
    }
    out.lastUpdated = toU64(root.value("last_updated"));
    out.totalBackups = toU64(root.value("total_backups"));
    out.successfulBackups = toU64(root.value("successful_backups"));
    out.failedBackups = toU64(root.value("failed_backups"));
    return true;
}

bool BackupHistory::save(const BackupHistoryData& data, QString& err) const {
    const QFileInfo fi(path_);
    if (!QDir().mkpath(fi.absolutePath())) {
        err = QString("Cannot create history directory %1").arg(fi.absolutePath());
        return false;
    }
    QJsonArray entries;
    for (const auto& e : data.entries)
        entries.append(entryToJson(e));
    QJsonObject root;
    root["entries"] = entries;
    root["last_updated"] = static_cast<double>(data.lastUpdated);
    root["total_backups"] = static_cast<double>(data.totalBackups);
    root["successful_backups"] = static_cast<double>(data.successfulBackups);
    root["failed_backups"] = static_cast<double>(data.failedBackups);

    QSaveFile f(path_);
    if (!f.open(QIODevice::WriteOnly)) {
        err = QString("Cannot write backup history %1: %2").arg(path_, f.errorString());
        return false;
    }
    const QByteArray bytes = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (f.write(bytes) != bytes.size()) {
        err = QString("Cannot write backup history %1: %2").arg(path_, f.errorString());
        f.cancelWriting();
        return false;
    }
    if (!f.commit()) {
        err = QString("Cannot save backup history %1: %2").arg(path_, f.errorString());
        return false;
    }
    return true;
}

bool BackupHistory::add(const BackupHistoryEntry& entry, QString& err) {
    BackupHistoryData data;
    if (!load(data, err))
        return false;
    data.entries.push_back(entry);
    data.totalBackups += 1;
    data.lastUpdated = nowSecs();
    switch (entry.status) {
    case BackupStatus::Success:
        data.successfulBackups += 1;
        break;
    case BackupStatus::Failed:
        data.failedBackups += 1;
        break;
    case BackupStatus::Cancelled:
        break;
    }
    if (data.entries.size() > kMaxEntries) {
        sortNewestFirst(data.entries);
        data.entries.resize(kMaxEntries);
    }
    if (!save(data, err))
        return false;
    qCInfo(sbHistory) << "history entry added" << entry.id << backupStatusName(entry.status);
    return true;
}

bool BackupHistory::recent(int limit, QVector<BackupHistoryEntry>& out, QString& err) const {
    BackupHistoryData data;
    if (!load(data, err))
        return false;
    out = data.entries;
    sortNewestFirst(out);
    if (limit > 0 && out.size() > limit)
        out.resize(limit);
    return true;
}

bool BackupHistory::byDateRange(quint64 start, quint64 end,
                                QVector<BackupHistoryEntry>& out, QString& err) const {
    BackupHistoryData data;
    if (!load(data, err))
        return false;
    out.clear();
    for (const auto& e : data.entries) {
        if (e.timestamp >= start && e.timestamp <= end)
            out.push_back(e);
    }
    return true;
}

bool BackupHistory::statistics(BackupStatistics& out, QString& err) const {
    BackupHistoryData data;
    if (!load(data, err))
        return false;
    out = BackupStatistics{};
    out.totalBackups = data.totalBackups;
    out.successfulBackups = data.successfulBackups;
    out.failedBackups = data.failedBackups;
    for (const auto& e : data.entries) {
        out.totalFilesTransferred += e.transferredFiles;
        out.totalTimeSpent += e.elapsedSeconds;
        out.lastBackupTimestamp = std::max(out.lastBackupTimestamp, e.timestamp);
    }
    if (data.totalBackups > 0) {
        const double total = static_cast<double>(data.totalBackups);
        out.avgFilesPerBackup = static_cast<double>(out.totalFilesTransferred) / total;
        out.avgTimePerBackup = static_cast<double>(out.totalTimeSpent) / total;
        out.successRate = static_cast<double>(data.successfulBackups) / total * 100.0;
    }
    return true;
}

bool BackupHistory::remove(const QString& id, bool& removed, QString& err) {
    removed = false;
    BackupHistoryData data;
    if (!load(data, err))
        return false;
    const auto before = data.entries.size();
    data.entries.erase(std::remove_if(data.entries.begin(), data.entries.end(),
                                      [&id](const BackupHistoryEntry& e) { return e.id == id; }),
                       data.entries.end());
    if (data.entries.size() == before)
        return true;

    data.totalBackups = static_cast<quint64>(data.entries.size());
    data.successfulBackups = 0;
    data.failedBackups = 0;
    for (const auto& e : data.entries) {
        if (e.status == BackupStatus::Success)
            ++data.successfulBackups;
        else if (e.status == BackupStatus::Failed)
            ++data.failedBackups;
    }
    data.lastUpdated = nowSecs();
    if (!save(data, err))
        return false;
    removed = true;
    qCInfo(sbHistory) << "history entry deleted" << id;
    return true;
}

bool BackupHistory::clear(QString& err) {
    if (!save(BackupHistoryData{}, err))
        return false;
    qCInfo(sbHistory) << "history cleared";
    return true;
}
