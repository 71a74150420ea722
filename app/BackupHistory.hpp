// Persistent record of finished backup runs, kept as a JSON file.
#pragma once
#include <QString>
#include <QVector>
#include <QtGlobal>

enum class BackupStatus { Success, Failed, Cancelled };

const char* backupStatusName(BackupStatus status);

struct BackupHistoryEntry {
    QString id;
    quint64 timestamp = 0; // unix seconds
    QString remotePath;
    QString localPath;
    quint64 transferredFiles = 0;
    quint64 elapsedSeconds = 0;
    BackupStatus status = BackupStatus::Success;
    QString message;
    QString sshHost;
    QString sshUser;
};

struct BackupHistoryData {
    QVector<BackupHistoryEntry> entries;
    quint64 lastUpdated = 0;
    // Counters survive the entry cap; only delete() recomputes them.
    quint64 totalBackups = 0;
    quint64 successfulBackups = 0;
    quint64 failedBackups = 0;
};

struct BackupStatistics {
    quint64 totalBackups = 0;
    quint64 successfulBackups = 0;
    quint64 failedBackups = 0;
    double successRate = 0.0; // percent
    quint64 totalFilesTransferred = 0;
    quint64 totalTimeSpent = 0; // seconds
    double avgFilesPerBackup = 0.0;
    double avgTimePerBackup = 0.0;
    quint64 lastBackupTimestamp = 0;
};

class BackupHistory {
public:
    static constexpr int kMaxEntries = 100;

    explicit BackupHistory(QString filePath = defaultFilePath());

    // SITE_BACKUP_HISTORY_FILE when set, else backup_history.json in the
    // application data directory.
    static QString defaultFilePath();
    // "backup_<millis>_<hash>"
    static QString newEntryId();

    const QString& filePath() const { return path_; }

    // A missing file reads as an empty history.
    bool load(BackupHistoryData& out, QString& err) const;

    // Appends and updates counters; only the newest kMaxEntries are kept.
    bool add(const BackupHistoryEntry& entry, QString& err);

    // Newest first; limit <= 0 means all.
    bool recent(int limit, QVector<BackupHistoryEntry>& out, QString& err) const;
    // Entries with start <= timestamp <= end, in stored order.
    bool byDateRange(quint64 start, quint64 end,
                     QVector<BackupHistoryEntry>& out, QString& err) const;
    bool statistics(BackupStatistics& out, QString& err) const;

    // removed is false when no entry has that id.
    bool remove(const QString& id, bool& removed, QString& err);
    bool clear(QString& err);

private:
    QString path_;

    bool save(const BackupHistoryData& data, QString& err) const;
};
