// Runs one backup on a worker thread and reports back on the owner's thread.
#pragma once
#include "AppSettings.hpp"
#include "BackupHistory.hpp"
#include "sitebackup/CancellationToken.hpp"
#include "sitebackup/ConnectionManager.hpp"
#include <QObject>
#include <QString>
#include <thread>

class BackupRunner : public QObject {
    Q_OBJECT
public:
    explicit BackupRunner(BackupHistory* history,
                          sitebackup::ConnectionManager::ClientFactory factory = {},
                          QObject* parent = nullptr);
    ~BackupRunner();

    // Starts the run; false if one is already in progress.
    bool start(const BackupProfile& profile);
    // Cooperative: the run stops at the next directory, file or retry wait.
    void cancel();
    bool running() const { return running_; }

signals:
    void progressChanged(const QString& phase,
                         quint64 transferredFiles,
                         quint64 transferredBytes,
                         const QString& currentFile,
                         double bytesPerSecond);
    // status is a BackupStatus value.
    void finished(int status, const QString& message, quint64 failedFiles);

private:
    struct Outcome;

    BackupHistory* history_;
    sitebackup::ConnectionManager manager_;
    sitebackup::CancellationToken cancel_;
    std::thread worker_;
    bool running_ = false;

    void runWorker(BackupProfile profile);
    void complete(const Outcome& outcome);
};
