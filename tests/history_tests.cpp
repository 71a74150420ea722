// Backup history persistence tests (Qt Core, no test framework; run via CTest).
#include "BackupHistory.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QSet>
#include <QTemporaryDir>

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

BackupHistoryEntry makeEntry(const QString &id, quint64 ts, BackupStatus status,
                             quint64 files = 10, quint64 secs = 20) {
    BackupHistoryEntry e;
    e.id = id;
    e.timestamp = ts;
    e.remotePath = "/home/alice/example.com/public_html";
    e.localPath = "/backups/example.com";
    e.transferredFiles = files;
    e.elapsedSeconds = secs;
    e.status = status;
    e.message = QString("run %1").arg(id);
    e.sshHost = "sites.example.test";
    e.sshUser = "alice";
    return e;
}

void test_missing_file_is_empty(TestContext &t, const QTemporaryDir &dir) {
    BackupHistory h(dir.filePath("none/history.json"));
    BackupHistoryData data;
    QString err;
    t.check(h.load(data, err), "missing history file should load");
    t.check(data.entries.isEmpty() && data.totalBackups == 0,
            "missing history file should be empty");

    BackupStatistics st;
    t.check(h.statistics(st, err), "statistics on empty history should succeed");
    t.check(st.successRate == 0.0 && st.avgFilesPerBackup == 0.0,
            "empty history should not divide by zero");
}

void test_add_and_reload(TestContext &t, const QTemporaryDir &dir) {
    const QString path = dir.filePath("nested/dir/history.json");
    QString err;
    {
        BackupHistory h(path);
        t.check(h.add(makeEntry("a", 100, BackupStatus::Success), err),
                "add should create the file and parents");
        t.check(h.add(makeEntry("b", 200, BackupStatus::Failed), err), "second add");
        t.check(h.add(makeEntry("c", 300, BackupStatus::Cancelled), err), "third add");
    }
    BackupHistory reopened(path);
    BackupHistoryData data;
    t.check(reopened.load(data, err), "history should reload");
    t.check(data.entries.size() == 3, "three entries should persist");
    t.check(data.totalBackups == 3, "total counter");
    t.check(data.successfulBackups == 1, "success counter");
    t.check(data.failedBackups == 1, "failed counter ignores cancelled runs");
    t.check(data.lastUpdated > 0, "last_updated should be stamped");
    if (data.entries.size() == 3) {
        const BackupHistoryEntry &b = data.entries[1];
        t.check(b.id == "b" && b.status == BackupStatus::Failed, "entry fields round trip");
        t.check(b.sshUser == "alice" && b.transferredFiles == 10 && b.elapsedSeconds == 20,
                "entry values round trip");
    }
}

void test_recent_and_range(TestContext &t, const QTemporaryDir &dir) {
    BackupHistory h(dir.filePath("recent.json"));
    QString err;
    h.add(makeEntry("old", 1000, BackupStatus::Success), err);
    h.add(makeEntry("new", 3000, BackupStatus::Success), err);
    h.add(makeEntry("mid", 2000, BackupStatus::Failed), err);

    QVector<BackupHistoryEntry> out;
    t.check(h.recent(2, out, err), "recent should succeed");
    t.check(out.size() == 2 && out[0].id == "new" && out[1].id == "mid",
            "recent should be newest first and limited");
    t.check(h.recent(0, out, err) && out.size() == 3, "limit 0 returns everything");

    t.check(h.byDateRange(1000, 2000, out, err), "range query should succeed");
    t.check(out.size() == 2, "range bounds are inclusive");
    t.check(h.byDateRange(4000, 5000, out, err) && out.isEmpty(), "empty range");
}

void test_cap_keeps_newest(TestContext &t, const QTemporaryDir &dir) {
    BackupHistory h(dir.filePath("cap.json"));
    QString err;
    for (int i = 0; i < BackupHistory::kMaxEntries + 5; ++i) {
        if (!h.add(makeEntry(QString("e%1").arg(i), 1000 + i, BackupStatus::Success), err)) {
            t.check(false, "add should succeed: " + err.toStdString());
            return;
        }
    }
    BackupHistoryData data;
    t.check(h.load(data, err), "capped history should load");
    t.check(data.entries.size() == BackupHistory::kMaxEntries, "history keeps 100 entries");
    t.check(data.totalBackups == BackupHistory::kMaxEntries + 5,
            "counters keep counting past the cap");
    bool hasOldest = false;
    bool hasNewest = false;
    for (const auto &e : data.entries) {
        if (e.id == "e0")
            hasOldest = true;
        if (e.id == QString("e%1").arg(BackupHistory::kMaxEntries + 4))
            hasNewest = true;
    }
    t.check(!hasOldest && hasNewest, "oldest entries are dropped first");
}

void test_statistics(TestContext &t, const QTemporaryDir &dir) {
    BackupHistory h(dir.filePath("stats.json"));
    QString err;
    h.add(makeEntry("s1", 100, BackupStatus::Success, 10, 30), err);
    h.add(makeEntry("s2", 500, BackupStatus::Success, 20, 60), err);
    h.add(makeEntry("f1", 300, BackupStatus::Failed, 0, 5), err);
    h.add(makeEntry("c1", 200, BackupStatus::Cancelled, 6, 25), err);

    BackupStatistics st;
    t.check(h.statistics(st, err), "statistics should succeed");
    t.check(st.totalBackups == 4, "total backups");
    t.check(st.successRate == 50.0, "success rate is a percentage");
    t.check(st.totalFilesTransferred == 36, "total files");
    t.check(st.totalTimeSpent == 120, "total time");
    t.check(st.avgFilesPerBackup == 9.0, "average files");
    t.check(st.avgTimePerBackup == 30.0, "average time");
    t.check(st.lastBackupTimestamp == 500, "last backup is the newest timestamp");
}

void test_delete_recomputes(TestContext &t, const QTemporaryDir &dir) {
    BackupHistory h(dir.filePath("delete.json"));
    QString err;
    h.add(makeEntry("keep", 100, BackupStatus::Success), err);
    h.add(makeEntry("drop", 200, BackupStatus::Failed), err);

    bool removed = true;
    t.check(h.remove("unknown", removed, err), "deleting an unknown id is not an error");
    t.check(!removed, "unknown id should report nothing removed");

    t.check(h.remove("drop", removed, err) && removed, "delete should remove the entry");
    BackupHistoryData data;
    h.load(data, err);
    t.check(data.entries.size() == 1 && data.entries[0].id == "keep", "one entry left");
    t.check(data.totalBackups == 1 && data.failedBackups == 0 && data.successfulBackups == 1,
            "counters are recomputed from the remaining entries");

    t.check(h.clear(err), "clear should succeed");
    h.load(data, err);
    t.check(data.entries.isEmpty() && data.totalBackups == 0, "clear empties everything");
}

void test_corrupt_file_reports_error(TestContext &t, const QTemporaryDir &dir) {
    const QString path = dir.filePath("corrupt.json");
    QFile f(path);
    if (f.open(QIODevice::WriteOnly)) {
        f.write("{ not json");
        f.close();
    }
    BackupHistory h(path);
    BackupHistoryData data;
    QString err;
    t.check(!h.load(data, err), "corrupt history should fail to load");
    t.check(!err.isEmpty(), "corrupt history should explain the failure");
    t.check(!h.add(makeEntry("x", 1, BackupStatus::Success), err),
            "add must not overwrite a corrupt history");
}

void test_ids(TestContext &t) {
    QSet<QString> seen;
    for (int i = 0; i < 50; ++i) {
        const QString id = BackupHistory::newEntryId();
        t.check(id.startsWith("backup_"), "id prefix");
        t.check(id.count('_') == 2, "id has millis and hash parts");
        seen.insert(id);
    }
    t.check(seen.size() == 50, "ids should be unique");
}

void test_env_override(TestContext &t, const QTemporaryDir &dir) {
    const QString path = dir.filePath("env.json");
    qputenv("SITE_BACKUP_HISTORY_FILE", path.toUtf8());
    t.check(BackupHistory::defaultFilePath() == path, "env var overrides the history path");
    qunsetenv("SITE_BACKUP_HISTORY_FILE");
    t.check(BackupHistory::defaultFilePath().endsWith("backup_history.json"),
            "default history file name");
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("SiteBackup");
    QCoreApplication::setApplicationName("SiteBackupTests");

    QTemporaryDir dir;
    if (!dir.isValid()) {
        std::cerr << "[FAIL] could not create temp dir\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    test_missing_file_is_empty(t, dir);
    test_add_and_reload(t, dir);
    test_recent_and_range(t, dir);
    test_cap_keeps_newest(t, dir);
    test_statistics(t, dir);
    test_delete_recomputes(t, dir);
    test_corrupt_file_reports_error(t, dir);
    test_ids(t);
    test_env_override(t, dir);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sitebackup_history_tests\n";
    return EXIT_SUCCESS;
}
