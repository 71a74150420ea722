#include "AppSettings.hpp"
#include <QSettings>

BackupProfile loadBackupProfile() {
    BackupProfile p;
    QSettings s("SiteBackup", "SiteBackup");
    s.beginGroup("Connection");
    p.connection.hostname = s.value("host").toString().trimmed().toStdString();
    const uint port = s.value("port", 22).toUInt();
    p.connection.port = static_cast<std::uint16_t>(port > 65535 ? 0 : port);
    p.connection.username = s.value("user").toString().trimmed().toStdString();
    p.connection.key_path = s.value("keyPath").toString().toStdString();
    s.endGroup();

    s.beginGroup("Backup");
    p.remoteFolder = s.value("remoteFolder").toString();
    p.localFolder = s.value("localFolder").toString();
    p.connectTimeoutSec = s.value("connectTimeoutSec", 30).toInt();
    if (p.connectTimeoutSec <= 0)
        p.connectTimeoutSec = 30;
    s.endGroup();
    return p;
}

void saveBackupProfile(const BackupProfile& p) {
    QSettings s("SiteBackup", "SiteBackup");
    s.beginGroup("Connection");
    s.setValue("host", QString::fromStdString(p.connection.hostname));
    s.setValue("port", static_cast<int>(p.connection.port));
    s.setValue("user", QString::fromStdString(p.connection.username));
    s.setValue("keyPath", QString::fromStdString(p.connection.key_path));
    s.endGroup();

    s.beginGroup("Backup");
    s.setValue("remoteFolder", p.remoteFolder);
    s.setValue("localFolder", p.localFolder);
    s.setValue("connectTimeoutSec", p.connectTimeoutSec);
    s.endGroup();
    s.sync();
}

QStringList missingProfileFields(const BackupProfile& p) {
    QStringList missing;
    if (p.connection.hostname.empty())
        missing << "host";
    if (p.connection.port == 0)
        missing << "port";
    if (p.connection.username.empty())
        missing << "user";
    if (p.connection.key_path.empty())
        missing << "key";
    return missing;
}
