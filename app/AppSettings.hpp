// Saved backup profile (QSettings "SiteBackup"/"SiteBackup").
#pragma once
#include "sitebackup/SftpTypes.hpp"
#include <QString>
#include <QStringList>

struct BackupProfile {
    sitebackup::SshConnectionConfig connection;
    QString remoteFolder;
    QString localFolder;
    int connectTimeoutSec = 30;
};

BackupProfile loadBackupProfile();
void saveBackupProfile(const BackupProfile& profile);

// Human-readable list of what is still missing before a backup can start;
// empty when the profile is usable.
QStringList missingProfileFields(const BackupProfile& profile);
