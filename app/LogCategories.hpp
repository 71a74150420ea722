// Logging categories of the host application. Tune with QT_LOGGING_RULES,
// e.g. "sitebackup.transfer.debug=true".
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(sbXfer)
Q_DECLARE_LOGGING_CATEGORY(sbConn)
Q_DECLARE_LOGGING_CATEGORY(sbHistory)
