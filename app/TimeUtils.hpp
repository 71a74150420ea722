// Small formatting helpers for console output.
#pragma once
#include <QDateTime>
#include <QLocale>
#include <QString>

namespace sitebackupapp {

// Epoch seconds in LOCAL time (short format), using the system locale so
// 12/24h and date formats match OS preferences.
inline QString localShortTime(quint64 secs) {
    if (secs == 0) return QStringLiteral("-");
    const QDateTime dt = QDateTime::fromSecsSinceEpoch(static_cast<qint64>(secs));
    if (!dt.isValid()) return QStringLiteral("-");
    return QLocale::system().toString(dt, QLocale::ShortFormat);
}

// "1h 02m 03s", "4m 05s", "7s"
inline QString formatDuration(quint64 secs) {
    const quint64 h = secs / 3600;
    const quint64 m = (secs % 3600) / 60;
    const quint64 s = secs % 60;
    if (h > 0)
        return QString("%1h %2m %3s").arg(h).arg(m, 2, 10, QLatin1Char('0')).arg(s, 2, 10, QLatin1Char('0'));
    if (m > 0)
        return QString("%1m %2s").arg(m).arg(s, 2, 10, QLatin1Char('0'));
    return QString("%1s").arg(s);
}

inline QString formatBytes(quint64 bytes) {
    return QLocale::system().formattedDataSize(static_cast<qint64>(bytes));
}

} // namespace sitebackupapp
