#include "TimeFormat.hpp"

namespace ft::timer {

    qint64 countDownSeconds(qint64 remainingMs) {
        // Integer division truncates toward zero, which is already the ceiling for negatives
        qint64 seconds = remainingMs / 1000;
        if (remainingMs > 0 && remainingMs % 1000 != 0) {
            ++seconds;
        }
        return seconds;
    }

    qint64 countUpSeconds(qint64 elapsedMs) {
        qint64 seconds = elapsedMs / 1000;
        if (elapsedMs < 0 && elapsedMs % 1000 != 0) {
            --seconds;
        }
        return seconds;
    }

    QString formatSeconds(qint64 seconds, bool overtime) {
        const bool   negative = seconds < 0 || overtime;
        const qint64 total    = negative ? -seconds : seconds;

        const qint64 hours   = total / 3600;
        const qint64 minutes = (total % 3600) / 60;
        const qint64 secs    = total % 60;

        QString      text;
        if (hours > 0) {
            text = QStringLiteral("%1:%2:%3").arg(hours, 2, 10, QChar('0')).arg(minutes, 2, 10, QChar('0')).arg(secs, 2, 10, QChar('0'));
        } else {
            text = QStringLiteral("%1:%2").arg(minutes, 2, 10, QChar('0')).arg(secs, 2, 10, QChar('0'));
        }

        return negative ? QStringLiteral("-") + text : text;
    }

    QString formatClock(const QDateTime& now) {
        return now.toString(QStringLiteral("HH:mm:ss"));
    }

} // namespace ft::timer
