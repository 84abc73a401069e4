#pragma once

#include <QDateTime>
#include <QString>

namespace ft::timer {

    inline constexpr const char* IDLE_TEXT = "--:--";

    // Count-down rounds up so a fresh 60000 ms timer shows 01:00 for a whole second
    qint64  countDownSeconds(qint64 remainingMs);
    // Count-up rounds down
    qint64  countUpSeconds(qint64 elapsedMs);

    // MM:SS below one hour, HH:MM:SS from one hour, leading '-' when overtime.
    // Pass overtime for values that round to zero seconds but are already negative.
    QString formatSeconds(qint64 seconds, bool overtime = false);
    QString formatClock(const QDateTime& now);

} // namespace ft::timer
