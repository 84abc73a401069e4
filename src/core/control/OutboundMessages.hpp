#pragma once

#include <QJsonObject>
#include <QString>

namespace ft::control::messages {

    enum class LoadTarget {
        Next,
        Previous
    };

    QJsonObject start();
    QJsonObject pause();
    QJsonObject reload();
    QJsonObject load(LoadTarget target);

    // Positive deltas add time, negative deltas remove it
    QJsonObject addTime(qint64 deltaMs);
    QJsonObject changeDuration(const QString& eventId, qint64 durationMs);

    QJsonObject blink(bool enabled);
    QJsonObject blackout(bool enabled);

} // namespace ft::control::messages
