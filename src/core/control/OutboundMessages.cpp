#include "OutboundMessages.hpp"

namespace ft::control::messages {

    QJsonObject start() {
        return QJsonObject{{"tag", "start"}};
    }

    QJsonObject pause() {
        return QJsonObject{{"tag", "pause"}};
    }

    QJsonObject reload() {
        return QJsonObject{{"tag", "reload"}};
    }

    QJsonObject load(LoadTarget target) {
        return QJsonObject{{"tag", "load"}, {"payload", target == LoadTarget::Next ? "next" : "previous"}};
    }

    QJsonObject addTime(qint64 deltaMs) {
        const QJsonObject payload = deltaMs >= 0 ? QJsonObject{{"add", deltaMs}} : QJsonObject{{"remove", -deltaMs}};
        return QJsonObject{{"tag", "addtime"}, {"payload", payload}};
    }

    QJsonObject changeDuration(const QString& eventId, qint64 durationMs) {
        const QJsonObject patch{{"duration", durationMs}};
        return QJsonObject{{"tag", "change"}, {"payload", QJsonObject{{eventId, patch}}}};
    }

    QJsonObject blink(bool enabled) {
        return QJsonObject{{"tag", "message"}, {"payload", QJsonObject{{"timer", QJsonObject{{"blink", enabled}}}}}};
    }

    QJsonObject blackout(bool enabled) {
        return QJsonObject{{"tag", "message"}, {"payload", QJsonObject{{"timer", QJsonObject{{"blackout", enabled}}}}}};
    }

} // namespace ft::control::messages
