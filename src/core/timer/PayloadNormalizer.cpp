#include "PayloadNormalizer.hpp"

#include <QList>

#include <cmath>
#include <initializer_list>
#include <limits>

namespace ft::timer {

    namespace {

        using KeyList = std::initializer_list<const char*>;

        // Alias tables. Order is priority: the first key present wins.
        constexpr KeyList CURRENT_KEYS       = {"current", "currentTime", "time"};
        constexpr KeyList REMAINING_KEYS     = {"remaining"};
        constexpr KeyList ELAPSED_KEYS       = {"elapsed"};
        constexpr KeyList DURATION_KEYS      = {"duration"};
        constexpr KeyList RUNNING_KEYS       = {"running", "isRunning"};
        constexpr KeyList PLAYBACK_KEYS      = {"playback", "playbackState", "state", "status"};
        constexpr KeyList CURRENT_EVENT_KEYS = {"currentEvent", "eventNow"};
        constexpr KeyList NEXT_EVENT_KEYS    = {"nextEvent", "eventNext", "next"};
        constexpr KeyList WARNING_KEYS       = {"timeWarning", "warningThreshold", "warning"};
        constexpr KeyList DANGER_KEYS        = {"timeDanger", "dangerThreshold", "danger"};
        constexpr KeyList RUNDOWN_KEYS       = {"runtime", "loaded"};
        constexpr KeyList TIMER_TYPE_KEYS    = {"timerType", "type", "mode"};

        // Keys that make an untagged object a full state frame
        constexpr KeyList STATE_KEYS = {"timer",     "current", "remaining", "elapsed",           "currentEvent", "eventNow", "nextEvent",
                                        "eventNext", "runtime", "loaded",    "selectedEventIndex", "numEvents",    "timerType"};

        // Largest magnitude that still fits a qint64 after conversion from double
        constexpr double MAX_MILLISECONDS = 9.0e18;

        QJsonValue firstPresent(const QJsonObject& obj, KeyList keys) {
            for (const char* key : keys) {
                const auto it = obj.constFind(QString::fromLatin1(key));
                if (it != obj.constEnd() && !it.value().isUndefined()) {
                    return it.value();
                }
            }
            return QJsonValue(QJsonValue::Undefined);
        }

        std::optional<qint64> firstMilliseconds(const QJsonObject& obj, KeyList keys) {
            for (const char* key : keys) {
                if (auto ms = PayloadNormalizer::toMilliseconds(obj.value(QString::fromLatin1(key)))) {
                    return ms;
                }
            }
            return std::nullopt;
        }

        std::optional<bool> firstBool(const QJsonObject& obj, KeyList keys) {
            for (const char* key : keys) {
                const QJsonValue value = obj.value(QString::fromLatin1(key));
                if (value.isBool()) {
                    return value.toBool();
                }
            }
            return std::nullopt;
        }

        std::optional<QString> firstString(const QJsonObject& obj, KeyList keys) {
            for (const char* key : keys) {
                const QJsonValue value = obj.value(QString::fromLatin1(key));
                if (value.isString()) {
                    return value.toString();
                }
                if (value.isDouble()) {
                    return QString::number(value.toDouble(), 'g', 17);
                }
            }
            return std::nullopt;
        }

        template <typename T>
        std::optional<T> orElse(std::optional<T> primary, std::optional<T> fallback) {
            return primary ? primary : fallback;
        }

        // Timer keys live in the timer object first and in the working object second
        TimerReading readTimer(const QJsonObject& timerObj, const QJsonObject& working) {
            TimerReading reading;
            reading.currentMs   = orElse(firstMilliseconds(timerObj, CURRENT_KEYS), firstMilliseconds(working, CURRENT_KEYS));
            reading.remainingMs = orElse(firstMilliseconds(timerObj, REMAINING_KEYS), firstMilliseconds(working, REMAINING_KEYS));
            reading.elapsedMs   = orElse(firstMilliseconds(timerObj, ELAPSED_KEYS), firstMilliseconds(working, ELAPSED_KEYS));
            reading.durationMs  = orElse(firstMilliseconds(timerObj, DURATION_KEYS), firstMilliseconds(working, DURATION_KEYS));
            reading.running     = orElse(firstBool(timerObj, RUNNING_KEYS), firstBool(working, RUNNING_KEYS));
            reading.playback    = orElse(PayloadNormalizer::parsePlayback(firstPresent(timerObj, PLAYBACK_KEYS)),
                                         PayloadNormalizer::parsePlayback(firstPresent(working, PLAYBACK_KEYS)));
            return reading;
        }

        std::optional<TimerType> resolveTimerType(const QJsonObject& working, const QJsonObject& event, const QJsonObject& timerObj) {
            if (auto type = PayloadNormalizer::parseTimerType(working.value("timerType")))
                return type;
            if (auto type = PayloadNormalizer::parseTimerType(event.value("timerType")))
                return type;

            for (const char* key : TIMER_TYPE_KEYS) {
                if (auto type = PayloadNormalizer::parseTimerType(timerObj.value(QString::fromLatin1(key))))
                    return type;
            }
            return std::nullopt;
        }

        bool carriesState(const QJsonObject& working) {
            for (const char* key : STATE_KEYS) {
                if (working.contains(QString::fromLatin1(key))) {
                    return true;
                }
            }
            return false;
        }

        // Frames without a payload carry their data beside the routing keys
        QJsonValue workingValue(const QJsonObject& frame) {
            if (frame.contains("payload")) {
                return frame.value("payload");
            }

            QJsonObject working = frame;
            working.remove("type");
            working.remove("tag");
            return working;
        }

    } // namespace

    PayloadNormalizer::PayloadNormalizer() {
        registerGranularTag("ontime-timer", Slice::Timer);
        registerGranularTag("ontime-eventNow", Slice::CurrentEvent);
        registerGranularTag("ontime-eventNext", Slice::NextEvent);
        registerGranularTag("ontime-runtime", Slice::Rundown);
        registerGranularTag("ontime-loaded", Slice::Rundown);

        registerGranularTag("ontime-clock", std::nullopt);
        registerGranularTag("ontime-message", std::nullopt);
        registerGranularTag("ontime-onAir", std::nullopt);
        registerGranularTag("ontime-log", std::nullopt);
        registerGranularTag("ontime-ping", std::nullopt);
    }

    void PayloadNormalizer::registerGranularTag(const QString& tag, std::optional<Slice> slice) {
        m_granularTags.insert(tag, slice);
    }

    bool PayloadNormalizer::isGranularTag(const QString& tag) const {
        return m_granularTags.contains(tag);
    }

    Update PayloadNormalizer::classify(const QJsonObject& frame) const {
        QString kind = frame.value("type").toString();
        if (kind.isEmpty()) {
            kind = frame.value("tag").toString();
        }

        const QJsonValue working = workingValue(frame);

        const auto       it = m_granularTags.constFind(kind);
        if (it != m_granularTags.constEnd()) {
            if (!it.value()) {
                return IgnoredUpdate{};
            }
            return PartialUpdate{*it.value(), working};
        }

        if (!working.isObject() || !carriesState(working.toObject())) {
            return IgnoredUpdate{};
        }

        return FullUpdate{normalize(working)};
    }

    RuntimeSnapshot PayloadNormalizer::normalize(const QJsonValue& raw) {
        RuntimeSnapshot snapshot;
        if (!raw.isObject()) {
            return snapshot;
        }

        const QJsonObject working    = raw.toObject();

        const QJsonValue  timerValue = working.value("timer");
        QJsonObject       timerObj;
        if (timerValue.isObject()) {
            timerObj = timerValue.toObject();
        } else if (toMilliseconds(timerValue)) {
            timerObj.insert("current", timerValue);
        }

        const QJsonValue currentEvent = firstPresent(working, CURRENT_EVENT_KEYS);

        snapshot.timer                = readTimer(timerObj, working);
        snapshot.currentEvent         = normalizeEvent(currentEvent);
        snapshot.nextEvent            = normalizeEvent(firstPresent(working, NEXT_EVENT_KEYS));
        snapshot.rundownPosition      = normalizeRundown(working);
        snapshot.timerType            = resolveTimerType(working, currentEvent.toObject(), timerObj);

        return snapshot;
    }

    RuntimeSnapshot PayloadNormalizer::normalizeSlice(Slice slice, const QJsonValue& value) {
        switch (slice) {
            case Slice::Timer: return normalize(QJsonObject{{"timer", value}});
            case Slice::CurrentEvent: return normalize(QJsonObject{{"currentEvent", value}});
            case Slice::NextEvent: return normalize(QJsonObject{{"nextEvent", value}});
            case Slice::Rundown: return normalize(value);
        }
        return {};
    }

    std::optional<EventInfo> PayloadNormalizer::normalizeEvent(const QJsonValue& raw) {
        // Older servers send the next event as a bare title
        if (raw.isString()) {
            if (raw.toString().isEmpty()) {
                return std::nullopt;
            }
            EventInfo event;
            event.title = raw.toString();
            return event;
        }

        if (!raw.isObject()) {
            return std::nullopt;
        }

        const QJsonObject obj = raw.toObject();

        EventInfo         event;
        event.id                 = firstString(obj, {"id"});
        event.title              = firstString(obj, {"title"});
        event.warningThresholdMs = firstMilliseconds(obj, WARNING_KEYS);
        event.dangerThresholdMs  = firstMilliseconds(obj, DANGER_KEYS);
        event.durationMs         = firstMilliseconds(obj, DURATION_KEYS);
        event.timerType          = parseTimerType(obj.value("timerType"));
        return event;
    }

    std::optional<RundownPosition> PayloadNormalizer::normalizeRundown(const QJsonObject& working) {
        QList<QJsonObject> containers;
        for (const char* key : RUNDOWN_KEYS) {
            const QJsonValue value = working.value(QString::fromLatin1(key));
            if (value.isObject()) {
                containers << value.toObject();
            }
        }
        containers << working;

        for (const QJsonObject& container : containers) {
            const auto index = toMilliseconds(container.value("selectedEventIndex"));
            const auto total = toMilliseconds(container.value("numEvents"));
            if (!index || !total) {
                continue;
            }

            if (*index < 0 || *total <= 0 || *index >= *total || *total > std::numeric_limits<int>::max()) {
                return std::nullopt;
            }
            return RundownPosition{static_cast<int>(*index), static_cast<int>(*total)};
        }

        return std::nullopt;
    }

    std::optional<TimerType> PayloadNormalizer::parseTimerType(const QJsonValue& value) {
        if (!value.isString()) {
            return std::nullopt;
        }

        QString type = value.toString().toLower();
        type.replace('-', ' ');
        type.replace('_', ' ');
        type = type.simplified();

        if (type.isEmpty()) {
            return std::nullopt;
        }

        if (type == "count down" || type == "countdown" || type == "time to end") {
            return TimerType::CountDown;
        }
        if (type == "count up" || type == "countup") {
            return TimerType::CountUp;
        }
        if (type == "clock") {
            return TimerType::Clock;
        }
        if (type == "none") {
            return TimerType::None;
        }
        return TimerType::Unknown;
    }

    std::optional<Playback> PayloadNormalizer::parsePlayback(const QJsonValue& value) {
        if (!value.isString() || value.toString().isEmpty()) {
            return std::nullopt;
        }

        const QString state = value.toString().trimmed().toLower();
        if (state == "play" || state == "playing" || state == "start" || state == "started") {
            return Playback::Play;
        }
        if (state == "pause" || state == "paused") {
            return Playback::Pause;
        }
        if (state == "stop" || state == "stopped") {
            return Playback::Stop;
        }
        if (state == "armed") {
            return Playback::Armed;
        }
        if (state == "roll") {
            return Playback::Roll;
        }
        return Playback::Unknown;
    }

    std::optional<qint64> PayloadNormalizer::toMilliseconds(const QJsonValue& value) {
        double number = 0.0;

        if (value.isDouble()) {
            number = value.toDouble();
        } else if (value.isString()) {
            bool ok = false;
            number  = value.toString().trimmed().toDouble(&ok);
            if (!ok) {
                return std::nullopt;
            }
        } else {
            return std::nullopt;
        }

        if (!std::isfinite(number) || std::fabs(number) > MAX_MILLISECONDS) {
            return std::nullopt;
        }

        return static_cast<qint64>(number);
    }

} // namespace ft::timer
