#pragma once

#include <QDateTime>
#include <QJsonValue>
#include <QString>

#include <optional>
#include <variant>

namespace ft::timer {

    enum class TimerType {
        CountUp,
        CountDown,
        Clock,
        None,
        Unknown
    };

    enum class Playback {
        Play,
        Pause,
        Stop,
        Armed,
        Roll,
        Unknown
    };

    // Every field is optional: absent means the server did not report it.
    struct TimerReading {
        std::optional<qint64>   currentMs;
        std::optional<qint64>   remainingMs;
        std::optional<qint64>   elapsedMs;
        std::optional<qint64>   durationMs;
        std::optional<bool>     running;
        std::optional<Playback> playback;

        bool                    operator==(const TimerReading&) const = default;
    };

    struct EventInfo {
        std::optional<QString>   id;
        std::optional<QString>   title;
        std::optional<qint64>    warningThresholdMs;
        std::optional<qint64>    dangerThresholdMs;
        std::optional<qint64>    durationMs;
        std::optional<TimerType> timerType;

        bool                     operator==(const EventInfo&) const = default;

        // An event without id and title is what Ontime sends when nothing is loaded
        bool isEmpty() const {
            return (!id || id->isEmpty()) && (!title || title->isEmpty());
        }
    };

    struct RundownPosition {
        int  index = 0;
        int  total = 0;

        bool operator==(const RundownPosition&) const = default;
    };

    struct RuntimeSnapshot {
        TimerReading                   timer;
        std::optional<TimerType>       timerType;
        std::optional<EventInfo>       currentEvent;
        std::optional<EventInfo>       nextEvent;
        std::optional<RundownPosition> rundownPosition;

        bool                           operator==(const RuntimeSnapshot&) const = default;
    };

    // Slices a granular update can refresh
    enum class Slice {
        Timer,
        CurrentEvent,
        NextEvent,
        Rundown
    };

    struct FullUpdate {
        RuntimeSnapshot snapshot;
    };

    struct PartialUpdate {
        Slice      slice;
        QJsonValue value;
    };

    struct IgnoredUpdate {};

    using Update = std::variant<FullUpdate, PartialUpdate, IgnoredUpdate>;

    // Owned by TimerStateMachine; everything else reads it through a const reference.
    struct TimerModel {
        RuntimeSnapshot snapshot;
        bool            hasLoadedEvent = false;
        bool            connected      = false;
        QDateTime       lastUpdate;
        QDateTime       lastTick;
    };

} // namespace ft::timer
