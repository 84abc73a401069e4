#include "Presentation.hpp"
#include "TimeFormat.hpp"

namespace ft::timer {

    namespace {

        std::optional<qint64> countDownValue(const TimerReading& timer) {
            return timer.remainingMs ? timer.remainingMs : timer.currentMs;
        }

        std::optional<qint64> countUpValue(const TimerReading& timer) {
            return timer.elapsedMs ? timer.elapsedMs : timer.currentMs;
        }

        void setIdle(RenderState& state) {
            state.displayText = QString::fromLatin1(IDLE_TEXT);
            state.colorTier   = ColorTier::Normal;
            state.dimmed      = true;
        }

    } // namespace

    bool canLoadPrevious(const RuntimeSnapshot& snapshot) {
        return snapshot.rundownPosition && snapshot.rundownPosition->index > 0;
    }

    bool canLoadNext(const RuntimeSnapshot& snapshot) {
        return snapshot.rundownPosition && snapshot.rundownPosition->index < snapshot.rundownPosition->total - 1;
    }

    ColorTier countDownTier(qint64 remainingMs, const std::optional<EventInfo>& event) {
        if (!event || (!event->warningThresholdMs && !event->dangerThresholdMs)) {
            return ColorTier::Normal;
        }

        if (remainingMs < 0) {
            return ColorTier::Danger;
        }
        if (event->dangerThresholdMs && remainingMs <= *event->dangerThresholdMs) {
            return ColorTier::Danger;
        }
        if (event->warningThresholdMs && remainingMs <= *event->warningThresholdMs) {
            return ColorTier::Warning;
        }
        return ColorTier::Normal;
    }

    ColorTier countUpTier(qint64 elapsedMs, const std::optional<EventInfo>& event) {
        if (event && event->durationMs && elapsedMs >= *event->durationMs) {
            return ColorTier::Warning;
        }
        return ColorTier::Normal;
    }

    QColor colorFor(ColorTier tier) {
        switch (tier) {
            case ColorTier::Warning: return QColor(0xFF, 0xA5, 0x28);
            case ColorTier::Danger: return QColor(0xFA, 0x56, 0x56);
            case ColorTier::Normal: break;
        }
        return QColor(Qt::white);
    }

    RenderState project(const TimerModel& model, const QDateTime& now, const DisplayOptions& options) {
        const RuntimeSnapshot& snapshot = model.snapshot;

        RenderState            state;
        state.connected = model.connected;

        if (snapshot.currentEvent && snapshot.currentEvent->title) {
            state.title = *snapshot.currentEvent->title;
        }
        if (snapshot.nextEvent && snapshot.nextEvent->title) {
            state.nextTitle = *snapshot.nextEvent->title;
        }

        state.prevEnabled = model.connected && canLoadPrevious(snapshot);
        state.nextEnabled = model.connected && canLoadNext(snapshot);

        if (options.mode == DisplayMode::Clock) {
            state.displayText = formatClock(now);
            return state;
        }

        if (!model.connected) {
            setIdle(state);
            return state;
        }

        const TimerType type = snapshot.timerType.value_or(TimerType::Unknown);

        if (type == TimerType::Clock) {
            state.displayText = formatClock(now);
            return state;
        }

        if (!model.hasLoadedEvent) {
            setIdle(state);
            return state;
        }

        if (type == TimerType::None) {
            state.displayText.clear();
            return state;
        }

        if (type == TimerType::CountUp) {
            const auto elapsed = countUpValue(snapshot.timer);
            if (!elapsed) {
                setIdle(state);
                return state;
            }
            state.displayText = formatSeconds(countUpSeconds(*elapsed));
            state.colorTier   = countUpTier(*elapsed, snapshot.currentEvent);
            return state;
        }

        // Count-down, and anything the server did not classify
        const auto remaining = countDownValue(snapshot.timer);
        if (!remaining) {
            setIdle(state);
            return state;
        }
        state.displayText = formatSeconds(countDownSeconds(*remaining), *remaining < 0);
        state.colorTier   = countDownTier(*remaining, snapshot.currentEvent);
        return state;
    }

} // namespace ft::timer
