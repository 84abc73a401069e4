#include "TimerStateMachine.hpp"
#include "PayloadNormalizer.hpp"

#include <type_traits>

namespace ft::timer {

    bool TimerStateMachine::applyUpdate(const Update& update, const QDateTime& now) {
        return std::visit(
            [this, &now](const auto& u) {
                using T = std::decay_t<decltype(u)>;
                if constexpr (std::is_same_v<T, FullUpdate>) {
                    return applySnapshot(u.snapshot, now);
                } else if constexpr (std::is_same_v<T, PartialUpdate>) {
                    const RuntimeSnapshot before = m_model.snapshot;
                    mergeSlice(u.slice, u.value);
                    refreshDerived(now);
                    return m_model.snapshot != before;
                } else {
                    return false;
                }
            },
            update);
    }

    bool TimerStateMachine::applySnapshot(const RuntimeSnapshot& snapshot, const QDateTime& now) {
        const bool changed = m_model.snapshot != snapshot;
        m_model.snapshot   = snapshot;
        refreshDerived(now);
        return changed;
    }

    bool TimerStateMachine::setConnected(bool connected) {
        if (m_model.connected == connected) {
            return false;
        }

        m_model.connected = connected;
        return true;
    }

    void TimerStateMachine::tick(const QDateTime& now) {
        m_model.lastTick = now;
    }

    void TimerStateMachine::reset() {
        m_model = TimerModel{};
    }

    const TimerModel& TimerStateMachine::model() const {
        return m_model;
    }

    bool TimerStateMachine::isIdle() const {
        return !m_model.hasLoadedEvent;
    }

    void TimerStateMachine::mergeSlice(Slice slice, const QJsonValue& value) {
        const RuntimeSnapshot part     = PayloadNormalizer::normalizeSlice(slice, value);
        RuntimeSnapshot&      snapshot = m_model.snapshot;

        switch (slice) {
            case Slice::Timer:
                snapshot.timer = part.timer;
                if (part.timerType) {
                    snapshot.timerType = part.timerType;
                }
                break;
            case Slice::CurrentEvent:
                snapshot.currentEvent = part.currentEvent;
                if (part.timerType) {
                    snapshot.timerType = part.timerType;
                }
                break;
            case Slice::NextEvent: snapshot.nextEvent = part.nextEvent; break;
            case Slice::Rundown: snapshot.rundownPosition = part.rundownPosition; break;
        }
    }

    void TimerStateMachine::refreshDerived(const QDateTime& now) {
        m_model.hasLoadedEvent = m_model.snapshot.currentEvent && !m_model.snapshot.currentEvent->isEmpty();
        m_model.lastUpdate     = now;
    }

} // namespace ft::timer
