#include "IntentDispatcher.hpp"
#include "OutboundMessages.hpp"
#include "../../common/Constants.hpp"
#include "../timer/Presentation.hpp"

#include <QDebug>
#include <QJsonDocument>

#include <algorithm>
#include <utility>

namespace ft::control {

    IntentDispatcher::IntentDispatcher(const timer::TimerStateMachine& stateMachine, SendFn sendFn, bool addtimeAffectsEventDuration) :
        m_stateMachine(stateMachine), m_sendFn(std::move(sendFn)), m_addtimeAffectsEventDuration(addtimeAffectsEventDuration) {}

    void IntentDispatcher::setAddtimeAffectsEventDuration(bool enabled) {
        m_addtimeAffectsEventDuration = enabled;
    }

    bool IntentDispatcher::addtimeAffectsEventDuration() const {
        return m_addtimeAffectsEventDuration;
    }

    IntentResult IntentDispatcher::start() {
        return dispatch(messages::start());
    }

    IntentResult IntentDispatcher::pause() {
        return dispatch(messages::pause());
    }

    IntentResult IntentDispatcher::reload() {
        return dispatch(messages::reload());
    }

    IntentResult IntentDispatcher::next() {
        if (!timer::canLoadNext(m_stateMachine.model().snapshot)) {
            qDebug() << "IntentDispatcher: next rejected, already at the last event";
            return IntentResult::ControlDisabled;
        }
        return dispatch(messages::load(messages::LoadTarget::Next));
    }

    IntentResult IntentDispatcher::previous() {
        if (!timer::canLoadPrevious(m_stateMachine.model().snapshot)) {
            qDebug() << "IntentDispatcher: previous rejected, already at the first event";
            return IntentResult::ControlDisabled;
        }
        return dispatch(messages::load(messages::LoadTarget::Previous));
    }

    IntentResult IntentDispatcher::addMinute() {
        return adjustTime(ADDTIME_STEP_MS);
    }

    IntentResult IntentDispatcher::removeMinute() {
        return adjustTime(-ADDTIME_STEP_MS);
    }

    IntentResult IntentDispatcher::setBlink(bool enabled) {
        return dispatch(messages::blink(enabled));
    }

    IntentResult IntentDispatcher::setBlackout(bool enabled) {
        return dispatch(messages::blackout(enabled));
    }

    IntentResult IntentDispatcher::reloadAndStart() {
        const IntentResult reloaded = reload();
        if (reloaded != IntentResult::Sent) {
            return reloaded;
        }
        return start();
    }

    IntentResult IntentDispatcher::adjustTime(qint64 deltaMs) {
        if (!m_addtimeAffectsEventDuration) {
            return dispatch(messages::addTime(deltaMs));
        }

        const auto& event = m_stateMachine.model().snapshot.currentEvent;
        if (!event || !event->id || event->id->isEmpty() || !event->durationMs) {
            qDebug() << "IntentDispatcher: duration change rejected, no current event id or duration";
            return IntentResult::MissingEventContext;
        }

        const qint64 duration = std::max<qint64>(0, *event->durationMs + deltaMs);
        return dispatch(messages::changeDuration(*event->id, duration));
    }

    IntentResult IntentDispatcher::dispatch(const QJsonObject& message) {
        if (!m_sendFn) {
            return IntentResult::NotConnected;
        }

        const auto error = m_sendFn(message);
        if (!error) {
            return IntentResult::Sent;
        }

        const IntentResult result = *error == net::TransportError::Closed ? IntentResult::ConnectionClosed : IntentResult::NotConnected;
        qDebug() << "IntentDispatcher: control rejected (" << toString(result) << "):" << QJsonDocument(message).toJson(QJsonDocument::Compact);
        return result;
    }

    const char* toString(IntentResult result) {
        switch (result) {
            case IntentResult::Sent: return "sent";
            case IntentResult::NotConnected: return "not connected";
            case IntentResult::ConnectionClosed: return "connection closed";
            case IntentResult::MissingEventContext: return "missing event context";
            case IntentResult::ControlDisabled: return "control disabled";
        }
        return "unknown";
    }

} // namespace ft::control
