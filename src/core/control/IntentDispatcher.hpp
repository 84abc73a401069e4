#pragma once

#include "../net/TransportError.hpp"
#include "../timer/TimerStateMachine.hpp"

#include <QJsonObject>

#include <functional>
#include <optional>

namespace ft::control {

    enum class IntentResult {
        Sent,
        NotConnected,
        ConnectionClosed,
        MissingEventContext,
        ControlDisabled
    };

    // Turns user controls into outbound messages. Reads the model, never writes
    // it: the UI changes when the server's next snapshot arrives.
    class IntentDispatcher {
      public:
        using SendFn = std::function<std::optional<net::TransportError>(const QJsonObject&)>;

        IntentDispatcher(const timer::TimerStateMachine& stateMachine, SendFn sendFn, bool addtimeAffectsEventDuration = false);

        void         setAddtimeAffectsEventDuration(bool enabled);
        bool         addtimeAffectsEventDuration() const;

        IntentResult start();
        IntentResult pause();
        IntentResult reload();
        IntentResult next();
        IntentResult previous();
        IntentResult addMinute();
        IntentResult removeMinute();
        IntentResult setBlink(bool enabled);
        IntentResult setBlackout(bool enabled);

        // Double activation: reload, then start. A failed reload skips the start.
        IntentResult reloadAndStart();

      private:
        IntentResult                    adjustTime(qint64 deltaMs);
        IntentResult                    dispatch(const QJsonObject& message);

        const timer::TimerStateMachine& m_stateMachine;
        SendFn                          m_sendFn;
        bool                            m_addtimeAffectsEventDuration = false;
    };

    const char* toString(IntentResult result);

} // namespace ft::control
