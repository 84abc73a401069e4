#pragma once

#include "../common/Settings.hpp"
#include "control/IntentDispatcher.hpp"
#include "net/ServerConnection.hpp"
#include "timer/PayloadNormalizer.hpp"
#include "timer/Presentation.hpp"
#include "timer/TimerStateMachine.hpp"

#include <QAction>
#include <QDateTime>
#include <QJsonObject>
#include <QObject>
#include <QTimer>

#include <functional>

namespace ft {

    // Owns the connection, the model and the dispatcher. Frames, ticks and
    // controls all arrive on the Qt event loop, so model writes never overlap.
    class TimerController : public QObject {
        Q_OBJECT

      public:
        using NowFn = std::function<QDateTime()>;

        explicit TimerController(const Settings& settings, QObject* parent = nullptr);
        TimerController(const Settings& settings, NowFn nowFn, QObject* parent = nullptr);
        ~TimerController() override;

        void                       start();
        void                       stop();

        const timer::TimerModel&   model() const;
        timer::RenderState         renderState() const;

        // Session-only overrides of the configured defaults
        void                       setDisplayMode(DisplayMode mode);
        DisplayMode                displayMode() const;
        void                       setAddtimeAffectsEventDuration(bool enabled);
        bool                       addtimeAffectsEventDuration() const;

        // Runs one control and reports rejections through controlRejected()
        template <typename IntentFn>
        control::IntentResult issue(IntentFn intentFn) {
            const control::IntentResult result = intentFn(m_dispatcher);
            if (result != control::IntentResult::Sent) {
                emit controlRejected(result);
            }
            return result;
        }

        // Drives a checkable action from a toggle control. A rejected control
        // puts the check mark back so it keeps matching the server.
        void bindToggle(QAction* action, std::function<control::IntentResult(control::IntentDispatcher&, bool)> intentFn);

        void handleFrame(const QJsonObject& frame);
        void handleConnectionState(bool connected);
        void tick();

      signals:
        void renderStateChanged(const ft::timer::RenderState& state);
        void controlRejected(ft::control::IntentResult result);
        void statusMessage(const QString& status);

      private:
        void                      publish();

        Settings                  m_settings;
        NowFn                     m_nowFn;

        net::ServerConnection     m_connection;
        timer::PayloadNormalizer  m_normalizer;
        timer::TimerStateMachine  m_stateMachine;
        control::IntentDispatcher m_dispatcher;

        QTimer                    m_tickTimer;
        timer::DisplayOptions     m_displayOptions;
        timer::RenderState        m_lastRenderState;
        bool                      m_published = false;
    };

} // namespace ft
