#include "TimerController.hpp"
#include "../common/Constants.hpp"

#include <QSignalBlocker>

#include <print>
#include <utility>

namespace ft {

    TimerController::TimerController(const Settings& settings, QObject* parent) : TimerController(settings, [] { return QDateTime::currentDateTime(); }, parent) {}

    TimerController::TimerController(const Settings& settings, NowFn nowFn, QObject* parent) :
        QObject(parent), m_settings(settings), m_nowFn(std::move(nowFn)),
        m_dispatcher(m_stateMachine, [this](const QJsonObject& message) { return m_connection.send(message); }, settings.addtimeAffectsEventDuration) {

        m_displayOptions.mode = settings.displayMode;

        connect(&m_connection, &net::ServerConnection::frameReceived, this, [this](const QJsonObject& frame) { handleFrame(frame); });
        connect(&m_connection, &net::ServerConnection::connectionStateChanged, this, [this](bool connected) { handleConnectionState(connected); });
        connect(&m_connection, &net::ServerConnection::statusMessage, this, &TimerController::statusMessage);

        m_tickTimer.setInterval(TICK_INTERVAL_MS);
        m_tickTimer.setSingleShot(false);
        connect(&m_tickTimer, &QTimer::timeout, this, [this]() { tick(); });
    }

    TimerController::~TimerController() {
        m_tickTimer.stop();
        m_connection.stop();
    }

    void TimerController::start() {
        std::print("Server: {}\n", m_settings.serverUrl.toStdString());
        m_tickTimer.start();
        m_connection.start(m_settings.serverUrl);
        publish();
    }

    void TimerController::stop() {
        m_tickTimer.stop();
        m_connection.stop();
    }

    const timer::TimerModel& TimerController::model() const {
        return m_stateMachine.model();
    }

    timer::RenderState TimerController::renderState() const {
        return timer::project(m_stateMachine.model(), m_nowFn(), m_displayOptions);
    }

    void TimerController::setDisplayMode(DisplayMode mode) {
        if (m_displayOptions.mode == mode) {
            return;
        }

        m_displayOptions.mode = mode;
        publish();
    }

    DisplayMode TimerController::displayMode() const {
        return m_displayOptions.mode;
    }

    void TimerController::setAddtimeAffectsEventDuration(bool enabled) {
        m_dispatcher.setAddtimeAffectsEventDuration(enabled);
    }

    bool TimerController::addtimeAffectsEventDuration() const {
        return m_dispatcher.addtimeAffectsEventDuration();
    }

    void TimerController::bindToggle(QAction* action, std::function<control::IntentResult(control::IntentDispatcher&, bool)> intentFn) {
        connect(action, &QAction::toggled, this, [this, action, intentFn = std::move(intentFn)](bool checked) {
            const control::IntentResult result = issue([&intentFn, checked](control::IntentDispatcher& d) { return intentFn(d, checked); });
            if (result != control::IntentResult::Sent) {
                const QSignalBlocker blocker(action);
                action->setChecked(!checked);
            }
        });
    }

    void TimerController::handleFrame(const QJsonObject& frame) {
        const timer::Update update = m_normalizer.classify(frame);
        if (m_stateMachine.applyUpdate(update, m_nowFn())) {
            publish();
        }
    }

    void TimerController::handleConnectionState(bool connected) {
        if (m_stateMachine.setConnected(connected)) {
            publish();
        }
    }

    void TimerController::tick() {
        m_stateMachine.tick(m_nowFn());
        publish();
    }

    void TimerController::publish() {
        const timer::RenderState state = renderState();
        if (m_published && state == m_lastRenderState) {
            return;
        }

        m_lastRenderState = state;
        m_published       = true;
        emit renderStateChanged(state);
    }

} // namespace ft
