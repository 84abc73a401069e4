#include "../src/core/control/IntentDispatcher.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QtTest/QtTest>

using ft::control::IntentDispatcher;
using ft::control::IntentResult;
using ft::net::TransportError;
using namespace ft::timer;

class IntentDispatcherTest : public QObject {
    Q_OBJECT

  private slots:
    void init();

    void simpleControlsSendTheirTag();
    void addMinuteAdjustsRunningTimer();
    void removeMinuteAdjustsRunningTimer();
    void addMinuteChangesEventDuration();
    void removeMinuteClampsEventDuration();
    void durationPolicyNeedsEventContext();
    void durationPolicyCanFlipBetweenControls();
    void nextAndPreviousFollowRundown();
    void blinkAndBlackoutToggles();
    void reloadAndStartSendsInOrder();
    void reloadAndStartStopsAfterFailedReload();
    void disconnectedControlLeavesModelUntouched();
    void closingConnectionReportsClosed();

  private:
    IntentDispatcher::SendFn recordingSend();
    void                     loadEvent(std::optional<QString> id, std::optional<qint64> durationMs, std::optional<RundownPosition> position = std::nullopt);
    static QByteArray        compact(const QJsonObject& message);

    TimerStateMachine             m_machine;
    QList<QJsonObject>            m_sent;
    std::optional<TransportError> m_failure;
};

void IntentDispatcherTest::init() {
    m_machine.reset();
    m_machine.setConnected(true);
    m_sent.clear();
    m_failure.reset();
}

IntentDispatcher::SendFn IntentDispatcherTest::recordingSend() {
    return [this](const QJsonObject& message) -> std::optional<TransportError> {
        if (m_failure) {
            return m_failure;
        }
        m_sent << message;
        return std::nullopt;
    };
}

void IntentDispatcherTest::loadEvent(std::optional<QString> id, std::optional<qint64> durationMs, std::optional<RundownPosition> position) {
    EventInfo event;
    event.id         = id;
    event.title      = "Opening";
    event.durationMs = durationMs;

    RuntimeSnapshot snapshot;
    snapshot.timerType         = TimerType::CountDown;
    snapshot.timer.remainingMs = 120000;
    snapshot.currentEvent      = event;
    snapshot.rundownPosition   = position;
    m_machine.applySnapshot(snapshot, QDateTime::currentDateTime());
}

QByteArray IntentDispatcherTest::compact(const QJsonObject& message) {
    return QJsonDocument(message).toJson(QJsonDocument::Compact);
}

void IntentDispatcherTest::simpleControlsSendTheirTag() {
    IntentDispatcher dispatcher(m_machine, recordingSend());

    QCOMPARE(dispatcher.start(), IntentResult::Sent);
    QCOMPARE(dispatcher.pause(), IntentResult::Sent);
    QCOMPARE(dispatcher.reload(), IntentResult::Sent);

    QCOMPARE(m_sent.size(), qsizetype(3));
    QCOMPARE(compact(m_sent.at(0)), QByteArray(R"({"tag":"start"})"));
    QCOMPARE(compact(m_sent.at(1)), QByteArray(R"({"tag":"pause"})"));
    QCOMPARE(compact(m_sent.at(2)), QByteArray(R"({"tag":"reload"})"));
}

void IntentDispatcherTest::addMinuteAdjustsRunningTimer() {
    loadEvent("e1", 300000);
    IntentDispatcher dispatcher(m_machine, recordingSend(), false);

    QCOMPARE(dispatcher.addMinute(), IntentResult::Sent);
    QCOMPARE(m_sent.size(), qsizetype(1));
    QCOMPARE(compact(m_sent.first()), QByteArray(R"({"payload":{"add":60000},"tag":"addtime"})"));
}

void IntentDispatcherTest::removeMinuteAdjustsRunningTimer() {
    IntentDispatcher dispatcher(m_machine, recordingSend());

    // Works without any event loaded
    QCOMPARE(dispatcher.removeMinute(), IntentResult::Sent);
    QCOMPARE(m_sent.size(), qsizetype(1));
    QCOMPARE(compact(m_sent.first()), QByteArray(R"({"payload":{"remove":60000},"tag":"addtime"})"));
}

void IntentDispatcherTest::addMinuteChangesEventDuration() {
    loadEvent("e1", 300000);
    IntentDispatcher dispatcher(m_machine, recordingSend(), true);

    QCOMPARE(dispatcher.addMinute(), IntentResult::Sent);
    QCOMPARE(m_sent.size(), qsizetype(1));

    const QJsonObject expected{{"tag", "change"}, {"payload", QJsonObject{{"e1", QJsonObject{{"duration", 360000}}}}}};
    QCOMPARE(m_sent.first(), expected);
    QVERIFY(!compact(m_sent.first()).contains("addtime"));
}

void IntentDispatcherTest::removeMinuteClampsEventDuration() {
    loadEvent("e1", 30000);
    IntentDispatcher dispatcher(m_machine, recordingSend(), true);

    QCOMPARE(dispatcher.removeMinute(), IntentResult::Sent);
    QCOMPARE(m_sent.size(), qsizetype(1));
    QCOMPARE(m_sent.first().value("payload").toObject().value("e1").toObject().value("duration").toInteger(), qint64(0));
}

void IntentDispatcherTest::durationPolicyNeedsEventContext() {
    IntentDispatcher dispatcher(m_machine, recordingSend(), true);

    // Nothing loaded
    QCOMPARE(dispatcher.addMinute(), IntentResult::MissingEventContext);

    loadEvent(std::nullopt, 300000);
    QCOMPARE(dispatcher.addMinute(), IntentResult::MissingEventContext);

    loadEvent(QString(), 300000);
    QCOMPARE(dispatcher.removeMinute(), IntentResult::MissingEventContext);

    loadEvent("e1", std::nullopt);
    QCOMPARE(dispatcher.addMinute(), IntentResult::MissingEventContext);

    QVERIFY(m_sent.isEmpty());
}

void IntentDispatcherTest::durationPolicyCanFlipBetweenControls() {
    loadEvent("e1", 300000);
    IntentDispatcher dispatcher(m_machine, recordingSend(), false);
    QVERIFY(!dispatcher.addtimeAffectsEventDuration());

    QCOMPARE(dispatcher.addMinute(), IntentResult::Sent);

    dispatcher.setAddtimeAffectsEventDuration(true);
    QVERIFY(dispatcher.addtimeAffectsEventDuration());
    QCOMPARE(dispatcher.addMinute(), IntentResult::Sent);

    dispatcher.setAddtimeAffectsEventDuration(false);
    QCOMPARE(dispatcher.removeMinute(), IntentResult::Sent);

    QCOMPARE(m_sent.size(), qsizetype(3));
    QCOMPARE(compact(m_sent.at(0)), QByteArray(R"({"payload":{"add":60000},"tag":"addtime"})"));
    QCOMPARE(compact(m_sent.at(1)), QByteArray(R"({"payload":{"e1":{"duration":360000}},"tag":"change"})"));
    QCOMPARE(compact(m_sent.at(2)), QByteArray(R"({"payload":{"remove":60000},"tag":"addtime"})"));
}

void IntentDispatcherTest::nextAndPreviousFollowRundown() {
    IntentDispatcher dispatcher(m_machine, recordingSend());

    // Unknown position disables both
    loadEvent("e1", 300000);
    QCOMPARE(dispatcher.next(), IntentResult::ControlDisabled);
    QCOMPARE(dispatcher.previous(), IntentResult::ControlDisabled);
    QVERIFY(m_sent.isEmpty());

    loadEvent("e1", 300000, RundownPosition{0, 2});
    QCOMPARE(dispatcher.previous(), IntentResult::ControlDisabled);
    QCOMPARE(dispatcher.next(), IntentResult::Sent);

    loadEvent("e2", 300000, RundownPosition{1, 2});
    QCOMPARE(dispatcher.next(), IntentResult::ControlDisabled);
    QCOMPARE(dispatcher.previous(), IntentResult::Sent);

    QCOMPARE(m_sent.size(), qsizetype(2));
    QCOMPARE(compact(m_sent.at(0)), QByteArray(R"({"payload":"next","tag":"load"})"));
    QCOMPARE(compact(m_sent.at(1)), QByteArray(R"({"payload":"previous","tag":"load"})"));
}

void IntentDispatcherTest::blinkAndBlackoutToggles() {
    IntentDispatcher dispatcher(m_machine, recordingSend());

    QCOMPARE(dispatcher.setBlink(true), IntentResult::Sent);
    QCOMPARE(dispatcher.setBlackout(false), IntentResult::Sent);

    QCOMPARE(m_sent.size(), qsizetype(2));
    QCOMPARE(compact(m_sent.at(0)), QByteArray(R"({"payload":{"timer":{"blink":true}},"tag":"message"})"));
    QCOMPARE(compact(m_sent.at(1)), QByteArray(R"({"payload":{"timer":{"blackout":false}},"tag":"message"})"));
}

void IntentDispatcherTest::reloadAndStartSendsInOrder() {
    IntentDispatcher dispatcher(m_machine, recordingSend());

    QCOMPARE(dispatcher.reloadAndStart(), IntentResult::Sent);
    QCOMPARE(m_sent.size(), qsizetype(2));
    QCOMPARE(m_sent.at(0).value("tag").toString(), QString("reload"));
    QCOMPARE(m_sent.at(1).value("tag").toString(), QString("start"));
}

void IntentDispatcherTest::reloadAndStartStopsAfterFailedReload() {
    int              attempts = 0;
    IntentDispatcher dispatcher(m_machine, [&attempts](const QJsonObject&) -> std::optional<TransportError> {
        ++attempts;
        return TransportError::NotConnected;
    });

    QCOMPARE(dispatcher.reloadAndStart(), IntentResult::NotConnected);
    QCOMPARE(attempts, 1);
}

void IntentDispatcherTest::disconnectedControlLeavesModelUntouched() {
    loadEvent("e1", 300000, RundownPosition{0, 3});
    m_machine.setConnected(false);
    m_failure = TransportError::NotConnected;

    const RuntimeSnapshot before = m_machine.model().snapshot;

    IntentDispatcher      dispatcher(m_machine, recordingSend(), true);
    QCOMPARE(dispatcher.start(), IntentResult::NotConnected);
    QCOMPARE(dispatcher.addMinute(), IntentResult::NotConnected);
    QCOMPARE(dispatcher.next(), IntentResult::NotConnected);

    QVERIFY(m_sent.isEmpty());
    QCOMPARE(m_machine.model().snapshot, before);
    QVERIFY(!m_machine.model().connected);
}

void IntentDispatcherTest::closingConnectionReportsClosed() {
    m_failure = TransportError::Closed;
    IntentDispatcher dispatcher(m_machine, recordingSend());

    QCOMPARE(dispatcher.pause(), IntentResult::ConnectionClosed);
    QCOMPARE(QString::fromLatin1(ft::control::toString(IntentResult::ConnectionClosed)), QString("connection closed"));
}

int runIntentDispatcherTests(int argc, char** argv) {
    IntentDispatcherTest test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_intent_dispatcher.moc"
