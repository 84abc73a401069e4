#include "../src/common/Paths.hpp"
#include "../src/core/net/ServerConnection.hpp"

#include <QHostAddress>
#include <QJsonObject>
#include <QSignalSpy>
#include <QWebSocket>
#include <QWebSocketServer>
#include <QtTest/QtTest>

#include <memory>

using ft::net::ServerConnection;
using ft::net::TransportError;

class ServerConnectionTest : public QObject {
    Q_OBJECT

  private slots:
    void init();
    void cleanup();

    void socketUrlFromBaseUrl();
    void sendWhileStoppedFails();
    void pollsOnConnect();
    void emitsParsedFramesOnly();
    void reconnectsAfterServerDrop();
    void stopCancelsReconnect();

  private:
    QUrl                              serverUrl() const;

    std::unique_ptr<QWebSocketServer> m_server;
    QList<QWebSocket*>                m_peers;
    QStringList                       m_received;
};

void ServerConnectionTest::init() {
    m_server = std::make_unique<QWebSocketServer>(QStringLiteral("ontime-test"), QWebSocketServer::NonSecureMode);
    QVERIFY(m_server->listen(QHostAddress::LocalHost, 0));

    connect(m_server.get(), &QWebSocketServer::newConnection, this, [this]() {
        while (m_server->hasPendingConnections()) {
            QWebSocket* peer = m_server->nextPendingConnection();
            peer->setParent(m_server.get());
            connect(peer, &QWebSocket::textMessageReceived, this, [this](const QString& message) { m_received << message; });
            m_peers << peer;
        }
    });
}

void ServerConnectionTest::cleanup() {
    m_peers.clear();
    m_received.clear();
    m_server.reset();
}

QUrl ServerConnectionTest::serverUrl() const {
    return QUrl(QStringLiteral("ws://127.0.0.1:%1/ws").arg(m_server->serverPort()));
}

void ServerConnectionTest::socketUrlFromBaseUrl() {
    QCOMPARE(ft::socketUrl("http://localhost:4001"), QUrl("ws://localhost:4001/ws"));
    QCOMPARE(ft::socketUrl("  http://localhost:4001/ "), QUrl("ws://localhost:4001/ws"));
    QCOMPARE(ft::socketUrl("https://ontime.example.com"), QUrl("wss://ontime.example.com/ws"));
    QCOMPARE(ft::socketUrl("ws://10.0.0.5:4001"), QUrl("ws://10.0.0.5:4001/ws"));
}

void ServerConnectionTest::sendWhileStoppedFails() {
    ServerConnection connection;
    QVERIFY(!connection.isConnected());

    const auto error = connection.send(QJsonObject{{"tag", "start"}});
    QVERIFY(error.has_value());
    QCOMPARE(*error, TransportError::NotConnected);
}

void ServerConnectionTest::pollsOnConnect() {
    ServerConnection connection;
    QSignalSpy       stateSpy(&connection, &ServerConnection::connectionStateChanged);

    connection.startUrl(serverUrl());

    QTRY_VERIFY(connection.isConnected());
    QCOMPARE(stateSpy.count(), qsizetype(1));
    QCOMPARE(stateSpy.first().first().toBool(), true);

    QTRY_COMPARE(m_received.size(), qsizetype(1));
    QCOMPARE(m_received.first(), QString(R"({"tag":"poll"})"));

    QVERIFY(!connection.send(QJsonObject{{"tag", "start"}}));
    QTRY_COMPARE(m_received.size(), qsizetype(2));
    QCOMPARE(m_received.at(1), QString(R"({"tag":"start"})"));
}

void ServerConnectionTest::emitsParsedFramesOnly() {
    ServerConnection connection;
    QSignalSpy       frameSpy(&connection, &ServerConnection::frameReceived);

    connection.startUrl(serverUrl());
    QTRY_VERIFY(connection.isConnected());
    QTRY_COMPARE(m_peers.size(), qsizetype(1));

    QWebSocket* peer = m_peers.first();
    peer->sendTextMessage("not json");
    peer->sendTextMessage("[1, 2, 3]");
    peer->sendTextMessage(R"({"type":"ontime-timer","payload":{"current":1000}})");

    QTRY_COMPARE(frameSpy.count(), qsizetype(1));
    const QJsonObject frame = frameSpy.first().first().toJsonObject();
    QCOMPARE(frame.value("type").toString(), QString("ontime-timer"));
}

void ServerConnectionTest::reconnectsAfterServerDrop() {
    ServerConnection connection;
    QSignalSpy       stateSpy(&connection, &ServerConnection::connectionStateChanged);

    connection.startUrl(serverUrl());
    QTRY_VERIFY(connection.isConnected());
    QTRY_COMPARE(m_peers.size(), qsizetype(1));

    m_peers.first()->close();

    // Back on the same server, with a fresh poll
    QTRY_COMPARE_WITH_TIMEOUT(stateSpy.count(), qsizetype(3), 5000);
    QCOMPARE(stateSpy.at(1).first().toBool(), false);
    QCOMPARE(stateSpy.at(2).first().toBool(), true);
    QTRY_COMPARE(m_peers.size(), qsizetype(2));
    QTRY_COMPARE(m_received.count(QString(R"({"tag":"poll"})")), qsizetype(2));
}

void ServerConnectionTest::stopCancelsReconnect() {
    ServerConnection connection;

    connection.startUrl(serverUrl());
    QTRY_VERIFY(connection.isConnected());
    QTRY_COMPARE(m_peers.size(), qsizetype(1));

    connection.stop();
    QTRY_VERIFY(!connection.isConnected());

    QTest::qWait(800);
    QCOMPARE(m_peers.size(), qsizetype(1));
    QVERIFY(connection.send(QJsonObject{{"tag", "start"}}).has_value());
}

int runServerConnectionTests(int argc, char** argv) {
    ServerConnectionTest test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_server_connection.moc"
