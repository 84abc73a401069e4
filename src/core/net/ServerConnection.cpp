#include "ServerConnection.hpp"
#include "../../common/Constants.hpp"
#include "../../common/Paths.hpp"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonParseError>

#include <cstdio>
#include <print>

namespace ft::net {

    ServerConnection::ServerConnection(QObject* parent) : QObject(parent), m_reconnectDelayMs(RECONNECT_INITIAL_DELAY_MS) {

        connect(&m_socket, &QWebSocket::connected, this, [this]() {
            m_reconnectDelayMs = RECONNECT_INITIAL_DELAY_MS;
            m_connected        = true;

            std::print("Connected to {}\n", m_url.toString().toStdString());
            emit connectionStateChanged(true);
            emit statusMessage("Connected to Ontime");

            // Ask for a full snapshot; granular pushes only carry what changed
            if (send(QJsonObject{{"tag", "poll"}})) {
                qWarning() << "ServerConnection: failed to request initial snapshot";
            }
        });

        connect(&m_socket, &QWebSocket::disconnected, this, [this]() {
            const bool wasConnected = m_connected;
            m_connected             = false;

            if (wasConnected) {
                std::print("Disconnected from {}\n", m_url.toString().toStdString());
                emit connectionStateChanged(false);
                emit statusMessage(m_running ? "Disconnected from Ontime, reconnecting..." : "Disconnected from Ontime");
            }

            scheduleReconnect();
        });

        connect(&m_socket, &QWebSocket::textMessageReceived, this, [this](const QString& message) { handleText(message); });

        connect(&m_socket, &QWebSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
            // First failure of a retry series goes to stderr, the rest to debug
            if (m_reconnectDelayMs == RECONNECT_INITIAL_DELAY_MS) {
                std::print(stderr, "Connection to {} failed: {}\n", m_url.toString().toStdString(), m_socket.errorString().toStdString());
            } else {
                qDebug() << "ServerConnection: socket error:" << m_socket.errorString();
            }
            if (m_socket.state() != QAbstractSocket::ConnectedState) {
                scheduleReconnect();
            }
        });

        m_reconnectTimer.setSingleShot(true);
        connect(&m_reconnectTimer, &QTimer::timeout, this, [this]() { ensureConnected(); });
    }

    ServerConnection::~ServerConnection() {
        m_running = false;
        m_reconnectTimer.stop();
        m_socket.disconnect(this);
        m_socket.abort();
    }

    void ServerConnection::start(const QString& baseUrl) {
        startUrl(socketUrl(baseUrl));
    }

    void ServerConnection::startUrl(const QUrl& socketUrl) {
        if (m_running && socketUrl == m_url) {
            return;
        }

        if (m_socket.state() != QAbstractSocket::UnconnectedState) {
            m_socket.abort();
        }
        m_reconnectTimer.stop();

        m_url              = socketUrl;
        m_running          = true;
        m_reconnectDelayMs = RECONNECT_INITIAL_DELAY_MS;

        std::print("Connecting to {}\n", m_url.toString().toStdString());
        ensureConnected();
    }

    void ServerConnection::stop() {
        m_running = false;
        m_reconnectTimer.stop();

        if (m_socket.state() != QAbstractSocket::UnconnectedState) {
            m_socket.close();
        }
    }

    bool ServerConnection::isConnected() const {
        return m_connected && m_socket.state() == QAbstractSocket::ConnectedState;
    }

    std::optional<TransportError> ServerConnection::send(const QJsonObject& json) {
        if (m_socket.state() == QAbstractSocket::ClosingState) {
            return TransportError::Closed;
        }

        if (!isConnected()) {
            return TransportError::NotConnected;
        }

        const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
        const qint64     written = m_socket.sendTextMessage(QString::fromUtf8(payload));
        if (written < payload.size()) {
            qWarning() << "ServerConnection: short write" << written << "of" << payload.size() << "bytes";
            return TransportError::Closed;
        }

        qDebug() << "ServerConnection: sent" << payload;
        return std::nullopt;
    }

    void ServerConnection::ensureConnected() {
        if (!m_running || m_socket.state() != QAbstractSocket::UnconnectedState) {
            return;
        }

        m_socket.open(m_url);
    }

    void ServerConnection::scheduleReconnect() {
        if (!m_running || m_reconnectTimer.isActive()) {
            return;
        }

        qDebug() << "ServerConnection: reconnecting in" << m_reconnectDelayMs << "ms";
        m_reconnectTimer.start(m_reconnectDelayMs);
        m_reconnectDelayMs = qMin(m_reconnectDelayMs * 2, RECONNECT_MAX_DELAY_MS);
    }

    void ServerConnection::handleText(const QString& message) {
        const QByteArray data = message.toUtf8();
        if (data.size() > MAX_FRAME_SIZE) {
            qDebug() << "ServerConnection: dropping oversized frame of" << data.size() << "bytes";
            return;
        }

        QJsonParseError   parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            qDebug() << "ServerConnection: dropping unparsable frame:" << parseError.errorString();
            return;
        }

        emit frameReceived(doc.object());
    }

} // namespace ft::net
