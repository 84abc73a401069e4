#pragma once

#include "TransportError.hpp"

#include <QJsonObject>
#include <QObject>
#include <QTimer>
#include <QUrl>
#include <QWebSocket>

#include <optional>

namespace ft::net {

    // One websocket to the Ontime server. Reconnects on its own until stop().
    class ServerConnection : public QObject {
        Q_OBJECT

      public:
        explicit ServerConnection(QObject* parent = nullptr);
        ~ServerConnection() override;

        // Derives the ws endpoint from the http base URL and connects
        void                          start(const QString& baseUrl);
        void                          startUrl(const QUrl& socketUrl);

        // Cancels pending reconnects and closes the socket
        void                          stop();

        bool                          isConnected() const;

        // Returns std::nullopt once the frame is handed to the socket
        std::optional<TransportError> send(const QJsonObject& json);

      signals:
        void connectionStateChanged(bool connected);
        void frameReceived(const QJsonObject& frame);
        void statusMessage(const QString& status);

      private:
        void       ensureConnected();
        void       scheduleReconnect();
        void       handleText(const QString& message);

        QWebSocket m_socket;
        QTimer     m_reconnectTimer;
        QUrl       m_url;

        int        m_reconnectDelayMs = 0;
        bool       m_running          = false;
        bool       m_connected        = false;
    };

} // namespace ft::net
