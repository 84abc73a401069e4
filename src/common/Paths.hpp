#pragma once

#include <QString>
#include <QUrl>

namespace ft {

    // Returns the default config file: $XDG_CONFIG_HOME/floattime/floattime.conf
    QString configFilePath();

    // Maps the configured server base URL to its websocket endpoint:
    // http(s)://host:port/ -> ws(s)://host:port/ws
    QUrl socketUrl(const QString& baseUrl);

} // namespace ft
