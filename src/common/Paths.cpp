#include "Paths.hpp"

#include <QStandardPaths>

namespace ft {

    QString configFilePath() {
        const auto configDir = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
        return configDir + QStringLiteral("/floattime/floattime.conf");
    }

    QUrl socketUrl(const QString& baseUrl) {
        QString url = baseUrl.trimmed();
        while (url.endsWith('/'))
            url.chop(1);

        if (url.startsWith("http", Qt::CaseInsensitive))
            url.replace(0, 4, QStringLiteral("ws"));

        return QUrl(url + QStringLiteral("/ws"));
    }

} // namespace ft
