#include "Settings.hpp"
#include "Constants.hpp"

#include <QFileInfo>
#include <QSettings>

#include <cstdio>
#include <print>

namespace ft {

    DisplayMode parseDisplayMode(const QString& value) {
        return value.trimmed().compare("clock", Qt::CaseInsensitive) == 0 ? DisplayMode::Clock : DisplayMode::Timer;
    }

    Settings Settings::load(const QString& path) {
        Settings settings;
        settings.serverUrl = QString::fromLatin1(DEFAULT_SERVER_URL);

        if (path.isEmpty() || !QFileInfo::exists(path))
            return settings;

        QSettings file(path, QSettings::IniFormat);
        if (file.status() != QSettings::NoError) {
            std::print(stderr, "Failed to read config {}, using defaults\n", path.toStdString());
            return settings;
        }

        const QString url = file.value("server_url").toString().trimmed();
        if (!url.isEmpty())
            settings.serverUrl = url;

        settings.addtimeAffectsEventDuration = file.value("addtime_affects_event_duration", false).toBool();
        settings.displayMode                 = parseDisplayMode(file.value("display_mode", "timer").toString());
        settings.debug                       = file.value("debug", false).toBool();

        return settings;
    }

} // namespace ft
