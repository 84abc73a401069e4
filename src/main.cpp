#include "common/Paths.hpp"
#include "common/Settings.hpp"
#include "core/TimerController.hpp"
#include "overlay/OverlayWindow.hpp"

#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QLoggingCategory>

#include <print>

namespace {

    bool debugFromEnvironment() {
        return qEnvironmentVariable("FLOATTIME_DEBUG").compare("true", Qt::CaseInsensitive) == 0;
    }

    ft::Settings parseSettings(QApplication& app) {
        QCommandLineParser parser;
        parser.setApplicationDescription("FloatTime - always-on-top overlay for Ontime timers");
        parser.addHelpOption();
        parser.addVersionOption();

        QCommandLineOption optConfig(QStringList{"config", "c"}, "Read settings from this file.", "path");
        QCommandLineOption optServer(QStringList{"server", "s"}, "Ontime server URL (e.g. http://localhost:4001).", "url");
        QCommandLineOption optDuration(QStringList{"addtime-affects-duration"}, "+1/-1 change the current event's duration instead of the running timer.");
        QCommandLineOption optClock(QStringList{"clock"}, "Start in clock mode.");
        QCommandLineOption optDebug(QStringList{"debug", "d"}, "Enable debug logging.");

        parser.addOption(optConfig);
        parser.addOption(optServer);
        parser.addOption(optDuration);
        parser.addOption(optClock);
        parser.addOption(optDebug);

        parser.process(app);

        const QString configPath = parser.isSet(optConfig) ? parser.value(optConfig) : ft::configFilePath();
        ft::Settings  settings   = ft::Settings::load(configPath);

        if (parser.isSet(optServer))
            settings.serverUrl = parser.value(optServer).trimmed();
        if (parser.isSet(optDuration))
            settings.addtimeAffectsEventDuration = true;
        if (parser.isSet(optClock))
            settings.displayMode = ft::DisplayMode::Clock;
        if (parser.isSet(optDebug) || debugFromEnvironment())
            settings.debug = true;

        return settings;
    }

} // namespace

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("floattime");
    app.setApplicationVersion("1.0.0");
    QApplication::setQuitOnLastWindowClosed(false);

    const ft::Settings settings = parseSettings(app);

    if (!settings.debug) {
        QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false"));
    }

    std::print("Starting FloatTime\n");
    if (settings.addtimeAffectsEventDuration) {
        std::print("+1/-1 change the current event's duration\n");
    }

    ft::TimerController controller(settings);
    ft::OverlayWindow   window(&controller);

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &controller, [&controller]() { controller.stop(); });

    window.show();
    controller.start();

    return app.exec();
}
