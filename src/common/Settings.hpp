#pragma once

#include <QString>

namespace ft {

    enum class DisplayMode {
        Timer,
        Clock
    };

    // Read-only view of the user configuration. The overlay never writes it back.
    struct Settings {
        QString     serverUrl;
        bool        addtimeAffectsEventDuration = false;
        DisplayMode displayMode                 = DisplayMode::Timer;
        bool        debug                       = false;

        // Loads an INI file; missing keys keep their defaults
        static Settings load(const QString& path);
    };

    DisplayMode parseDisplayMode(const QString& value);

} // namespace ft
