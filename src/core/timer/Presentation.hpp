#pragma once

#include "../../common/Settings.hpp"
#include "RuntimeSnapshot.hpp"

#include <QColor>
#include <QDateTime>
#include <QString>

namespace ft::timer {

    enum class ColorTier {
        Normal,
        Warning,
        Danger
    };

    struct DisplayOptions {
        DisplayMode mode = DisplayMode::Timer;
    };

    struct RenderState {
        QString   displayText;
        ColorTier colorTier   = ColorTier::Normal;
        bool      dimmed      = false;
        bool      connected   = false;
        bool      prevEnabled = false;
        bool      nextEnabled = false;
        QString   title;
        QString   nextTitle;

        bool      operator==(const RenderState&) const = default;
    };

    // Pure: same model, instant and options always give the same RenderState
    RenderState project(const TimerModel& model, const QDateTime& now, const DisplayOptions& options = {});

    // Rundown navigation, never wrapping; false when the position is unknown
    bool        canLoadPrevious(const RuntimeSnapshot& snapshot);
    bool        canLoadNext(const RuntimeSnapshot& snapshot);

    ColorTier   countDownTier(qint64 remainingMs, const std::optional<EventInfo>& event);
    ColorTier   countUpTier(qint64 elapsedMs, const std::optional<EventInfo>& event);
    QColor      colorFor(ColorTier tier);

} // namespace ft::timer
