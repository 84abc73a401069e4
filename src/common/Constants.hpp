#pragma once

#include <QtGlobal>

namespace ft {

    // Connection
    inline constexpr int RECONNECT_INITIAL_DELAY_MS = 200;
    inline constexpr int RECONNECT_MAX_DELAY_MS     = 4000;
    inline constexpr int MAX_FRAME_SIZE             = 1024 * 1024; // 1 MiB

    // Presentation
    inline constexpr int TICK_INTERVAL_MS = 1000;

    // Controls
    inline constexpr qint64 ADDTIME_STEP_MS = 60 * 1000; // 1 minute

    inline constexpr const char* DEFAULT_SERVER_URL = "http://localhost:4001";

} // namespace ft
