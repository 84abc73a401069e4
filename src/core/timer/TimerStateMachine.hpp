#pragma once

#include "RuntimeSnapshot.hpp"

#include <QDateTime>

namespace ft::timer {

    // Single writer of the TimerModel. Callers must serialize access; the
    // controller does so by running everything on the Qt event loop.
    class TimerStateMachine {
      public:
        TimerStateMachine() = default;

        // Full updates replace the snapshot, partial updates merge their slice.
        // Returns true only when the stored snapshot changed; lastUpdate is
        // refreshed for every update that is not ignored.
        bool              applyUpdate(const Update& update, const QDateTime& now);
        bool              applySnapshot(const RuntimeSnapshot& snapshot, const QDateTime& now);

        // Returns true when the connection state actually changed
        bool              setConnected(bool connected);

        void              tick(const QDateTime& now);
        void              reset();

        const TimerModel& model() const;
        bool              isIdle() const;

      private:
        void       mergeSlice(Slice slice, const QJsonValue& value);
        void       refreshDerived(const QDateTime& now);

        TimerModel m_model;
    };

} // namespace ft::timer
