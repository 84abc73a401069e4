#pragma once

#include "RuntimeSnapshot.hpp"

#include <QHash>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>

namespace ft::timer {

    // Turns inbound frames into canonical updates. Never throws: anything it
    // cannot read resolves to std::nullopt.
    class PayloadNormalizer {
      public:
        PayloadNormalizer();

        // Maps a frame type/tag to the slice it refreshes.
        // std::nullopt marks a tag whose frames are dropped (heartbeats, chat messages).
        void                                  registerGranularTag(const QString& tag, std::optional<Slice> slice);
        bool                                  isGranularTag(const QString& tag) const;

        Update                                classify(const QJsonObject& frame) const;

        static RuntimeSnapshot                normalize(const QJsonValue& raw);
        static RuntimeSnapshot                normalizeSlice(Slice slice, const QJsonValue& value);
        static std::optional<EventInfo>       normalizeEvent(const QJsonValue& raw);
        static std::optional<RundownPosition> normalizeRundown(const QJsonObject& working);
        static std::optional<TimerType>       parseTimerType(const QJsonValue& value);
        static std::optional<Playback>        parsePlayback(const QJsonValue& value);
        static std::optional<qint64>          toMilliseconds(const QJsonValue& value);

      private:
        QHash<QString, std::optional<Slice>> m_granularTags;
    };

} // namespace ft::timer
