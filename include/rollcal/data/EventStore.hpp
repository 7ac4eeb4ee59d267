#pragma once

#include <optional>
#include <vector>

#include "rollcal/data/Event.hpp"
#include "rollcal/data/EventSource.hpp"
#include "rollcal/data/OwnerPalette.hpp"

namespace rollcal {
namespace data {

struct EventStore
{
    std::vector<VacationEvent> events;
    OwnerColorMap colors;
    int rejectedRecords = 0;
};

// Accepts "yyyy/MM/dd" with or without zero padding.
QDate parseRecordDate(const QString &value);

std::optional<VacationEvent> parseRecord(const EventRecord &record, QString *errorMessage = nullptr);

// Keeps the last record per (owner, start, end) at the position where the key first
// appeared, then colors the surviving owners.
EventStore buildEvents(const std::vector<EventRecord> &records,
                       const OwnerPalette &palette = OwnerPalette::defaultPalette());

} // namespace data
} // namespace rollcal
