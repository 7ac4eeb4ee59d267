#pragma once

#include <QDate>
#include <vector>

#include "rollcal/core/BandSynthesizer.hpp"
#include "rollcal/core/GeometryMapper.hpp"
#include "rollcal/core/IntervalPacker.hpp"
#include "rollcal/core/LayoutSettings.hpp"
#include "rollcal/core/WeekWindow.hpp"
#include "rollcal/data/EventStore.hpp"

namespace rollcal {
namespace data {
class EventSource;
}

namespace core {

// Everything computed for one render call. Nothing here outlives the call that built it.
struct CalendarLayout
{
    Window window;
    data::EventStore store;
    PackingResult packing;
    std::vector<Band> bands;
    CalendarGeometry geometry;
};

CalendarLayout layoutCalendar(const data::EventSource &source,
                              const QDate &anchor,
                              const LayoutConfig &config,
                              const data::OwnerPalette &palette = data::OwnerPalette::defaultPalette());

} // namespace core
} // namespace rollcal
