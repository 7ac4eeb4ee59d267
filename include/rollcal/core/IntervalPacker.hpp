#pragma once

#include <QDate>
#include <QMap>
#include <QVector>
#include <vector>

#include "rollcal/core/WeekWindow.hpp"
#include "rollcal/data/Event.hpp"

namespace rollcal {
namespace core {

constexpr int EmptySlot = -1;

// Row slots of one day. Each slot holds an index into the events given to pack(), or EmptySlot.
using DayOccupancy = QVector<int>;

struct PackingResult
{
    QMap<QDate, DayOccupancy> occupancy;
    // Indices of the events that intersect the window, in packing order.
    std::vector<std::size_t> packedEvents;

    DayOccupancy dayAt(const QDate &date) const { return occupancy.value(date); }
    int maxRowCount() const;
};

/*
 * First-fit row assignment over the visible window.
 *
 * Events are visited in sequence order. Each relevant event gets the lowest row that is
 * free on every visible day of its range; days outside the window are ignored. The chosen
 * row is written back to VacationEvent::row. Events outside the window are reset to -1.
 * Packing is stable for a fixed input order, not globally minimal.
 */
PackingResult pack(std::vector<data::VacationEvent> &events, const Window &window);

} // namespace core
} // namespace rollcal
