#include "rollcal/core/IntervalPacker.hpp"

#include "rollcal/core/Logging.hpp"

#include <QtGlobal>
#include <algorithm>

namespace rollcal {
namespace core {

namespace {

bool rowIsFree(const QMap<QDate, DayOccupancy> &occupancy, const QDate &first, const QDate &last, int row)
{
    for (QDate date = first; date <= last; date = date.addDays(1)) {
        const DayOccupancy slots = occupancy.value(date);
        if (row < slots.size() && slots.at(row) != EmptySlot) {
            return false;
        }
    }
    return true;
}

void commitRow(QMap<QDate, DayOccupancy> &occupancy, const QDate &first, const QDate &last, int row, int eventIndex)
{
    for (QDate date = first; date <= last; date = date.addDays(1)) {
        DayOccupancy &slots = occupancy[date];
        while (slots.size() <= row) {
            slots.append(EmptySlot);
        }
        slots[row] = eventIndex;
    }
}

} // namespace

int PackingResult::maxRowCount() const
{
    int result = 0;
    for (const DayOccupancy &slots : occupancy) {
        result = std::max(result, slots.size());
    }
    return result;
}

PackingResult pack(std::vector<data::VacationEvent> &events, const Window &window)
{
    PackingResult result;
    for (const QDate &date : window.dates()) {
        result.occupancy.insert(date, DayOccupancy());
    }

    for (std::size_t i = 0; i < events.size(); ++i) {
        auto &event = events[i];
        event.row = -1;
        if (!event.startDate.isValid() || !event.endDate.isValid() || event.endDate < event.startDate) {
            qCWarning(lcLayout) << "Not packing event of" << event.owner << "with invalid range"
                                << event.startDate << event.endDate;
            continue;
        }
        if (!window.intersects(event.startDate, event.endDate)) {
            continue;
        }

        const QDate first = qMax(event.startDate, window.firstDay());
        const QDate last = qMin(event.endDate, window.lastDay());

        int row = 0;
        while (!rowIsFree(result.occupancy, first, last, row)) {
            ++row;
        }
        commitRow(result.occupancy, first, last, row, static_cast<int>(i));
        event.row = row;
        result.packedEvents.push_back(i);
    }

    qCDebug(lcLayout) << "Packed" << result.packedEvents.size() << "of" << events.size() << "events into"
                      << result.maxRowCount() << "rows";
    return result;
}

} // namespace core
} // namespace rollcal
