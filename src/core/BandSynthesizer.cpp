#include "rollcal/core/BandSynthesizer.hpp"

#include "rollcal/core/Logging.hpp"

#include <QSet>
#include <QVector>
#include <QtGlobal>

namespace rollcal {
namespace core {

QString bandLabel(const data::VacationEvent &event)
{
    if (event.description.trimmed().isEmpty()) {
        return event.owner;
    }
    // Cut on code points so a surrogate pair is never split.
    const QVector<uint> codePoints = event.description.toUcs4();
    if (codePoints.size() <= LabelDescriptionLength) {
        return QStringLiteral("%1: %2").arg(event.owner, event.description);
    }
    const QString cut = QString::fromUcs4(codePoints.constData(), LabelDescriptionLength);
    return QStringLiteral("%1: %2...").arg(event.owner, cut);
}

std::vector<Band> synthesizeBands(const std::vector<data::VacationEvent> &events,
                                  const PackingResult &packing,
                                  const Window &window,
                                  const data::OwnerColorMap &colors)
{
    std::vector<Band> bands;

    for (int weekIndex = 0; weekIndex < WeeksPerWindow; ++weekIndex) {
        const Week &week = window.week(weekIndex);
        // A multi-day event shows up on every day it covers; emit it once per week.
        QSet<data::EventKey> drawn;

        for (const QDate &date : week.days()) {
            const DayOccupancy slots = packing.dayAt(date);
            for (int row = 0; row < slots.size(); ++row) {
                const int eventIndex = slots.at(row);
                if (eventIndex == EmptySlot) {
                    continue;
                }
                if (eventIndex < 0 || static_cast<std::size_t>(eventIndex) >= events.size()) {
                    qCWarning(lcLayout) << "Occupancy on" << date << "references unknown event" << eventIndex;
                    continue;
                }

                const auto &event = events[static_cast<std::size_t>(eventIndex)];
                const data::EventKey key = event.key();
                if (drawn.contains(key) || !event.covers(date)) {
                    continue;
                }

                const QDate startInWeek = qMax(event.startDate, week.firstDay());
                const QDate endInWeek = qMin(event.endDate, week.lastDay());
                if (startInWeek != date) {
                    continue;
                }
                drawn.insert(key);

                Band band;
                band.eventKey = key;
                band.owner = event.owner;
                band.color = data::colorForOwner(colors, event.owner);
                band.row = row;
                band.weekIndex = weekIndex;
                band.firstDayIndex = weekdayIndex(startInWeek);
                band.lengthInDays = weekdayIndex(endInWeek) - weekdayIndex(startInWeek) + 1;
                band.firstDate = startInWeek;
                band.lastDate = endInWeek;
                // The leading edge of every week segment is labelled, continuations included.
                band.label = bandLabel(event);
                bands.push_back(std::move(band));
            }
        }
    }
    return bands;
}

} // namespace core
} // namespace rollcal
