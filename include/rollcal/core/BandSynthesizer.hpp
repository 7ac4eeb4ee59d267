#pragma once

#include <QColor>
#include <QDate>
#include <QString>
#include <vector>

#include "rollcal/core/IntervalPacker.hpp"
#include "rollcal/core/WeekWindow.hpp"
#include "rollcal/data/Event.hpp"
#include "rollcal/data/OwnerPalette.hpp"

namespace rollcal {
namespace core {

constexpr int LabelDescriptionLength = 15;

// One event's contiguous run of days inside a single week.
struct Band
{
    data::EventKey eventKey;
    QString owner;
    QColor color;
    int row = 0;
    int weekIndex = 0;
    int firstDayIndex = 0;
    int lengthInDays = 0;
    QString label;
    QDate firstDate;
    QDate lastDate;
};

QString bandLabel(const data::VacationEvent &event);

// Bands are ordered by week, then by leading weekday, then by row.
std::vector<Band> synthesizeBands(const std::vector<data::VacationEvent> &events,
                                  const PackingResult &packing,
                                  const Window &window,
                                  const data::OwnerColorMap &colors);

} // namespace core
} // namespace rollcal
