#include "rollcal/core/GeometryMapper.hpp"

#include <algorithm>

namespace rollcal {
namespace core {

namespace {
constexpr int SaturdayIndex = 5;
constexpr int SundayIndex = 6;
constexpr double LabelBaseline = 12.0;

QPointF cellOrigin(int weekIndex, int weekday, double cellHeight, const LayoutConfig &config)
{
    return QPointF(config.margin + weekday * config.cellWidth,
                   config.margin + config.headerHeight + weekIndex * cellHeight);
}
} // namespace

int resolveCellHeight(int maxRowCount, const LayoutConfig &config)
{
    if (maxRowCount <= 0) {
        return config.cellHeight;
    }
    return std::max(config.minimumCellHeight, config.cellHeightPadding + maxRowCount * config.rowPitch());
}

CalendarGeometry mapToPixels(const Window &window,
                             const std::vector<Band> &bands,
                             int maxRowCount,
                             const LayoutConfig &config)
{
    CalendarGeometry geometry;
    geometry.cellHeight = resolveCellHeight(maxRowCount, config);
    geometry.canvasSize = QSizeF(DaysPerWeek * config.cellWidth + 2 * config.margin,
                                 config.headerHeight + WeeksPerWindow * geometry.cellHeight + 2 * config.margin);

    geometry.headers.reserve(DaysPerWeek);
    for (int weekday = 0; weekday < DaysPerWeek; ++weekday) {
        HeaderCell header;
        header.text = config.weekdayNames.value(weekday);
        header.rect = QRectF(config.margin + weekday * config.cellWidth, config.margin,
                             config.cellWidth, config.headerHeight);
        geometry.headers.push_back(std::move(header));
    }

    geometry.days.reserve(DaysPerWindow);
    for (int weekIndex = 0; weekIndex < WeeksPerWindow; ++weekIndex) {
        const Week &week = window.week(weekIndex);
        for (int weekday = 0; weekday < DaysPerWeek; ++weekday) {
            DayCell cell;
            cell.date = week.at(weekday);
            cell.weekIndex = weekIndex;
            cell.weekday = weekday;
            cell.rect = QRectF(cellOrigin(weekIndex, weekday, geometry.cellHeight, config),
                               QSizeF(config.cellWidth, geometry.cellHeight));
            cell.isToday = cell.date == window.anchor();
            cell.isSaturday = !cell.isToday && weekday == SaturdayIndex;
            cell.isSunday = !cell.isToday && weekday == SundayIndex;
            if (cell.date.day() == 1) {
                cell.monthLabel = config.monthLabelFormat.arg(cell.date.month());
            }
            geometry.days.push_back(std::move(cell));
        }
    }

    geometry.bands.reserve(bands.size());
    for (const Band &band : bands) {
        const QPointF origin = cellOrigin(band.weekIndex, band.firstDayIndex, geometry.cellHeight, config);
        const double top = origin.y() + config.bandTopOffset + band.row * config.rowPitch();

        BandRect mapped;
        mapped.band = band;
        mapped.rect = QRectF(origin.x() + config.bandInset / 2.0,
                             top,
                             band.lengthInDays * config.cellWidth - config.bandInset,
                             config.eventRowHeight);
        mapped.labelOrigin = QPointF(origin.x() + config.bandInset, top + LabelBaseline);
        geometry.bands.push_back(std::move(mapped));
    }
    return geometry;
}

} // namespace core
} // namespace rollcal
