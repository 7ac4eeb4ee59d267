#pragma once

#include <QString>
#include <QStringList>

#include "rollcal/data/OwnerPalette.hpp"

class QSettings;

namespace rollcal {
namespace core {

struct LayoutConfig
{
    int cellWidth = 120;
    // Used as is while no event is visible.
    int cellHeight = 140;
    int minimumCellHeight = 120;
    int cellHeightPadding = 60;
    int headerHeight = 40;
    int margin = 10;
    int eventRowHeight = 18;
    int rowSpacing = 2;
    int bandTopOffset = 30;
    int bandInset = 4;
    QStringList weekdayNames = defaultWeekdayNames();
    QString monthLabelFormat = QStringLiteral("%1月");

    int rowPitch() const { return eventRowHeight + rowSpacing; }

    static QStringList defaultWeekdayNames();
};

/*
 * INI layout:
 *
 *   [layout]
 *   cellWidth=120
 *   cellHeight=140
 *   ...
 *   [labels]
 *   weekdays=Mon, Tue, Wed, Thu, Fri, Sat, Sun
 *   monthFormat=%1
 *   [palette]
 *   colors="#ffb3ba", "#bae1ff"
 *
 * Layout keys may also be spelled snake_case (cell_width); the camelCase key wins when both
 * are present. Missing keys keep their defaults. Invalid values and unknown layout keys are
 * reported and ignored.
 */
LayoutConfig loadLayoutConfig(QSettings &settings);
data::OwnerPalette loadOwnerPalette(QSettings &settings);

} // namespace core
} // namespace rollcal
