#pragma once

#include <QDate>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <vector>

#include "rollcal/core/BandSynthesizer.hpp"
#include "rollcal/core/LayoutSettings.hpp"
#include "rollcal/core/WeekWindow.hpp"

namespace rollcal {
namespace core {

struct HeaderCell
{
    QString text;
    QRectF rect;
};

struct DayCell
{
    QDate date;
    QRectF rect;
    int weekIndex = 0;
    int weekday = 0;
    bool isToday = false;
    bool isSaturday = false;
    bool isSunday = false;
    // Set on the first of a month only.
    QString monthLabel;
};

struct BandRect
{
    Band band;
    QRectF rect;
    QPointF labelOrigin;
};

struct CalendarGeometry
{
    QSizeF canvasSize;
    double cellHeight = 0.0;
    std::vector<HeaderCell> headers;
    std::vector<DayCell> days;
    std::vector<BandRect> bands;
};

// Uniform cell height for the whole grid, driven by the busiest day.
int resolveCellHeight(int maxRowCount, const LayoutConfig &config);

CalendarGeometry mapToPixels(const Window &window,
                             const std::vector<Band> &bands,
                             int maxRowCount,
                             const LayoutConfig &config);

} // namespace core
} // namespace rollcal
