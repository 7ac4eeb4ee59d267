#pragma once

#include <QColor>
#include <QString>

#include "rollcal/core/GeometryMapper.hpp"

class QFont;
class QIODevice;
class QPainter;

namespace rollcal {
namespace render {

struct RenderStyle
{
    QColor background = QColor(0xfa, 0xfa, 0xfa);
    QColor gridLine = QColor(0xcc, 0xcc, 0xcc);
    QColor headerFill = QColor(0xe0, 0xe0, 0xe0);
    QColor cellFill = Qt::white;
    QColor saturdayFill = QColor(0xe3, 0xf2, 0xfd);
    QColor sundayFill = QColor(0xff, 0xeb, 0xee);
    QColor todayFill = QColor(0xff, 0xff, 0xa8);
    QColor bandOutline = QColor(0x66, 0x66, 0x66);
    QColor text = Qt::black;
    double bandOutlineWidth = 0.5;
    QString fontFamily = QStringLiteral("Arial");
    int headerFontPixels = 16;
    int monthFontPixels = 18;
    int dayNumberFontPixels = 14;
    int bandFontPixels = 10;
};

class CalendarRenderer
{
public:
    explicit CalendarRenderer(core::CalendarGeometry geometry, RenderStyle style = RenderStyle());

    // Cells first, bands on top.
    void paint(QPainter &painter) const;

    bool writeSvg(QIODevice *device) const;
    bool renderSvg(const QString &filePath) const;

    static QString pngPathFor(const QString &svgPath);
    static bool convertSvgToPng(const QString &svgPath, const QString &pngPath, int dpi = 300);

private:
    void paintHeaders(QPainter &painter) const;
    void paintDays(QPainter &painter) const;
    void paintBands(QPainter &painter) const;
    QColor fillFor(const core::DayCell &cell) const;
    QFont font(int pixelSize, bool bold) const;

    core::CalendarGeometry m_geometry;
    RenderStyle m_style;
};

} // namespace render
} // namespace rollcal
