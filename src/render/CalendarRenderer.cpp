#include "rollcal/render/CalendarRenderer.hpp"

#include "rollcal/core/Logging.hpp"

#include <QDir>
#include <QFileInfo>
#include <QFont>
#include <QFontMetricsF>
#include <QImage>
#include <QPainter>
#include <QPen>
#include <QSaveFile>
#include <QSvgGenerator>
#include <QSvgRenderer>
#include <QtMath>

namespace rollcal {
namespace render {

namespace {
constexpr int SvgResolution = 96;
constexpr double InchesPerMeter = 39.3700787;
constexpr double DayNumberPadding = 8.0;
constexpr double CellTextBaseline = 20.0;
} // namespace

CalendarRenderer::CalendarRenderer(core::CalendarGeometry geometry, RenderStyle style)
    : m_geometry(std::move(geometry))
    , m_style(std::move(style))
{
}

void CalendarRenderer::paint(QPainter &painter) const
{
    painter.save();
    painter.fillRect(QRectF(QPointF(0, 0), m_geometry.canvasSize), m_style.background);
    paintHeaders(painter);
    paintDays(painter);
    paintBands(painter);
    painter.restore();
}

void CalendarRenderer::paintHeaders(QPainter &painter) const
{
    painter.setFont(font(m_style.headerFontPixels, true));
    for (const auto &header : m_geometry.headers) {
        painter.fillRect(header.rect, m_style.headerFill);
        painter.setPen(m_style.gridLine);
        painter.drawRect(header.rect);
        painter.setPen(m_style.text);
        painter.drawText(header.rect, Qt::AlignCenter, header.text);
    }
}

void CalendarRenderer::paintDays(QPainter &painter) const
{
    const QFont dayFont = font(m_style.dayNumberFontPixels, false);
    const QFont monthFont = font(m_style.monthFontPixels, true);

    for (const auto &cell : m_geometry.days) {
        painter.fillRect(cell.rect, fillFor(cell));
        painter.setPen(m_style.gridLine);
        painter.drawRect(cell.rect);

        painter.setPen(m_style.text);
        if (!cell.monthLabel.isEmpty()) {
            painter.setFont(monthFont);
            painter.drawText(QPointF(cell.rect.left() + DayNumberPadding, cell.rect.top() + CellTextBaseline),
                             cell.monthLabel);
        }

        painter.setFont(dayFont);
        const QString dayText = QString::number(cell.date.day());
        const double textWidth = QFontMetricsF(dayFont).horizontalAdvance(dayText);
        painter.drawText(QPointF(cell.rect.right() - DayNumberPadding - textWidth, cell.rect.top() + CellTextBaseline),
                         dayText);
    }
}

void CalendarRenderer::paintBands(QPainter &painter) const
{
    painter.setFont(font(m_style.bandFontPixels, false));
    QPen outline(m_style.bandOutline);
    outline.setWidthF(m_style.bandOutlineWidth);

    for (const auto &mapped : m_geometry.bands) {
        painter.setPen(outline);
        painter.setBrush(mapped.band.color);
        painter.drawRect(mapped.rect);
        if (!mapped.band.label.isEmpty()) {
            painter.setPen(m_style.text);
            painter.drawText(mapped.labelOrigin, mapped.band.label);
        }
    }
    painter.setBrush(Qt::NoBrush);
}

QColor CalendarRenderer::fillFor(const core::DayCell &cell) const
{
    if (cell.isToday) {
        return m_style.todayFill;
    }
    if (cell.isSaturday) {
        return m_style.saturdayFill;
    }
    if (cell.isSunday) {
        return m_style.sundayFill;
    }
    return m_style.cellFill;
}

QFont CalendarRenderer::font(int pixelSize, bool bold) const
{
    QFont result(m_style.fontFamily);
    result.setPixelSize(pixelSize);
    result.setBold(bold);
    return result;
}

bool CalendarRenderer::writeSvg(QIODevice *device) const
{
    if (!device) {
        return false;
    }
    const QSize size = m_geometry.canvasSize.toSize();

    QSvgGenerator generator;
    generator.setOutputDevice(device);
    generator.setSize(size);
    generator.setViewBox(QRect(QPoint(0, 0), size));
    generator.setResolution(SvgResolution);
    generator.setTitle(QStringLiteral("Four-week calendar"));

    QPainter painter;
    if (!painter.begin(&generator)) {
        qCWarning(lcRender) << "Cannot start painting the SVG document";
        return false;
    }
    paint(painter);
    return painter.end();
}

bool CalendarRenderer::renderSvg(const QString &filePath) const
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcRender) << "Cannot write" << filePath << ':' << file.errorString();
        return false;
    }
    if (!writeSvg(&file)) {
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qCWarning(lcRender) << "Cannot commit" << filePath << ':' << file.errorString();
        return false;
    }
    qCInfo(lcRender) << "Wrote" << filePath;
    return true;
}

QString CalendarRenderer::pngPathFor(const QString &svgPath)
{
    const QFileInfo info(svgPath);
    if (info.suffix().compare(QLatin1String("svg"), Qt::CaseInsensitive) == 0) {
        return info.dir().filePath(info.completeBaseName() + QStringLiteral(".png"));
    }
    return svgPath + QStringLiteral(".png");
}

bool CalendarRenderer::convertSvgToPng(const QString &svgPath, const QString &pngPath, int dpi)
{
    if (dpi <= 0) {
        qCWarning(lcRender) << "Invalid raster resolution" << dpi;
        return false;
    }
    QSvgRenderer renderer(svgPath);
    if (!renderer.isValid()) {
        qCWarning(lcRender) << "Cannot load SVG" << svgPath;
        return false;
    }

    const double scale = static_cast<double>(dpi) / SvgResolution;
    const QSize size = (renderer.viewBoxF().size() * scale).toSize();
    QImage image(size, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);
    const int dotsPerMeter = qRound(dpi * InchesPerMeter);
    image.setDotsPerMeterX(dotsPerMeter);
    image.setDotsPerMeterY(dotsPerMeter);

    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing, true);
    renderer.render(&painter);
    painter.end();

    if (!image.save(pngPath, "PNG")) {
        qCWarning(lcRender) << "Cannot write" << pngPath;
        return false;
    }
    qCInfo(lcRender) << "Wrote" << pngPath << "at" << dpi << "dpi";
    return true;
}

} // namespace render
} // namespace rollcal
