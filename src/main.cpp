#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QGuiApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include "version.h"

#include "rollcal/core/CalendarLayout.hpp"
#include "rollcal/core/LayoutSettings.hpp"
#include "rollcal/data/CsvEventSource.hpp"
#include "rollcal/render/CalendarRenderer.hpp"

using namespace rollcal;

namespace {

void printDateInfo(QTextStream &out, const core::CalendarLayout &layout)
{
    const QStringList weekNames = { QObject::tr("previous"), QObject::tr("current"),
                                    QObject::tr("next"), QObject::tr("after next") };
    out << QObject::tr("Anchor date: %1").arg(layout.window.anchor().toString(Qt::ISODate)) << '\n';
    out << QObject::tr("Four-week range:") << '\n';
    for (int i = 0; i < core::WeeksPerWindow; ++i) {
        const auto &week = layout.window.week(i);
        out << QStringLiteral("  %1: %2 - %3")
                   .arg(weekNames.at(i), week.firstDay().toString(Qt::ISODate), week.lastDay().toString(Qt::ISODate))
            << '\n';
    }

    out << '\n' << QObject::tr("Events loaded: %1").arg(layout.store.events.size()) << '\n';
    if (layout.store.rejectedRecords > 0) {
        out << QObject::tr("Records rejected: %1").arg(layout.store.rejectedRecords) << '\n';
    }
    out << QObject::tr("Members: %1").arg(layout.store.colors.size()) << '\n';
    for (auto it = layout.store.colors.constBegin(); it != layout.store.colors.constEnd(); ++it) {
        out << QStringLiteral("  %1: %2").arg(it.key(), it.value().name()) << '\n';
    }
}

} // namespace

int main(int argc, char *argv[])
{
    // Rendering needs fonts but never a display.
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QCoreApplication::setApplicationName(QStringLiteral("rollcal"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kRollcalVersion));

    QGuiApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Renders a rolling four-week vacation calendar as SVG."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption csvOption({ QStringLiteral("i"), QStringLiteral("csv") },
                                       QObject::tr("Event CSV file (start,end,member,description)."),
                                       QObject::tr("file"),
                                       QStringLiteral("vacation.csv"));
    const QCommandLineOption outputOption({ QStringLiteral("o"), QStringLiteral("output") },
                                          QObject::tr("SVG file to write."),
                                          QObject::tr("file"),
                                          QStringLiteral("calendar.svg"));
    const QCommandLineOption todayOption({ QStringLiteral("t"), QStringLiteral("today") },
                                         QObject::tr("Anchor date, defaults to the current date."),
                                         QObject::tr("yyyy-MM-dd"));
    const QCommandLineOption configOption({ QStringLiteral("c"), QStringLiteral("config") },
                                          QObject::tr("INI file with layout, label and palette settings."),
                                          QObject::tr("file"));
    const QCommandLineOption pngOption(QStringLiteral("png"), QObject::tr("Also rasterize the SVG to PNG."));
    const QCommandLineOption dpiOption(QStringLiteral("dpi"),
                                       QObject::tr("PNG resolution."),
                                       QObject::tr("dpi"),
                                       QStringLiteral("300"));
    const QCommandLineOption infoOption(QStringLiteral("info"), QObject::tr("Print the date range and members."));
    parser.addOptions({ csvOption, outputOption, todayOption, configOption, pngOption, dpiOption, infoOption });
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    QDate today;
    if (parser.isSet(todayOption)) {
        today = QDate::fromString(parser.value(todayOption), Qt::ISODate);
        if (!today.isValid()) {
            err << QObject::tr("Invalid date '%1', expected yyyy-MM-dd").arg(parser.value(todayOption)) << '\n';
            return 1;
        }
    }

    bool dpiOk = false;
    const int dpi = parser.value(dpiOption).toInt(&dpiOk);
    if (!dpiOk || dpi <= 0) {
        err << QObject::tr("Invalid resolution '%1'").arg(parser.value(dpiOption)) << '\n';
        return 1;
    }

    core::LayoutConfig config;
    data::OwnerPalette palette = data::OwnerPalette::defaultPalette();
    if (parser.isSet(configOption)) {
        const QString configPath = parser.value(configOption);
        if (!QFileInfo::exists(configPath)) {
            err << QObject::tr("Configuration file %1 not found").arg(configPath) << '\n';
            return 1;
        }
        QSettings settings(configPath, QSettings::IniFormat);
        if (settings.status() != QSettings::NoError) {
            err << QObject::tr("Cannot read configuration file %1").arg(configPath) << '\n';
            return 1;
        }
        config = core::loadLayoutConfig(settings);
        palette = core::loadOwnerPalette(settings);
    }

    const data::CsvEventSource source(parser.value(csvOption));
    const core::CalendarLayout layout = core::layoutCalendar(source, today, config, palette);

    const QString outputPath = parser.value(outputOption);
    const render::CalendarRenderer renderer(layout.geometry);
    if (!renderer.renderSvg(outputPath)) {
        err << QObject::tr("Failed to write %1").arg(outputPath) << '\n';
        return 1;
    }
    out << QObject::tr("Calendar written to %1").arg(outputPath) << '\n';

    if (parser.isSet(pngOption)) {
        const QString pngPath = render::CalendarRenderer::pngPathFor(outputPath);
        if (!render::CalendarRenderer::convertSvgToPng(outputPath, pngPath, dpi)) {
            err << QObject::tr("Failed to convert %1 to PNG").arg(outputPath) << '\n';
            return 1;
        }
        out << QObject::tr("PNG written to %1").arg(pngPath) << '\n';
    }

    if (parser.isSet(infoOption)) {
        out << '\n';
        printDateInfo(out, layout);
    }
    return 0;
}
