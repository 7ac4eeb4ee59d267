#include "rollcal/core/LayoutSettings.hpp"

#include "rollcal/core/Logging.hpp"
#include "rollcal/core/WeekWindow.hpp"

#include <QSettings>

namespace rollcal {
namespace core {

namespace {

void readInt(QSettings &settings, const QString &key, int minimum, int &target)
{
    if (!settings.contains(key)) {
        return;
    }
    const QVariant raw = settings.value(key);
    bool ok = false;
    const int value = raw.toInt(&ok);
    if (!ok || value < minimum) {
        qCWarning(lcLayout) << "Ignoring invalid setting" << key << '=' << raw.toString();
        return;
    }
    target = value;
}

struct IntSetting
{
    const char *key;
    const char *alias;
    int minimum;
    int LayoutConfig::*field;
};

// INI keys are camelCase; the snake_case spelling is accepted as an alias.
const IntSetting LayoutIntSettings[] = {
    { "cellWidth", "cell_width", 1, &LayoutConfig::cellWidth },
    { "cellHeight", "cell_height", 1, &LayoutConfig::cellHeight },
    { "minimumCellHeight", "minimum_cell_height", 1, &LayoutConfig::minimumCellHeight },
    { "cellHeightPadding", "cell_height_padding", 0, &LayoutConfig::cellHeightPadding },
    { "headerHeight", "header_height", 1, &LayoutConfig::headerHeight },
    { "margin", "margin", 0, &LayoutConfig::margin },
    { "eventRowHeight", "event_row_height", 1, &LayoutConfig::eventRowHeight },
    { "rowSpacing", "row_spacing", 0, &LayoutConfig::rowSpacing },
    { "bandTopOffset", "band_top_offset", 0, &LayoutConfig::bandTopOffset },
    { "bandInset", "band_inset", 0, &LayoutConfig::bandInset },
};

bool isKnownLayoutKey(const QString &key)
{
    for (const IntSetting &setting : LayoutIntSettings) {
        if (key == QLatin1String(setting.key) || key == QLatin1String(setting.alias)) {
            return true;
        }
    }
    return false;
}

} // namespace

QStringList LayoutConfig::defaultWeekdayNames()
{
    return { QStringLiteral("月"), QStringLiteral("火"), QStringLiteral("水"), QStringLiteral("木"),
             QStringLiteral("金"), QStringLiteral("土"), QStringLiteral("日") };
}

LayoutConfig loadLayoutConfig(QSettings &settings)
{
    LayoutConfig config;

    settings.beginGroup(QStringLiteral("layout"));
    for (const QString &key : settings.childKeys()) {
        if (!isKnownLayoutKey(key)) {
            qCWarning(lcLayout) << "Ignoring unknown layout setting" << key;
        }
    }
    for (const IntSetting &setting : LayoutIntSettings) {
        readInt(settings, QLatin1String(setting.alias), setting.minimum, config.*setting.field);
        readInt(settings, QLatin1String(setting.key), setting.minimum, config.*setting.field);
    }
    settings.endGroup();

    if (config.bandInset >= config.cellWidth) {
        qCWarning(lcLayout) << "Band inset" << config.bandInset << "does not fit cell width" << config.cellWidth;
        config.bandInset = LayoutConfig().bandInset;
    }

    settings.beginGroup(QStringLiteral("labels"));
    if (settings.contains(QStringLiteral("weekdays"))) {
        const QStringList names = settings.value(QStringLiteral("weekdays")).toStringList();
        if (names.size() == DaysPerWeek) {
            config.weekdayNames.clear();
            for (const QString &name : names) {
                config.weekdayNames << name.trimmed();
            }
        } else {
            qCWarning(lcLayout) << "Expected" << DaysPerWeek << "weekday names, got" << names;
        }
    }
    if (settings.contains(QStringLiteral("monthFormat"))) {
        const QString format = settings.value(QStringLiteral("monthFormat")).toString();
        if (format.contains(QLatin1String("%1"))) {
            config.monthLabelFormat = format;
        } else {
            qCWarning(lcLayout) << "Month label format" << format << "lacks a %1 placeholder";
        }
    }
    settings.endGroup();

    return config;
}

data::OwnerPalette loadOwnerPalette(QSettings &settings)
{
    const QString key = QStringLiteral("palette/colors");
    if (!settings.contains(key)) {
        return data::OwnerPalette::defaultPalette();
    }

    QVector<QColor> colors;
    for (const QString &name : settings.value(key).toStringList()) {
        const QColor color(name.trimmed());
        if (!color.isValid()) {
            qCWarning(lcLayout) << "Ignoring invalid palette color" << name;
            continue;
        }
        colors.append(color);
    }
    if (colors.isEmpty()) {
        qCWarning(lcLayout) << "Configured palette has no usable colors, using the default palette";
        return data::OwnerPalette::defaultPalette();
    }
    return data::OwnerPalette(std::move(colors));
}

} // namespace core
} // namespace rollcal
