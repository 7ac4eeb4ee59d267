#include "rollcal/data/OwnerPalette.hpp"

#include "rollcal/core/Logging.hpp"

#include <algorithm>
#include <iterator>

namespace rollcal {
namespace data {

namespace {
const char *const DefaultColors[] = {
    "#ffb3ba", "#bae1ff", "#baffc9", "#ffffba", "#ffdfba",
    "#e0bbe4", "#d4d4aa", "#ffc9c9", "#c9e4ff", "#d4ffd4",
    "#ffffe0", "#ffe4e1", "#f0f8ff", "#f0fff0", "#ffefd5",
    "#e6e6fa", "#f5deb3", "#ffe4b5", "#dda0dd", "#98fb98",
};
} // namespace

OwnerPalette::OwnerPalette(QVector<QColor> colors)
    : m_colors(std::move(colors))
{
    if (m_colors.isEmpty()) {
        qCWarning(lcData) << "Empty owner palette, using fallback color only";
        m_colors.append(fallbackColor());
    }
}

OwnerPalette OwnerPalette::defaultPalette()
{
    QVector<QColor> colors;
    colors.reserve(static_cast<int>(std::size(DefaultColors)));
    for (const char *name : DefaultColors) {
        colors.append(QColor(QLatin1String(name)));
    }
    return OwnerPalette(std::move(colors));
}

QColor OwnerPalette::fallbackColor()
{
    return QColor(0xf0, 0xf0, 0xf0);
}

int OwnerPalette::size() const
{
    return m_colors.size();
}

QColor OwnerPalette::colorAt(int index) const
{
    if (index < 0) {
        return fallbackColor();
    }
    return m_colors.at(index % m_colors.size());
}

OwnerColorMap OwnerPalette::assign(QStringList owners) const
{
    owners.removeDuplicates();
    // Code point order; QString's own comparison orders by UTF-16 unit.
    std::sort(owners.begin(), owners.end(), [](const QString &lhs, const QString &rhs) {
        return lhs.toUcs4() < rhs.toUcs4();
    });

    OwnerColorMap result;
    for (int i = 0; i < owners.size(); ++i) {
        result.insert(owners.at(i), colorAt(i));
    }
    return result;
}

QColor colorForOwner(const OwnerColorMap &colors, const QString &owner)
{
    return colors.value(owner, OwnerPalette::fallbackColor());
}

} // namespace data
} // namespace rollcal
