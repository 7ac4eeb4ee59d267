#pragma once

#include <QColor>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

namespace rollcal {
namespace data {

using OwnerColorMap = QMap<QString, QColor>;

class OwnerPalette
{
public:
    explicit OwnerPalette(QVector<QColor> colors);

    static OwnerPalette defaultPalette();
    static QColor fallbackColor();

    int size() const;
    QColor colorAt(int index) const;

    // Owners are sorted before assignment, so input order never matters.
    OwnerColorMap assign(QStringList owners) const;

private:
    QVector<QColor> m_colors;
};

QColor colorForOwner(const OwnerColorMap &colors, const QString &owner);

} // namespace data
} // namespace rollcal
