#pragma once

#include <QDate>
#include <QHash>
#include <QString>

#include <tuple>

namespace rollcal {
namespace data {

struct EventKey
{
    QString owner;
    QDate startDate;
    QDate endDate;
};

inline bool operator==(const EventKey &lhs, const EventKey &rhs)
{
    return lhs.owner == rhs.owner && lhs.startDate == rhs.startDate && lhs.endDate == rhs.endDate;
}

inline bool operator!=(const EventKey &lhs, const EventKey &rhs)
{
    return !(lhs == rhs);
}

inline bool operator<(const EventKey &lhs, const EventKey &rhs)
{
    return std::tie(lhs.owner, lhs.startDate, lhs.endDate) < std::tie(rhs.owner, rhs.startDate, rhs.endDate);
}

inline uint qHash(const EventKey &key, uint seed = 0)
{
    return ::qHash(key.owner, seed) ^ ::qHash(key.startDate.toJulianDay(), seed)
        ^ (::qHash(key.endDate.toJulianDay(), seed) << 1);
}

// One owner's reservation over an inclusive date range.
struct VacationEvent
{
    QString owner;
    QDate startDate;
    QDate endDate;
    QString description;
    int row = -1; // assigned by core::pack(), -1 while unpacked

    EventKey key() const { return { owner, startDate, endDate }; }
    bool covers(const QDate &date) const { return startDate <= date && date <= endDate; }
};

} // namespace data
} // namespace rollcal
