#include "rollcal/core/WeekWindow.hpp"

namespace rollcal {
namespace core {

int weekdayIndex(const QDate &date)
{
    return date.dayOfWeek() - 1;
}

QDate alignToWeekStart(const QDate &date)
{
    return date.addDays(-weekdayIndex(date));
}

Week::Week(const QDate &day)
{
    const QDate monday = alignToWeekStart(day);
    for (int i = 0; i < DaysPerWeek; ++i) {
        m_days[static_cast<std::size_t>(i)] = monday.addDays(i);
    }
}

bool Week::contains(const QDate &date) const
{
    return firstDay() <= date && date <= lastDay();
}

Window::Window(const QDate &anchor)
    : m_anchor(anchor)
    , m_weeks(buildWeeks(alignToWeekStart(anchor)))
{
}

std::array<Week, WeeksPerWindow> Window::buildWeeks(const QDate &monday)
{
    return { Week(monday.addDays(-DaysPerWeek)),
             Week(monday),
             Week(monday.addDays(DaysPerWeek)),
             Week(monday.addDays(2 * DaysPerWeek)) };
}

bool Window::contains(const QDate &date) const
{
    return firstDay() <= date && date <= lastDay();
}

bool Window::intersects(const QDate &start, const QDate &end) const
{
    return !(end < firstDay() || start > lastDay());
}

int Window::weekIndexOf(const QDate &date) const
{
    if (!contains(date)) {
        return -1;
    }
    return static_cast<int>(firstDay().daysTo(date)) / DaysPerWeek;
}

QVector<QDate> Window::dates() const
{
    QVector<QDate> result;
    result.reserve(DaysPerWindow);
    for (const Week &week : m_weeks) {
        for (const QDate &day : week.days()) {
            result.append(day);
        }
    }
    return result;
}

Window computeWindow(const QDate &anchor)
{
    return Window(anchor.isValid() ? anchor : QDate::currentDate());
}

} // namespace core
} // namespace rollcal
