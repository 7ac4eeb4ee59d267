#pragma once

#include <QDate>
#include <QVector>
#include <array>

namespace rollcal {
namespace core {

constexpr int DaysPerWeek = 7;
constexpr int WeeksPerWindow = 4;
constexpr int DaysPerWindow = DaysPerWeek * WeeksPerWindow;
// Index of the week containing the anchor date.
constexpr int CurrentWeekIndex = 1;

// 0 = Monday ... 6 = Sunday
int weekdayIndex(const QDate &date);
QDate alignToWeekStart(const QDate &date);

class Week
{
public:
    // Builds the Monday..Sunday week that contains |day|.
    explicit Week(const QDate &day);

    const QDate &firstDay() const { return m_days.front(); }
    const QDate &lastDay() const { return m_days.back(); }
    const QDate &at(int weekday) const { return m_days.at(static_cast<std::size_t>(weekday)); }
    const std::array<QDate, DaysPerWeek> &days() const { return m_days; }
    bool contains(const QDate &date) const;

private:
    std::array<QDate, DaysPerWeek> m_days;
};

class Window
{
public:
    explicit Window(const QDate &anchor);

    const QDate &anchor() const { return m_anchor; }
    const Week &week(int index) const { return m_weeks.at(static_cast<std::size_t>(index)); }
    const std::array<Week, WeeksPerWindow> &weeks() const { return m_weeks; }
    const Week &currentWeek() const { return week(CurrentWeekIndex); }

    const QDate &firstDay() const { return m_weeks.front().firstDay(); }
    const QDate &lastDay() const { return m_weeks.back().lastDay(); }
    bool contains(const QDate &date) const;
    bool intersects(const QDate &start, const QDate &end) const;
    int weekIndexOf(const QDate &date) const;
    QVector<QDate> dates() const;

private:
    static std::array<Week, WeeksPerWindow> buildWeeks(const QDate &monday);

    QDate m_anchor;
    std::array<Week, WeeksPerWindow> m_weeks;
};

// An invalid anchor means "today".
Window computeWindow(const QDate &anchor = QDate());

} // namespace core
} // namespace rollcal
