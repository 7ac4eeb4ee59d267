#include <QtTest/QtTest>

#include "rollcal/core/WeekWindow.hpp"

using namespace rollcal::core;

class WeekWindowTest : public QObject
{
    Q_OBJECT

private slots:
    void weekdayIndexStartsOnMonday();
    void currentWeekContainsAnchor_data();
    void currentWeekContainsAnchor();
    void windowForFriday();
    void crossesYearBoundary();
    void weekLookup();
    void invalidAnchorUsesToday();
};

void WeekWindowTest::weekdayIndexStartsOnMonday()
{
    QCOMPARE(weekdayIndex(QDate(2024, 3, 11)), 0);
    QCOMPARE(weekdayIndex(QDate(2024, 3, 15)), 4);
    QCOMPARE(weekdayIndex(QDate(2024, 3, 17)), 6);
    QCOMPARE(alignToWeekStart(QDate(2024, 3, 17)), QDate(2024, 3, 11));
    QCOMPARE(alignToWeekStart(QDate(2024, 3, 11)), QDate(2024, 3, 11));
}

void WeekWindowTest::currentWeekContainsAnchor_data()
{
    QTest::addColumn<QDate>("anchor");

    QTest::newRow("monday") << QDate(2024, 3, 11);
    QTest::newRow("sunday") << QDate(2024, 3, 17);
    QTest::newRow("leap day") << QDate(2024, 2, 29);
    QTest::newRow("new year") << QDate(2025, 1, 1);
    QTest::newRow("month end") << QDate(2023, 4, 30);
}

void WeekWindowTest::currentWeekContainsAnchor()
{
    QFETCH(QDate, anchor);

    const Window window = computeWindow(anchor);
    QCOMPARE(window.anchor(), anchor);
    QVERIFY(window.currentWeek().firstDay() <= anchor);
    QVERIFY(anchor <= window.currentWeek().lastDay());
    QCOMPARE(window.firstDay().daysTo(window.lastDay()), qint64(DaysPerWindow - 1));

    const QVector<QDate> dates = window.dates();
    QCOMPARE(dates.size(), DaysPerWindow);
    for (int i = 1; i < dates.size(); ++i) {
        QCOMPARE(dates.at(i - 1).addDays(1), dates.at(i));
    }
    for (const Week &week : window.weeks()) {
        QCOMPARE(weekdayIndex(week.firstDay()), 0);
        QCOMPARE(weekdayIndex(week.lastDay()), 6);
    }
}

void WeekWindowTest::windowForFriday()
{
    const Window window = computeWindow(QDate(2024, 3, 15));
    QCOMPARE(window.currentWeek().firstDay(), QDate(2024, 3, 11));
    QCOMPARE(window.currentWeek().lastDay(), QDate(2024, 3, 17));
    QCOMPARE(window.week(0).firstDay(), QDate(2024, 3, 4));
    QCOMPARE(window.week(2).firstDay(), QDate(2024, 3, 18));
    QCOMPARE(window.week(3).firstDay(), QDate(2024, 3, 25));
    QCOMPARE(window.firstDay(), QDate(2024, 3, 4));
    QCOMPARE(window.lastDay(), QDate(2024, 3, 31));
}

void WeekWindowTest::crossesYearBoundary()
{
    const Window window = computeWindow(QDate(2025, 1, 1));
    QCOMPARE(window.currentWeek().firstDay(), QDate(2024, 12, 30));
    QCOMPARE(window.firstDay(), QDate(2024, 12, 23));
    QCOMPARE(window.lastDay(), QDate(2025, 1, 19));
}

void WeekWindowTest::weekLookup()
{
    const Window window = computeWindow(QDate(2024, 3, 15));
    QCOMPARE(window.weekIndexOf(QDate(2024, 3, 4)), 0);
    QCOMPARE(window.weekIndexOf(QDate(2024, 3, 17)), 1);
    QCOMPARE(window.weekIndexOf(QDate(2024, 3, 31)), 3);
    QCOMPARE(window.weekIndexOf(QDate(2024, 4, 1)), -1);
    QVERIFY(window.intersects(QDate(2024, 2, 1), QDate(2024, 3, 4)));
    QVERIFY(!window.intersects(QDate(2024, 2, 1), QDate(2024, 3, 3)));
    QVERIFY(!window.intersects(QDate(2024, 4, 1), QDate(2024, 4, 2)));
}

void WeekWindowTest::invalidAnchorUsesToday()
{
    const Window window = computeWindow(QDate());
    QVERIFY(window.currentWeek().contains(QDate::currentDate()));
}

QTEST_GUILESS_MAIN(WeekWindowTest)
#include "WeekWindowTest.moc"
