#include <QtTest/QtTest>

#include "rollcal/core/BandSynthesizer.hpp"
#include "rollcal/data/OwnerPalette.hpp"

using namespace rollcal;

namespace {

data::VacationEvent makeEvent(const QString &owner,
                              const QDate &start,
                              const QDate &end,
                              const QString &description = QString())
{
    data::VacationEvent event;
    event.owner = owner;
    event.startDate = start;
    event.endDate = end;
    event.description = description;
    return event;
}

} // namespace

class BandSynthesizerTest : public QObject
{
    Q_OBJECT

private slots:
    void labelText();
    void splitsAtWeekBoundary();
    void coversClippedRangeWithoutGaps();
    void oneBandPerEventAndWeek();
    void bandsCarryRowAndColor();
};

void BandSynthesizerTest::labelText()
{
    QCOMPARE(core::bandLabel(makeEvent("Alice", QDate(2024, 3, 1), QDate(2024, 3, 1))), QStringLiteral("Alice"));
    QCOMPARE(core::bandLabel(makeEvent("Alice", QDate(2024, 3, 1), QDate(2024, 3, 1), "  ")),
             QStringLiteral("Alice"));
    QCOMPARE(core::bandLabel(makeEvent("Alice", QDate(2024, 3, 1), QDate(2024, 3, 1), "Ski trip")),
             QStringLiteral("Alice: Ski trip"));
    QCOMPARE(core::bandLabel(makeEvent("Alice", QDate(2024, 3, 1), QDate(2024, 3, 1), "123456789012345")),
             QStringLiteral("Alice: 123456789012345"));
    QCOMPARE(core::bandLabel(makeEvent("Alice", QDate(2024, 3, 1), QDate(2024, 3, 1), "1234567890123456")),
             QStringLiteral("Alice: 123456789012345..."));

    // U+20BB7 takes two UTF-16 units but counts as one character.
    const QString wide = QString::fromUcs4(U"\U00020BB7", 1);
    QCOMPARE(core::bandLabel(makeEvent("A", QDate(2024, 3, 1), QDate(2024, 3, 1), "abcdefghijklmn" + wide)),
             "A: abcdefghijklmn" + wide);
    QCOMPARE(core::bandLabel(makeEvent("A", QDate(2024, 3, 1), QDate(2024, 3, 1), "abcdefghijklmn" + wide + "z")),
             "A: abcdefghijklmn" + wide + "...");
    QCOMPARE(core::bandLabel(makeEvent("A", QDate(2024, 3, 1), QDate(2024, 3, 1), "abcdefghijklmno" + wide)),
             QStringLiteral("A: abcdefghijklmno..."));
}

void BandSynthesizerTest::splitsAtWeekBoundary()
{
    const auto window = core::computeWindow(QDate(2024, 3, 15));
    std::vector<data::VacationEvent> events = {
        makeEvent("A", QDate(2024, 3, 16), QDate(2024, 3, 19), "Trip"),
    };
    const auto packing = core::pack(events, window);
    const auto bands = core::synthesizeBands(events, packing, window, {});

    QCOMPARE(bands.size(), static_cast<size_t>(2));
    QCOMPARE(bands[0].weekIndex, 1);
    QCOMPARE(bands[0].firstDayIndex, 5);
    QCOMPARE(bands[0].lengthInDays, 2);
    QCOMPARE(bands[0].label, QStringLiteral("A: Trip"));
    QCOMPARE(bands[1].weekIndex, 2);
    QCOMPARE(bands[1].firstDayIndex, 0);
    QCOMPARE(bands[1].lengthInDays, 2);
    QCOMPARE(bands[1].label, QStringLiteral("A: Trip"));
}

void BandSynthesizerTest::coversClippedRangeWithoutGaps()
{
    const auto window = core::computeWindow(QDate(2024, 3, 15));
    std::vector<data::VacationEvent> events = {
        makeEvent("A", QDate(2024, 2, 28), QDate(2024, 4, 3)),
        makeEvent("B", QDate(2024, 3, 6), QDate(2024, 3, 22)),
    };
    const auto packing = core::pack(events, window);
    const auto bands = core::synthesizeBands(events, packing, window, {});

    for (const auto &event : events) {
        std::vector<core::Band> own;
        for (const auto &band : bands) {
            if (band.eventKey == event.key()) {
                own.push_back(band);
            }
        }
        QVERIFY(!own.empty());
        QCOMPARE(own.front().firstDate, qMax(event.startDate, window.firstDay()));
        QCOMPARE(own.back().lastDate, qMin(event.endDate, window.lastDay()));
        for (std::size_t i = 1; i < own.size(); ++i) {
            QCOMPARE(own[i - 1].lastDate.addDays(1), own[i].firstDate);
        }
        for (const auto &band : own) {
            QCOMPARE(static_cast<int>(band.firstDate.daysTo(band.lastDate)) + 1, band.lengthInDays);
            QCOMPARE(band.row, event.row);
        }
    }
    // A spans all four weeks, B three.
    QCOMPARE(bands.size(), static_cast<size_t>(7));
}

void BandSynthesizerTest::oneBandPerEventAndWeek()
{
    const auto window = core::computeWindow(QDate(2024, 3, 15));
    std::vector<data::VacationEvent> events = {
        makeEvent("A", QDate(2024, 3, 11), QDate(2024, 3, 17)),
        makeEvent("B", QDate(2024, 3, 12), QDate(2024, 3, 13)),
        makeEvent("C", QDate(2024, 3, 14), QDate(2024, 3, 14)),
    };
    const auto packing = core::pack(events, window);
    const auto bands = core::synthesizeBands(events, packing, window, {});

    QCOMPARE(bands.size(), static_cast<size_t>(3));
    QCOMPARE(bands[0].owner, QStringLiteral("A"));
    QCOMPARE(bands[0].lengthInDays, 7);
    QCOMPARE(bands[1].owner, QStringLiteral("B"));
    QCOMPARE(bands[1].row, 1);
    QCOMPARE(bands[2].owner, QStringLiteral("C"));
    QCOMPARE(bands[2].row, 1);
}

void BandSynthesizerTest::bandsCarryRowAndColor()
{
    const auto window = core::computeWindow(QDate(2024, 3, 15));
    std::vector<data::VacationEvent> events = {
        makeEvent("Bob", QDate(2024, 3, 10), QDate(2024, 3, 12)),
        makeEvent("Bob", QDate(2024, 3, 11), QDate(2024, 3, 13)),
        makeEvent("Zed", QDate(2024, 3, 20), QDate(2024, 3, 20)),
    };
    data::OwnerColorMap colors;
    colors.insert(QStringLiteral("Bob"), QColor(Qt::red));

    const auto packing = core::pack(events, window);
    const auto bands = core::synthesizeBands(events, packing, window, colors);

    // Week 0 holds only Sunday the 10th; week 1 holds both continuations.
    QCOMPARE(bands.size(), static_cast<size_t>(4));
    QCOMPARE(bands[0].weekIndex, 0);
    QCOMPARE(bands[0].lengthInDays, 1);
    QCOMPARE(bands[1].weekIndex, 1);
    QCOMPARE(bands[1].row, 0);
    QCOMPARE(bands[1].lengthInDays, 2);
    QCOMPARE(bands[2].row, 1);
    QCOMPARE(bands[2].lengthInDays, 3);
    QCOMPARE(bands[1].color, QColor(Qt::red));
    QCOMPARE(bands[3].owner, QStringLiteral("Zed"));
    QCOMPARE(bands[3].color, data::OwnerPalette::fallbackColor());
}

QTEST_GUILESS_MAIN(BandSynthesizerTest)
#include "BandSynthesizerTest.moc"
