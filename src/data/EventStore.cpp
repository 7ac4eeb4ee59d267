#include "rollcal/data/EventStore.hpp"

#include "rollcal/core/Logging.hpp"

#include <QHash>
#include <QSet>

namespace rollcal {
namespace data {

namespace {
constexpr int REQUIRED_FIELDS = 4;
constexpr auto DATE_FORMAT = "yyyy/MM/dd";
constexpr auto SHORT_DATE_FORMAT = "yyyy/M/d";

void setError(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}
} // namespace

QDate parseRecordDate(const QString &value)
{
    QDate date = QDate::fromString(value, QLatin1String(DATE_FORMAT));
    if (!date.isValid()) {
        date = QDate::fromString(value, QLatin1String(SHORT_DATE_FORMAT));
    }
    return date;
}

std::optional<VacationEvent> parseRecord(const EventRecord &record, QString *errorMessage)
{
    if (record.fields.size() < REQUIRED_FIELDS) {
        setError(errorMessage,
                 QStringLiteral("expected %1 fields, got %2").arg(REQUIRED_FIELDS).arg(record.fields.size()));
        return std::nullopt;
    }

    VacationEvent event;
    event.startDate = parseRecordDate(record.fields.at(0));
    if (!event.startDate.isValid()) {
        setError(errorMessage, QStringLiteral("invalid start date '%1'").arg(record.fields.at(0)));
        return std::nullopt;
    }
    event.endDate = parseRecordDate(record.fields.at(1));
    if (!event.endDate.isValid()) {
        setError(errorMessage, QStringLiteral("invalid end date '%1'").arg(record.fields.at(1)));
        return std::nullopt;
    }
    if (event.endDate < event.startDate) {
        setError(errorMessage,
                 QStringLiteral("end date %1 precedes start date %2")
                     .arg(event.endDate.toString(Qt::ISODate), event.startDate.toString(Qt::ISODate)));
        return std::nullopt;
    }

    event.owner = record.fields.at(2);
    if (event.owner.trimmed().isEmpty()) {
        setError(errorMessage, QStringLiteral("missing owner"));
        return std::nullopt;
    }
    event.description = record.fields.at(3);
    return event;
}

EventStore buildEvents(const std::vector<EventRecord> &records, const OwnerPalette &palette)
{
    EventStore store;
    QHash<EventKey, std::size_t> positions;

    for (const EventRecord &record : records) {
        QString error;
        auto parsed = parseRecord(record, &error);
        if (!parsed) {
            qCWarning(lcData) << "Skipping record at line" << record.lineNumber << ':' << error;
            ++store.rejectedRecords;
            continue;
        }

        const EventKey key = parsed->key();
        const auto existing = positions.constFind(key);
        if (existing != positions.constEnd()) {
            store.events[existing.value()] = std::move(*parsed);
            continue;
        }
        positions.insert(key, store.events.size());
        store.events.push_back(std::move(*parsed));
    }

    QStringList owners;
    QSet<QString> seen;
    for (const auto &event : store.events) {
        if (!seen.contains(event.owner)) {
            seen.insert(event.owner);
            owners << event.owner;
        }
    }
    store.colors = palette.assign(owners);

    qCDebug(lcData) << "Loaded" << store.events.size() << "events for" << store.colors.size() << "owners,"
                    << store.rejectedRecords << "records rejected";
    return store;
}

} // namespace data
} // namespace rollcal
