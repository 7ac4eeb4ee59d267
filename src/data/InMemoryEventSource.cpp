#include "rollcal/data/InMemoryEventSource.hpp"

namespace rollcal {
namespace data {

InMemoryEventSource::InMemoryEventSource() = default;
InMemoryEventSource::~InMemoryEventSource() = default;

std::vector<EventRecord> InMemoryEventSource::fetchRecords() const
{
    return m_records;
}

void InMemoryEventSource::addRecord(const QStringList &fields)
{
    EventRecord record;
    record.fields = fields;
    record.lineNumber = static_cast<int>(m_records.size()) + 1;
    m_records.push_back(std::move(record));
}

void InMemoryEventSource::addRecord(const QString &start,
                                    const QString &end,
                                    const QString &owner,
                                    const QString &description)
{
    addRecord(QStringList{ start, end, owner, description });
}

} // namespace data
} // namespace rollcal
