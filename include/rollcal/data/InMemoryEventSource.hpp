#pragma once

#include "rollcal/data/EventSource.hpp"

namespace rollcal {
namespace data {

class InMemoryEventSource : public EventSource
{
public:
    InMemoryEventSource();
    ~InMemoryEventSource() override;

    std::vector<EventRecord> fetchRecords() const override;

    void addRecord(const QStringList &fields);
    void addRecord(const QString &start, const QString &end, const QString &owner, const QString &description);

private:
    std::vector<EventRecord> m_records;
};

} // namespace data
} // namespace rollcal
