#pragma once

#include <QStringList>
#include <vector>

namespace rollcal {
namespace data {

// Raw, unvalidated event row: start, end, owner, description.
struct EventRecord
{
    QStringList fields;
    int lineNumber = 0;
};

class EventSource
{
public:
    virtual ~EventSource() = default;

    virtual std::vector<EventRecord> fetchRecords() const = 0;
};

} // namespace data
} // namespace rollcal
