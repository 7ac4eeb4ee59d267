#pragma once

#include "rollcal/data/EventSource.hpp"

#include <QString>

class QTextStream;

namespace rollcal {
namespace data {

// Reads "start,end,owner,description" rows from a UTF-8 CSV file.
// The first record is a header and is skipped. A missing file yields no records.
class CsvEventSource : public EventSource
{
public:
    explicit CsvEventSource(QString filePath);
    ~CsvEventSource() override = default;

    std::vector<EventRecord> fetchRecords() const override;

    static std::vector<EventRecord> parse(QTextStream &stream);

private:
    QString m_filePath;
};

} // namespace data
} // namespace rollcal
