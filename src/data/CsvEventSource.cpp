#include "rollcal/data/CsvEventSource.hpp"

#include "rollcal/core/Logging.hpp"

#include <QFile>
#include <QTextStream>

namespace rollcal {
namespace data {

CsvEventSource::CsvEventSource(QString filePath)
    : m_filePath(std::move(filePath))
{
}

std::vector<EventRecord> CsvEventSource::fetchRecords() const
{
    QFile file(m_filePath);
    if (!file.exists()) {
        qCWarning(lcData) << "Event source" << m_filePath << "not found, continuing without events";
        return {};
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcData) << "Cannot open event source" << m_filePath << ':' << file.errorString();
        return {};
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    return parse(stream);
}

std::vector<EventRecord> CsvEventSource::parse(QTextStream &stream)
{
    std::vector<EventRecord> records;
    QStringList fields;
    QString field;
    bool inQuotes = false;
    bool headerSkipped = false;
    int lineNumber = 0;
    int recordLine = 0;

    auto finishRecord = [&]() {
        fields << field;
        field.clear();
        const bool blank = fields.size() == 1 && fields.front().isEmpty();
        if (!blank) {
            if (!headerSkipped) {
                headerSkipped = true;
            } else {
                EventRecord record;
                record.fields = fields;
                record.lineNumber = recordLine;
                records.push_back(std::move(record));
            }
        }
        fields.clear();
    };

    while (!stream.atEnd()) {
        const QString line = stream.readLine();
        ++lineNumber;
        if (inQuotes) {
            // Quoted field continues on the next physical line.
            field += QLatin1Char('\n');
        } else {
            recordLine = lineNumber;
        }

        for (int i = 0; i < line.size(); ++i) {
            const QChar ch = line.at(i);
            if (inQuotes) {
                if (ch == QLatin1Char('"')) {
                    if (i + 1 < line.size() && line.at(i + 1) == QLatin1Char('"')) {
                        field += ch;
                        ++i;
                    } else {
                        inQuotes = false;
                    }
                } else {
                    field += ch;
                }
            } else if (ch == QLatin1Char('"') && field.isEmpty()) {
                inQuotes = true;
            } else if (ch == QLatin1Char(',')) {
                fields << field;
                field.clear();
            } else {
                field += ch;
            }
        }

        if (!inQuotes) {
            finishRecord();
        }
    }

    if (inQuotes) {
        qCWarning(lcData) << "Unterminated quoted field in record starting at line" << recordLine;
        finishRecord();
    }
    return records;
}

} // namespace data
} // namespace rollcal
