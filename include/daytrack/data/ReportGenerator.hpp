#pragma once

#include <QDate>
#include <QString>

namespace daytrack {
namespace data {

// Reads the finished day's record and metadata and writes its report.
class ReportGenerator
{
public:
    virtual ~ReportGenerator() = default;
    virtual bool generate(const QDate &date, QString *errorMessage = nullptr) = 0;
};

} // namespace data
} // namespace daytrack
