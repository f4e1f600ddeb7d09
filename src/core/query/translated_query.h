#pragma once

#include <QDate>
#include <QString>
#include <QStringList>

#include <optional>

namespace ox {

// Query with its relative date phrases resolved to concrete terms and,
// when some rule matched, a date range. Start and end are inclusive.
struct TranslatedQuery {
    QString originalQuery;
    QStringList dateTerms;
    std::optional<QDate> startDate;
    std::optional<QDate> endDate;

    bool hasRange() const { return startDate.has_value() && endDate.has_value(); }

    // First resolved range wins; later rules only contribute terms.
    void setRangeIfUnset(const QDate& start, const QDate& end)
    {
        if (!startDate) {
            startDate = start;
        }
        if (!endDate) {
            endDate = end;
        }
    }

    QString combinedQuery() const
    {
        if (dateTerms.isEmpty()) {
            return originalQuery;
        }
        return originalQuery + QLatin1Char(' ') + dateTerms.join(QLatin1Char(' '));
    }
};

} // namespace ox
