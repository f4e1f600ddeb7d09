#pragma once

#include "core/query/date_rules.h"
#include "core/query/translated_query.h"

#include <QDate>
#include <QString>

#include <memory>
#include <vector>

namespace ox {

// DateQueryTranslator: resolves relative date phrases ("yesterday", "last
// week of December", "January 1st") against a reference date.
//
// Every rule runs, in order from most to least specific. All matching rules
// contribute terms; the range comes from the first rule that resolves one,
// so "January 1st" yields a single day rather than the whole month.
class DateQueryTranslator {
public:
    DateQueryTranslator();
    explicit DateQueryTranslator(std::vector<std::unique_ptr<DateRule>> rules);

    TranslatedQuery translate(const QString& query, const QDate& referenceDate) const;

    const std::vector<std::unique_ptr<DateRule>>& rules() const { return m_rules; }

private:
    std::vector<std::unique_ptr<DateRule>> m_rules;
};

} // namespace ox
