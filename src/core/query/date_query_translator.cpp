#include "core/query/date_query_translator.h"
#include "core/shared/logging.h"

namespace ox {

DateQueryTranslator::DateQueryTranslator()
    : m_rules(makeDefaultDateRules())
{
}

DateQueryTranslator::DateQueryTranslator(std::vector<std::unique_ptr<DateRule>> rules)
    : m_rules(std::move(rules))
{
}

TranslatedQuery DateQueryTranslator::translate(const QString& query,
                                               const QDate& referenceDate) const
{
    TranslatedQuery result;
    result.originalQuery = query;
    if (query.trimmed().isEmpty() || !referenceDate.isValid()) {
        return result;
    }

    for (const auto& rule : m_rules) {
        if (!rule->recognizes(query)) {
            continue;
        }
        if (rule->resolve(query, referenceDate, result)) {
            LOG_DEBUG(oxQuery, "Date rule %s matched \"%s\"",
                      qUtf8Printable(rule->name()), qUtf8Printable(query));
        }
    }

    if (result.hasRange()) {
        LOG_DEBUG(oxQuery, "Resolved date range %s..%s (%d terms)",
                  qUtf8Printable(result.startDate->toString(Qt::ISODate)),
                  qUtf8Printable(result.endDate->toString(Qt::ISODate)),
                  static_cast<int>(result.dateTerms.size()));
    }
    return result;
}

} // namespace ox
