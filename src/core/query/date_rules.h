#pragma once

#include "core/query/translated_query.h"

#include <QDate>
#include <QString>

#include <memory>
#include <vector>

namespace ox {

// One recognizer/resolver pair for a family of date phrases. Rules are
// stateless; their patterns are compiled once and shared.
class DateRule {
public:
    virtual ~DateRule() = default;

    virtual QString name() const = 0;

    // Cheap check for the phrase.
    virtual bool recognizes(const QString& query) const = 0;

    // Appends terms for every phrase this rule understands and sets the range
    // if no earlier rule did. Returns true when anything was resolved.
    virtual bool resolve(const QString& query, const QDate& today,
                         TranslatedQuery& result) const = 0;
};

// ── Term helpers ────────────────────────────────────────────

namespace date_terms {

// Per-day terms in four formats: 2026-01-18, 20260118, "January 18, 2026",
// "18 January 2026". Sets the range if unset.
void addDayRange(TranslatedQuery& result, const QDate& start, const QDate& end);

// Month terms (2026-01, "January 2026", optionally "January") with the range
// [firstOfMonth, end].
void addMonth(TranslatedQuery& result, const QDate& firstOfMonth, const QDate& end,
              bool includeBareName);

// ISO-8601 week term ("2026-W03") using the ISO week-numbering year.
QString isoWeekTerm(const QDate& date);

// 1..12 for an English month name or its three-letter prefix, else 0.
int parseMonthName(const QString& name);

// 1 (Monday)..7 (Sunday) for an English weekday name, else 0.
int parseWeekdayName(const QString& name);

QDate mondayOf(const QDate& date);
QDate lastDayOfMonth(const QDate& firstOfMonth);

} // namespace date_terms

// ── Rules, in evaluation order ──────────────────────────────

// "first/last week of 2025": first or last 7 calendar days of the year.
class WeekOfYearRule : public DateRule {
public:
    QString name() const override { return QStringLiteral("week-of-year"); }
    bool recognizes(const QString& query) const override;
    bool resolve(const QString& query, const QDate& today, TranslatedQuery& result) const override;
};

// "first/last week of [last|this] <month> [year]".
class WeekOfMonthRule : public DateRule {
public:
    QString name() const override { return QStringLiteral("week-of-month"); }
    bool recognizes(const QString& query) const override;
    bool resolve(const QString& query, const QDate& today, TranslatedQuery& result) const override;

    // Year a "week of <month>" phrase refers to.
    static int resolveYear(int month, const QString& modifier, std::optional<int> explicitYear,
                           const QDate& today);
};

// "last/this/next weekend".
class WeekendRule : public DateRule {
public:
    QString name() const override { return QStringLiteral("weekend"); }
    bool recognizes(const QString& query) const override;
    bool resolve(const QString& query, const QDate& today, TranslatedQuery& result) const override;

    // Saturday of the weekend containing `today` (the coming one on weekdays).
    static QDate thisSaturday(const QDate& today);
};

// "yesterday", "today".
class RelativeDayRule : public DateRule {
public:
    QString name() const override { return QStringLiteral("relative-day"); }
    bool recognizes(const QString& query) const override;
    bool resolve(const QString& query, const QDate& today, TranslatedQuery& result) const override;
};

// "last week", "this week": Monday-aligned, plus an ISO week term.
class RelativeWeekRule : public DateRule {
public:
    QString name() const override { return QStringLiteral("relative-week"); }
    bool recognizes(const QString& query) const override;
    bool resolve(const QString& query, const QDate& today, TranslatedQuery& result) const override;
};

// "last month", "this month".
class RelativeMonthRule : public DateRule {
public:
    QString name() const override { return QStringLiteral("relative-month"); }
    bool recognizes(const QString& query) const override;
    bool resolve(const QString& query, const QDate& today, TranslatedQuery& result) const override;
};

// "N days ago", "N weeks ago", "N months ago".
class AgoRule : public DateRule {
public:
    QString name() const override { return QStringLiteral("ago"); }
    bool recognizes(const QString& query) const override;
    bool resolve(const QString& query, const QDate& today, TranslatedQuery& result) const override;
};

// "last monday" .. "last sunday".
class LastWeekdayRule : public DateRule {
public:
    QString name() const override { return QStringLiteral("last-weekday"); }
    bool recognizes(const QString& query) const override;
    bool resolve(const QString& query, const QDate& today, TranslatedQuery& result) const override;
};

// ISO, European numeric or natural-language single dates.
class SpecificDateRule : public DateRule {
public:
    QString name() const override { return QStringLiteral("specific-date"); }
    bool recognizes(const QString& query) const override;
    bool resolve(const QString& query, const QDate& today, TranslatedQuery& result) const override;

    std::optional<QDate> parse(const QString& query, const QDate& today) const;
};

// Bare month name, lowest priority.
class MonthNameRule : public DateRule {
public:
    QString name() const override { return QStringLiteral("month-name"); }
    bool recognizes(const QString& query) const override;
    bool resolve(const QString& query, const QDate& today, TranslatedQuery& result) const override;
};

// All rules, most to least specific.
std::vector<std::unique_ptr<DateRule>> makeDefaultDateRules();

} // namespace ox
