#include "core/query/date_rules.h"

#include <QLocale>
#include <QRegularExpression>

#include <algorithm>

namespace ox {

namespace {

struct NameEntry {
    const char* name;
    int value;
};

constexpr NameEntry kMonths[] = {
    {"january", 1},   {"february", 2},  {"march", 3},
    {"april", 4},     {"may", 5},       {"june", 6},
    {"july", 7},      {"august", 8},    {"september", 9},
    {"october", 10},  {"november", 11}, {"december", 12},
};

constexpr NameEntry kWeekdays[] = {
    {"monday", 1}, {"tuesday", 2}, {"wednesday", 3}, {"thursday", 4},
    {"friday", 5}, {"saturday", 6}, {"sunday", 7},
};

QRegularExpression caseless(const QString& pattern)
{
    return QRegularExpression(pattern, QRegularExpression::CaseInsensitiveOption);
}

QRegularExpression caseless(const char* pattern)
{
    return caseless(QString::fromLatin1(pattern));
}

const QString& monthAlternation()
{
    static const QString names = QStringLiteral(
        "january|february|march|april|may|june|july|august|september|october|november|december");
    return names;
}

const QString& weekdayAlternation()
{
    static const QString names =
        QStringLiteral("monday|tuesday|wednesday|thursday|friday|saturday|sunday");
    return names;
}

const QRegularExpression& weekOfYearPattern()
{
    static const QRegularExpression re = caseless(R"(\b(first|last)\s+week\s+of\s+(\d{4})\b)");
    return re;
}

const QRegularExpression& weekOfMonthPattern()
{
    static const QRegularExpression re = caseless(
        QStringLiteral(R"(\b(first|last)\s+week\s+of\s+(?:(last|this)\s+)?(%1)(?:\s+(\d{4}))?\b)")
            .arg(monthAlternation()));
    return re;
}

const QRegularExpression& weekendPattern()
{
    static const QRegularExpression re = caseless(R"(\b(last|this|next)\s+weekend\b)");
    return re;
}

const QRegularExpression& yesterdayPattern()
{
    static const QRegularExpression re = caseless(R"(\byesterday\b)");
    return re;
}

const QRegularExpression& todayPattern()
{
    static const QRegularExpression re = caseless(R"(\btoday\b)");
    return re;
}

const QRegularExpression& lastWeekPattern()
{
    static const QRegularExpression re = caseless(R"(\blast\s+week\b(?!\s+of\b))");
    return re;
}

const QRegularExpression& thisWeekPattern()
{
    static const QRegularExpression re = caseless(R"(\bthis\s+week\b)");
    return re;
}

const QRegularExpression& lastMonthPattern()
{
    static const QRegularExpression re = caseless(R"(\blast\s+month\b)");
    return re;
}

const QRegularExpression& thisMonthPattern()
{
    static const QRegularExpression re = caseless(R"(\bthis\s+month\b)");
    return re;
}

const QRegularExpression& daysAgoPattern()
{
    static const QRegularExpression re = caseless(R"(\b(\d{1,5})\s+days?\s+ago\b)");
    return re;
}

const QRegularExpression& weeksAgoPattern()
{
    static const QRegularExpression re = caseless(R"(\b(\d{1,4})\s+weeks?\s+ago\b)");
    return re;
}

const QRegularExpression& monthsAgoPattern()
{
    static const QRegularExpression re = caseless(R"(\b(\d{1,4})\s+months?\s+ago\b)");
    return re;
}

const QRegularExpression& lastWeekdayPattern()
{
    static const QRegularExpression re =
        caseless(QStringLiteral(R"(\blast\s+(%1)\b)").arg(weekdayAlternation()));
    return re;
}

const QRegularExpression& isoDatePattern()
{
    static const QRegularExpression re(QStringLiteral(R"(\b(\d{4})-(\d{2})-(\d{2})\b)"));
    return re;
}

const QRegularExpression& europeanDatePattern()
{
    static const QRegularExpression re(QStringLiteral(R"(\b(\d{1,2})[./](\d{1,2})[./](\d{4})\b)"));
    return re;
}

// Groups: 1=day, 2=month (day first); 3=month, 4=day (month first).
const QRegularExpression& naturalDatePattern()
{
    static const QRegularExpression re = caseless(
        QStringLiteral(R"(\b(?:(\d{1,2})(?:st|nd|rd|th)?\s+(%1)|(%1)\s+(\d{1,2})(?:st|nd|rd|th)?)\b)")
            .arg(monthAlternation()));
    return re;
}

const QRegularExpression& monthNamePattern()
{
    static const QRegularExpression re =
        caseless(QStringLiteral(R"(\b(%1)\b)").arg(monthAlternation()));
    return re;
}

QDate clampedDate(int year, int month, int day)
{
    const QDate first(year, month, 1);
    return QDate(year, month, std::min(day, first.daysInMonth()));
}

} // namespace

// ── Term helpers ────────────────────────────────────────────

namespace date_terms {

void addDayRange(TranslatedQuery& result, const QDate& start, const QDate& end)
{
    if (!start.isValid() || !end.isValid() || start > end) {
        return;
    }
    result.setRangeIfUnset(start, end);

    const QLocale english = QLocale::c();
    for (QDate d = start; d <= end; d = d.addDays(1)) {
        result.dateTerms.append(d.toString(QStringLiteral("yyyy-MM-dd")));
        result.dateTerms.append(d.toString(QStringLiteral("yyyyMMdd")));
        result.dateTerms.append(english.toString(d, QStringLiteral("MMMM d, yyyy")));
        result.dateTerms.append(english.toString(d, QStringLiteral("d MMMM yyyy")));
    }
}

void addMonth(TranslatedQuery& result, const QDate& firstOfMonth, const QDate& end,
              bool includeBareName)
{
    if (!firstOfMonth.isValid() || !end.isValid() || firstOfMonth > end) {
        return;
    }
    result.setRangeIfUnset(firstOfMonth, end);

    const QLocale english = QLocale::c();
    result.dateTerms.append(firstOfMonth.toString(QStringLiteral("yyyy-MM")));
    result.dateTerms.append(english.toString(firstOfMonth, QStringLiteral("MMMM yyyy")));
    if (includeBareName) {
        result.dateTerms.append(english.toString(firstOfMonth, QStringLiteral("MMMM")));
    }
}

QString isoWeekTerm(const QDate& date)
{
    int weekYear = 0;
    const int week = date.weekNumber(&weekYear);
    return QStringLiteral("%1-W%2").arg(weekYear).arg(week, 2, 10, QLatin1Char('0'));
}

int parseMonthName(const QString& name)
{
    const QString lower = name.trimmed().toLower();
    if (lower.size() < 3) {
        return 0;
    }
    for (const NameEntry& entry : kMonths) {
        if (QLatin1String(entry.name).startsWith(lower) || lower.startsWith(QLatin1String(entry.name))) {
            return entry.value;
        }
    }
    return 0;
}

int parseWeekdayName(const QString& name)
{
    const QString lower = name.trimmed().toLower();
    for (const NameEntry& entry : kWeekdays) {
        if (lower == QLatin1String(entry.name)) {
            return entry.value;
        }
    }
    return 0;
}

QDate mondayOf(const QDate& date)
{
    return date.addDays(-(date.dayOfWeek() - 1));
}

QDate lastDayOfMonth(const QDate& firstOfMonth)
{
    return firstOfMonth.addMonths(1).addDays(-1);
}

} // namespace date_terms

using namespace date_terms;

// ── Week of year ────────────────────────────────────────────

bool WeekOfYearRule::recognizes(const QString& query) const
{
    return weekOfYearPattern().match(query).hasMatch();
}

bool WeekOfYearRule::resolve(const QString& query, const QDate& /*today*/,
                             TranslatedQuery& result) const
{
    const QRegularExpressionMatch m = weekOfYearPattern().match(query);
    if (!m.hasMatch()) {
        return false;
    }
    const int year = m.captured(2).toInt();
    QDate start;
    QDate end;
    if (m.captured(1).compare(QLatin1String("last"), Qt::CaseInsensitive) == 0) {
        end = QDate(year, 12, 31);
        start = end.addDays(-6);
    } else {
        start = QDate(year, 1, 1);
        end = start.addDays(6);
    }
    if (!start.isValid() || !end.isValid()) {
        return false;
    }
    addDayRange(result, start, end);
    return true;
}

// ── Week of month ───────────────────────────────────────────

bool WeekOfMonthRule::recognizes(const QString& query) const
{
    return weekOfMonthPattern().match(query).hasMatch();
}

int WeekOfMonthRule::resolveYear(int month, const QString& modifier,
                                 std::optional<int> explicitYear, const QDate& today)
{
    if (explicitYear) {
        return *explicitYear;
    }
    if (modifier == QLatin1String("this")) {
        return today.year();
    }
    if (modifier == QLatin1String("last")) {
        // Most recent occurrence strictly before the current month.
        return month >= today.month() ? today.year() - 1 : today.year();
    }
    return month > today.month() ? today.year() - 1 : today.year();
}

bool WeekOfMonthRule::resolve(const QString& query, const QDate& today,
                              TranslatedQuery& result) const
{
    const QRegularExpressionMatch m = weekOfMonthPattern().match(query);
    if (!m.hasMatch()) {
        return false;
    }
    const int month = parseMonthName(m.captured(3));
    if (month == 0) {
        return false;
    }
    std::optional<int> explicitYear;
    if (!m.captured(4).isEmpty()) {
        explicitYear = m.captured(4).toInt();
    }
    const int year = resolveYear(month, m.captured(2).toLower(), explicitYear, today);

    const QDate first(year, month, 1);
    if (!first.isValid()) {
        return false;
    }
    const QDate last = lastDayOfMonth(first);
    QDate start;
    QDate end;
    if (m.captured(1).compare(QLatin1String("last"), Qt::CaseInsensitive) == 0) {
        end = last;
        start = end.addDays(-6);
    } else {
        start = first;
        end = start.addDays(6);
    }
    addDayRange(result, start, end);
    return true;
}

// ── Weekend ─────────────────────────────────────────────────

bool WeekendRule::recognizes(const QString& query) const
{
    return weekendPattern().match(query).hasMatch();
}

QDate WeekendRule::thisSaturday(const QDate& today)
{
    const int dow = today.dayOfWeek();
    if (dow == Qt::Sunday) {
        return today.addDays(-1);
    }
    return today.addDays(Qt::Saturday - dow);
}

bool WeekendRule::resolve(const QString& query, const QDate& today,
                          TranslatedQuery& result) const
{
    const QRegularExpressionMatch m = weekendPattern().match(query);
    if (!m.hasMatch()) {
        return false;
    }
    const QString modifier = m.captured(1).toLower();
    const QDate current = thisSaturday(today);

    QDate saturday;
    if (modifier == QLatin1String("last")) {
        saturday = current.addDays(-7);
    } else if (modifier == QLatin1String("next")) {
        // First Saturday strictly after today.
        saturday = current > today ? current : current.addDays(7);
    } else {
        saturday = current;
    }
    addDayRange(result, saturday, saturday.addDays(1));
    return true;
}

// ── Yesterday / today ───────────────────────────────────────

bool RelativeDayRule::recognizes(const QString& query) const
{
    return yesterdayPattern().match(query).hasMatch() || todayPattern().match(query).hasMatch();
}

bool RelativeDayRule::resolve(const QString& query, const QDate& today,
                              TranslatedQuery& result) const
{
    bool resolved = false;
    if (yesterdayPattern().match(query).hasMatch()) {
        const QDate yesterday = today.addDays(-1);
        addDayRange(result, yesterday, yesterday);
        resolved = true;
    }
    if (todayPattern().match(query).hasMatch()) {
        addDayRange(result, today, today);
        resolved = true;
    }
    return resolved;
}

// ── Last / this week ────────────────────────────────────────

bool RelativeWeekRule::recognizes(const QString& query) const
{
    return lastWeekPattern().match(query).hasMatch() || thisWeekPattern().match(query).hasMatch();
}

bool RelativeWeekRule::resolve(const QString& query, const QDate& today,
                               TranslatedQuery& result) const
{
    bool resolved = false;
    if (lastWeekPattern().match(query).hasMatch()) {
        const QDate monday = mondayOf(today).addDays(-7);
        result.dateTerms.append(isoWeekTerm(monday));
        addDayRange(result, monday, monday.addDays(6));
        resolved = true;
    }
    if (thisWeekPattern().match(query).hasMatch()) {
        const QDate monday = mondayOf(today);
        result.dateTerms.append(isoWeekTerm(monday));
        addDayRange(result, monday, today);
        resolved = true;
    }
    return resolved;
}

// ── Last / this month ───────────────────────────────────────

bool RelativeMonthRule::recognizes(const QString& query) const
{
    return lastMonthPattern().match(query).hasMatch() || thisMonthPattern().match(query).hasMatch();
}

bool RelativeMonthRule::resolve(const QString& query, const QDate& today,
                                TranslatedQuery& result) const
{
    const QDate firstOfThisMonth(today.year(), today.month(), 1);
    bool resolved = false;
    if (lastMonthPattern().match(query).hasMatch()) {
        const QDate first = firstOfThisMonth.addMonths(-1);
        addMonth(result, first, lastDayOfMonth(first), false);
        resolved = true;
    }
    if (thisMonthPattern().match(query).hasMatch()) {
        addMonth(result, firstOfThisMonth, today, false);
        resolved = true;
    }
    return resolved;
}

// ── N days / weeks / months ago ─────────────────────────────

bool AgoRule::recognizes(const QString& query) const
{
    return daysAgoPattern().match(query).hasMatch()
        || weeksAgoPattern().match(query).hasMatch()
        || monthsAgoPattern().match(query).hasMatch();
}

bool AgoRule::resolve(const QString& query, const QDate& today, TranslatedQuery& result) const
{
    bool resolved = false;

    const QRegularExpressionMatch days = daysAgoPattern().match(query);
    if (days.hasMatch()) {
        const QDate target = today.addDays(-days.captured(1).toInt());
        addDayRange(result, target, target);
        resolved = true;
    }

    const QRegularExpressionMatch weeks = weeksAgoPattern().match(query);
    if (weeks.hasMatch()) {
        const QDate monday = mondayOf(today).addDays(-7LL * weeks.captured(1).toInt());
        result.dateTerms.append(isoWeekTerm(monday));
        addDayRange(result, monday, monday.addDays(6));
        resolved = true;
    }

    const QRegularExpressionMatch months = monthsAgoPattern().match(query);
    if (months.hasMatch()) {
        const QDate first = QDate(today.year(), today.month(), 1)
                                .addMonths(-months.captured(1).toInt());
        addMonth(result, first, lastDayOfMonth(first), false);
        resolved = true;
    }

    return resolved;
}

// ── Last <weekday> ──────────────────────────────────────────

bool LastWeekdayRule::recognizes(const QString& query) const
{
    return lastWeekdayPattern().match(query).hasMatch();
}

bool LastWeekdayRule::resolve(const QString& query, const QDate& today,
                              TranslatedQuery& result) const
{
    const QRegularExpressionMatch m = lastWeekdayPattern().match(query);
    if (!m.hasMatch()) {
        return false;
    }
    const int target = parseWeekdayName(m.captured(1));
    if (target == 0) {
        return false;
    }
    int daysBack = (7 + today.dayOfWeek() - target) % 7;
    if (daysBack == 0) {
        daysBack = 7;
    }
    const QDate date = today.addDays(-daysBack);
    addDayRange(result, date, date);
    return true;
}

// ── Specific date ───────────────────────────────────────────

bool SpecificDateRule::recognizes(const QString& query) const
{
    return isoDatePattern().match(query).hasMatch()
        || europeanDatePattern().match(query).hasMatch()
        || naturalDatePattern().match(query).hasMatch();
}

std::optional<QDate> SpecificDateRule::parse(const QString& query, const QDate& today) const
{
    const QRegularExpressionMatch iso = isoDatePattern().match(query);
    if (iso.hasMatch()) {
        const QDate date(iso.captured(1).toInt(), iso.captured(2).toInt(), iso.captured(3).toInt());
        if (date.isValid()) {
            return date;
        }
    }

    const QRegularExpressionMatch european = europeanDatePattern().match(query);
    if (european.hasMatch()) {
        const int day = european.captured(1).toInt();
        const int month = european.captured(2).toInt();
        const int year = european.captured(3).toInt();
        // QDate rejects days past the end of the month.
        const QDate date(year, month, day);
        if (date.isValid()) {
            return date;
        }
    }

    const QRegularExpressionMatch natural = naturalDatePattern().match(query);
    if (natural.hasMatch()) {
        const bool dayFirst = !natural.captured(1).isEmpty();
        const int day = (dayFirst ? natural.captured(1) : natural.captured(4)).toInt();
        const int month = parseMonthName(dayFirst ? natural.captured(2) : natural.captured(3));
        if (day >= 1 && day <= 31 && month != 0) {
            QDate date = clampedDate(today.year(), month, day);
            if (date > today) {
                date = clampedDate(today.year() - 1, month, day);
            }
            return date;
        }
    }

    return std::nullopt;
}

bool SpecificDateRule::resolve(const QString& query, const QDate& today,
                               TranslatedQuery& result) const
{
    const std::optional<QDate> date = parse(query, today);
    if (!date) {
        return false;
    }
    addDayRange(result, *date, *date);
    return true;
}

// ── Bare month name ─────────────────────────────────────────

bool MonthNameRule::recognizes(const QString& query) const
{
    return monthNamePattern().match(query).hasMatch();
}

bool MonthNameRule::resolve(const QString& query, const QDate& today,
                            TranslatedQuery& result) const
{
    const QRegularExpressionMatch m = monthNamePattern().match(query);
    if (!m.hasMatch()) {
        return false;
    }
    const int month = parseMonthName(m.captured(1));
    if (month == 0) {
        return false;
    }
    const int year = month > today.month() ? today.year() - 1 : today.year();
    const QDate first(year, month, 1);
    QDate end = lastDayOfMonth(first);
    if (year == today.year() && month == today.month()) {
        end = today;
    }
    addMonth(result, first, end, true);
    return true;
}

// ── Registry ────────────────────────────────────────────────

std::vector<std::unique_ptr<DateRule>> makeDefaultDateRules()
{
    std::vector<std::unique_ptr<DateRule>> rules;
    rules.push_back(std::make_unique<WeekOfYearRule>());
    rules.push_back(std::make_unique<WeekOfMonthRule>());
    rules.push_back(std::make_unique<WeekendRule>());
    rules.push_back(std::make_unique<RelativeDayRule>());
    rules.push_back(std::make_unique<RelativeWeekRule>());
    rules.push_back(std::make_unique<RelativeMonthRule>());
    rules.push_back(std::make_unique<AgoRule>());
    rules.push_back(std::make_unique<LastWeekdayRule>());
    rules.push_back(std::make_unique<SpecificDateRule>());
    rules.push_back(std::make_unique<MonthNameRule>());
    return rules;
}

} // namespace ox
