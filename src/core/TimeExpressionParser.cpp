#include "reminders/core/TimeExpressionParser.hpp"

#include "reminders/Logging.hpp"

#include <QRegularExpression>
#include <QStringList>
#include <QTime>

namespace reminders {
namespace core {

namespace {

constexpr int DEFAULT_DELAY_SECONDS = 60 * 60;
const QTime DEFAULT_DAY_TIME(9, 0);

struct DaySelection
{
    int offsetDays = 0;
    int rollDays = 1;
};

struct ClockTime
{
    int hour = 0;
    int minute = 0;
};

QString collapseWhitespace(QString text)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    text.replace(whitespace, QStringLiteral(" "));
    return text.trimmed();
}

data::Recurrence extractRecurrence(QString &text)
{
    struct Keyword
    {
        QRegularExpression pattern;
        data::Recurrence recurrence;
    };
    static const Keyword keywords[] = {
        { QRegularExpression(QStringLiteral("\\b(?:every\\s+day|daily)\\b")), data::Recurrence::days(1) },
        { QRegularExpression(QStringLiteral("\\b(?:every\\s+week|weekly)\\b")), data::Recurrence::weeks(1) },
        { QRegularExpression(QStringLiteral("\\b(?:every\\s+month|monthly)\\b")), data::Recurrence::months(1) },
    };
    for (const Keyword &keyword : keywords) {
        if (text.contains(keyword.pattern)) {
            text.remove(keyword.pattern);
            return keyword.recurrence;
        }
    }
    return data::Recurrence::none();
}

std::optional<DaySelection> extractDay(QString &text, const QDate &today)
{
    static const QRegularExpression relativeDay(QStringLiteral("\\b(today|tomorrow)\\b"));
    static const QRegularExpression weekday(
        QStringLiteral("\\b(?:(?:on|next)\\s+)?(monday|tuesday|wednesday|thursday|friday|saturday|sunday)\\b"));
    static const QStringList weekdayNames = {
        QStringLiteral("monday"), QStringLiteral("tuesday"), QStringLiteral("wednesday"),
        QStringLiteral("thursday"), QStringLiteral("friday"), QStringLiteral("saturday"),
        QStringLiteral("sunday"),
    };

    QRegularExpressionMatch match = relativeDay.match(text);
    if (match.hasMatch()) {
        DaySelection selection;
        selection.offsetDays = match.captured(1) == QLatin1String("tomorrow") ? 1 : 0;
        text.remove(match.capturedStart(), match.capturedLength());
        return selection;
    }

    match = weekday.match(text);
    if (match.hasMatch()) {
        const int target = weekdayNames.indexOf(match.captured(1)) + 1;
        DaySelection selection;
        selection.offsetDays = (target - today.dayOfWeek() + 7) % 7;
        selection.rollDays = 7;
        text.remove(match.capturedStart(), match.capturedLength());
        return selection;
    }
    return std::nullopt;
}

std::optional<ClockTime> toClockTime(const QRegularExpressionMatch &match)
{
    const int hour = match.captured(1).toInt();
    const int minute = match.captured(2).isEmpty() ? 0 : match.captured(2).toInt();
    const QString period = match.captured(3);
    if (minute > 59) {
        return std::nullopt;
    }
    if (period.isEmpty()) {
        if (hour > 23) {
            return std::nullopt;
        }
        return ClockTime{ hour, minute };
    }
    if (hour < 1 || hour > 12) {
        return std::nullopt;
    }
    if (period == QLatin1String("pm") && hour < 12) {
        return ClockTime{ hour + 12, minute };
    }
    if (period == QLatin1String("am") && hour == 12) {
        return ClockTime{ 0, minute };
    }
    return ClockTime{ hour, minute };
}

std::optional<ClockTime> extractClockTime(QString &text)
{
    static const QRegularExpression patterns[] = {
        QRegularExpression(QStringLiteral("\\b(?:at|by|for)\\s+(\\d{1,2})(?::(\\d{2}))?\\s*([ap]m)?\\b")),
        QRegularExpression(QStringLiteral("\\b(\\d{1,2})(?::(\\d{2}))?\\s*([ap]m)?\\b")),
    };
    for (const QRegularExpression &pattern : patterns) {
        QRegularExpressionMatchIterator it = pattern.globalMatch(text);
        while (it.hasNext()) {
            const QRegularExpressionMatch match = it.next();
            const std::optional<ClockTime> clock = toClockTime(match);
            if (!clock) {
                qCDebug(lcParser) << "Ignoring out-of-range time" << match.captured(0);
                continue;
            }
            qCDebug(lcParser) << "Matched time expression" << match.captured(0);
            text.remove(match.capturedStart(), match.capturedLength());
            return clock;
        }
    }
    return std::nullopt;
}

QString stripTriggerPhrases(QString text)
{
    static const QRegularExpression leadingTrigger(QStringLiteral(
        "^(?:please\\s+)?(?:remind\\s+me(?:\\s+to)?|set\\s+(?:a\\s+)?reminder(?:\\s+(?:to|for))?)\\b\\s*"));
    static const QRegularExpression leadingFiller(QStringLiteral("^(?:that|to)\\b\\s*"));
    static const QRegularExpression edgePunctuation(QStringLiteral("^[\\s.,!?;:]+|[\\s.,!?;:]+$"));

    text = collapseWhitespace(text);
    QString previous;
    while (previous != text) {
        previous = text;
        text.remove(leadingTrigger);
        text.remove(leadingFiller);
        text = text.trimmed();
    }
    text.remove(edgePunctuation);
    return collapseWhitespace(text);
}

} // namespace

std::optional<ParsedReminder> parseReminderText(const QString &rawText, const QDateTime &now)
{
    const QDateTime anchor = now.toUTC();
    QString text = rawText.toLower();

    ParsedReminder parsed;
    parsed.recurrence = extractRecurrence(text);

    const std::optional<DaySelection> day = extractDay(text, anchor.date());
    const QDate targetDate = anchor.date().addDays(day ? day->offsetDays : 0);

    const std::optional<ClockTime> clock = extractClockTime(text);
    if (clock) {
        QDateTime due(targetDate, QTime(clock->hour, clock->minute), Qt::UTC);
        if (due <= anchor) {
            due = due.addDays(day ? day->rollDays : 1);
        }
        parsed.dueTime = due;
    } else if (day && day->offsetDays > 0) {
        parsed.dueTime = QDateTime(targetDate, DEFAULT_DAY_TIME, Qt::UTC);
    } else if (day && day->rollDays > 1) {
        // A weekday naming today means the same weekday next week.
        parsed.dueTime = QDateTime(targetDate.addDays(day->rollDays), DEFAULT_DAY_TIME, Qt::UTC);
    } else {
        parsed.dueTime = anchor.addSecs(DEFAULT_DELAY_SECONDS);
    }

    parsed.text = stripTriggerPhrases(text);
    if (parsed.text.isEmpty()) {
        qCDebug(lcParser) << "Nothing to remind about in" << rawText;
        return std::nullopt;
    }
    return parsed;
}

} // namespace core
} // namespace reminders
