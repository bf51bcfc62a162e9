#include "reminders/core/ReminderPhrases.hpp"

#include <QLocale>
#include <QStringList>

namespace reminders {
namespace core {

namespace {
QString every(int count, const QString &singular, const QString &plural)
{
    if (count == 1) {
        return QStringLiteral(" every %1").arg(singular);
    }
    return QStringLiteral(" every %1 %2").arg(count).arg(plural);
}
} // namespace

QString describeRecurrence(const data::Recurrence &recurrence)
{
    if (!recurrence.isValid()) {
        return QString();
    }
    switch (recurrence.unit) {
    case data::Recurrence::Unit::Days:
        return every(recurrence.count, QStringLiteral("day"), QStringLiteral("days"));
    case data::Recurrence::Unit::Weeks:
        return every(recurrence.count, QStringLiteral("week"), QStringLiteral("weeks"));
    case data::Recurrence::Unit::Months:
        return every(recurrence.count, QStringLiteral("month"), QStringLiteral("months"));
    case data::Recurrence::Unit::None:
        break;
    }
    return QString();
}

QString spokenTime(const QDateTime &instant)
{
    return QLocale::c().toString(instant.toLocalTime(), QStringLiteral("hh:mm AP 'on' dddd, MMMM dd"));
}

QString confirmation(const data::Reminder &reminder)
{
    const QString frequency = reminder.recurring ? describeRecurrence(reminder.interval) : QString();
    return QStringLiteral("I'll remind you to %1%2 at %3.").arg(reminder.text, frequency, spokenTime(reminder.dueTime));
}

QString listing(const std::vector<data::Reminder> &reminders)
{
    if (reminders.empty()) {
        return QStringLiteral("You don't have any upcoming reminders.");
    }
    QStringList lines;
    lines << QStringLiteral("Here are your upcoming reminders:");
    int index = 1;
    for (const data::Reminder &reminder : reminders) {
        lines << QStringLiteral("%1. %2 at %3").arg(index++).arg(reminder.text, spokenTime(reminder.dueTime));
    }
    return lines.join('\n');
}

QString parseFailureMessage()
{
    return QStringLiteral("I couldn't understand the reminder details. Please try again.");
}

QString trayDigest(const std::vector<data::Reminder> &reminders, int limit)
{
    QStringList lines;
    for (const data::Reminder &reminder : reminders) {
        if (lines.size() >= limit) {
            break;
        }
        if (reminder.completed) {
            continue;
        }
        lines << QStringLiteral("%1: %2").arg(reminder.dueTime.toLocalTime().toString(QStringLiteral("yyyy-MM-dd hh:mm")),
                                             reminder.text);
    }
    return lines.join('\n');
}

} // namespace core
} // namespace reminders
