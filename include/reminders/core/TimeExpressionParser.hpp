#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

#include "reminders/data/Reminder.hpp"

namespace reminders {
namespace core {

struct ParsedReminder
{
    QString text;
    QDateTime dueTime;
    data::Recurrence recurrence;

    bool recurring() const { return recurrence.isValid(); }
};

// Turns requests such as "remind me every day at 8am to take my medicine"
// into structured fields. Understands a recurrence keyword (daily, weekly,
// monthly), a day keyword (today, tomorrow, a weekday) and a clock time
// (hour[:minute][am|pm], optionally after "at", "by" or "for"). Due times are
// UTC and always strictly after `now`; without a clock time the reminder is
// due an hour from `now`, or at 09:00 on a later day named by a day keyword.
// A weekday naming today refers to next week.
//
// Returns std::nullopt when nothing is left to remind about.
std::optional<ParsedReminder> parseReminderText(const QString &rawText, const QDateTime &now);

} // namespace core
} // namespace reminders
