#pragma once

#include <QString>
#include <vector>

#include "reminders/data/Reminder.hpp"

namespace reminders {
namespace core {

// " every day", " every 3 weeks", ... or an empty string.
QString describeRecurrence(const data::Recurrence &recurrence);

// "03:00 PM on Tuesday, January 02" in local time.
QString spokenTime(const QDateTime &instant);

QString confirmation(const data::Reminder &reminder);
QString listing(const std::vector<data::Reminder> &reminders);
QString parseFailureMessage();

// Short "yyyy-MM-dd hh:mm: text" lines for a tray tooltip.
QString trayDigest(const std::vector<data::Reminder> &reminders, int limit = 5);

} // namespace core
} // namespace reminders
