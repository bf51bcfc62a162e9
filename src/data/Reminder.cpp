#include "reminders/data/Reminder.hpp"

namespace reminders {
namespace data {

QDateTime Recurrence::advance(const QDateTime &from, int times) const
{
    switch (unit) {
    case Unit::Days:
        return from.addDays(static_cast<qint64>(count) * times);
    case Unit::Weeks:
        return from.addDays(static_cast<qint64>(count) * times * 7);
    case Unit::Months:
        return from.addMonths(count * times);
    case Unit::None:
        break;
    }
    return from;
}

bool operator==(const Recurrence &lhs, const Recurrence &rhs)
{
    if (lhs.unit == Recurrence::Unit::None || rhs.unit == Recurrence::Unit::None) {
        return lhs.unit == rhs.unit;
    }
    return lhs.unit == rhs.unit && lhs.count == rhs.count;
}

bool operator!=(const Recurrence &lhs, const Recurrence &rhs)
{
    return !(lhs == rhs);
}

bool Reminder::isDue(const QDateTime &now) const
{
    if (completed || !dueTime.isValid()) {
        return false;
    }
    return dueTime.toUTC() <= now.toUTC();
}

} // namespace data
} // namespace reminders
