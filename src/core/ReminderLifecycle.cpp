#include "reminders/core/ReminderLifecycle.hpp"

#include <algorithm>

namespace reminders {
namespace core {

void markCompleted(data::Reminder &reminder, const QDateTime &firedAt)
{
    if (reminder.completed) {
        return;
    }
    reminder.completed = true;
    reminder.lastTriggered = firedAt.toUTC();
}

bool reschedule(data::Reminder &reminder, const QDateTime &firedAt)
{
    if (!reminder.recurring || !reminder.interval.isValid() || !reminder.dueTime.isValid()) {
        return false;
    }

    const QDateTime original = reminder.dueTime.toUTC();
    const QDateTime floor = std::max(original, firedAt.toUTC());
    int times = 1;
    QDateTime next = reminder.interval.advance(original, times);
    // Months are recomputed from the original instant so that day clamping
    // in a short month does not carry into the following ones.
    while (next <= floor) {
        ++times;
        next = reminder.interval.advance(original, times);
    }

    reminder.dueTime = next;
    reminder.lastTriggered = firedAt.toUTC();
    reminder.completed = false;
    return true;
}

void applyFiredTransition(data::Reminder &reminder, const QDateTime &firedAt)
{
    if (reminder.recurring && reschedule(reminder, firedAt)) {
        return;
    }
    markCompleted(reminder, firedAt);
}

} // namespace core
} // namespace reminders
