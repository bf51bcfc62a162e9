#pragma once

#include <QDateTime>

#include "reminders/core/ReminderStore.hpp"

namespace reminders {
namespace core {

class NotificationDispatcher;

struct IterationReport
{
    int due = 0;
    int delivered = 0;
    int suppressed = 0;
    int failed = 0;
    TransitionReport transitions;
};

// One poll: dispatch everything due at `now` in store order, then apply the
// lifecycle transitions for the whole batch with a single persist.
IterationReport processDueReminders(ReminderStore &store, NotificationDispatcher &dispatcher, const QDateTime &now);

} // namespace core
} // namespace reminders
