#include "reminders/core/DueProcessing.hpp"

#include "reminders/core/NotificationDispatcher.hpp"

namespace reminders {
namespace core {

IterationReport processDueReminders(ReminderStore &store, NotificationDispatcher &dispatcher, const QDateTime &now)
{
    IterationReport report;
    const std::vector<data::Reminder> due = store.due(now);
    report.due = static_cast<int>(due.size());
    if (due.empty()) {
        return report;
    }

    for (const data::Reminder &reminder : due) {
        switch (dispatcher.dispatch(reminder, now)) {
        case DispatchOutcome::Delivered:
            ++report.delivered;
            break;
        case DispatchOutcome::Suppressed:
            ++report.suppressed;
            break;
        case DispatchOutcome::Failed:
            ++report.failed;
            break;
        }
    }

    report.transitions = store.applyFired(due, now);
    return report;
}

} // namespace core
} // namespace reminders
