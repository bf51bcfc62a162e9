#pragma once

#include <QDateTime>

#include "reminders/data/Reminder.hpp"

namespace reminders {
namespace core {

// Terminal transition for a fired one-shot reminder. A reminder that is
// already completed is left untouched, including its lastTriggered stamp.
void markCompleted(data::Reminder &reminder, const QDateTime &firedAt);

// Advances a recurring reminder past `firedAt`, skipping missed occurrences.
// Returns false for reminders without a valid interval.
bool reschedule(data::Reminder &reminder, const QDateTime &firedAt);

// Applies whichever transition fits the reminder.
void applyFiredTransition(data::Reminder &reminder, const QDateTime &firedAt);

} // namespace core
} // namespace reminders
