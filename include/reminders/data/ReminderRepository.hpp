#pragma once

#include <optional>
#include <vector>

#include "reminders/data/Reminder.hpp"

namespace reminders {
namespace data {

// Mutators return false when the record is missing or the change could not be
// made durable. A failed mutation leaves the repository unchanged.
class ReminderRepository
{
public:
    virtual ~ReminderRepository() = default;

    virtual std::vector<Reminder> fetchReminders() const = 0;
    virtual std::optional<Reminder> findById(const QString &id) const = 0;
    virtual bool contains(const QString &id) const = 0;
    virtual bool addReminder(const Reminder &reminder) = 0;
    virtual bool updateReminders(const std::vector<Reminder> &reminders) = 0;
    virtual bool removeReminder(const QString &id) = 0;
};

} // namespace data
} // namespace reminders
