#include "reminders/data/InMemoryReminderRepository.hpp"

namespace reminders {
namespace data {

InMemoryReminderRepository::InMemoryReminderRepository() = default;
InMemoryReminderRepository::~InMemoryReminderRepository() = default;

std::vector<Reminder> InMemoryReminderRepository::fetchReminders() const
{
    std::vector<Reminder> reminders;
    reminders.reserve(static_cast<size_t>(m_items.size()));
    for (const auto &item : m_items) {
        reminders.push_back(item);
    }
    return reminders;
}

std::optional<Reminder> InMemoryReminderRepository::findById(const QString &id) const
{
    if (m_items.contains(id)) {
        return m_items.value(id);
    }
    return std::nullopt;
}

bool InMemoryReminderRepository::contains(const QString &id) const
{
    return m_items.contains(id);
}

bool InMemoryReminderRepository::addReminder(const Reminder &reminder)
{
    if (reminder.id.isEmpty() || m_items.contains(reminder.id)) {
        return false;
    }
    m_items.insert(reminder.id, reminder);
    return true;
}

bool InMemoryReminderRepository::updateReminders(const std::vector<Reminder> &reminders)
{
    for (const Reminder &reminder : reminders) {
        if (!m_items.contains(reminder.id)) {
            return false;
        }
    }
    for (const Reminder &reminder : reminders) {
        m_items.insert(reminder.id, reminder);
    }
    return true;
}

bool InMemoryReminderRepository::removeReminder(const QString &id)
{
    return m_items.remove(id) > 0;
}

} // namespace data
} // namespace reminders
