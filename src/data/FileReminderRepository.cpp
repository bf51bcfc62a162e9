#include "reminders/data/FileReminderRepository.hpp"

namespace reminders {
namespace data {

FileReminderRepository::FileReminderRepository(std::shared_ptr<FileReminderStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Reminder> FileReminderRepository::fetchReminders() const
{
    std::vector<Reminder> result;
    if (!m_storage) {
        return result;
    }
    const auto &reminders = m_storage->reminders();
    result.reserve(static_cast<size_t>(reminders.size()));
    for (auto it = reminders.constBegin(); it != reminders.constEnd(); ++it) {
        result.push_back(it.value());
    }
    return result;
}

std::optional<Reminder> FileReminderRepository::findById(const QString &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &reminders = m_storage->reminders();
    if (reminders.contains(id)) {
        return reminders.value(id);
    }
    return std::nullopt;
}

bool FileReminderRepository::contains(const QString &id) const
{
    return m_storage && m_storage->reminders().contains(id);
}

bool FileReminderRepository::addReminder(const Reminder &reminder)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->insertReminder(reminder);
}

bool FileReminderRepository::updateReminders(const std::vector<Reminder> &reminders)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->updateReminders(reminders);
}

bool FileReminderRepository::removeReminder(const QString &id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeReminder(id);
}

} // namespace data
} // namespace reminders
