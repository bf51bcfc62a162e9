#pragma once

#include <QHash>

#include "reminders/data/ReminderRepository.hpp"

namespace reminders {
namespace data {

class InMemoryReminderRepository : public ReminderRepository
{
public:
    InMemoryReminderRepository();
    ~InMemoryReminderRepository() override;

    std::vector<Reminder> fetchReminders() const override;
    std::optional<Reminder> findById(const QString &id) const override;
    bool contains(const QString &id) const override;
    bool addReminder(const Reminder &reminder) override;
    bool updateReminders(const std::vector<Reminder> &reminders) override;
    bool removeReminder(const QString &id) override;

private:
    QHash<QString, Reminder> m_items;
};

} // namespace data
} // namespace reminders
