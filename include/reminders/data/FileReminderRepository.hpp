#pragma once

#include "reminders/data/FileReminderStorage.hpp"
#include "reminders/data/ReminderRepository.hpp"

#include <memory>

namespace reminders {
namespace data {

class FileReminderRepository : public ReminderRepository
{
public:
    explicit FileReminderRepository(std::shared_ptr<FileReminderStorage> storage);
    ~FileReminderRepository() override = default;

    std::vector<Reminder> fetchReminders() const override;
    std::optional<Reminder> findById(const QString &id) const override;
    bool contains(const QString &id) const override;
    bool addReminder(const Reminder &reminder) override;
    bool updateReminders(const std::vector<Reminder> &reminders) override;
    bool removeReminder(const QString &id) override;

private:
    std::shared_ptr<FileReminderStorage> m_storage;
};

} // namespace data
} // namespace reminders
