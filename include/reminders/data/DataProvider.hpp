#pragma once

#include <memory>
#include <QString>

namespace reminders {
namespace data {

class ReminderRepository;
class FileReminderStorage;

class DataProvider
{
public:
    explicit DataProvider(const QString &filePath);
    ~DataProvider();

    ReminderRepository &reminderRepository();
    const FileReminderStorage &storage() const;

private:
    std::shared_ptr<FileReminderStorage> m_storage;
    std::unique_ptr<ReminderRepository> m_reminderRepository;
};

} // namespace data
} // namespace reminders
