#include "reminders/data/DataProvider.hpp"

#include "reminders/Logging.hpp"
#include "reminders/data/FileReminderRepository.hpp"
#include "reminders/data/FileReminderStorage.hpp"
#include "reminders/data/ReminderRepository.hpp"

#include <QDir>
#include <QFileInfo>

namespace reminders {
namespace data {

DataProvider::DataProvider(const QString &filePath)
{
    QDir dir = QFileInfo(filePath).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcStore) << "Could not create storage folder" << dir.absolutePath();
    }

    m_storage = std::make_shared<FileReminderStorage>(filePath);
    m_reminderRepository = std::make_unique<FileReminderRepository>(m_storage);
}

DataProvider::~DataProvider() = default;

ReminderRepository &DataProvider::reminderRepository()
{
    return *m_reminderRepository;
}

const FileReminderStorage &DataProvider::storage() const
{
    return *m_storage;
}

} // namespace data
} // namespace reminders
