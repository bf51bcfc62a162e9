#pragma once

#include <QHash>
#include <QJsonObject>
#include <QString>
#include <optional>
#include <vector>

#include "reminders/data/Reminder.hpp"

namespace reminders {
namespace data {

// JSON snapshot of all reminders, keyed by id. Every mutation rewrites the
// whole file through QSaveFile, so the file on disk is either the previous or
// the new snapshot, never a mix.
class FileReminderStorage
{
public:
    enum class LoadStatus
    {
        Missing,
        Loaded,
        Corrupt,
        Unreadable,
    };

    explicit FileReminderStorage(QString filePath);
    ~FileReminderStorage() = default;

    const QHash<QString, Reminder> &reminders() const;
    const QString &filePath() const;
    LoadStatus loadStatus() const;

    bool insertReminder(const Reminder &reminder);
    bool updateReminders(const std::vector<Reminder> &reminders);
    bool removeReminder(const QString &id);

    static QJsonObject toJson(const Reminder &reminder);
    static std::optional<Reminder> fromJson(const QString &key, const QJsonObject &object);
    // ISO-8601 with optional milliseconds. Instants without an offset are UTC.
    static QDateTime parseInstant(const QString &value);

private:
    void load();
    bool save() const;
    bool commit(QHash<QString, Reminder> next);

    static QString formatInstant(const QDateTime &dt);
    static QJsonValue recurrenceToJson(const Recurrence &recurrence);
    static Recurrence recurrenceFromJson(const QJsonValue &value);

    QString m_filePath;
    QHash<QString, Reminder> m_reminders;
    LoadStatus m_loadStatus = LoadStatus::Missing;
};

} // namespace data
} // namespace reminders
