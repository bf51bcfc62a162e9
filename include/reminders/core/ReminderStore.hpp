#pragma once

#include <QDateTime>
#include <QMutex>
#include <QString>
#include <optional>
#include <vector>

#include "reminders/data/Reminder.hpp"

namespace reminders {
namespace data {
class ReminderRepository;
}

namespace core {

struct TransitionReport
{
    int completed = 0;
    int rescheduled = 0;
    int skipped = 0;
    bool persisted = true;
};

// Single owner of reminder state. Every call holds the same mutex, and
// callers only ever receive copies of the records.
class ReminderStore
{
public:
    explicit ReminderStore(data::ReminderRepository &repository);
    ~ReminderStore();

    ReminderStore(const ReminderStore &) = delete;
    ReminderStore &operator=(const ReminderStore &) = delete;

    // Assigns id and createdAt when they are empty. Returns std::nullopt when
    // the reminder could not be persisted.
    std::optional<QString> add(data::Reminder reminder, const QDateTime &now);
    bool remove(const QString &id);
    bool markCompleted(const QString &id, const QDateTime &firedAt);
    std::optional<data::Reminder> get(const QString &id) const;
    std::vector<data::Reminder> upcoming(int limit) const;
    std::vector<data::Reminder> due(const QDateTime &now) const;
    int size() const;

    // Completes or reschedules each fired reminder and persists once. A
    // reminder is skipped when it was cancelled, completed or rescheduled
    // since it was read, i.e. when its stored due time no longer matches.
    TransitionReport applyFired(const std::vector<data::Reminder> &fired, const QDateTime &firedAt);

    // Returns a warning the first time persistence fails after having
    // succeeded, then nothing until it has recovered and failed again.
    std::optional<QString> takePersistenceWarning();

private:
    QString nextId(const QDateTime &createdAt) const;
    void recordPersistence(bool ok, const char *operation);

    mutable QMutex m_mutex;
    data::ReminderRepository &m_repository;
    bool m_persistenceFailing = false;
    bool m_warningPending = false;
};

} // namespace core
} // namespace reminders
