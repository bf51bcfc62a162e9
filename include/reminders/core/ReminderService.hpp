#pragma once

#include <QDateTime>
#include <QString>
#include <optional>
#include <vector>

#include "reminders/core/ReminderScheduler.hpp"
#include "reminders/data/Reminder.hpp"

namespace reminders {
namespace core {

class ReminderStore;

// Entry point for the dialogue layer and the command line.
class ReminderService
{
public:
    explicit ReminderService(ReminderStore &store, Clock clock = systemClock());

    std::optional<QString> addFromText(const QString &rawText);
    std::optional<QString> addFromText(const QString &rawText, const QDateTime &now);
    // Accepts any due time, including past ones.
    std::optional<QString> addStructured(const QString &text, const QDateTime &dueTime,
                                         const data::Recurrence &recurrence = data::Recurrence::none());
    bool cancel(const QString &id);
    std::vector<data::Reminder> upcoming(int limit = 10) const;
    std::vector<data::Reminder> dueNow() const;
    std::optional<data::Reminder> find(const QString &id) const;

    // Spoken replies for "remind me ..." and "what are my reminders".
    QString handleAddRequest(const QString &rawText);
    QString handleListRequest(int limit = 10) const;

    std::optional<QString> takePersistenceWarning();

private:
    ReminderStore &m_store;
    Clock m_clock;
};

} // namespace core
} // namespace reminders
