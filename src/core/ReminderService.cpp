#include "reminders/core/ReminderService.hpp"

#include "reminders/core/ReminderPhrases.hpp"
#include "reminders/core/ReminderStore.hpp"
#include "reminders/core/TimeExpressionParser.hpp"

namespace reminders {
namespace core {

ReminderService::ReminderService(ReminderStore &store, Clock clock)
    : m_store(store)
    , m_clock(clock ? std::move(clock) : systemClock())
{
}

std::optional<QString> ReminderService::addFromText(const QString &rawText)
{
    return addFromText(rawText, m_clock());
}

std::optional<QString> ReminderService::addFromText(const QString &rawText, const QDateTime &now)
{
    const std::optional<ParsedReminder> parsed = parseReminderText(rawText, now);
    if (!parsed) {
        return std::nullopt;
    }
    data::Reminder reminder;
    reminder.text = parsed->text;
    reminder.dueTime = parsed->dueTime;
    reminder.createdAt = now.toUTC();
    reminder.recurring = parsed->recurring();
    reminder.interval = parsed->recurrence;
    return m_store.add(std::move(reminder), now);
}

std::optional<QString> ReminderService::addStructured(const QString &text, const QDateTime &dueTime,
                                                      const data::Recurrence &recurrence)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty() || !dueTime.isValid()) {
        return std::nullopt;
    }
    const QDateTime now = m_clock();
    data::Reminder reminder;
    reminder.text = trimmed;
    reminder.dueTime = dueTime.toUTC();
    reminder.createdAt = now.toUTC();
    reminder.recurring = recurrence.isValid();
    reminder.interval = recurrence;
    return m_store.add(std::move(reminder), now);
}

bool ReminderService::cancel(const QString &id)
{
    return m_store.remove(id);
}

std::vector<data::Reminder> ReminderService::upcoming(int limit) const
{
    return m_store.upcoming(limit);
}

std::vector<data::Reminder> ReminderService::dueNow() const
{
    return m_store.due(m_clock());
}

std::optional<data::Reminder> ReminderService::find(const QString &id) const
{
    return m_store.get(id);
}

QString ReminderService::handleAddRequest(const QString &rawText)
{
    const QDateTime now = m_clock();
    if (!parseReminderText(rawText, now)) {
        return parseFailureMessage();
    }
    const std::optional<QString> id = addFromText(rawText, now);
    if (!id) {
        return QStringLiteral("I couldn't save that reminder. Please try again later.");
    }
    const std::optional<data::Reminder> reminder = m_store.get(*id);
    if (!reminder) {
        return QStringLiteral("I've set a reminder for you.");
    }
    return confirmation(*reminder);
}

QString ReminderService::handleListRequest(int limit) const
{
    return listing(upcoming(limit));
}

std::optional<QString> ReminderService::takePersistenceWarning()
{
    return m_store.takePersistenceWarning();
}

} // namespace core
} // namespace reminders
