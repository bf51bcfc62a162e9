#include "reminders/core/ReminderStore.hpp"

#include "reminders/Logging.hpp"
#include "reminders/core/ReminderLifecycle.hpp"
#include "reminders/data/ReminderRepository.hpp"

#include <QMutexLocker>
#include <algorithm>

namespace reminders {
namespace core {

ReminderStore::ReminderStore(data::ReminderRepository &repository)
    : m_repository(repository)
{
}

ReminderStore::~ReminderStore() = default;

std::optional<QString> ReminderStore::add(data::Reminder reminder, const QDateTime &now)
{
    QMutexLocker locker(&m_mutex);
    if (!reminder.createdAt.isValid()) {
        reminder.createdAt = now.toUTC();
    }
    if (reminder.id.isEmpty() || m_repository.contains(reminder.id)) {
        reminder.id = nextId(reminder.createdAt);
    }
    reminder.dueTime = reminder.dueTime.toUTC();
    if (!reminder.recurring || !reminder.interval.isValid()) {
        reminder.recurring = false;
        reminder.interval = data::Recurrence::none();
    }

    const bool ok = m_repository.addReminder(reminder);
    recordPersistence(ok, "add");
    if (!ok) {
        return std::nullopt;
    }
    qCDebug(lcStore) << "Added reminder" << reminder.id << "due" << reminder.dueTime;
    return reminder.id;
}

bool ReminderStore::remove(const QString &id)
{
    QMutexLocker locker(&m_mutex);
    if (!m_repository.contains(id)) {
        return false;
    }
    const bool ok = m_repository.removeReminder(id);
    recordPersistence(ok, "remove");
    return ok;
}

bool ReminderStore::markCompleted(const QString &id, const QDateTime &firedAt)
{
    QMutexLocker locker(&m_mutex);
    std::optional<data::Reminder> reminder = m_repository.findById(id);
    if (!reminder) {
        return false;
    }
    if (reminder->completed) {
        return true;
    }
    core::markCompleted(*reminder, firedAt);
    const bool ok = m_repository.updateReminders({ *reminder });
    recordPersistence(ok, "mark completed");
    return ok;
}

std::optional<data::Reminder> ReminderStore::get(const QString &id) const
{
    QMutexLocker locker(&m_mutex);
    return m_repository.findById(id);
}

std::vector<data::Reminder> ReminderStore::upcoming(int limit) const
{
    QMutexLocker locker(&m_mutex);
    std::vector<data::Reminder> pending;
    for (auto &reminder : m_repository.fetchReminders()) {
        if (!reminder.completed) {
            pending.push_back(std::move(reminder));
        }
    }
    std::sort(pending.begin(), pending.end(), [](const data::Reminder &lhs, const data::Reminder &rhs) {
        if (lhs.dueTime == rhs.dueTime) {
            return lhs.id < rhs.id;
        }
        return lhs.dueTime < rhs.dueTime;
    });
    if (limit >= 0 && pending.size() > static_cast<size_t>(limit)) {
        pending.resize(static_cast<size_t>(limit));
    }
    return pending;
}

std::vector<data::Reminder> ReminderStore::due(const QDateTime &now) const
{
    QMutexLocker locker(&m_mutex);
    std::vector<data::Reminder> result;
    for (auto &reminder : m_repository.fetchReminders()) {
        if (reminder.isDue(now)) {
            result.push_back(std::move(reminder));
        }
    }
    return result;
}

int ReminderStore::size() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_repository.fetchReminders().size());
}

TransitionReport ReminderStore::applyFired(const std::vector<data::Reminder> &fired, const QDateTime &firedAt)
{
    QMutexLocker locker(&m_mutex);
    TransitionReport report;
    std::vector<data::Reminder> updates;
    updates.reserve(fired.size());

    for (const data::Reminder &seen : fired) {
        std::optional<data::Reminder> stored = m_repository.findById(seen.id);
        if (!stored || stored->completed || stored->dueTime != seen.dueTime) {
            ++report.skipped;
            continue;
        }
        applyFiredTransition(*stored, firedAt);
        if (stored->completed) {
            ++report.completed;
        } else {
            ++report.rescheduled;
        }
        updates.push_back(*stored);
    }

    if (updates.empty()) {
        return report;
    }
    report.persisted = m_repository.updateReminders(updates);
    recordPersistence(report.persisted, "apply transitions");
    if (!report.persisted) {
        report.completed = 0;
        report.rescheduled = 0;
    }
    return report;
}

std::optional<QString> ReminderStore::takePersistenceWarning()
{
    QMutexLocker locker(&m_mutex);
    if (!m_warningPending) {
        return std::nullopt;
    }
    m_warningPending = false;
    return QStringLiteral("Reminders could not be saved to disk. Recent changes will be lost when the assistant exits.");
}

QString ReminderStore::nextId(const QDateTime &createdAt) const
{
    const QString base = QString::number(createdAt.toSecsSinceEpoch());
    QString candidate = base;
    int suffix = 0;
    while (m_repository.contains(candidate)) {
        candidate = QStringLiteral("%1-%2").arg(base).arg(++suffix);
    }
    return candidate;
}

void ReminderStore::recordPersistence(bool ok, const char *operation)
{
    if (ok) {
        if (m_persistenceFailing) {
            qCInfo(lcStore) << "Persistence recovered on" << operation;
        }
        m_persistenceFailing = false;
        return;
    }
    if (!m_persistenceFailing) {
        qCWarning(lcStore) << "Persisting reminders failed on" << operation;
        m_warningPending = true;
    }
    m_persistenceFailing = true;
}

} // namespace core
} // namespace reminders
