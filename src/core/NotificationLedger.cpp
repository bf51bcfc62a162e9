#include "reminders/core/NotificationLedger.hpp"

#include <QMutexLocker>

namespace reminders {
namespace core {

NotificationLedger::NotificationLedger(int windowSeconds)
    : m_windowSeconds(windowSeconds)
{
}

bool NotificationLedger::tryAcquire(const QString &id, const QDateTime &now)
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_lastNotified.constFind(id);
    if (it != m_lastNotified.constEnd()) {
        const qint64 elapsed = it.value().secsTo(now);
        if (elapsed < m_windowSeconds) {
            return false;
        }
    }
    m_lastNotified.insert(id, now.toUTC());
    prune(now);
    return true;
}

int NotificationLedger::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastNotified.size();
}

void NotificationLedger::prune(const QDateTime &now)
{
    for (auto it = m_lastNotified.begin(); it != m_lastNotified.end();) {
        if (it.value().secsTo(now) >= m_windowSeconds) {
            it = m_lastNotified.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<QDateTime> NotificationLedger::lastNotified(const QString &id) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_lastNotified.constFind(id);
    if (it == m_lastNotified.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

int NotificationLedger::windowSeconds() const
{
    return m_windowSeconds;
}

} // namespace core
} // namespace reminders
