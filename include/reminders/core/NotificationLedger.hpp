#pragma once

#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QString>
#include <optional>

namespace reminders {
namespace core {

// Last-notified instant per reminder id, shared by every component that may
// notify about the same due reminder.
class NotificationLedger
{
public:
    explicit NotificationLedger(int windowSeconds = 300);

    // Stamps `now` for `id` and returns true, unless `id` was already stamped
    // less than the window ago. Stamps older than the window are dropped.
    bool tryAcquire(const QString &id, const QDateTime &now);
    std::optional<QDateTime> lastNotified(const QString &id) const;
    int size() const;
    int windowSeconds() const;

private:
    void prune(const QDateTime &now);

    mutable QMutex m_mutex;
    QHash<QString, QDateTime> m_lastNotified;
    int m_windowSeconds;
};

} // namespace core
} // namespace reminders
