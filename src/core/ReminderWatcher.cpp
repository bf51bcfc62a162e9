#include "reminders/core/ReminderWatcher.hpp"

#include "reminders/Logging.hpp"
#include "reminders/core/NotificationDispatcher.hpp"
#include "reminders/core/ReminderStore.hpp"

#include <exception>

namespace reminders {
namespace core {

ReminderWatcher::ReminderWatcher(ReminderStore &store, NotificationDispatcher &dispatcher, Clock clock,
                                 QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_dispatcher(dispatcher)
    , m_clock(clock ? std::move(clock) : systemClock())
{
    connect(&m_timer, &QTimer::timeout, this, &ReminderWatcher::poll);
}

void ReminderWatcher::start(int intervalMs)
{
    if (m_timer.isActive()) {
        return;
    }
    m_timer.start(intervalMs);
    qCInfo(lcWatcher) << "Watcher polling every" << intervalMs << "ms";
}

void ReminderWatcher::stop()
{
    m_timer.stop();
}

bool ReminderWatcher::isActive() const
{
    return m_timer.isActive();
}

IterationReport ReminderWatcher::poll()
{
    IterationReport report;
    try {
        report = processDueReminders(m_store, m_dispatcher, m_clock());
    } catch (const std::exception &e) {
        qCWarning(lcWatcher) << "Watcher poll failed:" << e.what();
        return report;
    } catch (...) {
        qCWarning(lcWatcher) << "Watcher poll failed with an unknown error";
        return report;
    }
    if (report.suppressed > 0) {
        qCDebug(lcWatcher) << report.suppressed << "reminders were already announced";
    }
    emit polled(report.due);
    return report;
}

} // namespace core
} // namespace reminders
