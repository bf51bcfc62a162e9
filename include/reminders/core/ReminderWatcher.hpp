#pragma once

#include <QObject>
#include <QTimer>

#include "reminders/core/DueProcessing.hpp"
#include "reminders/core/ReminderScheduler.hpp"

namespace reminders {
namespace core {

class NotificationDispatcher;
class ReminderStore;

// Tray-style observer. Polls the same store on the event loop of the thread
// it lives in and notifies through its own dispatcher, which shares the
// scheduler's ledger so a reminder is announced once per dedup window.
class ReminderWatcher : public QObject
{
    Q_OBJECT

public:
    ReminderWatcher(ReminderStore &store, NotificationDispatcher &dispatcher, Clock clock = systemClock(),
                    QObject *parent = nullptr);

    void start(int intervalMs);
    void stop();
    bool isActive() const;

    IterationReport poll();

signals:
    void polled(int dueCount);

private:
    ReminderStore &m_store;
    NotificationDispatcher &m_dispatcher;
    Clock m_clock;
    QTimer m_timer;
};

} // namespace core
} // namespace reminders
