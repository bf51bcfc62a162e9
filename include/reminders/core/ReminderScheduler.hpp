#pragma once

#include <QDateTime>
#include <QDeadlineTimer>
#include <QMutex>
#include <QWaitCondition>
#include <functional>
#include <memory>

#include "reminders/core/DueProcessing.hpp"

class QThread;

namespace reminders {
namespace core {

class NotificationDispatcher;
class ReminderStore;

using Clock = std::function<QDateTime()>;

Clock systemClock();

// Background worker that polls the store for due reminders. Ticks are
// deadline based: the next poll is scheduled from the start of the previous
// one. A failed poll (an exception or a failed persist) delays the next one by
// the backoff interval instead.
class ReminderScheduler
{
public:
    enum class State
    {
        Stopped,
        Running,
    };

    struct Options
    {
        int pollIntervalMs = 10 * 1000;
        int backoffMs = 60 * 1000;
    };

    ReminderScheduler(ReminderStore &store, NotificationDispatcher &dispatcher, Clock clock = systemClock());
    ReminderScheduler(ReminderStore &store, NotificationDispatcher &dispatcher, Clock clock, Options options);
    ~ReminderScheduler();

    ReminderScheduler(const ReminderScheduler &) = delete;
    ReminderScheduler &operator=(const ReminderScheduler &) = delete;

    void start();
    // Blocks until the in-flight poll, if any, has dispatched, transitioned
    // and persisted its batch. No poll runs after stop() returns.
    void stop();

    State state() const;
    bool isRunning() const;
    int completedIterations() const;
    const Options &options() const;

    // Runs one poll on the calling thread, serialized with the worker's polls.
    IterationReport runIteration();

private:
    void run();
    bool sleepUntil(const QDeadlineTimer &deadline);

    ReminderStore &m_store;
    NotificationDispatcher &m_dispatcher;
    Clock m_clock;
    Options m_options;

    QMutex m_controlMutex;
    QMutex m_iterationMutex;
    mutable QMutex m_stateMutex;
    QWaitCondition m_wakeUp;
    State m_state = State::Stopped;
    bool m_stopRequested = false;
    int m_completedIterations = 0;
    std::unique_ptr<QThread> m_thread;
};

} // namespace core
} // namespace reminders
