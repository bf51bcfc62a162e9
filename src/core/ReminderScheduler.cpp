#include "reminders/core/ReminderScheduler.hpp"

#include "reminders/Logging.hpp"
#include "reminders/core/NotificationDispatcher.hpp"
#include "reminders/core/ReminderStore.hpp"

#include <QDeadlineTimer>
#include <QMutexLocker>
#include <QThread>
#include <exception>

namespace reminders {
namespace core {

Clock systemClock()
{
    return []() { return QDateTime::currentDateTimeUtc(); };
}

ReminderScheduler::ReminderScheduler(ReminderStore &store, NotificationDispatcher &dispatcher, Clock clock)
    : ReminderScheduler(store, dispatcher, std::move(clock), Options())
{
}

ReminderScheduler::ReminderScheduler(ReminderStore &store, NotificationDispatcher &dispatcher, Clock clock,
                                     Options options)
    : m_store(store)
    , m_dispatcher(dispatcher)
    , m_clock(clock ? std::move(clock) : systemClock())
    , m_options(options)
{
}

ReminderScheduler::~ReminderScheduler()
{
    stop();
}

void ReminderScheduler::start()
{
    QMutexLocker control(&m_controlMutex);
    {
        QMutexLocker locker(&m_stateMutex);
        if (m_state == State::Running) {
            return;
        }
        m_state = State::Running;
        m_stopRequested = false;
    }

    m_thread.reset(QThread::create([this]() { run(); }));
    m_thread->setObjectName(QStringLiteral("ReminderScheduler"));
    m_thread->start();
    qCInfo(lcScheduler) << "Scheduler started, polling every" << m_options.pollIntervalMs << "ms";
}

void ReminderScheduler::stop()
{
    if (m_thread && QThread::currentThread() == m_thread.get()) {
        // Called from a sink on the worker itself; the loop exits after this poll.
        QMutexLocker locker(&m_stateMutex);
        m_stopRequested = true;
        return;
    }

    QMutexLocker control(&m_controlMutex);
    {
        QMutexLocker locker(&m_stateMutex);
        if (m_state == State::Stopped) {
            return;
        }
        m_stopRequested = true;
        m_wakeUp.wakeAll();
    }

    if (m_thread) {
        m_thread->wait();
        m_thread.reset();
    }

    QMutexLocker locker(&m_stateMutex);
    m_state = State::Stopped;
    qCInfo(lcScheduler) << "Scheduler stopped";
}

ReminderScheduler::State ReminderScheduler::state() const
{
    QMutexLocker locker(&m_stateMutex);
    return m_state;
}

bool ReminderScheduler::isRunning() const
{
    return state() == State::Running;
}

int ReminderScheduler::completedIterations() const
{
    QMutexLocker locker(&m_stateMutex);
    return m_completedIterations;
}

const ReminderScheduler::Options &ReminderScheduler::options() const
{
    return m_options;
}

IterationReport ReminderScheduler::runIteration()
{
    QMutexLocker locker(&m_iterationMutex);
    const IterationReport report = processDueReminders(m_store, m_dispatcher, m_clock());
    if (report.due > 0) {
        qCInfo(lcScheduler) << "Processed" << report.due << "due reminders:" << report.transitions.completed
                            << "completed," << report.transitions.rescheduled << "rescheduled,"
                            << report.suppressed << "suppressed," << report.failed << "failed to notify";
    }
    {
        QMutexLocker stateLocker(&m_stateMutex);
        ++m_completedIterations;
    }
    return report;
}

void ReminderScheduler::run()
{
    while (true) {
        {
            QMutexLocker locker(&m_stateMutex);
            if (m_stopRequested) {
                break;
            }
        }

        QDeadlineTimer deadline(m_options.pollIntervalMs);
        bool healthy = true;
        try {
            const IterationReport report = runIteration();
            if (!report.transitions.persisted) {
                qCWarning(lcScheduler) << "Could not persist reminder transitions";
                healthy = false;
            }
        } catch (const std::exception &e) {
            qCCritical(lcScheduler) << "Reminder poll failed:" << e.what();
            healthy = false;
        } catch (...) {
            qCCritical(lcScheduler) << "Reminder poll failed with an unknown error";
            healthy = false;
        }

        if (!healthy) {
            qCWarning(lcScheduler) << "Backing off for" << m_options.backoffMs << "ms";
            deadline = QDeadlineTimer(m_options.backoffMs);
        }
        if (!sleepUntil(deadline)) {
            break;
        }
    }
}

bool ReminderScheduler::sleepUntil(const QDeadlineTimer &deadline)
{
    QMutexLocker locker(&m_stateMutex);
    while (!m_stopRequested && !deadline.hasExpired()) {
        m_wakeUp.wait(&m_stateMutex, deadline);
    }
    return !m_stopRequested;
}

} // namespace core
} // namespace reminders
