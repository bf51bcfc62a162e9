#include <QtTest/QtTest>

#include <QElapsedTimer>
#include <QHash>
#include <QMutex>
#include <QSemaphore>
#include <QThread>
#include <atomic>
#include <memory>
#include <stdexcept>

#include "reminders/core/NotificationDispatcher.hpp"
#include "reminders/core/NotificationLedger.hpp"
#include "reminders/core/ReminderScheduler.hpp"
#include "reminders/core/ReminderStore.hpp"
#include "reminders/data/InMemoryReminderRepository.hpp"

using namespace reminders;
using namespace reminders::core;

namespace {
QDateTime utc(int year, int month, int day, int hour, int minute = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
}

data::Reminder makeReminder(const QString &text, const QDateTime &due,
                            const data::Recurrence &recurrence = data::Recurrence::none())
{
    data::Reminder reminder;
    reminder.text = text;
    reminder.dueTime = due;
    reminder.recurring = recurrence.isValid();
    reminder.interval = recurrence;
    return reminder;
}

Clock fixedClock(const QDateTime &instant)
{
    return [instant]() { return instant; };
}

ReminderScheduler::Options fastOptions()
{
    ReminderScheduler::Options options;
    options.pollIntervalMs = 10;
    options.backoffMs = 60 * 1000;
    return options;
}
} // namespace

class ReminderSchedulerTest : public QObject
{
    Q_OBJECT

private slots:
    void iterationCompletesAndReschedules();
    void monthlyReminderClampsToFebruary();
    void repeatedIterationsNotifyOnce();
    void startIsIdempotent();
    void pollsUntilStopped();
    void stopWaitsForInFlightDispatch();
    void failedPollBacksOff();
    void unknownExceptionBacksOff();
    void addAndCancelWhilePolling();
};

void ReminderSchedulerTest::iterationCompletesAndReschedules()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    NotificationLedger ledger;
    QStringList alerts;
    NotificationDispatcher dispatcher(ledger, [&](const QString &title, const QString &) { alerts << title; },
                                      SpeechSink());
    const QDateTime now = utc(2024, 1, 1, 10);
    ReminderScheduler scheduler(store, dispatcher, fixedClock(now));

    const auto oneShot = store.add(makeReminder(QStringLiteral("call mom"), utc(2024, 1, 1, 9)), now);
    const auto daily = store.add(makeReminder(QStringLiteral("take my medicine"), utc(2024, 1, 1, 8),
                                              data::Recurrence::days(1)),
                                 now);
    store.add(makeReminder(QStringLiteral("later"), utc(2024, 1, 1, 11)), now);

    const IterationReport report = scheduler.runIteration();
    QCOMPARE(report.due, 2);
    QCOMPARE(report.delivered, 2);
    QCOMPARE(report.transitions.completed, 1);
    QCOMPARE(report.transitions.rescheduled, 1);
    QVERIFY(report.transitions.persisted);
    QCOMPARE(scheduler.completedIterations(), 1);

    QVERIFY(store.get(*oneShot)->completed);
    QCOMPARE(store.get(*daily)->dueTime, utc(2024, 1, 2, 8));
    QCOMPARE(alerts.size(), 2);
    QVERIFY(!scheduler.isRunning());
}

void ReminderSchedulerTest::monthlyReminderClampsToFebruary()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    NotificationLedger ledger;
    NotificationDispatcher dispatcher(ledger, AlertSink(), SpeechSink());
    const QDateTime due = utc(2024, 1, 31, 9);
    ReminderScheduler scheduler(store, dispatcher, fixedClock(due));

    const auto id = store.add(makeReminder(QStringLiteral("pay rent"), due, data::Recurrence::months(1)), due);
    scheduler.runIteration();
    QCOMPARE(store.get(*id)->dueTime, utc(2024, 2, 29, 9));
    QVERIFY(!store.get(*id)->completed);
}

void ReminderSchedulerTest::repeatedIterationsNotifyOnce()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    NotificationLedger ledger;
    int alerts = 0;
    NotificationDispatcher dispatcher(ledger, [&](const QString &, const QString &) { ++alerts; }, SpeechSink());
    const QDateTime now = utc(2024, 1, 1, 15);
    ReminderScheduler scheduler(store, dispatcher, fixedClock(now));

    store.add(makeReminder(QStringLiteral("call mom"), now), now);
    scheduler.runIteration();
    const IterationReport second = scheduler.runIteration();
    QCOMPARE(second.due, 0);
    QCOMPARE(alerts, 1);
}

void ReminderSchedulerTest::startIsIdempotent()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    NotificationLedger ledger;
    NotificationDispatcher dispatcher(ledger, AlertSink(), SpeechSink());
    ReminderScheduler scheduler(store, dispatcher, fixedClock(utc(2024, 1, 1, 10)), fastOptions());

    QVERIFY(scheduler.state() == ReminderScheduler::State::Stopped);
    scheduler.start();
    scheduler.start();
    QVERIFY(scheduler.isRunning());

    scheduler.stop();
    scheduler.stop();
    QVERIFY(scheduler.state() == ReminderScheduler::State::Stopped);

    scheduler.start();
    QVERIFY(scheduler.isRunning());
    scheduler.stop();
}

void ReminderSchedulerTest::pollsUntilStopped()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    NotificationLedger ledger;
    NotificationDispatcher dispatcher(ledger, AlertSink(), SpeechSink());
    ReminderScheduler scheduler(store, dispatcher, fixedClock(utc(2024, 1, 1, 10)), fastOptions());

    scheduler.start();
    QTRY_VERIFY(scheduler.completedIterations() >= 3);
    scheduler.stop();

    const int iterations = scheduler.completedIterations();
    QTest::qWait(50);
    QCOMPARE(scheduler.completedIterations(), iterations);
}

void ReminderSchedulerTest::stopWaitsForInFlightDispatch()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    NotificationLedger ledger;
    QSemaphore entered;
    QSemaphore release;
    NotificationDispatcher dispatcher(
        ledger,
        [&](const QString &, const QString &) {
            entered.release();
            release.acquire();
        },
        SpeechSink());
    const QDateTime now = utc(2024, 1, 1, 15);
    ReminderScheduler scheduler(store, dispatcher, fixedClock(now), fastOptions());
    const auto id = store.add(makeReminder(QStringLiteral("call mom"), now), now);

    scheduler.start();
    QVERIFY(entered.tryAcquire(1, 5000));

    std::unique_ptr<QThread> stopper(QThread::create([&scheduler]() { scheduler.stop(); }));
    stopper->start();
    QVERIFY(!stopper->wait(100));
    QVERIFY(!store.get(*id)->completed);

    release.release();
    QVERIFY(stopper->wait(5000));
    QVERIFY(scheduler.state() == ReminderScheduler::State::Stopped);
    QVERIFY(store.get(*id)->completed);
    QCOMPARE(*store.get(*id)->lastTriggered, now);
}

void ReminderSchedulerTest::failedPollBacksOff()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    NotificationLedger ledger;
    NotificationDispatcher dispatcher(ledger, AlertSink(), SpeechSink());
    std::atomic<int> clockCalls{ 0 };
    Clock brokenClock = [&clockCalls]() -> QDateTime {
        ++clockCalls;
        throw std::runtime_error("clock unavailable");
    };
    ReminderScheduler scheduler(store, dispatcher, brokenClock, fastOptions());

    scheduler.start();
    QTRY_COMPARE(clockCalls.load(), 1);
    QTest::qWait(100);
    QCOMPARE(clockCalls.load(), 1);
    QVERIFY(scheduler.isRunning());

    // stop() interrupts the backoff sleep.
    QElapsedTimer timer;
    timer.start();
    scheduler.stop();
    QVERIFY(timer.elapsed() < 5000);
}

void ReminderSchedulerTest::unknownExceptionBacksOff()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    NotificationLedger ledger;
    NotificationDispatcher dispatcher(ledger, AlertSink(), SpeechSink());
    std::atomic<int> clockCalls{ 0 };
    Clock brokenClock = [&clockCalls]() -> QDateTime {
        ++clockCalls;
        throw 42;
    };
    ReminderScheduler scheduler(store, dispatcher, brokenClock, fastOptions());

    scheduler.start();
    QTRY_COMPARE(clockCalls.load(), 1);
    QTest::qWait(100);
    QCOMPARE(clockCalls.load(), 1);
    QVERIFY(scheduler.isRunning());
    scheduler.stop();
    QVERIFY(scheduler.state() == ReminderScheduler::State::Stopped);
}

void ReminderSchedulerTest::addAndCancelWhilePolling()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    NotificationLedger ledger;
    QMutex alertsMutex;
    QHash<QString, int> alertsByTitle;
    NotificationDispatcher dispatcher(
        ledger,
        [&](const QString &title, const QString &) {
            QMutexLocker locker(&alertsMutex);
            ++alertsByTitle[title];
        },
        SpeechSink());
    const QDateTime now = utc(2024, 1, 1, 12);
    ReminderScheduler scheduler(store, dispatcher, fixedClock(now), fastOptions());

    scheduler.start();
    QStringList kept;
    QStringList cancelled;
    for (int i = 0; i < 200; ++i) {
        const QString text = QStringLiteral("item %1").arg(i);
        const auto id = store.add(makeReminder(text, now), now.addSecs(i));
        QVERIFY(id.has_value());
        if (i % 2 == 0) {
            kept << *id;
        } else if (store.remove(*id)) {
            cancelled << *id;
        }
        if (i % 20 == 0) {
            QThread::msleep(5);
        }
    }

    QTRY_VERIFY_WITH_TIMEOUT(store.due(now).empty(), 10000);
    scheduler.stop();

    QCOMPARE(store.size(), kept.size());
    for (const QString &id : kept) {
        const auto stored = store.get(id);
        QVERIFY2(stored.has_value(), qPrintable(id));
        QVERIFY(stored->completed);
        QCOMPARE(*stored->lastTriggered, now);
    }
    for (const QString &id : cancelled) {
        QVERIFY(!store.get(id).has_value());
    }

    QMutexLocker locker(&alertsMutex);
    for (int i = 0; i < 200; i += 2) {
        QCOMPARE(alertsByTitle.value(QStringLiteral("Reminder: item %1").arg(i)), 1);
    }
    for (auto it = alertsByTitle.constBegin(); it != alertsByTitle.constEnd(); ++it) {
        QVERIFY2(it.value() <= 1, qPrintable(it.key()));
    }
}

QTEST_GUILESS_MAIN(ReminderSchedulerTest)
#include "ReminderSchedulerTest.moc"
