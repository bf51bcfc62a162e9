#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "reminders/core/ReminderPhrases.hpp"
#include "reminders/core/ReminderService.hpp"
#include "reminders/core/ReminderStore.hpp"
#include "reminders/data/DataProvider.hpp"
#include "reminders/data/FileReminderStorage.hpp"
#include "reminders/data/InMemoryReminderRepository.hpp"

using namespace reminders;
using namespace reminders::core;

namespace {
QDateTime utc(int year, int month, int day, int hour, int minute = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
}

const QDateTime NOW = utc(2024, 1, 1, 10);

Clock fixedClock()
{
    return []() { return NOW; };
}
} // namespace

class ReminderServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void addFromTextStoresParsedReminder();
    void addFromTextRejectsEmptyReminder();
    void addStructuredAcceptsPastDueTime();
    void addStructuredRejectsInvalidInput();
    void cancelRemovesReminder();
    void addRequestConfirms();
    void addRequestExplainsParseFailure();
    void addRequestReportsSaveFailure();
    void listRequest();
    void recurrenceDescriptions_data();
    void recurrenceDescriptions();
    void trayDigestSkipsCompletedAndLimits();
    void remindersSurviveRestart();
};

void ReminderServiceTest::addFromTextStoresParsedReminder()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderService service(store, fixedClock());

    const auto id = service.addFromText(QStringLiteral("remind me every day at 8am to take my medicine"));
    QVERIFY(id.has_value());

    const auto stored = service.find(*id);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->text, QStringLiteral("take my medicine"));
    QCOMPARE(stored->dueTime, utc(2024, 1, 2, 8));
    QCOMPARE(stored->createdAt, NOW);
    QVERIFY(stored->recurring);
    QVERIFY(stored->interval == data::Recurrence::days(1));
}

void ReminderServiceTest::addFromTextRejectsEmptyReminder()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderService service(store, fixedClock());

    QVERIFY(!service.addFromText(QStringLiteral("remind me at 5pm")).has_value());
    QCOMPARE(store.size(), 0);
}

void ReminderServiceTest::addStructuredAcceptsPastDueTime()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderService service(store, fixedClock());

    const auto id = service.addStructured(QStringLiteral("  file taxes "), utc(2023, 12, 31, 9));
    QVERIFY(id.has_value());
    QCOMPARE(service.find(*id)->text, QStringLiteral("file taxes"));

    const auto due = service.dueNow();
    QCOMPARE(due.size(), static_cast<size_t>(1));
    QCOMPARE(due.front().id, *id);
}

void ReminderServiceTest::addStructuredRejectsInvalidInput()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderService service(store, fixedClock());

    QVERIFY(!service.addStructured(QStringLiteral("   "), NOW).has_value());
    QVERIFY(!service.addStructured(QStringLiteral("nothing"), QDateTime()).has_value());
    QCOMPARE(store.size(), 0);
}

void ReminderServiceTest::cancelRemovesReminder()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderService service(store, fixedClock());

    const auto id = service.addStructured(QStringLiteral("call mom"), utc(2024, 1, 1, 15));
    QVERIFY(service.cancel(*id));
    QVERIFY(!service.find(*id).has_value());
    QVERIFY(!service.cancel(*id));
    QVERIFY(service.upcoming().empty());
}

void ReminderServiceTest::addRequestConfirms()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderService service(store, fixedClock());

    const QString reply = service.handleAddRequest(QStringLiteral("remind me to call mom tomorrow at 3pm"));
    QVERIFY2(reply.startsWith(QStringLiteral("I'll remind you to call mom at ")), qPrintable(reply));
    QVERIFY(reply.endsWith('.'));
    QCOMPARE(store.size(), 1);

    const QString recurring = service.handleAddRequest(QStringLiteral("remind me weekly to call grandma"));
    QVERIFY2(recurring.startsWith(QStringLiteral("I'll remind you to call grandma every week at ")),
             qPrintable(recurring));
}

void ReminderServiceTest::addRequestExplainsParseFailure()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderService service(store, fixedClock());

    QCOMPARE(service.handleAddRequest(QStringLiteral("remind me")), parseFailureMessage());
    QCOMPARE(store.size(), 0);
}

void ReminderServiceTest::addRequestReportsSaveFailure()
{
    QTemporaryDir dir;
    const QString blocker = dir.filePath(QStringLiteral("blocker"));
    {
        QFile file(blocker);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("x");
    }
    data::DataProvider provider(blocker + QStringLiteral("/reminders.json"));
    ReminderStore store(provider.reminderRepository());
    ReminderService service(store, fixedClock());

    QCOMPARE(service.handleAddRequest(QStringLiteral("remind me to call mom at 3pm")),
             QStringLiteral("I couldn't save that reminder. Please try again later."));
    QVERIFY(service.takePersistenceWarning().has_value());
}

void ReminderServiceTest::listRequest()
{
    data::InMemoryReminderRepository repo;
    ReminderStore store(repo);
    ReminderService service(store, fixedClock());

    QCOMPARE(service.handleListRequest(), QStringLiteral("You don't have any upcoming reminders."));

    service.addStructured(QStringLiteral("second"), utc(2024, 1, 3, 9));
    service.addStructured(QStringLiteral("first"), utc(2024, 1, 2, 9));
    const QStringList lines = service.handleListRequest().split('\n');
    QCOMPARE(lines.size(), 3);
    QCOMPARE(lines.at(0), QStringLiteral("Here are your upcoming reminders:"));
    QVERIFY(lines.at(1).startsWith(QStringLiteral("1. first at ")));
    QVERIFY(lines.at(2).startsWith(QStringLiteral("2. second at ")));

    QCOMPARE(service.handleListRequest(1).split('\n').size(), 2);
}

void ReminderServiceTest::recurrenceDescriptions_data()
{
    QTest::addColumn<int>("unit");
    QTest::addColumn<int>("count");
    QTest::addColumn<QString>("expected");

    QTest::newRow("none") << int(data::Recurrence::Unit::None) << 0 << QString();
    QTest::newRow("day") << int(data::Recurrence::Unit::Days) << 1 << QStringLiteral(" every day");
    QTest::newRow("days") << int(data::Recurrence::Unit::Days) << 3 << QStringLiteral(" every 3 days");
    QTest::newRow("week") << int(data::Recurrence::Unit::Weeks) << 1 << QStringLiteral(" every week");
    QTest::newRow("months") << int(data::Recurrence::Unit::Months) << 2 << QStringLiteral(" every 2 months");
}

void ReminderServiceTest::recurrenceDescriptions()
{
    QFETCH(int, unit);
    QFETCH(int, count);
    QFETCH(QString, expected);
    QCOMPARE(describeRecurrence(data::Recurrence{ static_cast<data::Recurrence::Unit>(unit), count }), expected);
}

void ReminderServiceTest::trayDigestSkipsCompletedAndLimits()
{
    std::vector<data::Reminder> items;
    for (int i = 0; i < 8; ++i) {
        data::Reminder reminder;
        reminder.id = QString::number(i);
        reminder.text = QStringLiteral("item %1").arg(i);
        reminder.dueTime = utc(2024, 1, 2, 9 + i);
        reminder.completed = i == 0;
        items.push_back(reminder);
    }

    const QStringList lines = trayDigest(items).split('\n');
    QCOMPARE(lines.size(), 5);
    QVERIFY(lines.first().endsWith(QStringLiteral(": item 1")));
    QVERIFY(lines.last().endsWith(QStringLiteral(": item 5")));
    QVERIFY(trayDigest({}).isEmpty());
}

void ReminderServiceTest::remindersSurviveRestart()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("nested/reminders.json"));

    QString id;
    {
        data::DataProvider provider(path);
        ReminderStore store(provider.reminderRepository());
        ReminderService service(store, fixedClock());
        id = service.addFromText(QStringLiteral("remind me monthly at 9am to pay rent")).value_or(QString());
    }
    QVERIFY(!id.isEmpty());

    data::DataProvider provider(path);
    QVERIFY(provider.storage().loadStatus() == data::FileReminderStorage::LoadStatus::Loaded);
    ReminderStore store(provider.reminderRepository());
    ReminderService service(store, fixedClock());
    const auto reloaded = service.find(id);
    QVERIFY(reloaded.has_value());
    QCOMPARE(reloaded->text, QStringLiteral("pay rent"));
    QCOMPARE(reloaded->dueTime, utc(2024, 1, 2, 9));
    QVERIFY(reloaded->interval == data::Recurrence::months(1));
}

QTEST_GUILESS_MAIN(ReminderServiceTest)
#include "ReminderServiceTest.moc"
