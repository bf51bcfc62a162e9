#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QMutex>
#include <QMutexLocker>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <QTimer>
#include <csignal>
#include <optional>
#include <vector>

#include "version.h"

#include "reminders/core/AppContext.hpp"
#include "reminders/core/ReminderPhrases.hpp"
#include "reminders/core/ReminderService.hpp"
#include "reminders/core/ReminderWatcher.hpp"
#include "reminders/data/FileReminderStorage.hpp"

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

volatile std::sig_atomic_t quitRequested = 0;

// Sinks run on the scheduler thread while the watcher writes from the main
// thread; every line written in run mode goes through here.
void writeLine(QTextStream &stream, const QString &line)
{
    static QMutex mutex;
    QMutexLocker locker(&mutex);
    stream << line << '\n';
    stream.flush();
}

std::optional<reminders::data::Recurrence> parseEvery(const QString &value)
{
    using reminders::data::Recurrence;
    if (value.isEmpty()) {
        return Recurrence::none();
    }
    const QStringList parts = value.split(':');
    if (parts.size() != 2) {
        return std::nullopt;
    }
    bool ok = false;
    const int count = parts.at(1).toInt(&ok);
    if (!ok || count <= 0) {
        return std::nullopt;
    }
    const QString unit = parts.at(0).toLower();
    if (unit == QLatin1String("days")) {
        return Recurrence::days(count);
    }
    if (unit == QLatin1String("weeks")) {
        return Recurrence::weeks(count);
    }
    if (unit == QLatin1String("months")) {
        return Recurrence::months(count);
    }
    return std::nullopt;
}

void reportPersistenceWarning(reminders::core::ReminderService &service)
{
    if (const auto warning = service.takePersistenceWarning()) {
        writeLine(err(), *warning);
    }
}

void printReminders(const std::vector<reminders::data::Reminder> &items)
{
    if (items.empty()) {
        out() << QObject::tr("No reminders.") << '\n';
        return;
    }
    for (const auto &reminder : items) {
        out() << reminder.id << '\t' << reminder.dueTime.toUTC().toString(Qt::ISODate) << '\t' << reminder.text
              << reminders::core::describeRecurrence(reminder.interval) << '\n';
    }
}

reminders::core::Sinks consoleSinks()
{
    reminders::core::Sinks sinks;
    sinks.alert = [](const QString &title, const QString &body) {
        writeLine(out(), QStringLiteral("[alert] %1\n%2").arg(title, body));
    };
    sinks.speech = [](const QString &utterance) { writeLine(out(), QStringLiteral("[speech] %1").arg(utterance)); };
    sinks.tray = [](const QString &title, const QString &body) {
        writeLine(out(), QStringLiteral("[tray] %1: %2").arg(title, body));
    };
    return sinks;
}

void handleSignal(int)
{
    quitRequested = 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Reminders"));
    QCoreApplication::setApplicationName(QStringLiteral("reminders"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kRemindersVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Natural-language reminder scheduler"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QObject::tr("add | schedule | list | due | cancel | run"));
    parser.addPositionalArgument(QStringLiteral("args"), QObject::tr("Command arguments"), QStringLiteral("[args...]"));

    const QCommandLineOption fileOption(QStringLiteral("file"), QObject::tr("Reminder file to use."),
                                        QStringLiteral("path"));
    const QCommandLineOption textOption(QStringLiteral("text"), QObject::tr("Reminder text (schedule)."),
                                        QStringLiteral("text"));
    const QCommandLineOption dueOption(QStringLiteral("due"), QObject::tr("ISO-8601 due time, UTC unless an offset is given (schedule)."),
                                       QStringLiteral("instant"));
    const QCommandLineOption everyOption(QStringLiteral("every"),
                                         QObject::tr("Recurrence: days:N, weeks:N or months:N (schedule)."),
                                         QStringLiteral("interval"));
    const QCommandLineOption limitOption(QStringLiteral("limit"), QObject::tr("Maximum reminders to list."),
                                         QStringLiteral("n"), QStringLiteral("10"));
    parser.addOptions({ fileOption, textOption, dueOption, everyOption, limitOption });
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = positional.first();
    const QStringList args = positional.mid(1);

    QSettings settings;
    reminders::core::Settings config = reminders::core::Settings::load(settings);
    if (parser.isSet(fileOption)) {
        config.filePath = parser.value(fileOption);
    }

    reminders::core::AppContext context(config, consoleSinks());
    reminders::core::ReminderService &service = context.service();

    if (command == QLatin1String("add")) {
        const QString text = args.join(' ');
        if (text.trimmed().isEmpty()) {
            err() << QObject::tr("Nothing to remind about.") << '\n';
            return 1;
        }
        const auto id = service.addFromText(text);
        if (!id) {
            if (const auto warning = service.takePersistenceWarning()) {
                err() << *warning << '\n';
            } else {
                out() << reminders::core::parseFailureMessage() << '\n';
            }
            return 1;
        }
        const auto reminder = service.find(*id);
        out() << (reminder ? reminders::core::confirmation(*reminder) : QObject::tr("I've set a reminder for you."))
              << '\n';
        return 0;
    }

    if (command == QLatin1String("schedule")) {
        const QDateTime due = reminders::data::FileReminderStorage::parseInstant(parser.value(dueOption));
        const auto recurrence = parseEvery(parser.value(everyOption));
        if (!due.isValid() || !recurrence) {
            err() << QObject::tr("Invalid --due or --every value.") << '\n';
            return 1;
        }
        const auto id = service.addStructured(parser.value(textOption), due, *recurrence);
        if (!id) {
            reportPersistenceWarning(service);
            err() << QObject::tr("Could not add the reminder.") << '\n';
            return 1;
        }
        out() << *id << '\n';
        return 0;
    }

    if (command == QLatin1String("list")) {
        bool ok = false;
        const int limit = parser.value(limitOption).toInt(&ok);
        printReminders(service.upcoming(ok ? limit : 10));
        return 0;
    }

    if (command == QLatin1String("due")) {
        printReminders(service.dueNow());
        return 0;
    }

    if (command == QLatin1String("cancel")) {
        if (args.isEmpty()) {
            err() << QObject::tr("cancel needs a reminder id.") << '\n';
            return 1;
        }
        if (!service.cancel(args.first())) {
            reportPersistenceWarning(service);
            err() << QObject::tr("No reminder with id %1.").arg(args.first()) << '\n';
            return 1;
        }
        return 0;
    }

    if (command == QLatin1String("run")) {
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);
        QTimer signalPoll;
        QObject::connect(&signalPoll, &QTimer::timeout, &app, []() {
            if (quitRequested) {
                QCoreApplication::quit();
            }
        });
        signalPoll.start(200);

        QString lastDigest;
        QObject::connect(&context.watcher(), &reminders::core::ReminderWatcher::polled, &app,
                         [&service, &lastDigest]() {
                             reportPersistenceWarning(service);
                             const QString digest = reminders::core::trayDigest(service.upcoming(5));
                             if (digest != lastDigest) {
                                 lastDigest = digest;
                                 writeLine(out(), QStringLiteral("[tray] Upcoming reminders:\n%1")
                                                      .arg(digest.isEmpty() ? QObject::tr("none") : digest));
                             }
                         });
        context.startBackgroundWork();
        const int rc = app.exec();
        context.stopBackgroundWork();
        reportPersistenceWarning(service);
        return rc;
    }

    err() << QObject::tr("Unknown command: %1").arg(command) << '\n';
    return 1;
}
