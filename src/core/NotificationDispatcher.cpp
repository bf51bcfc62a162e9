#include "reminders/core/NotificationDispatcher.hpp"

#include "reminders/Logging.hpp"
#include "reminders/core/NotificationLedger.hpp"

#include <exception>

namespace reminders {
namespace core {

NotificationDispatcher::NotificationDispatcher(NotificationLedger &ledger, AlertSink alertSink, SpeechSink speechSink)
    : m_ledger(ledger)
    , m_alertSink(std::move(alertSink))
    , m_speechSink(std::move(speechSink))
{
}

DispatchOutcome NotificationDispatcher::dispatch(const data::Reminder &reminder, const QDateTime &now)
{
    if (!m_ledger.tryAcquire(reminder.id, now)) {
        qCDebug(lcDispatch) << "Suppressing repeat notification for" << reminder.id;
        return DispatchOutcome::Suppressed;
    }

    bool failed = false;
    if (m_alertSink) {
        try {
            m_alertSink(alertTitle(reminder), alertBody(reminder));
        } catch (const std::exception &e) {
            qCWarning(lcDispatch) << "Alert for reminder" << reminder.id << "failed:" << e.what();
            failed = true;
        } catch (...) {
            qCWarning(lcDispatch) << "Alert for reminder" << reminder.id << "failed with an unknown error";
            failed = true;
        }
    }
    if (m_speechSink) {
        try {
            m_speechSink(utterance(reminder));
        } catch (const std::exception &e) {
            qCWarning(lcDispatch) << "Speaking reminder" << reminder.id << "failed:" << e.what();
            failed = true;
        } catch (...) {
            qCWarning(lcDispatch) << "Speaking reminder" << reminder.id << "failed with an unknown error";
            failed = true;
        }
    }

    if (failed) {
        return DispatchOutcome::Failed;
    }
    qCInfo(lcDispatch) << "Notified reminder" << reminder.id << reminder.text;
    return DispatchOutcome::Delivered;
}

QString NotificationDispatcher::alertTitle(const data::Reminder &reminder)
{
    return QStringLiteral("Reminder: %1").arg(reminder.text);
}

QString NotificationDispatcher::alertBody(const data::Reminder &reminder)
{
    return QStringLiteral("Time: %1\n%2")
        .arg(reminder.dueTime.toLocalTime().toString(QStringLiteral("yyyy-MM-dd hh:mm")), reminder.text);
}

QString NotificationDispatcher::utterance(const data::Reminder &reminder)
{
    return QStringLiteral("Reminder: %1").arg(reminder.text);
}

} // namespace core
} // namespace reminders
