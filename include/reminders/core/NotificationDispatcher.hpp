#pragma once

#include <QDateTime>
#include <QString>
#include <functional>

#include "reminders/data/Reminder.hpp"

namespace reminders {
namespace core {

class NotificationLedger;

using AlertSink = std::function<void(const QString &title, const QString &body)>;
using SpeechSink = std::function<void(const QString &utterance)>;

enum class DispatchOutcome
{
    Delivered,
    Suppressed,
    Failed,
};

class NotificationDispatcher
{
public:
    NotificationDispatcher(NotificationLedger &ledger, AlertSink alertSink, SpeechSink speechSink);

    // Presents the reminder through both sinks unless the ledger says it was
    // presented within the dedup window. Sink failures are logged and
    // reported as Failed, never thrown.
    DispatchOutcome dispatch(const data::Reminder &reminder, const QDateTime &now);

    static QString alertTitle(const data::Reminder &reminder);
    static QString alertBody(const data::Reminder &reminder);
    static QString utterance(const data::Reminder &reminder);

private:
    NotificationLedger &m_ledger;
    AlertSink m_alertSink;
    SpeechSink m_speechSink;
};

} // namespace core
} // namespace reminders
