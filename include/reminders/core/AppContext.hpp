#pragma once

#include <memory>

#include "reminders/core/NotificationDispatcher.hpp"
#include "reminders/core/ReminderScheduler.hpp"
#include "reminders/core/Settings.hpp"

namespace reminders {
namespace data {
class DataProvider;
}

namespace core {

class NotificationLedger;
class ReminderService;
class ReminderStore;
class ReminderWatcher;

struct Sinks
{
    AlertSink alert;
    SpeechSink speech;
    AlertSink tray;
};

// Owns one store, one scheduler and one watcher for the process and hands
// out references to them.
class AppContext
{
public:
    AppContext(const Settings &settings, Sinks sinks, Clock clock = systemClock());
    ~AppContext();

    ReminderStore &store();
    ReminderService &service();
    ReminderScheduler &scheduler();
    ReminderWatcher &watcher();
    NotificationLedger &ledger();
    const Settings &settings() const;

    // Starts the scheduler, and the watcher when enabled. The watcher needs a
    // running event loop on the calling thread.
    void startBackgroundWork();
    void stopBackgroundWork();

private:
    Settings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<ReminderStore> m_store;
    std::unique_ptr<NotificationLedger> m_ledger;
    std::unique_ptr<NotificationDispatcher> m_schedulerDispatcher;
    std::unique_ptr<NotificationDispatcher> m_watcherDispatcher;
    std::unique_ptr<ReminderScheduler> m_scheduler;
    std::unique_ptr<ReminderWatcher> m_watcher;
    std::unique_ptr<ReminderService> m_service;
};

} // namespace core
} // namespace reminders
