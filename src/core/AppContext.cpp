#include "reminders/core/AppContext.hpp"

#include "reminders/core/NotificationLedger.hpp"
#include "reminders/core/ReminderService.hpp"
#include "reminders/core/ReminderStore.hpp"
#include "reminders/core/ReminderWatcher.hpp"
#include "reminders/data/DataProvider.hpp"

namespace reminders {
namespace core {

AppContext::AppContext(const Settings &settings, Sinks sinks, Clock clock)
    : m_settings(settings)
    , m_dataProvider(std::make_unique<data::DataProvider>(settings.filePath))
    , m_store(std::make_unique<ReminderStore>(m_dataProvider->reminderRepository()))
    , m_ledger(std::make_unique<NotificationLedger>(settings.dedupWindowSeconds))
    , m_schedulerDispatcher(std::make_unique<NotificationDispatcher>(*m_ledger, std::move(sinks.alert),
                                                                     std::move(sinks.speech)))
    , m_watcherDispatcher(std::make_unique<NotificationDispatcher>(*m_ledger, std::move(sinks.tray), SpeechSink()))
{
    ReminderScheduler::Options options;
    options.pollIntervalMs = settings.pollIntervalSeconds * 1000;
    options.backoffMs = settings.backoffSeconds * 1000;
    m_scheduler = std::make_unique<ReminderScheduler>(*m_store, *m_schedulerDispatcher, clock, options);
    m_watcher = std::make_unique<ReminderWatcher>(*m_store, *m_watcherDispatcher, clock);
    m_service = std::make_unique<ReminderService>(*m_store, clock);
}

AppContext::~AppContext()
{
    stopBackgroundWork();
}

ReminderStore &AppContext::store()
{
    return *m_store;
}

ReminderService &AppContext::service()
{
    return *m_service;
}

ReminderScheduler &AppContext::scheduler()
{
    return *m_scheduler;
}

ReminderWatcher &AppContext::watcher()
{
    return *m_watcher;
}

NotificationLedger &AppContext::ledger()
{
    return *m_ledger;
}

const Settings &AppContext::settings() const
{
    return m_settings;
}

void AppContext::startBackgroundWork()
{
    m_scheduler->start();
    if (m_settings.watcherEnabled) {
        m_watcher->start(m_settings.watcherIntervalSeconds * 1000);
    }
}

void AppContext::stopBackgroundWork()
{
    m_watcher->stop();
    m_scheduler->stop();
}

} // namespace core
} // namespace reminders
