#include "reminders/Logging.hpp"

Q_LOGGING_CATEGORY(lcParser, "reminders.parser", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStore, "reminders.store")
Q_LOGGING_CATEGORY(lcScheduler, "reminders.scheduler")
Q_LOGGING_CATEGORY(lcDispatch, "reminders.dispatch")
Q_LOGGING_CATEGORY(lcWatcher, "reminders.watcher")
