#include "reminders/core/Settings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace reminders {
namespace core {

namespace {
int positiveOr(const QSettings &settings, const QString &key, int fallback)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok || value <= 0) {
        return fallback;
    }
    return value;
}
} // namespace

Settings Settings::load(const QSettings &settings)
{
    Settings result;
    result.filePath = settings.value(QStringLiteral("storage/filePath")).toString();
    if (result.filePath.isEmpty()) {
        result.filePath = defaultFilePath();
    }
    result.pollIntervalSeconds = positiveOr(settings, QStringLiteral("scheduler/pollIntervalSeconds"),
                                            result.pollIntervalSeconds);
    result.backoffSeconds = positiveOr(settings, QStringLiteral("scheduler/backoffSeconds"), result.backoffSeconds);
    result.dedupWindowSeconds = positiveOr(settings, QStringLiteral("notifications/dedupWindowSeconds"),
                                           result.dedupWindowSeconds);
    result.watcherIntervalSeconds = positiveOr(settings, QStringLiteral("watcher/pollIntervalSeconds"),
                                               result.watcherIntervalSeconds);
    result.watcherEnabled = settings.value(QStringLiteral("watcher/enabled"), result.watcherEnabled).toBool();
    return result;
}

QString Settings::defaultFilePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/reminders");
    }
    return QDir(storageFolder).filePath(QStringLiteral("reminders.json"));
}

} // namespace core
} // namespace reminders
