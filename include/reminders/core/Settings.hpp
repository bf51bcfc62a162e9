#pragma once

#include <QString>

class QSettings;

namespace reminders {
namespace core {

struct Settings
{
    QString filePath;
    int pollIntervalSeconds = 10;
    int backoffSeconds = 60;
    int dedupWindowSeconds = 5 * 60;
    int watcherIntervalSeconds = 30;
    bool watcherEnabled = true;

    // Missing or non-positive values keep their defaults.
    static Settings load(const QSettings &settings);
    static QString defaultFilePath();
};

} // namespace core
} // namespace reminders
