#include "reminders/data/FileReminderStorage.hpp"

#include "reminders/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStringList>
#include <algorithm>

namespace reminders {
namespace data {

namespace {
const QString ID_KEY = QStringLiteral("id");
const QString TEXT_KEY = QStringLiteral("text");
const QString DUE_TIME_KEY = QStringLiteral("due_time");
const QString CREATED_AT_KEY = QStringLiteral("created_at");
const QString COMPLETED_KEY = QStringLiteral("completed");
const QString RECURRING_KEY = QStringLiteral("recurring");
const QString INTERVAL_KEY = QStringLiteral("recurring_interval");
const QString LAST_TRIGGERED_KEY = QStringLiteral("last_triggered");

const QString DAYS_KEY = QStringLiteral("days");
const QString WEEKS_KEY = QStringLiteral("weeks");
const QString MONTHS_KEY = QStringLiteral("months");
} // namespace

FileReminderStorage::FileReminderStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

const QHash<QString, Reminder> &FileReminderStorage::reminders() const
{
    return m_reminders;
}

const QString &FileReminderStorage::filePath() const
{
    return m_filePath;
}

FileReminderStorage::LoadStatus FileReminderStorage::loadStatus() const
{
    return m_loadStatus;
}

bool FileReminderStorage::insertReminder(const Reminder &reminder)
{
    if (reminder.id.isEmpty() || m_reminders.contains(reminder.id)) {
        return false;
    }
    QHash<QString, Reminder> next = m_reminders;
    next.insert(reminder.id, reminder);
    return commit(std::move(next));
}

bool FileReminderStorage::updateReminders(const std::vector<Reminder> &reminders)
{
    QHash<QString, Reminder> next = m_reminders;
    for (const Reminder &reminder : reminders) {
        if (!next.contains(reminder.id)) {
            return false;
        }
        next.insert(reminder.id, reminder);
    }
    return commit(std::move(next));
}

bool FileReminderStorage::removeReminder(const QString &id)
{
    if (!m_reminders.contains(id)) {
        return false;
    }
    QHash<QString, Reminder> next = m_reminders;
    next.remove(id);
    return commit(std::move(next));
}

bool FileReminderStorage::commit(QHash<QString, Reminder> next)
{
    QHash<QString, Reminder> previous = std::move(m_reminders);
    m_reminders = std::move(next);
    if (save()) {
        return true;
    }
    m_reminders = std::move(previous);
    return false;
}

void FileReminderStorage::load()
{
    m_reminders.clear();
    m_loadStatus = LoadStatus::Missing;

    QFile file(m_filePath);
    if (m_filePath.isEmpty() || !file.exists()) {
        qCInfo(lcStore) << "No reminder file at" << m_filePath << "- starting empty";
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcStore) << "Cannot read" << m_filePath << ":" << file.errorString() << "- starting empty";
        m_loadStatus = LoadStatus::Unreadable;
        return;
    }

    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        qCWarning(lcStore) << "Reminder file" << m_filePath << "is corrupt"
                           << (error.error != QJsonParseError::NoError ? error.errorString() : QStringLiteral("(not an object)"))
                           << "- starting empty";
        m_loadStatus = LoadStatus::Corrupt;
        return;
    }

    const QJsonObject root = document.object();
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        if (!it.value().isObject()) {
            qCWarning(lcStore) << "Skipping malformed reminder entry" << it.key();
            continue;
        }
        std::optional<Reminder> reminder = fromJson(it.key(), it.value().toObject());
        if (!reminder) {
            qCWarning(lcStore) << "Skipping malformed reminder entry" << it.key();
            continue;
        }
        m_reminders.insert(reminder->id, *reminder);
    }
    m_loadStatus = LoadStatus::Loaded;
    qCInfo(lcStore) << "Loaded" << m_reminders.size() << "reminders from" << m_filePath;
}

bool FileReminderStorage::save() const
{
    if (m_filePath.isEmpty()) {
        return true;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcStore) << "Cannot create directory" << dir.path();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcStore) << "Cannot write" << m_filePath << ":" << file.errorString();
        return false;
    }

    QStringList ids = m_reminders.keys();
    std::sort(ids.begin(), ids.end());
    QJsonObject root;
    for (const QString &id : ids) {
        root.insert(id, toJson(m_reminders.value(id)));
    }

    const QByteArray payload = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        qCWarning(lcStore) << "Short write to" << m_filePath << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qCWarning(lcStore) << "Cannot commit" << m_filePath << ":" << file.errorString();
        return false;
    }
    return true;
}

QJsonObject FileReminderStorage::toJson(const Reminder &reminder)
{
    QJsonObject object;
    object.insert(ID_KEY, reminder.id);
    object.insert(TEXT_KEY, reminder.text);
    object.insert(DUE_TIME_KEY, formatInstant(reminder.dueTime));
    object.insert(CREATED_AT_KEY, formatInstant(reminder.createdAt));
    object.insert(COMPLETED_KEY, reminder.completed);
    object.insert(RECURRING_KEY, reminder.recurring);
    object.insert(INTERVAL_KEY, reminder.recurring ? recurrenceToJson(reminder.interval) : QJsonValue());
    object.insert(LAST_TRIGGERED_KEY,
                  reminder.lastTriggered ? QJsonValue(formatInstant(*reminder.lastTriggered)) : QJsonValue());
    return object;
}

std::optional<Reminder> FileReminderStorage::fromJson(const QString &key, const QJsonObject &object)
{
    Reminder reminder;
    reminder.id = object.value(ID_KEY).toString(key);
    reminder.text = object.value(TEXT_KEY).toString();
    reminder.dueTime = parseInstant(object.value(DUE_TIME_KEY).toString());
    reminder.createdAt = parseInstant(object.value(CREATED_AT_KEY).toString());
    if (reminder.id.isEmpty() || reminder.text.isEmpty() || !reminder.dueTime.isValid()) {
        return std::nullopt;
    }
    if (!reminder.createdAt.isValid()) {
        reminder.createdAt = reminder.dueTime;
    }
    reminder.completed = object.value(COMPLETED_KEY).toBool(false);
    reminder.recurring = object.value(RECURRING_KEY).toBool(false);
    reminder.interval = recurrenceFromJson(object.value(INTERVAL_KEY));
    if (reminder.recurring && !reminder.interval.isValid()) {
        qCWarning(lcStore) << "Reminder" << reminder.id << "is recurring without a valid interval; treating as one-shot";
        reminder.recurring = false;
    }
    if (!reminder.recurring) {
        reminder.interval = Recurrence::none();
    }
    const QDateTime lastTriggered = parseInstant(object.value(LAST_TRIGGERED_KEY).toString());
    if (lastTriggered.isValid()) {
        reminder.lastTriggered = lastTriggered;
    }
    return reminder;
}

QString FileReminderStorage::formatInstant(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime FileReminderStorage::parseInstant(const QString &value)
{
    if (value.isEmpty()) {
        return {};
    }
    QDateTime dt = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        return {};
    }
    if (dt.timeSpec() == Qt::LocalTime) {
        dt.setTimeSpec(Qt::UTC);
    }
    return dt.toUTC();
}

QJsonValue FileReminderStorage::recurrenceToJson(const Recurrence &recurrence)
{
    QJsonObject object;
    switch (recurrence.unit) {
    case Recurrence::Unit::Days:
        object.insert(DAYS_KEY, recurrence.count);
        break;
    case Recurrence::Unit::Weeks:
        object.insert(WEEKS_KEY, recurrence.count);
        break;
    case Recurrence::Unit::Months:
        object.insert(MONTHS_KEY, recurrence.count);
        break;
    case Recurrence::Unit::None:
        return QJsonValue();
    }
    return object;
}

Recurrence FileReminderStorage::recurrenceFromJson(const QJsonValue &value)
{
    if (!value.isObject()) {
        return Recurrence::none();
    }
    const QJsonObject object = value.toObject();
    if (object.size() != 1) {
        return Recurrence::none();
    }
    const int days = object.value(DAYS_KEY).toInt(0);
    const int weeks = object.value(WEEKS_KEY).toInt(0);
    const int months = object.value(MONTHS_KEY).toInt(0);
    if (days > 0) {
        return Recurrence::days(days);
    }
    if (weeks > 0) {
        return Recurrence::weeks(weeks);
    }
    if (months > 0) {
        return Recurrence::months(months);
    }
    return Recurrence::none();
}

} // namespace data
} // namespace reminders
