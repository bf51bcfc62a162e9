#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

namespace reminders {
namespace data {

struct Recurrence
{
    enum class Unit
    {
        None,
        Days,
        Weeks,
        Months,
    };

    Unit unit = Unit::None;
    int count = 0;

    static Recurrence none() { return {}; }
    static Recurrence days(int n) { return { Unit::Days, n }; }
    static Recurrence weeks(int n) { return { Unit::Weeks, n }; }
    static Recurrence months(int n) { return { Unit::Months, n }; }

    bool isValid() const { return unit != Unit::None && count > 0; }

    // Advances the instant by `times` intervals. Months clamp to the target
    // month's length.
    QDateTime advance(const QDateTime &from, int times = 1) const;
};

bool operator==(const Recurrence &lhs, const Recurrence &rhs);
bool operator!=(const Recurrence &lhs, const Recurrence &rhs);

struct Reminder
{
    QString id;
    QString text;
    QDateTime dueTime;
    QDateTime createdAt;
    bool completed = false;
    bool recurring = false;
    Recurrence interval;
    std::optional<QDateTime> lastTriggered;

    bool isDue(const QDateTime &now) const;
};

} // namespace data
} // namespace reminders
