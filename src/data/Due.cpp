#include "taskwire/data/Due.hpp"

#include <utility>

namespace taskwire {
namespace data {

Due::Due(QString string)
    : m_string(std::move(string))
{
}

Due Due::create(const QString &string)
{
    return Due(string);
}

Due Due::restore(const QString &string,
                 std::optional<QString> date,
                 std::optional<QString> datetime,
                 std::optional<QString> timezone)
{
    Due due(string);
    due.m_date = std::move(date);
    due.m_datetime = std::move(datetime);
    due.m_timezone = std::move(timezone);
    return due;
}

void Due::setString(const QString &string)
{
    m_string = string;
    m_date.reset();
    m_datetime.reset();
    m_timezone.reset();
}

void Due::setDate(const QString &date)
{
    m_string = date;
    m_date = date;
    m_datetime.reset();
    m_timezone.reset();
}

void Due::setDatetime(const QString &datetime)
{
    m_string = datetime;
    m_date.reset();
    m_datetime = datetime;
    m_timezone.reset();
}

const QString &Due::string() const
{
    return m_string;
}

const std::optional<QString> &Due::date() const
{
    return m_date;
}

const std::optional<QString> &Due::datetime() const
{
    return m_datetime;
}

const std::optional<QString> &Due::timezone() const
{
    return m_timezone;
}

bool Due::operator==(const Due &other) const
{
    return m_string == other.m_string
        && m_date == other.m_date
        && m_datetime == other.m_datetime
        && m_timezone == other.m_timezone;
}

bool Due::operator!=(const Due &other) const
{
    return !(*this == other);
}

} // namespace data
} // namespace taskwire
