#pragma once

#include <QString>
#include <optional>

namespace taskwire {
namespace data {

// When a task is due. `string` is the human description and is always set;
// `date` and `datetime` are the structured forms. Setting one form clears
// the others, the structured setters mirror their value into `string`.
class Due
{
public:
    static Due create(const QString &string);
    // Rebuilds a value exactly as the service reported it, all forms at once.
    static Due restore(const QString &string,
                       std::optional<QString> date,
                       std::optional<QString> datetime,
                       std::optional<QString> timezone);

    void setString(const QString &string);
    void setDate(const QString &date);         // YYYY-MM-DD
    void setDatetime(const QString &datetime); // RFC3339, UTC

    const QString &string() const;
    const std::optional<QString> &date() const;
    const std::optional<QString> &datetime() const;
    const std::optional<QString> &timezone() const;

    bool operator==(const Due &other) const;
    bool operator!=(const Due &other) const;

private:
    explicit Due(QString string);

    QString m_string;
    std::optional<QString> m_date;
    std::optional<QString> m_datetime;
    std::optional<QString> m_timezone;
};

} // namespace data
} // namespace taskwire
