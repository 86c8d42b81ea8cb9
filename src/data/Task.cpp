#include "taskwire/data/Task.hpp"

#include "taskwire/core/Logging.hpp"

#include <algorithm>
#include <utility>

namespace taskwire {
namespace data {

Task::Task(QString content)
    : m_content(std::move(content))
{
}

Task Task::create(const QString &content)
{
    return Task(content);
}

bool Task::isValidPriority(int priority)
{
    return priority >= NormalPriority && priority <= UrgentPriority;
}

void Task::setContent(const QString &content)
{
    m_content = content;
}

void Task::setCompleted(bool completed)
{
    m_completed = completed;
}

void Task::setProjectId(std::optional<qint64> projectId)
{
    m_projectId = projectId;
}

void Task::setDue(std::optional<Due> due)
{
    m_due = std::move(due);
}

bool Task::setPriority(int priority, ValidationError *error)
{
    if (error) {
        *error = ValidationError();
    }
    if (!isValidPriority(priority)) {
        qCDebug(core::lcData) << "rejected priority" << priority;
        if (error) {
            error->code = ValidationError::PriorityOutOfRange;
            error->field = QStringLiteral("priority");
            error->message = QStringLiteral("priority must be between %1 and %2, got %3")
                                 .arg(NormalPriority)
                                 .arg(UrgentPriority)
                                 .arg(priority);
        }
        return false;
    }
    m_priority = priority;
    return true;
}

void Task::addLabelId(qint64 labelId)
{
    m_labelIds.append(labelId);
}

void Task::removeLabelId(qint64 labelId)
{
    m_labelIds.erase(std::remove(m_labelIds.begin(), m_labelIds.end(), labelId), m_labelIds.end());
}

bool Task::hasLabelId(qint64 labelId) const
{
    return m_labelIds.contains(labelId);
}

void Task::setId(std::optional<qint64> id)
{
    m_id = id;
}

void Task::setOrder(std::optional<int> order)
{
    m_order = order;
}

void Task::setIndent(std::optional<int> indent)
{
    m_indent = indent;
}

void Task::setUrl(std::optional<QString> url)
{
    m_url = std::move(url);
}

void Task::setCommentCount(std::optional<int> commentCount)
{
    m_commentCount = commentCount;
}

const std::optional<qint64> &Task::id() const
{
    return m_id;
}

const std::optional<qint64> &Task::projectId() const
{
    return m_projectId;
}

const QString &Task::content() const
{
    return m_content;
}

bool Task::completed() const
{
    return m_completed;
}

const QVector<qint64> &Task::labelIds() const
{
    return m_labelIds;
}

const std::optional<int> &Task::order() const
{
    return m_order;
}

const std::optional<int> &Task::indent() const
{
    return m_indent;
}

int Task::priority() const
{
    return m_priority;
}

const std::optional<Due> &Task::due() const
{
    return m_due;
}

const std::optional<QString> &Task::url() const
{
    return m_url;
}

const std::optional<int> &Task::commentCount() const
{
    return m_commentCount;
}

} // namespace data
} // namespace taskwire
