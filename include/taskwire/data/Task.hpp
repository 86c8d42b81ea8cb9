#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>
#include <optional>

#include "taskwire/data/Due.hpp"
#include "taskwire/data/ValidationError.hpp"

namespace taskwire {
namespace data {

class Task
{
public:
    static constexpr int NormalPriority = 1;
    static constexpr int UrgentPriority = 4;

    static Task create(const QString &content);
    static bool isValidPriority(int priority);

    void setContent(const QString &content);
    void setCompleted(bool completed);
    void setProjectId(std::optional<qint64> projectId);
    void setDue(std::optional<Due> due);

    // Returns false and leaves the task untouched when priority is not 1..4.
    bool setPriority(int priority, ValidationError *error = nullptr);

    void addLabelId(qint64 labelId);
    void removeLabelId(qint64 labelId);
    bool hasLabelId(qint64 labelId) const;

    // Server-assigned fields, only written when decoding the read model.
    void setId(std::optional<qint64> id);
    void setOrder(std::optional<int> order);
    void setIndent(std::optional<int> indent);
    void setUrl(std::optional<QString> url);
    void setCommentCount(std::optional<int> commentCount);

    const std::optional<qint64> &id() const;
    const std::optional<qint64> &projectId() const;
    const QString &content() const;
    bool completed() const;
    const QVector<qint64> &labelIds() const;
    const std::optional<int> &order() const;
    const std::optional<int> &indent() const;
    int priority() const;
    const std::optional<Due> &due() const;
    const std::optional<QString> &url() const;
    const std::optional<int> &commentCount() const;

private:
    explicit Task(QString content);

    std::optional<qint64> m_id;
    std::optional<qint64> m_projectId;
    QString m_content;
    bool m_completed = false;
    QVector<qint64> m_labelIds;
    std::optional<int> m_order;
    std::optional<int> m_indent;
    int m_priority = NormalPriority;
    std::optional<Due> m_due;
    std::optional<QString> m_url;
    std::optional<int> m_commentCount;
};

} // namespace data
} // namespace taskwire
