#include "taskwire/codec/TaskCodec.hpp"

#include "taskwire/codec/WireDue.hpp"
#include "taskwire/core/Logging.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <cmath>
#include <limits>
#include <variant>

namespace taskwire {
namespace codec {

namespace {

using data::Due;
using data::Task;

// Largest integer a JSON number (IEEE double) holds exactly.
constexpr qint64 MAX_SAFE_INTEGER = 9007199254740991LL;
constexpr qint64 MAX_INT = std::numeric_limits<int>::max();
constexpr qint64 MIN_INT = std::numeric_limits<int>::min();
constexpr int MIN_INDENT = 1;
constexpr int MAX_INDENT = 5;

void setError(DeserializationError &error, DeserializationError::Code code, const QString &field, const QString &message)
{
    error.code = code;
    error.field = field;
    error.message = message;
}

bool fail(DeserializationError &error, DeserializationError::Code code, const QString &field, const QString &message)
{
    setError(error, code, field, message);
    return false;
}

QString joinPath(const QString &prefix, const QString &key)
{
    return prefix.isEmpty() ? key : prefix + QLatin1Char('.') + key;
}

bool isAbsent(const QJsonValue &value)
{
    return value.isUndefined() || value.isNull();
}

bool readInteger(const QJsonValue &value, const QString &field, qint64 minimum, qint64 maximum,
                 qint64 &out, DeserializationError &error)
{
    if (!value.isDouble()) {
        return fail(error, DeserializationError::TypeMismatch, field, QStringLiteral("expected an integer"));
    }
    const double number = value.toDouble();
    if (std::isfinite(number) && std::floor(number) != number) {
        return fail(error, DeserializationError::TypeMismatch, field, QStringLiteral("expected an integer"));
    }
    if (!std::isfinite(number) || number < static_cast<double>(minimum) || number > static_cast<double>(maximum)) {
        return fail(error, DeserializationError::OutOfRange, field,
                    QStringLiteral("value must be between %1 and %2").arg(minimum).arg(maximum));
    }
    out = static_cast<qint64>(number);
    return true;
}

bool readRequiredInteger(const QJsonObject &object, const QString &key, qint64 minimum, qint64 maximum,
                         qint64 &out, DeserializationError &error)
{
    const QJsonValue value = object.value(key);
    if (value.isUndefined()) {
        return fail(error, DeserializationError::MissingField, key, QStringLiteral("required field is missing"));
    }
    return readInteger(value, key, minimum, maximum, out, error);
}

bool readOptionalId(const QJsonObject &object, const QString &key, std::optional<qint64> &out,
                    DeserializationError &error)
{
    const QJsonValue value = object.value(key);
    if (isAbsent(value)) {
        out.reset();
        return true;
    }
    qint64 number = 0;
    if (!readInteger(value, key, 1, MAX_SAFE_INTEGER, number, error)) {
        return false;
    }
    out = number;
    return true;
}

bool readOptionalInt(const QJsonObject &object, const QString &key, qint64 minimum, qint64 maximum,
                     std::optional<int> &out, DeserializationError &error)
{
    const QJsonValue value = object.value(key);
    if (isAbsent(value)) {
        out.reset();
        return true;
    }
    qint64 number = 0;
    if (!readInteger(value, key, minimum, maximum, number, error)) {
        return false;
    }
    out = static_cast<int>(number);
    return true;
}

bool readRequiredString(const QJsonObject &object, const QString &key, const QString &field, QString &out,
                        DeserializationError &error)
{
    const QJsonValue value = object.value(key);
    if (value.isUndefined()) {
        return fail(error, DeserializationError::MissingField, field, QStringLiteral("required field is missing"));
    }
    if (!value.isString()) {
        return fail(error, DeserializationError::TypeMismatch, field, QStringLiteral("expected a string"));
    }
    out = value.toString();
    return true;
}

bool readOptionalString(const QJsonObject &object, const QString &key, const QString &field,
                        std::optional<QString> &out, DeserializationError &error)
{
    const QJsonValue value = object.value(key);
    if (isAbsent(value)) {
        out.reset();
        return true;
    }
    if (!value.isString()) {
        return fail(error, DeserializationError::TypeMismatch, field, QStringLiteral("expected a string"));
    }
    out = value.toString();
    return true;
}

bool readLabelIds(const QJsonObject &object, QVector<qint64> &out, DeserializationError &error)
{
    const QString key = QStringLiteral("label_ids");
    const QJsonValue value = object.value(key);
    if (value.isUndefined()) {
        return fail(error, DeserializationError::MissingField, key, QStringLiteral("required field is missing"));
    }
    if (!value.isArray()) {
        return fail(error, DeserializationError::TypeMismatch, key, QStringLiteral("expected an array"));
    }
    const QJsonArray array = value.toArray();
    out.clear();
    out.reserve(array.size());
    for (int i = 0; i < array.size(); ++i) {
        qint64 labelId = 0;
        if (!readInteger(array.at(i), QStringLiteral("%1[%2]").arg(key).arg(i), 0, MAX_SAFE_INTEGER, labelId, error)) {
            return false;
        }
        out.append(labelId);
    }
    return true;
}

// Extra members of the due object (e.g. "recurring") are not retained.
bool readDue(const QJsonObject &object, std::optional<Due> &out, DeserializationError &error)
{
    const QString key = QStringLiteral("due");
    const QJsonValue value = object.value(key);
    if (isAbsent(value)) {
        out.reset();
        return true;
    }
    if (!value.isObject()) {
        return fail(error, DeserializationError::TypeMismatch, key, QStringLiteral("expected an object"));
    }
    const QJsonObject dueObject = value.toObject();

    QString string;
    std::optional<QString> date;
    std::optional<QString> datetime;
    std::optional<QString> timezone;
    if (!readRequiredString(dueObject, QStringLiteral("string"), joinPath(key, QStringLiteral("string")), string, error)
        || !readOptionalString(dueObject, QStringLiteral("date"), joinPath(key, QStringLiteral("date")), date, error)
        || !readOptionalString(dueObject, QStringLiteral("datetime"), joinPath(key, QStringLiteral("datetime")), datetime, error)
        || !readOptionalString(dueObject, QStringLiteral("timezone"), joinPath(key, QStringLiteral("timezone")), timezone, error)) {
        return false;
    }
    out = Due::restore(string, std::move(date), std::move(datetime), std::move(timezone));
    return true;
}

std::optional<Task> decodeTaskObject(const QJsonObject &object, DeserializationError &error)
{
    QString content;
    if (!readRequiredString(object, QStringLiteral("content"), QStringLiteral("content"), content, error)) {
        return std::nullopt;
    }

    const QJsonValue completed = object.value(QStringLiteral("completed"));
    if (completed.isUndefined()) {
        setError(error, DeserializationError::MissingField, QStringLiteral("completed"), QStringLiteral("required field is missing"));
        return std::nullopt;
    }
    if (!completed.isBool()) {
        setError(error, DeserializationError::TypeMismatch, QStringLiteral("completed"), QStringLiteral("expected a boolean"));
        return std::nullopt;
    }

    QVector<qint64> labelIds;
    if (!readLabelIds(object, labelIds, error)) {
        return std::nullopt;
    }

    qint64 priority = 0;
    if (!readRequiredInteger(object, QStringLiteral("priority"), MIN_INT, MAX_INT, priority, error)) {
        return std::nullopt;
    }

    std::optional<qint64> id;
    std::optional<qint64> projectId;
    std::optional<int> order;
    std::optional<int> indent;
    std::optional<int> commentCount;
    std::optional<QString> url;
    std::optional<Due> due;
    if (!readOptionalId(object, QStringLiteral("id"), id, error)
        || !readOptionalId(object, QStringLiteral("project_id"), projectId, error)
        || !readOptionalInt(object, QStringLiteral("order"), MIN_INT, MAX_INT, order, error)
        || !readOptionalInt(object, QStringLiteral("indent"), MIN_INDENT, MAX_INDENT, indent, error)
        || !readOptionalInt(object, QStringLiteral("comment_count"), 0, MAX_INT, commentCount, error)
        || !readOptionalString(object, QStringLiteral("url"), QStringLiteral("url"), url, error)
        || !readDue(object, due, error)) {
        return std::nullopt;
    }

    Task task = Task::create(content);
    data::ValidationError validation;
    if (!task.setPriority(static_cast<int>(priority), &validation)) {
        setError(error, DeserializationError::OutOfRange, validation.field, validation.message);
        return std::nullopt;
    }
    task.setCompleted(completed.toBool());
    for (qint64 labelId : labelIds) {
        task.addLabelId(labelId);
    }
    task.setId(id);
    task.setProjectId(projectId);
    task.setOrder(order);
    task.setIndent(indent);
    task.setCommentCount(commentCount);
    task.setUrl(std::move(url));
    task.setDue(std::move(due));
    return task;
}

bool parseDocument(const QByteArray &json, QJsonDocument &document, DeserializationError &error)
{
    QJsonParseError parseError;
    document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return fail(error, DeserializationError::MalformedJson, QString(),
                    QStringLiteral("%1 at offset %2").arg(parseError.errorString()).arg(parseError.offset));
    }
    return true;
}

void resetError(DeserializationError *error)
{
    if (error) {
        *error = DeserializationError();
    }
}

void report(const DeserializationError &error, DeserializationError *out)
{
    qCWarning(core::lcCodec) << "failed to decode task:" << error.errorString();
    if (out) {
        *out = error;
    }
}

QJsonValue toJsonValue(const std::optional<qint64> &value)
{
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

QJsonValue toJsonValue(const std::optional<int> &value)
{
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

struct DueFieldWriter
{
    WireFields &fields;

    void operator()(const NoDue &) const {}

    void operator()(const DueString &due) const
    {
        fields.append(qMakePair(QStringLiteral("due_string"), QJsonValue(due.string)));
        fields.append(qMakePair(QStringLiteral("due_lang"), QJsonValue(due.language)));
    }

    void operator()(const DueDate &due) const
    {
        fields.append(qMakePair(QStringLiteral("due_date"), QJsonValue(due.date)));
    }

    void operator()(const DueDateTime &due) const
    {
        fields.append(qMakePair(QStringLiteral("due_datetime"), QJsonValue(due.datetime)));
    }
};

// QJsonDocument only renders arrays and objects; wrap the value and strip the brackets.
QByteArray renderValue(const QJsonValue &value)
{
    const QByteArray wrapped = QJsonDocument(QJsonArray{ value }).toJson(QJsonDocument::Compact);
    return wrapped.mid(1, wrapped.size() - 2);
}

} // namespace

std::optional<Task> decodeTask(const QByteArray &json, DeserializationError *error)
{
    resetError(error);
    DeserializationError local;
    QJsonDocument document;
    if (!parseDocument(json, document, local)) {
        report(local, error);
        return std::nullopt;
    }
    if (!document.isObject()) {
        setError(local, DeserializationError::NotAnObject, QString(), QStringLiteral("expected a JSON object"));
        report(local, error);
        return std::nullopt;
    }
    return decodeTask(document.object(), error);
}

std::optional<Task> decodeTask(const QJsonObject &object, DeserializationError *error)
{
    resetError(error);
    DeserializationError local;
    auto task = decodeTaskObject(object, local);
    if (!task) {
        report(local, error);
    }
    return task;
}

std::optional<QVector<Task>> decodeTasks(const QByteArray &json, DeserializationError *error)
{
    resetError(error);
    DeserializationError local;
    QJsonDocument document;
    if (!parseDocument(json, document, local)) {
        report(local, error);
        return std::nullopt;
    }
    if (!document.isArray()) {
        setError(local, DeserializationError::TypeMismatch, QString(), QStringLiteral("expected a JSON array of tasks"));
        report(local, error);
        return std::nullopt;
    }

    const QJsonArray array = document.array();
    QVector<Task> tasks;
    tasks.reserve(array.size());
    for (int i = 0; i < array.size(); ++i) {
        const QString index = QStringLiteral("[%1]").arg(i);
        const QJsonValue element = array.at(i);
        if (!element.isObject()) {
            setError(local, DeserializationError::NotAnObject, index, QStringLiteral("expected a JSON object"));
            report(local, error);
            return std::nullopt;
        }
        auto task = decodeTaskObject(element.toObject(), local);
        if (!task) {
            local.field = index + QLatin1Char('.') + local.field;
            report(local, error);
            return std::nullopt;
        }
        tasks.append(std::move(*task));
    }
    return tasks;
}

WireFields encodeTask(const Task &task)
{
    QJsonArray labelIds;
    for (qint64 labelId : task.labelIds()) {
        labelIds.append(QJsonValue(labelId));
    }

    WireFields fields;
    fields.reserve(7);
    fields.append(qMakePair(QStringLiteral("content"), QJsonValue(task.content())));
    fields.append(qMakePair(QStringLiteral("project_id"), toJsonValue(task.projectId())));
    fields.append(qMakePair(QStringLiteral("order"), toJsonValue(task.order())));
    fields.append(qMakePair(QStringLiteral("label_ids"), QJsonValue(labelIds)));
    fields.append(qMakePair(QStringLiteral("priority"), QJsonValue(task.priority())));
    std::visit(DueFieldWriter{ fields }, resolveWireDue(task.due()));
    return fields;
}

QByteArray toJson(const Task &task, const CodecOptions &options)
{
    const WireFields fields = encodeTask(task);
    const bool indented = options.format == QJsonDocument::Indented;

    QByteArray json("{");
    for (int i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            json += ',';
        }
        if (indented) {
            json += "\n    ";
        }
        json += renderValue(QJsonValue(fields.at(i).first));
        json += indented ? ": " : ":";
        json += renderValue(fields.at(i).second);
    }
    if (indented) {
        json += "\n}\n";
    } else {
        json += '}';
    }
    return json;
}

QJsonObject toJsonObject(const Task &task)
{
    QJsonObject object;
    for (const auto &field : encodeTask(task)) {
        object.insert(field.first, field.second);
    }
    return object;
}

} // namespace codec
} // namespace taskwire
