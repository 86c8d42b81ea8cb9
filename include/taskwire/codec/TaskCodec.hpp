#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QPair>
#include <QString>
#include <QVector>
#include <optional>

#include "taskwire/codec/CodecOptions.hpp"
#include "taskwire/codec/DeserializationError.hpp"
#include "taskwire/data/Task.hpp"

namespace taskwire {
namespace codec {

// Write-model fields in emission order.
using WireFields = QVector<QPair<QString, QJsonValue>>;

// Read model -> Task. Unknown fields are ignored; on failure returns
// std::nullopt and fills `error` when given.
std::optional<data::Task> decodeTask(const QByteArray &json, DeserializationError *error = nullptr);
std::optional<data::Task> decodeTask(const QJsonObject &object, DeserializationError *error = nullptr);
std::optional<QVector<data::Task>> decodeTasks(const QByteArray &json, DeserializationError *error = nullptr);

// Task -> write model. Server-assigned fields are never emitted.
WireFields encodeTask(const data::Task &task);
QByteArray toJson(const data::Task &task, const CodecOptions &options = CodecOptions());
QJsonObject toJsonObject(const data::Task &task);

} // namespace codec
} // namespace taskwire
