#pragma once

#include <QJsonDocument>

class QSettings;

namespace taskwire {
namespace codec {

// Indented puts each top-level field on its own line. Nested values such
// as label_ids stay compact on that line, e.g. "label_ids": [10,1].
struct CodecOptions
{
    QJsonDocument::JsonFormat format = QJsonDocument::Compact;
};

CodecOptions loadCodecOptions(const QSettings &settings);
void saveCodecOptions(QSettings &settings, const CodecOptions &options);

} // namespace codec
} // namespace taskwire
