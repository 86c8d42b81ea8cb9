#include "taskwire/codec/CodecOptions.hpp"

#include "taskwire/core/Logging.hpp"

#include <QSettings>
#include <QString>

namespace taskwire {
namespace codec {

namespace {
constexpr auto FORMAT_KEY = "codec/format";
constexpr auto COMPACT = "compact";
constexpr auto INDENTED = "indented";
} // namespace

CodecOptions loadCodecOptions(const QSettings &settings)
{
    CodecOptions options;
    const QString format = settings.value(QLatin1String(FORMAT_KEY), QLatin1String(COMPACT))
                               .toString()
                               .trimmed()
                               .toLower();
    if (format == QLatin1String(INDENTED)) {
        options.format = QJsonDocument::Indented;
    } else if (format != QLatin1String(COMPACT)) {
        qCWarning(core::lcCodec) << "unknown codec format" << format << "- falling back to compact";
    }
    return options;
}

void saveCodecOptions(QSettings &settings, const CodecOptions &options)
{
    const auto format = options.format == QJsonDocument::Indented ? INDENTED : COMPACT;
    settings.setValue(QLatin1String(FORMAT_KEY), QLatin1String(format));
}

} // namespace codec
} // namespace taskwire
