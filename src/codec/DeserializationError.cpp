#include "taskwire/codec/DeserializationError.hpp"

namespace taskwire {
namespace codec {

QString DeserializationError::errorString() const
{
    if (code == NoError) {
        return QStringLiteral("no error");
    }
    if (field.isEmpty()) {
        return message;
    }
    return QStringLiteral("%1: %2").arg(field, message);
}

} // namespace codec
} // namespace taskwire
