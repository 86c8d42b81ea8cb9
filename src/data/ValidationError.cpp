#include "taskwire/data/ValidationError.hpp"

namespace taskwire {
namespace data {

QString ValidationError::errorString() const
{
    if (code == NoError) {
        return QStringLiteral("no error");
    }
    return QStringLiteral("%1: %2").arg(field, message);
}

} // namespace data
} // namespace taskwire
