#pragma once

#include <QLoggingCategory>

namespace taskwire {
namespace core {

Q_DECLARE_LOGGING_CATEGORY(lcData)
Q_DECLARE_LOGGING_CATEGORY(lcCodec)

} // namespace core
} // namespace taskwire
