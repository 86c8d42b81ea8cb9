#include "taskwire/core/Logging.hpp"

namespace taskwire {
namespace core {

Q_LOGGING_CATEGORY(lcData, "taskwire.data")
Q_LOGGING_CATEGORY(lcCodec, "taskwire.codec")

} // namespace core
} // namespace taskwire
