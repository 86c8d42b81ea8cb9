#include "taskwire/codec/WireDue.hpp"

namespace taskwire {
namespace codec {

WireDue resolveWireDue(const std::optional<data::Due> &due)
{
    if (!due) {
        return NoDue{};
    }
    if (due->datetime()) {
        return DueDateTime{ *due->datetime() };
    }
    if (due->date()) {
        return DueDate{ *due->date() };
    }
    return DueString{ due->string(), QString::fromLatin1(DueLanguage) };
}

} // namespace codec
} // namespace taskwire
